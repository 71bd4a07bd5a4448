#pragma once
// SignatureStore.h — таблица известных вредоносных хэшей
//
// hex digest (MD5 или SHA-256, lower-case) -> имя угрозы ("Trojan.Generic")
// Наполняется до старта сессии и дальше только читается (shared между воркерами).

#include <string>
#include <optional>
#include <unordered_map>
#include <map>

class SignatureStore {
public:
    SignatureStore() = default;
    explicit SignatureStore(const std::map<std::string, std::string>& entries);

    // Нормализует digest к lower-case. false — digest не hex или длина не 32/64.
    bool add(const std::string& digest, const std::string& threat_name);

    std::optional<std::string> lookup(const std::string& digest) const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    static bool is_valid_digest(const std::string& digest);

    // Встроенная база: MD5 образцы из исходного каталога сигнатур.
    static SignatureStore builtin();

private:
    std::unordered_map<std::string, std::string> m_entries;
};
