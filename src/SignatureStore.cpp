#include "SignatureStore.h"
#include "ThreatTypes.h"
#include <cctype>

SignatureStore::SignatureStore(const std::map<std::string, std::string>& entries) {
    for (const auto& [digest, name] : entries) add(digest, name);
}

bool SignatureStore::is_valid_digest(const std::string& digest) {
    if (digest.size() != 32 && digest.size() != 64) return false;
    for (char c : digest) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool SignatureStore::add(const std::string& digest, const std::string& threat_name) {
    if (!is_valid_digest(digest)) return false;
    m_entries[to_lower(digest)] = threat_name;
    return true;
}

std::optional<std::string> SignatureStore::lookup(const std::string& digest) const {
    if (digest.empty()) return std::nullopt;
    auto it = m_entries.find(to_lower(digest));
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

SignatureStore SignatureStore::builtin() {
    return SignatureStore({
        { "44d88612fea8a8f36de82e1278abb02f", "Trojan.Generic" },
        { "81891b0d3cbb89c1e044b8c5c504c83a", "Worm.Win32" },
        { "e6d290a03b70cfa5d4451da444bdea39", "Ransomware.Crypto" },
        // deep scan placeholders
        { "e44f9e348c0c7eed13d225a9bdb4c576", "Malware.Generic" },
        { "5b4f8efdd7bbe4a7dbd307f7778e5e66", "Malware.Generic" },
    });
}
