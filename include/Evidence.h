#pragma once
// Evidence.h — факты об одном файле, не зависящие от детекторов
//
// Evidence создаётся один раз на файл (EvidenceExtractor::extract),
// дальше только читается детекторами и выбрасывается после агрегации,
// чтобы память не росла на больших деревьях.
//
// Алгоритм извлечения (один проход по файлу):
//   файл читается кусками по CHUNK_SIZE (4 KiB) через boost::iostreams::file_source
//   ├── SHA-256 (и MD5, если включены legacy digests) — OpenSSL EVP
//   ├── гистограмма байт на 256 корзин → энтропия Шеннона
//   └── первые sample_bytes байт → content_sample для паттернов

#include <string>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

// Лимиты для распаковки контейнеров (.jar, .docm, ...)
constexpr int MAX_CONTAINER_ENTRIES = 1000;                  // Максимум записей в одном контейнере
constexpr size_t MAX_UNCOMPRESSED_SIZE = 100 * 1024 * 1024;  // 100MB лимит распаковки

constexpr size_t DEFAULT_SAMPLE_BYTES = 256 * 1024;

struct Evidence {
    std::filesystem::path path;
    std::uintmax_t size_bytes = 0;
    std::string extension;               // ".exe" (lower-case), пусто если нет
    std::string sha256;                  // hex, lower-case
    std::optional<std::string> md5;      // только для legacy сигнатур (deep scan)
    double entropy = 0.0;                // 0.0 .. 8.0 бит/байт
    std::string content_sample;          // ограниченный префикс (или содержимое контейнера)
    bool hidden = false;                 // имя начинается с '.'
    std::filesystem::perms permissions = std::filesystem::perms::none;
    std::chrono::system_clock::time_point created_at;  // момент создания записи, не mtime файла
};

struct ExtractOptions {
    bool legacy_digests = false;          // считать MD5 дополнительно к SHA-256
    size_t sample_bytes = DEFAULT_SAMPLE_BYTES;
    bool expand_containers = true;        // подменять sample содержимым ZIP-контейнера
};

// Shannon entropy over a byte histogram, bits per byte. 0 for length 0.
double shannon_entropy(const std::array<std::uint64_t, 256>& histogram, std::uint64_t length);
double shannon_entropy(const char* data, size_t size);

std::string normalized_extension(const std::filesystem::path& path);

// Единственное место в проекте, где считаются хэши.
// Метод виртуальный — тесты подменяют извлечение для отдельных путей.
class EvidenceExtractor {
public:
    static constexpr size_t CHUNK_SIZE = 4096;

    virtual ~EvidenceExtractor() = default;

    // Либо полностью заполненный Evidence, либо исключение:
    // IOError (файл не читается) или TimeoutError (deadline прошёл).
    virtual Evidence extract(const std::filesystem::path& path,
                             const ExtractOptions& options,
                             std::chrono::steady_clock::time_point deadline) const;

    // Содержимое ZIP-контейнера (имена и распакованные данные записей).
    // nullopt — файл не контейнер или не открылся.
    static std::optional<std::string> expand_container(const std::filesystem::path& path,
                                                       size_t limit);
};
