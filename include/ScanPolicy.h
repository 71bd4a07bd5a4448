#pragma once
// ScanPolicy.h — какие пути, расширения и глубину сканирует сессия
//
// Quick / Deep / Custom — это три конфигурации одного и того же движка,
// а не три разных пути в коде. Политика не меняется во время сессии.
//
//            roots                               depth  md5
// Quick      /tmp, /var/tmp, ~/Downloads, ...    2      нет
// Deep       /usr/bin, /usr/local/bin, /opt, ... 5      да
// Custom     один путь от пользователя           10     нет

#include <set>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include "ScanConfig.h"

// Фильтр расширений: либо "all", либо allow-list (lower-case, с точкой)
struct ExtensionFilter {
    bool all = false;
    std::set<std::string> extensions;

    bool accepts(const std::string& ext) const { return all || extensions.count(ext) > 0; }

    static ExtensionFilter any() { return ExtensionFilter{ true, {} }; }
    static ExtensionFilter of(std::set<std::string> exts) { return ExtensionFilter{ false, std::move(exts) }; }
};

// Исполняемые файлы, скрипты, Java, офис с макросами, инсталляторы
const std::set<std::string>& default_target_extensions();

struct ScanPolicy {
    std::string name = "custom";
    std::vector<std::filesystem::path> root_paths;
    int max_depth = 10;
    ExtensionFilter target_extensions = ExtensionFilter::of(default_target_extensions());
    std::uintmax_t max_file_size_bytes = DEFAULT_MAX_FILESIZE_MB * 1024 * 1024;
    bool follow_symlinks = false;   // даже с true симлинки на каталоги не обходятся
    bool legacy_digests = false;    // MD5 для старых сигнатур
    size_t content_sample_bytes = DEFAULT_SAMPLE_BYTES;

    unsigned int worker_count = 0;  // 0 = число ядер
    size_t queue_capacity = 256;
    std::chrono::milliseconds file_timeout{30000};
    size_t progress_interval = 100; // колбэк прогресса раз в N файлов

    unsigned int effective_workers() const;
    ExtractOptions extract_options() const;

    static ScanPolicy quick(const ScanConfig& config);
    static ScanPolicy deep(const ScanConfig& config);
    static ScanPolicy custom(const std::filesystem::path& root, const ScanConfig& config);
};
