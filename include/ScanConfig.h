#pragma once
// ScanConfig.h — настройки движка, общие для всех типов скана
//
// Заполняется ConfigLoader из sentinel.json, либо берутся встроенные значения.
// Из ScanConfig строятся ScanPolicy (quick/deep/custom) и набор детекторов.

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include "PatternEngine.h"
#include "SignatureStore.h"
#include "Evidence.h"

constexpr std::uintmax_t DEFAULT_MAX_FILESIZE_MB = 100;

struct ScanConfig {
    EngineType engine = EngineType::HYPERSCAN;
    unsigned int threads = 0;                     // 0 = std::thread::hardware_concurrency()
    std::uintmax_t max_file_size_bytes = DEFAULT_MAX_FILESIZE_MB * 1024 * 1024;
    std::chrono::milliseconds file_timeout{30000};
    size_t content_sample_bytes = DEFAULT_SAMPLE_BYTES;

    std::vector<PatternRule> heuristic_rules;
    std::vector<std::string> suspicious_names;    // denylist для AI-модели
    std::shared_ptr<const SignatureStore> signatures;

    // Пусто — используются встроенные пути
    std::vector<std::filesystem::path> quick_paths;
    std::vector<std::filesystem::path> deep_paths;

    static ScanConfig defaults();
};

std::vector<PatternRule> default_heuristic_rules();
std::vector<std::string> default_suspicious_names();
