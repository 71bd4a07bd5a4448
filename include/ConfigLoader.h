#pragma once
// ConfigLoader.h — чтение sentinel.json
//
// Формат (все ключи необязательны):
// {
//   "engine": "hs",                      // hs | re2 | boost
//   "threads": 0,                        // 0 = число ядер
//   "max_filesize_mb": 100,
//   "file_timeout_ms": 30000,
//   "content_sample_kb": 256,
//   "signatures": [ { "digest": "44d8...", "name": "Trojan.Generic" } ],
//   "heuristic_rules": [ { "name": "...", "pattern": "...", "weight": 3, "category": "trojan" } ],
//   "suspicious_names": [ "keygen", "crack" ],
//   "quick_paths": [ "/tmp" ],
//   "deep_paths": [ "/usr/bin" ]
// }
//
// Конфиг никогда не роняет сканер: любая проблема — предупреждение в лог
// и встроенные значения (для всего файла или для одной секции).

#include <vector>
#include <string>
#include <set>
#include <fstream>
#include <cctype>
#include <nlohmann/json.hpp>
#include "ScanConfig.h"
#include "Logger.h"

class ConfigLoader {
public:
    static ScanConfig load(const std::string& filepath) {
        ScanConfig config = ScanConfig::defaults();
        std::ifstream f(filepath);

        if (!f.is_open()) {
            warn("Could not open " + filepath + ", using built-in defaults");
            return config;
        }

        try {
            nlohmann::json j;
            f >> j;

            if (!j.is_object()) {
                warn("Root must be an object {}, using built-in defaults");
                return config;
            }

            ScanConfig loaded = ScanConfig::defaults();
            load_settings(j, loaded);
            if (j.contains("signatures")) load_signatures(j["signatures"], loaded);
            if (j.contains("heuristic_rules")) load_rules(j["heuristic_rules"], loaded);
            if (j.contains("suspicious_names")) load_names(j["suspicious_names"], loaded);
            if (j.contains("quick_paths")) loaded.quick_paths = load_paths(j["quick_paths"]);
            if (j.contains("deep_paths")) loaded.deep_paths = load_paths(j["deep_paths"]);
            config = std::move(loaded);
        }
        catch (const std::exception& e) {
            warn(std::string("JSON Error: ") + e.what() + ", using built-in defaults");
            return ScanConfig::defaults();
        }

        Logger::info("[ConfigLoader] " + filepath + ": " + std::to_string(config.signatures->size())
                     + " signatures, " + std::to_string(config.heuristic_rules.size()) + " rules");
        return config;
    }

private:
    static void warn(const std::string& msg) {
        Logger::warn("[ConfigLoader] Warning: " + msg);
    }

    static void load_settings(const nlohmann::json& j, ScanConfig& config) {
        if (j.contains("engine")) {
            std::string e = j["engine"].get<std::string>();
            if (!parse_engine(e, config.engine)) {
                warn("unknown engine '" + e + "', using " + to_string(config.engine));
            }
        }
        if (j.contains("threads")) {
            int n = j["threads"].get<int>();
            if (n < 0) warn("'threads' must be >= 0, ignored");
            else config.threads = static_cast<unsigned int>(n);
        }
        if (j.contains("max_filesize_mb")) {
            long long mb = j["max_filesize_mb"].get<long long>();
            if (mb <= 0) warn("'max_filesize_mb' must be > 0, ignored");
            else config.max_file_size_bytes = static_cast<std::uintmax_t>(mb) * 1024 * 1024;
        }
        if (j.contains("file_timeout_ms")) {
            long long ms = j["file_timeout_ms"].get<long long>();
            if (ms <= 0) warn("'file_timeout_ms' must be > 0, ignored");
            else config.file_timeout = std::chrono::milliseconds(ms);
        }
        if (j.contains("content_sample_kb")) {
            long long kb = j["content_sample_kb"].get<long long>();
            if (kb <= 0) warn("'content_sample_kb' must be > 0, ignored");
            else config.content_sample_bytes = static_cast<size_t>(kb) * 1024;
        }
    }

    static void load_signatures(const nlohmann::json& arr, ScanConfig& config) {
        if (!arr.is_array()) {
            warn("'signatures' must be an array, using built-in signatures");
            return;
        }
        auto store = std::make_shared<SignatureStore>();
        std::set<std::string> seen;

        for (size_t idx = 0; idx < arr.size(); ++idx) {
            const auto& item = arr[idx];
            if (!item.is_object() || !item.contains("digest") || !item.contains("name")) {
                warn("signature #" + std::to_string(idx) + " needs 'digest' and 'name', skipped");
                continue;
            }
            std::string digest = item["digest"].get<std::string>();
            std::string name = item["name"].get<std::string>();

            if (!validate_digest(digest, name)) continue;
            if (!seen.insert(to_lower(digest)).second) {
                warn("duplicate digest " + digest + " ('" + name + "'), last entry wins");
            }
            store->add(digest, name);
        }

        if (store->empty()) {
            warn("no valid signatures, using built-in signatures");
            return;
        }
        config.signatures = std::move(store);
    }

    static void load_rules(const nlohmann::json& arr, ScanConfig& config) {
        if (!arr.is_array()) {
            warn("'heuristic_rules' must be an array, using built-in rules");
            return;
        }
        std::vector<PatternRule> rules;

        for (size_t idx = 0; idx < arr.size(); ++idx) {
            const auto& item = arr[idx];
            if (!item.is_object() || !item.contains("pattern")) {
                warn("rule #" + std::to_string(idx) + " has no 'pattern', skipped");
                continue;
            }
            PatternRule rule;
            rule.pattern = item["pattern"].get<std::string>();
            rule.name = item.value("name", rule.pattern);
            if (rule.pattern.empty()) {
                warn("rule '" + rule.name + "' has an empty pattern, skipped");
                continue;
            }

            rule.weight = item.value("weight", 1);
            if (rule.weight < 1) {
                warn("rule '" + rule.name + "' weight " + std::to_string(rule.weight) + " < 1, set to 1");
                rule.weight = 1;
            }

            if (item.contains("category")) {
                std::string cat = item["category"].get<std::string>();
                if (!parse_category(cat, rule.category)) {
                    warn("rule '" + rule.name + "' has unknown category '" + cat + "', skipped");
                    continue;
                }
            }
            rules.push_back(rule);
        }

        std::set<std::string> names;
        for (const auto& r : rules) {
            if (!names.insert(r.name).second) {
                warn("duplicate rule name '" + r.name + "'");
            }
        }

        if (rules.empty()) {
            warn("no valid heuristic rules, using built-in rules");
            return;
        }
        config.heuristic_rules = std::move(rules);
    }

    static void load_names(const nlohmann::json& arr, ScanConfig& config) {
        if (!arr.is_array()) {
            warn("'suspicious_names' must be an array, using built-in list");
            return;
        }
        std::vector<std::string> names;
        for (const auto& n : arr) {
            std::string s = n.get<std::string>();
            if (!s.empty()) names.push_back(to_lower(s));
        }
        config.suspicious_names = std::move(names);
    }

    static std::vector<std::filesystem::path> load_paths(const nlohmann::json& arr) {
        std::vector<std::filesystem::path> paths;
        if (!arr.is_array()) {
            warn("path list must be an array, using built-in roots");
            return paths;
        }
        for (const auto& p : arr) paths.emplace_back(p.get<std::string>());
        return paths;
    }

    static bool validate_digest(const std::string& digest, const std::string& sig_name) {
        if (digest.length() != 32 && digest.length() != 64) {
            warn("'" + sig_name + "' digest has length " + std::to_string(digest.length())
                 + " (expected 32 or 64), skipped");
            return false;
        }
        for (size_t i = 0; i < digest.length(); ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(digest[i]))) {
                warn("'" + sig_name + "' digest has non-hex char at pos " + std::to_string(i) + ", skipped");
                return false;
            }
        }
        return true;
    }
};
