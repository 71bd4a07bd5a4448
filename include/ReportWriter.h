#pragma once
#include <string>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <nlohmann/json.hpp>
#include "TraversalEngine.h"
#include "Logger.h"

class ReportWriter {
public:
    static bool write_json(const std::string& path,
                           const ScanResult& result,
                           const std::string& target,
                           const std::string& engine_name)
    {
        const auto& s = result.statistics;
        nlohmann::json j;
        j["scan_target"] = target;
        j["policy"] = result.policy_name;
        j["engine"] = engine_name;
        j["status"] = to_string(result.status);
        j["started_at"] = format_time(s.started_at);
        j["finished_at"] = format_time(s.finished_at);

        nlohmann::json stats;
        stats["files_scanned"] = s.files_scanned;
        stats["suspicious"] = s.suspicious_count;
        stats["malicious"] = s.malicious_count;
        stats["errors"] = s.error_count;
        stats["timeouts"] = s.timeout_count;
        stats["bytes_scanned"] = s.bytes_scanned;
        stats["skipped"] = {
            { "symlink", s.skipped_symlink },
            { "depth-limit", s.skipped_depth },
            { "extension-filter", s.skipped_extension },
            { "size-limit", s.skipped_size },
            { "special-file", s.skipped_special },
        };
        stats["elapsed_seconds"] = s.elapsed_seconds();
        j["statistics"] = stats;

        nlohmann::json verdicts = nlohmann::json::array();
        for (const auto& v : result.verdicts) {
            nlohmann::json jv;
            jv["path"] = v.path.string();
            jv["sha256"] = v.digest;
            jv["risk_score"] = v.risk_score;
            jv["classification"] = to_string(v.classification);
            nlohmann::json findings = nlohmann::json::array();
            for (const auto& f : v.findings) {
                findings.push_back({
                    { "method", to_string(f.method) },
                    { "category", to_string(f.category) },
                    { "severity", f.severity },
                    { "rationale", f.rationale },
                });
            }
            jv["findings"] = findings;
            verdicts.push_back(jv);
        }
        j["verdicts"] = verdicts;

        // Linux file names are arbitrary bytes; invalid UTF-8 is written as U+FFFD
        std::string text;
        try {
            text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        catch (const std::exception& e) {
            Logger::error("[ReportWriter] JSON serialization failed: " + std::string(e.what()));
            return false;
        }

        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) return false;
        f << text << "\n";
        return f.good();
    }

    static bool write_txt(const std::string& path,
                          const ScanResult& result,
                          const std::string& target,
                          const std::string& engine_name)
    {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) return false;

        const auto& s = result.statistics;
        f << "--- РЕЗУЛЬТАТЫ СКАНИРОВАНИЯ ---\n";
        f << "Цель:    " << target << "\n";
        f << "Режим:   " << result.policy_name << "\n";
        f << "Движок:  " << engine_name << "\n";
        f << "Статус:  " << to_string(result.status) << "\n";
        f << "Начало:  " << format_time(s.started_at) << "\n";
        f << "-------------------------------\n";
        f << std::left << std::setw(12) << "Вердикт" << " | " << std::setw(5) << "Риск" << " | " << "Файл\n";
        f << "-------------------------------\n";

        size_t notes = 0;
        for (const auto& v : result.verdicts) {
            if (v.has_notes()) ++notes;
            if (v.classification == Classification::CLEAN) continue;
            f << std::left << std::setw(12) << to_string(v.classification) << " | "
              << std::setw(5) << v.risk_score << " | " << v.path.string() << "\n";
            for (const auto& fd : v.findings) {
                f << "    [" << to_string(fd.method) << "/" << to_string(fd.category)
                  << " " << fd.severity << "] " << fd.rationale << "\n";
            }
        }
        f << "-------------------------------\n";
        f << "Файлов проверено:   " << s.files_scanned << "\n";
        f << "Подозрительных:     " << s.suspicious_count << "\n";
        f << "Вредоносных:        " << s.malicious_count << "\n";
        f << "Чистых с заметками: " << notes << "\n";
        f << "Ошибок:             " << s.error_count << " (таймаутов: " << s.timeout_count << ")\n";
        f << "Пропущено:          symlink " << s.skipped_symlink
          << ", depth " << s.skipped_depth
          << ", extension " << s.skipped_extension
          << ", size " << s.skipped_size
          << ", special " << s.skipped_special << "\n";
        f << "Время:              " << std::fixed << std::setprecision(2) << s.elapsed_seconds() << "s\n";
        return true;
    }

private:
    static std::string format_time(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
};
