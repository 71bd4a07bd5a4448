#pragma once
// ScanStatistics.h — счётчики сессии, отмена
//
// StatisticsAccumulator — единственное разделяемое изменяемое состояние
// между продюсером и воркерами, поэтому только атомики.
// ScanStatistics — снимок, который получает вызывающий код.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

enum class ScanStatus { COMPLETED, CANCELLED };

inline const char* to_string(ScanStatus s) {
    switch (s) {
        case ScanStatus::COMPLETED: return "completed";
        case ScanStatus::CANCELLED: return "cancelled";
    }
    return "completed";
}

// Почему путь не был проверен
enum class SkipReason { SYMLINK, DEPTH_LIMIT, EXTENSION_FILTER, SIZE_LIMIT, IO_ERROR, TIMEOUT, SPECIAL_FILE };

inline const char* to_string(SkipReason r) {
    switch (r) {
        case SkipReason::SYMLINK:          return "symlink";
        case SkipReason::DEPTH_LIMIT:      return "depth-limit";
        case SkipReason::EXTENSION_FILTER: return "extension-filter";
        case SkipReason::SIZE_LIMIT:       return "size-limit";
        case SkipReason::IO_ERROR:         return "io-error";
        case SkipReason::TIMEOUT:          return "timeout";
        case SkipReason::SPECIAL_FILE:     return "special-file";
    }
    return "io-error";
}

struct ScanStatistics {
    std::uint64_t files_scanned = 0;      // файлы, дошедшие до вердикта
    std::uint64_t suspicious_count = 0;
    std::uint64_t malicious_count = 0;
    std::uint64_t error_count = 0;        // io-error + timeout
    std::uint64_t timeout_count = 0;
    std::uint64_t bytes_scanned = 0;

    std::uint64_t skipped_symlink = 0;
    std::uint64_t skipped_depth = 0;
    std::uint64_t skipped_extension = 0;
    std::uint64_t skipped_size = 0;
    std::uint64_t skipped_special = 0;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    double elapsed_seconds() const {
        return std::chrono::duration<double>(finished_at - started_at).count();
    }
};

class StatisticsAccumulator {
public:
    StatisticsAccumulator() : m_started_at(std::chrono::system_clock::now()) {}

    // Returns files_scanned after the increment.
    std::uint64_t record_scanned(std::uint64_t bytes) {
        m_bytes_scanned.fetch_add(bytes, std::memory_order_relaxed);
        return m_files_scanned.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    void record_suspicious() { m_suspicious.fetch_add(1, std::memory_order_relaxed); }
    void record_malicious()  { m_malicious.fetch_add(1, std::memory_order_relaxed); }

    void record_skip(SkipReason reason) {
        switch (reason) {
            case SkipReason::SYMLINK:          ++m_skipped_symlink; break;
            case SkipReason::DEPTH_LIMIT:      ++m_skipped_depth; break;
            case SkipReason::EXTENSION_FILTER: ++m_skipped_extension; break;
            case SkipReason::SIZE_LIMIT:       ++m_skipped_size; break;
            case SkipReason::SPECIAL_FILE:     ++m_skipped_special; break;
            case SkipReason::TIMEOUT:          ++m_timeouts; ++m_errors; break;
            case SkipReason::IO_ERROR:         ++m_errors; break;
        }
    }

    std::uint64_t files_scanned() const { return m_files_scanned.load(); }

    ScanStatistics snapshot() const {
        ScanStatistics s;
        s.files_scanned = m_files_scanned.load();
        s.suspicious_count = m_suspicious.load();
        s.malicious_count = m_malicious.load();
        s.error_count = m_errors.load();
        s.timeout_count = m_timeouts.load();
        s.bytes_scanned = m_bytes_scanned.load();
        s.skipped_symlink = m_skipped_symlink.load();
        s.skipped_depth = m_skipped_depth.load();
        s.skipped_extension = m_skipped_extension.load();
        s.skipped_size = m_skipped_size.load();
        s.skipped_special = m_skipped_special.load();
        s.started_at = m_started_at;
        s.finished_at = std::chrono::system_clock::now();
        return s;
    }

private:
    std::chrono::system_clock::time_point m_started_at;

    std::atomic<std::uint64_t> m_files_scanned{0};
    std::atomic<std::uint64_t> m_suspicious{0};
    std::atomic<std::uint64_t> m_malicious{0};
    std::atomic<std::uint64_t> m_errors{0};
    std::atomic<std::uint64_t> m_timeouts{0};
    std::atomic<std::uint64_t> m_bytes_scanned{0};
    std::atomic<std::uint64_t> m_skipped_symlink{0};
    std::atomic<std::uint64_t> m_skipped_depth{0};
    std::atomic<std::uint64_t> m_skipped_extension{0};
    std::atomic<std::uint64_t> m_skipped_size{0};
    std::atomic<std::uint64_t> m_skipped_special{0};
};

// Кооперативная отмена: продюсер и воркеры проверяют флаг между файлами
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool is_cancelled() const { return m_cancelled.load(); }
private:
    std::atomic<bool> m_cancelled{false};
};
