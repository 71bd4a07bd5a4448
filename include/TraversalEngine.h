#pragma once
// TraversalEngine.h — обход дерева и пул воркеров одной сессии
//
// Поток выполнения:
//   вызывающий поток (продюсер)       воркеры (std::async × N)
//   ─────────────────────────────     ────────────────────────────────
//   обход каталогов (стек)            pop() → extract → detect → aggregate
//   фильтры: symlink, depth,   push   ──────────────────────────────────►
//   extension, size, special  ─────►  вердикты копятся локально в каждом
//                                     воркере и сливаются при join
//
// Очередь ограничена (policy.queue_capacity): продюсер не уходит далеко
// вперёд воркеров. Все потоки завершаются до возврата из run().

#include <string>
#include <vector>
#include <mutex>
#include <memory>
#include <functional>
#include <filesystem>
#include "Detector.h"
#include "ScanPolicy.h"
#include "ScoreAggregator.h"
#include "ScanStatistics.h"
#include "BoundedQueue.h"

struct ScanResult {
    std::string policy_name;
    std::vector<Verdict> verdicts;     // отсортированы по пути
    ScanStatistics statistics;
    ScanStatus status = ScanStatus::COMPLETED;
};

// (files_scanned_so_far, current_path)
using ProgressCallback = std::function<void(std::uint64_t, const std::filesystem::path&)>;

class TraversalEngine {
public:
    TraversalEngine(const ScanPolicy& policy,
                    const DetectorSet& detectors,
                    const EvidenceExtractor& extractor,
                    const CancellationToken& token);

    void set_progress_callback(ProgressCallback callback) { m_progress = std::move(callback); }

    ScanResult run();

private:
    struct WorkItem {
        std::filesystem::path path;
        std::uintmax_t size = 0;
    };
    using WorkQueue = BoundedQueue<WorkItem>;

    const ScanPolicy& m_policy;
    const DetectorSet& m_detectors;
    const EvidenceExtractor& m_extractor;
    const CancellationToken& m_token;
    ProgressCallback m_progress;
    std::mutex m_progress_mutex;
    StatisticsAccumulator m_stats;

    // Producer side
    void walk_root(const std::filesystem::path& root, WorkQueue& queue);
    bool list_directory(const std::filesystem::path& dir, std::vector<std::filesystem::directory_entry>& out);
    bool offer_file(const std::filesystem::path& path, bool explicit_root, WorkQueue& queue);
    bool enqueue(WorkItem item, WorkQueue& queue);
    void skip(const std::filesystem::path& path, SkipReason reason, const std::string& detail = "");

    // Worker side
    std::vector<Verdict> worker_loop(WorkQueue& queue);
    void evaluate_file(const WorkItem& item, std::vector<Verdict>& out);
    void report_progress(std::uint64_t scanned, const std::filesystem::path& path);
};
