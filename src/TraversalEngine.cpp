#include "TraversalEngine.h"
#include "ScanErrors.h"
#include "Logger.h"
#include <algorithm>
#include <future>
#include <chrono>

namespace fs = std::filesystem;

namespace {
    // How long the producer waits on a full queue before re-checking cancellation
    constexpr auto PUSH_POLL = std::chrono::milliseconds(50);
}

TraversalEngine::TraversalEngine(const ScanPolicy& policy,
                                 const DetectorSet& detectors,
                                 const EvidenceExtractor& extractor,
                                 const CancellationToken& token)
    : m_policy(policy), m_detectors(detectors), m_extractor(extractor), m_token(token) {}

ScanResult TraversalEngine::run() {
    const unsigned int workers = std::max(1u, m_policy.effective_workers());
    Logger::info("Scan started: policy=" + m_policy.name
                 + ", roots=" + std::to_string(m_policy.root_paths.size())
                 + ", max_depth=" + std::to_string(m_policy.max_depth)
                 + ", workers=" + std::to_string(workers));

    WorkQueue queue(m_policy.queue_capacity);
    std::vector<std::future<std::vector<Verdict>>> futures;

    // Closes the queue on every exit path so that the futures can join
    struct QueueCloser {
        WorkQueue& queue;
        ~QueueCloser() { queue.close(); }
    } closer{ queue };

    for (unsigned int t = 0; t < workers; ++t) {
        futures.push_back(std::async(std::launch::async, &TraversalEngine::worker_loop, this, std::ref(queue)));
    }

    for (const auto& root : m_policy.root_paths) {
        if (m_token.is_cancelled()) break;
        walk_root(root, queue);
    }

    queue.close();
    if (m_token.is_cancelled()) queue.clear();

    ScanResult result;
    result.policy_name = m_policy.name;
    for (auto& f : futures) {
        auto part = f.get();
        result.verdicts.insert(result.verdicts.end(),
                               std::make_move_iterator(part.begin()),
                               std::make_move_iterator(part.end()));
    }
    std::sort(result.verdicts.begin(), result.verdicts.end(),
              [](const Verdict& a, const Verdict& b) { return a.path < b.path; });

    result.statistics = m_stats.snapshot();
    result.status = m_token.is_cancelled() ? ScanStatus::CANCELLED : ScanStatus::COMPLETED;

    const auto& s = result.statistics;
    Logger::info("Scan " + std::string(to_string(result.status)) + ": policy=" + m_policy.name
                 + ", files=" + std::to_string(s.files_scanned)
                 + ", suspicious=" + std::to_string(s.suspicious_count)
                 + ", malicious=" + std::to_string(s.malicious_count)
                 + ", errors=" + std::to_string(s.error_count)
                 + ", time=" + std::to_string(s.elapsed_seconds()) + "s");
    return result;
}

// ============================================================================
// Producer
// ============================================================================

void TraversalEngine::walk_root(const fs::path& root, WorkQueue& queue) {
    std::error_code ec;
    fs::file_status st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        Logger::warn("Root not found, skipping: " + root.string());
        return;
    }
    if (fs::is_regular_file(st)) {
        offer_file(root, true, queue);
        return;
    }
    if (!fs::is_directory(st)) {
        skip(root, SkipReason::SPECIAL_FILE);
        return;
    }

    struct Pending {
        fs::path dir;
        int depth;
    };
    std::vector<Pending> stack{ { root, 0 } };

    while (!stack.empty()) {
        if (m_token.is_cancelled()) return;
        Pending current = std::move(stack.back());
        stack.pop_back();

        std::vector<fs::directory_entry> entries;
        if (!list_directory(current.dir, entries)) continue;

        std::vector<fs::path> subdirs;
        for (const auto& entry : entries) {
            if (m_token.is_cancelled()) return;
            const fs::path& p = entry.path();

            fs::file_status lst = entry.symlink_status(ec);
            if (ec) {
                skip(p, SkipReason::IO_ERROR, ec.message());
                continue;
            }

            if (fs::is_symlink(lst)) {
                // Каталоги по ссылкам не обходим никогда
                if (!m_policy.follow_symlinks) {
                    skip(p, SkipReason::SYMLINK);
                    continue;
                }
                fs::file_status target = fs::status(p, ec);
                if (ec || !fs::is_regular_file(target)) {
                    skip(p, SkipReason::SYMLINK);
                    continue;
                }
                if (!offer_file(p, false, queue)) return;
            }
            else if (fs::is_directory(lst)) {
                if (current.depth + 1 > m_policy.max_depth) {
                    skip(p, SkipReason::DEPTH_LIMIT);
                    continue;
                }
                subdirs.push_back(p);
            }
            else if (fs::is_regular_file(lst)) {
                if (!offer_file(p, false, queue)) return;
            }
            else {
                // FIFO, socket, device — не открываем
                skip(p, SkipReason::SPECIAL_FILE);
            }
        }

        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
            stack.push_back({ *it, current.depth + 1 });
        }
    }
}

bool TraversalEngine::list_directory(const fs::path& dir, std::vector<fs::directory_entry>& out) {
    const auto deadline = std::chrono::steady_clock::now() + m_policy.file_timeout;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        skip(dir, SkipReason::IO_ERROR, ec.message());
        return false;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (std::chrono::steady_clock::now() > deadline) {
            skip(dir, SkipReason::TIMEOUT, "directory listing exceeded "
                 + std::to_string(m_policy.file_timeout.count()) + " ms");
            return false;
        }
        out.push_back(*it);
    }
    if (ec) {
        skip(dir, SkipReason::IO_ERROR, ec.message());
        return false;
    }
    std::sort(out.begin(), out.end());
    return true;
}

bool TraversalEngine::offer_file(const fs::path& path, bool explicit_root, WorkQueue& queue) {
    // Явно указанный файл проверяется при любом расширении
    if (!explicit_root && !m_policy.target_extensions.accepts(normalized_extension(path))) {
        skip(path, SkipReason::EXTENSION_FILTER);
        return true;
    }

    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        skip(path, SkipReason::IO_ERROR, ec.message());
        return true;
    }
    if (size > m_policy.max_file_size_bytes) {
        skip(path, SkipReason::SIZE_LIMIT, std::to_string(size) + " bytes");
        return true;
    }
    return enqueue({ path, size }, queue);
}

bool TraversalEngine::enqueue(WorkItem item, WorkQueue& queue) {
    while (!m_token.is_cancelled()) {
        if (queue.push_for(item, PUSH_POLL)) return true;
        if (queue.closed()) return false;
    }
    return false;
}

void TraversalEngine::skip(const fs::path& path, SkipReason reason, const std::string& detail) {
    m_stats.record_skip(reason);

    std::string msg = std::string("Skipped (") + to_string(reason) + "): " + path.string();
    if (!detail.empty()) msg += " - " + detail;

    switch (reason) {
        case SkipReason::IO_ERROR:
        case SkipReason::TIMEOUT:
            Logger::warn(msg);
            break;
        case SkipReason::EXTENSION_FILTER:
            break;
        case SkipReason::SYMLINK:
        case SkipReason::DEPTH_LIMIT:
        case SkipReason::SIZE_LIMIT:
        case SkipReason::SPECIAL_FILE:
            Logger::info(msg);
            break;
    }
}

// ============================================================================
// Workers
// ============================================================================

std::vector<Verdict> TraversalEngine::worker_loop(WorkQueue& queue) {
    std::vector<Verdict> local;
    while (auto item = queue.pop()) {
        if (m_token.is_cancelled()) break;
        evaluate_file(*item, local);
    }
    return local;
}

void TraversalEngine::evaluate_file(const WorkItem& item, std::vector<Verdict>& out) {
    const auto deadline = std::chrono::steady_clock::now() + m_policy.file_timeout;

    Evidence evidence;
    try {
        evidence = m_extractor.extract(item.path, m_policy.extract_options(), deadline);
    }
    catch (const TimeoutError& e) {
        skip(item.path, SkipReason::TIMEOUT, e.what());
        return;
    }
    catch (const IOError& e) {
        skip(item.path, SkipReason::IO_ERROR, e.what());
        return;
    }
    catch (const std::exception& e) {
        skip(item.path, SkipReason::IO_ERROR, e.what());
        return;
    }

    std::vector<Finding> findings;
    for (const auto& detector : m_detectors) {
        if (!detector) continue;
        auto part = evaluate_isolated(*detector, evidence, m_policy);
        findings.insert(findings.end(), part.begin(), part.end());
    }

    Verdict verdict = aggregate(evidence, std::move(findings));
    if (verdict.classification == Classification::MALICIOUS) {
        m_stats.record_malicious();
    } else if (verdict.classification == Classification::SUSPICIOUS) {
        m_stats.record_suspicious();
    }
    if (verdict.classification != Classification::CLEAN) {
        Logger::info(std::string("Threat: ") + to_string(verdict.classification) + " "
                     + item.path.string() + " (risk " + std::to_string(verdict.risk_score) + ")");
    }

    std::uint64_t scanned = m_stats.record_scanned(evidence.size_bytes);
    out.push_back(std::move(verdict));
    report_progress(scanned, item.path);
}

void TraversalEngine::report_progress(std::uint64_t scanned, const fs::path& path) {
    if (!m_progress || m_policy.progress_interval == 0) return;
    if (scanned % m_policy.progress_interval != 0) return;

    std::lock_guard<std::mutex> lock(m_progress_mutex);
    try {
        m_progress(scanned, path);
    } catch (const std::exception& e) {
        Logger::error("Progress callback failed: " + std::string(e.what()));
    }
}
