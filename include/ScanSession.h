#pragma once
// ScanSession.h — одна сессия сканирования (quick / deep / custom)
//
// Пример:
//   auto session = ScanSession::custom("/home/user/Downloads", config);
//   session.set_progress_callback([](uint64_t n, const fs::path& p) { ... });
//   ScanResult result = session.run();   // cancel() можно звать из другого потока
//
// Сессия владеет политикой, делит детекторы и базу сигнатур (read-only).

#include <memory>
#include <filesystem>
#include "ScanConfig.h"
#include "ScanPolicy.h"
#include "Detector.h"
#include "TraversalEngine.h"

class ScanSession {
public:
    ScanSession(ScanPolicy policy,
                DetectorSet detectors,
                std::shared_ptr<const EvidenceExtractor> extractor = nullptr);

    void set_progress_callback(ProgressCallback callback) { m_progress = std::move(callback); }

    // Потокобезопасно; run() вернёт результат со статусом CANCELLED
    void cancel() { m_token->cancel(); }
    bool cancelled() const { return m_token->is_cancelled(); }

    const ScanPolicy& policy() const { return m_policy; }
    const DetectorSet& detectors() const { return m_detectors; }

    ScanResult run();

    static ScanSession quick(const ScanConfig& config);
    static ScanSession deep(const ScanConfig& config);
    // PathNotFound, если path не существует
    static ScanSession custom(const std::filesystem::path& path, const ScanConfig& config);

private:
    ScanPolicy m_policy;
    DetectorSet m_detectors;
    std::shared_ptr<const EvidenceExtractor> m_extractor;
    std::shared_ptr<CancellationToken> m_token;
    ProgressCallback m_progress;
};

ScanResult run_quick_scan(const ScanConfig& config = ScanConfig::defaults());
ScanResult run_deep_scan(const ScanConfig& config = ScanConfig::defaults());
ScanResult run_custom_scan(const std::filesystem::path& path, const ScanConfig& config = ScanConfig::defaults());
