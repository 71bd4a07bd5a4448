#include "ScanSession.h"
#include "ScanErrors.h"
#include "Logger.h"

namespace fs = std::filesystem;

ScanSession::ScanSession(ScanPolicy policy,
                         DetectorSet detectors,
                         std::shared_ptr<const EvidenceExtractor> extractor)
    : m_policy(std::move(policy)),
      m_detectors(std::move(detectors)),
      m_extractor(extractor ? std::move(extractor) : std::make_shared<const EvidenceExtractor>()),
      m_token(std::make_shared<CancellationToken>()) {}

ScanResult ScanSession::run() {
    TraversalEngine engine(m_policy, m_detectors, *m_extractor, *m_token);
    engine.set_progress_callback(m_progress);
    return engine.run();
}

ScanSession ScanSession::quick(const ScanConfig& config) {
    return ScanSession(ScanPolicy::quick(config), make_detectors(config));
}

ScanSession ScanSession::deep(const ScanConfig& config) {
    return ScanSession(ScanPolicy::deep(config), make_detectors(config));
}

ScanSession ScanSession::custom(const fs::path& path, const ScanConfig& config) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        Logger::error("Custom scan path not found: " + path.string());
        throw PathNotFound(path.string());
    }
    return ScanSession(ScanPolicy::custom(path, config), make_detectors(config));
}

ScanResult run_quick_scan(const ScanConfig& config) {
    return ScanSession::quick(config).run();
}

ScanResult run_deep_scan(const ScanConfig& config) {
    return ScanSession::deep(config).run();
}

ScanResult run_custom_scan(const fs::path& path, const ScanConfig& config) {
    return ScanSession::custom(path, config).run();
}
