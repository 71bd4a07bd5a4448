#include "Detector.h"
#include "ScanConfig.h"
#include "ScanPolicy.h"
#include "ScanErrors.h"
#include "Logger.h"
#include <sstream>
#include <iomanip>

std::vector<Finding> evaluate_isolated(const Detector& detector, const Evidence& evidence,
                                       const ScanPolicy& policy) {
    try {
        return detector.evaluate(evidence, policy);
    } catch (const std::exception& e) {
        DetectorError err(detector.name() + " failed on " + evidence.path.string() + ": " + e.what());
        Logger::error(err.what());
    }
    return {};
}

DetectorSet make_detectors(const ScanConfig& config) {
    auto signatures = config.signatures
        ? config.signatures
        : std::make_shared<const SignatureStore>(SignatureStore::builtin());
    auto names = config.suspicious_names.empty() ? default_suspicious_names() : config.suspicious_names;

    DetectorSet detectors;
    detectors.push_back(std::make_shared<SignatureDetector>(signatures));
    detectors.push_back(std::make_shared<HeuristicDetector>(config.heuristic_rules, config.engine));
    detectors.push_back(std::make_shared<BehavioralDetector>());
    detectors.push_back(std::make_shared<AiModelDetector>(
        std::make_unique<HeuristicThreatModel>(std::move(names))));
    return detectors;
}

// ============================================================================
// Signature
// ============================================================================

SignatureDetector::SignatureDetector(std::shared_ptr<const SignatureStore> store)
    : m_store(std::move(store)) {}

std::vector<Finding> SignatureDetector::evaluate(const Evidence& evidence, const ScanPolicy&) const {
    if (!m_store) return {};

    auto threat = m_store->lookup(evidence.sha256);
    if (!threat && evidence.md5) threat = m_store->lookup(*evidence.md5);
    if (!threat) return {};

    Finding f;
    f.method = DetectionMethod::SIGNATURE;
    f.category = category_from_threat_name(*threat);
    f.severity = 10;
    f.rationale = "Known signature: " + *threat;
    return { f };
}

// ============================================================================
// Behavioral
// ============================================================================

const std::vector<BehaviorPattern>& default_behavior_patterns() {
    using C = ThreatCategory;
    static const std::vector<BehaviorPattern> catalog = {
        { "Ransomware_File_Encryption", C::RANSOMWARE,
          { "rapid_file_encryption", "file_extension_change", "ransom_note_creation" }, 9,
          "File encryption behavior typical of ransomware" },
        { "Trojan_Persistence", C::TROJAN,
          { "registry_run_key_modification", "startup_folder_addition", "scheduled_task_creation" }, 7,
          "Persistence mechanisms used by Trojans" },
        { "Spyware_Data_Collection", C::SPYWARE,
          { "screenshot_capture", "keylogging", "browser_history_access" }, 8,
          "Data collection activities typical of spyware" },
        { "Cryptominer_High_CPU", C::CRYPTOMINER,
          { "sustained_high_cpu_usage", "connection_to_mining_pools", "mining_software_detection" }, 9,
          "High CPU usage and network activity associated with cryptominers" },
        { "Rootkit_System_Hooking", C::ROOTKIT,
          { "system_call_hooking", "driver_manipulation", "hidden_process" }, 8,
          "System-level manipulation indicating rootkit presence" },
        { "Backdoor_Remote_Access", C::BACKDOOR,
          { "remote_connection", "unusual_port_listening", "hidden_communication" }, 9,
          "Remote access and control behavior typical of backdoors" },
        { "Worm_Self_Replication", C::WORM,
          { "self_copying", "network_propagation", "system_resource_consumption" }, 8,
          "Self-replicating and spreading behavior of worms" },
        { "Adware_Unwanted_Ads", C::ADWARE,
          { "browser_redirection", "unwanted_popups", "browser_setting_modification" }, 6,
          "Displaying unwanted advertisements and modifying browser settings" },
    };
    return catalog;
}

BehavioralDetector::BehavioralDetector(std::shared_ptr<const IndicatorSource> source,
                                       std::vector<BehaviorPattern> catalog)
    : m_source(std::move(source)), m_catalog(std::move(catalog)) {}

std::vector<Finding> BehavioralDetector::evaluate(const Evidence& evidence, const ScanPolicy&) const {
    if (!m_source) return {};

    std::set<std::string> observed = m_source->indicators_for(evidence.path);
    if (observed.empty()) return {};

    std::vector<Finding> findings;
    for (const auto& pattern : m_catalog) {
        for (const auto& indicator : pattern.indicators) {
            if (observed.count(indicator)) {
                Finding f;
                f.method = DetectionMethod::BEHAVIORAL;
                f.category = pattern.category;
                f.severity = pattern.severity;
                f.rationale = pattern.name + ": " + pattern.description;
                findings.push_back(std::move(f));
                break;
            }
        }
    }
    return findings;
}

// ============================================================================
// AI model stand-in
// ============================================================================

HeuristicThreatModel::HeuristicThreatModel(std::vector<std::string> suspicious_names) {
    for (auto& n : suspicious_names) m_names.push_back(to_lower(std::move(n)));
}

ModelScore HeuristicThreatModel::score(const Evidence& evidence) const {
    ModelScore result;

    // Упакованные/зашифрованные данные
    if (evidence.entropy > 7.0) {
        result.score += 0.3;
        result.reasons.push_back("High entropy (possible packing)");
    }

    if (evidence.size_bytes < SMALL_EXECUTABLE_BYTES && evidence.extension == ".exe") {
        result.score += 0.4;
        result.reasons.push_back("Unusually small executable");
    }

    // Только первое совпадение из denylist
    std::string filename = to_lower(evidence.path.filename().string());
    for (const auto& name : m_names) {
        if (!name.empty() && filename.find(name) != std::string::npos) {
            result.score += 0.5;
            result.reasons.push_back("Suspicious filename pattern: " + name);
            result.category = category_from_threat_name(name);
            break;
        }
    }

    if (result.score > 1.0) result.score = 1.0;
    return result;
}

AiModelDetector::AiModelDetector(std::unique_ptr<ThreatModel> model)
    : m_model(std::move(model)) {}

std::vector<Finding> AiModelDetector::evaluate(const Evidence& evidence, const ScanPolicy&) const {
    if (!m_model) return {};

    ModelScore s = m_model->score(evidence);
    double score = s.score < 0.0 ? 0.0 : (s.score > 1.0 ? 1.0 : s.score);

    Finding f;
    f.method = DetectionMethod::AI_MODEL;
    f.category = s.category;
    std::string label;
    if (score >= MALICIOUS_THRESHOLD) {
        f.severity = 10;
        label = "malicious";
    } else if (score >= SUSPICIOUS_THRESHOLD) {
        f.severity = 5;
        label = "suspicious";
    } else {
        return {};
    }

    std::ostringstream ss;
    ss << m_model->name() << " " << label << " (score " << std::fixed << std::setprecision(2) << score << ")";
    for (const auto& r : s.reasons) ss << "; " << r;
    f.rationale = ss.str();
    return { f };
}
