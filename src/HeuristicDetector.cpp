#include "Detector.h"
#include "ScanPolicy.h"
#include "Logger.h"

namespace fs = std::filesystem;

namespace {
    // Length of a well-formed UTF-8 sequence starting at data[i], 0 if malformed.
    size_t utf8_sequence_length(const std::string& data, size_t i) {
        auto byte = [&](size_t k) { return static_cast<unsigned char>(data[k]); };
        unsigned char lead = byte(i);
        size_t len;
        if (lead < 0x80) return 1;
        if (lead >= 0xC2 && lead <= 0xDF) len = 2;
        else if (lead >= 0xE0 && lead <= 0xEF) len = 3;
        else if (lead >= 0xF0 && lead <= 0xF4) len = 4;
        else return 0;

        if (i + len > data.size()) return 0;
        for (size_t k = 1; k < len; ++k) {
            if ((byte(i + k) & 0xC0) != 0x80) return 0;
        }
        // Overlong and surrogate forms
        if (lead == 0xE0 && byte(i + 1) < 0xA0) return 0;
        if (lead == 0xED && byte(i + 1) > 0x9F) return 0;
        if (lead == 0xF0 && byte(i + 1) < 0x90) return 0;
        if (lead == 0xF4 && byte(i + 1) > 0x8F) return 0;
        return len;
    }
}

std::string decode_permissive(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        size_t len = utf8_sequence_length(raw, i);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(raw, i, len);
        i += len;
    }
    return out;
}

HeuristicDetector::HeuristicDetector(std::vector<PatternRule> rules, EngineType engine)
    : m_rules(std::move(rules)), m_engine(PatternEngine::create(engine)) {
    m_engine->prepare(m_rules);
    m_engine_name = m_engine->name();
    Logger::info("Heuristic detector: " + std::to_string(m_rules.size()) + " rules on " + m_engine_name);
}

std::vector<Finding> HeuristicDetector::evaluate(const Evidence& evidence, const ScanPolicy&) const {
    std::vector<Finding> findings;

    if (!evidence.content_sample.empty() && !m_rules.empty()) {
        std::string text = decode_permissive(evidence.content_sample);
        for (size_t idx : m_engine->match(text.data(), text.size())) {
            const PatternRule& rule = m_rules[idx];
            Finding f;
            f.method = DetectionMethod::HEURISTIC;
            f.category = rule.category;
            f.severity = rule.weight;
            f.rationale = "Matched pattern: " + (rule.name.empty() ? rule.pattern : rule.name);
            findings.push_back(std::move(f));
        }
    }

    auto attrs = evaluate_attributes(evidence);
    findings.insert(findings.end(), attrs.begin(), attrs.end());
    return findings;
}

std::vector<Finding> HeuristicDetector::evaluate_attributes(const Evidence& evidence) const {
    std::vector<Finding> findings;
    auto add = [&](int severity, const std::string& rationale) {
        Finding f;
        f.method = DetectionMethod::HEURISTIC;
        f.severity = severity;
        f.rationale = rationale;
        findings.push_back(std::move(f));
    };

    if (evidence.hidden) add(1, "Hidden file");

    if ((evidence.permissions & fs::perms::others_write) != fs::perms::none) {
        add(2, "World-writable permissions");
    }

    if ((evidence.extension == ".exe" || evidence.extension == ".dll")
        && evidence.size_bytes < SMALL_EXECUTABLE_BYTES) {
        add(2, "Suspicious size for executable (" + std::to_string(evidence.size_bytes) + " bytes)");
    }
    return findings;
}
