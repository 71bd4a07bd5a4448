#include "ScoreAggregator.h"
#include <algorithm>

int clamp_severity(int severity) {
    return std::max(1, std::min(10, severity));
}

bool finding_less(const Finding& a, const Finding& b) {
    if (a.method != b.method) return a.method < b.method;
    if (a.category != b.category) return a.category < b.category;
    if (a.severity != b.severity) return a.severity > b.severity;
    return a.rationale < b.rationale;
}

Verdict aggregate(std::vector<Finding> findings) {
    Verdict v;
    bool signature_hit = false;
    int total = 0;
    for (auto& f : findings) {
        f.severity = clamp_severity(f.severity);
        total += f.severity * 10;
        if (f.method == DetectionMethod::SIGNATURE && f.severity == 10) signature_hit = true;
    }
    std::sort(findings.begin(), findings.end(), finding_less);

    v.risk_score = std::min(100, total);
    if (signature_hit || v.risk_score >= MALICIOUS_SCORE) {
        v.classification = Classification::MALICIOUS;
    } else if (v.risk_score >= SUSPICIOUS_SCORE) {
        v.classification = Classification::SUSPICIOUS;
    } else {
        v.classification = Classification::CLEAN;
    }
    v.findings = std::move(findings);
    return v;
}

Verdict aggregate(const Evidence& evidence, std::vector<Finding> findings) {
    Verdict v = aggregate(std::move(findings));
    v.path = evidence.path;
    v.digest = evidence.sha256;
    return v;
}
