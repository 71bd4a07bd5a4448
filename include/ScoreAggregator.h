#pragma once
// ScoreAggregator.h — сведение находок одного файла в вердикт
//
// risk_score = min(100, Σ severity × 10), severity обрезается до [1, 10]
//
//   SIGNATURE с severity 10  → MALICIOUS (сразу, без учёта суммы)
//   risk_score >= 70         → MALICIOUS
//   40 <= risk_score < 70    → SUSPICIOUS
//   risk_score < 40          → CLEAN ("clean with notes", если находки есть)
//
// Находки сортируются, поэтому порядок детекторов на вердикт не влияет.

#include <string>
#include <vector>
#include <filesystem>
#include "Detector.h"

constexpr int MALICIOUS_SCORE = 70;
constexpr int SUSPICIOUS_SCORE = 40;

struct Verdict {
    std::filesystem::path path;
    int risk_score = 0;
    Classification classification = Classification::CLEAN;
    std::vector<Finding> findings;
    std::string digest;          // SHA-256 проверенного содержимого

    bool has_notes() const { return classification == Classification::CLEAN && !findings.empty(); }
};

// Pure function of the findings; path and digest are left empty.
Verdict aggregate(std::vector<Finding> findings);

Verdict aggregate(const Evidence& evidence, std::vector<Finding> findings);

int clamp_severity(int severity);

// (method, category, severity desc, rationale)
bool finding_less(const Finding& a, const Finding& b);
