#pragma once
// ThreatTypes.h — закрытые таксономии движка
//
// DetectionMethod — каким методом получена находка
// ThreatCategory  — семейство угрозы
// Classification  — итоговый уровень риска файла
//
// Все преобразования в строку сделаны через switch без default,
// чтобы компилятор (-Wswitch) ругался при добавлении нового значения.

#include <string>
#include <algorithm>
#include <cctype>

enum class DetectionMethod { SIGNATURE, HEURISTIC, BEHAVIORAL, AI_MODEL, SANDBOX };

enum class ThreatCategory {
    RANSOMWARE, TROJAN, SPYWARE, ROOTKIT, CRYPTOMINER,
    BACKDOOR, WORM, ADWARE, UNCLASSIFIED
};

enum class Classification { CLEAN, SUSPICIOUS, MALICIOUS };

inline const char* to_string(DetectionMethod m) {
    switch (m) {
    case DetectionMethod::SIGNATURE:  return "signature";
    case DetectionMethod::HEURISTIC:  return "heuristic";
    case DetectionMethod::BEHAVIORAL: return "behavioral";
    case DetectionMethod::AI_MODEL:   return "ai_model";
    case DetectionMethod::SANDBOX:    return "sandbox";
    }
    return "unknown";
}

inline const char* to_string(ThreatCategory c) {
    switch (c) {
    case ThreatCategory::RANSOMWARE:   return "ransomware";
    case ThreatCategory::TROJAN:       return "trojan";
    case ThreatCategory::SPYWARE:      return "spyware";
    case ThreatCategory::ROOTKIT:      return "rootkit";
    case ThreatCategory::CRYPTOMINER:  return "cryptominer";
    case ThreatCategory::BACKDOOR:     return "backdoor";
    case ThreatCategory::WORM:         return "worm";
    case ThreatCategory::ADWARE:       return "adware";
    case ThreatCategory::UNCLASSIFIED: return "unclassified";
    }
    return "unclassified";
}

inline const char* to_string(Classification c) {
    switch (c) {
    case Classification::CLEAN:      return "clean";
    case Classification::SUSPICIOUS: return "suspicious";
    case Classification::MALICIOUS:  return "malicious";
    }
    return "clean";
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Parses a category name as written in sentinel.json ("trojan", "Worm", ...).
// Returns false for unknown names, `out` is left untouched.
inline bool parse_category(const std::string& name, ThreatCategory& out) {
    static const std::pair<const char*, ThreatCategory> table[] = {
        { "ransomware",   ThreatCategory::RANSOMWARE },
        { "trojan",       ThreatCategory::TROJAN },
        { "spyware",      ThreatCategory::SPYWARE },
        { "rootkit",      ThreatCategory::ROOTKIT },
        { "cryptominer",  ThreatCategory::CRYPTOMINER },
        { "backdoor",     ThreatCategory::BACKDOOR },
        { "worm",         ThreatCategory::WORM },
        { "adware",       ThreatCategory::ADWARE },
        { "unclassified", ThreatCategory::UNCLASSIFIED },
    };
    std::string key = to_lower(name);
    for (const auto& [n, c] : table) {
        if (key == n) { out = c; return true; }
    }
    return false;
}

// Threat names follow the "Family.Variant" convention ("Ransomware.Crypto",
// "Worm.Win32"). Any family token anywhere in the name is accepted.
inline ThreatCategory category_from_threat_name(const std::string& threat_name) {
    static const std::pair<const char*, ThreatCategory> tokens[] = {
        { "ransom",  ThreatCategory::RANSOMWARE },
        { "trojan",  ThreatCategory::TROJAN },
        { "spy",     ThreatCategory::SPYWARE },
        { "keylog",  ThreatCategory::SPYWARE },
        { "rootkit", ThreatCategory::ROOTKIT },
        { "miner",   ThreatCategory::CRYPTOMINER },
        { "backdoor", ThreatCategory::BACKDOOR },
        { "worm",    ThreatCategory::WORM },
        { "adware",  ThreatCategory::ADWARE },
    };
    std::string lowered = to_lower(threat_name);
    for (const auto& [token, category] : tokens) {
        if (lowered.find(token) != std::string::npos) return category;
    }
    return ThreatCategory::UNCLASSIFIED;
}
