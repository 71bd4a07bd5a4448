#pragma once
// Detector.h — методы обнаружения
//
// Архитектура:
// Detector (абстрактный класс) — evaluate(evidence, policy) -> находки
// ├── SignatureDetector  — точное совпадение хэша с базой (severity 10)
// ├── HeuristicDetector  — паттерны в содержимом + атрибуты файла
// ├── BehavioralDetector — каталог поведенческих шаблонов по индикаторам
// └── AiModelDetector    — оценка [0,1] от ThreatModel (заглушка вместо ML)
//
// Контракт:
//   - пустой результат — нормальный и самый частый случай, не ошибка
//   - один и тот же Evidence даёт одни и те же находки
//   - evaluate() const и потокобезопасен: один экземпляр на все воркеры
//   - исключение из детектора ловит evaluate_isolated(), файл не теряется

#include <string>
#include <vector>
#include <memory>
#include <set>
#include "ThreatTypes.h"
#include "Evidence.h"
#include "PatternEngine.h"
#include "SignatureStore.h"

struct ScanPolicy;
struct ScanConfig;

// Одна находка одного детектора
struct Finding {
    DetectionMethod method = DetectionMethod::HEURISTIC;
    ThreatCategory category = ThreatCategory::UNCLASSIFIED;
    int severity = 1;          // 1..10, шкала детектора
    std::string rationale;     // "Matched pattern: WriteProcessMemory"
};

class Detector {
public:
    virtual ~Detector() = default;

    virtual std::vector<Finding> evaluate(const Evidence& evidence, const ScanPolicy& policy) const = 0;

    virtual DetectionMethod method() const = 0;
    virtual std::string name() const = 0;
};

using DetectorSet = std::vector<std::shared_ptr<const Detector>>;

// Runs one detector; any exception becomes "no finding" and is logged as a DetectorError.
std::vector<Finding> evaluate_isolated(const Detector& detector, const Evidence& evidence,
                                       const ScanPolicy& policy);

// Signature + Heuristic + Behavioral + AIModel, configured from `config`.
DetectorSet make_detectors(const ScanConfig& config);

// === Signature ===
class SignatureDetector : public Detector {
public:
    explicit SignatureDetector(std::shared_ptr<const SignatureStore> store);

    std::vector<Finding> evaluate(const Evidence& evidence, const ScanPolicy& policy) const override;
    DetectionMethod method() const override { return DetectionMethod::SIGNATURE; }
    std::string name() const override { return "signature"; }

private:
    std::shared_ptr<const SignatureStore> m_store;
};

// === Heuristic / Pattern ===
// Минимальный размер "нормального" исполняемого файла; меньше — подозрительно
constexpr std::uintmax_t SMALL_EXECUTABLE_BYTES = 1024;

class HeuristicDetector : public Detector {
public:
    HeuristicDetector(std::vector<PatternRule> rules, EngineType engine);

    std::vector<Finding> evaluate(const Evidence& evidence, const ScanPolicy& policy) const override;
    DetectionMethod method() const override { return DetectionMethod::HEURISTIC; }
    std::string name() const override { return "heuristic"; }

    const std::string& engine_name() const { return m_engine_name; }

private:
    std::vector<PatternRule> m_rules;
    std::unique_ptr<PatternEngine> m_engine;
    std::string m_engine_name;

    std::vector<Finding> evaluate_attributes(const Evidence& evidence) const;
};

// Drops invalid UTF-8 sequences instead of failing ("errors=ignore" decoding).
std::string decode_permissive(const std::string& raw);

// === Behavioral ===
struct BehaviorPattern {
    std::string name;
    ThreatCategory category = ThreatCategory::UNCLASSIFIED;
    std::vector<std::string> indicators;
    int severity = 1;
    std::string description;
};

const std::vector<BehaviorPattern>& default_behavior_patterns();

// Источник runtime-индикаторов ("keylogging", "self_copying", ...).
// Живой мониторинг процессов — внешний модуль, здесь только интерфейс.
class IndicatorSource {
public:
    virtual ~IndicatorSource() = default;
    virtual std::set<std::string> indicators_for(const std::filesystem::path& path) const = 0;
};

class BehavioralDetector : public Detector {
public:
    explicit BehavioralDetector(std::shared_ptr<const IndicatorSource> source = nullptr,
                                std::vector<BehaviorPattern> catalog = default_behavior_patterns());

    std::vector<Finding> evaluate(const Evidence& evidence, const ScanPolicy& policy) const override;
    DetectionMethod method() const override { return DetectionMethod::BEHAVIORAL; }
    std::string name() const override { return "behavioral"; }

private:
    std::shared_ptr<const IndicatorSource> m_source;
    std::vector<BehaviorPattern> m_catalog;
};

// === AI model (stand-in) ===
struct ModelScore {
    double score = 0.0;                 // [0,1]
    std::vector<std::string> reasons;
    ThreatCategory category = ThreatCategory::UNCLASSIFIED;
};

// Сюда подключается настоящая модель; агрегатор об этом не знает.
class ThreatModel {
public:
    virtual ~ThreatModel() = default;
    virtual ModelScore score(const Evidence& evidence) const = 0;
    virtual std::string name() const = 0;
};

// Не ML: фиксированные правила по энтропии, размеру и имени файла
class HeuristicThreatModel : public ThreatModel {
public:
    explicit HeuristicThreatModel(std::vector<std::string> suspicious_names);
    ModelScore score(const Evidence& evidence) const override;
    std::string name() const override { return "heuristic-stand-in"; }
private:
    std::vector<std::string> m_names;
};

class AiModelDetector : public Detector {
public:
    static constexpr double MALICIOUS_THRESHOLD = 0.75;
    static constexpr double SUSPICIOUS_THRESHOLD = 0.4;

    explicit AiModelDetector(std::unique_ptr<ThreatModel> model);

    std::vector<Finding> evaluate(const Evidence& evidence, const ScanPolicy& policy) const override;
    DetectionMethod method() const override { return DetectionMethod::AI_MODEL; }
    std::string name() const override { return "ai_model"; }

private:
    std::unique_ptr<ThreatModel> m_model;
};
