#pragma once
// PatternEngine.h — движки поиска эвристических паттернов в содержимом файла
//
// Архитектура:
// PatternEngine (абстрактный класс) — общий интерфейс
// ├── BoostPatternEngine — Boost.Regex, медленный но надёжный
// ├── Re2PatternEngine   — Google RE2, быстрый, безопасный (no backtracking)
// └── HsPatternEngine    — Intel Hyperscan, самый быстрый (SIMD инструкции)
//
// В отличие от сигнатур форматов, здесь нас интересует только факт
// совпадения правила (хотя бы одно вхождение), а не количество.
// Все паттерны ищутся без учёта регистра.

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <boost/regex.hpp>
#include "ThreatTypes.h"

// Forward declarations — чтобы не включать тяжёлые заголовки
namespace re2 { class RE2; }
struct hs_database;  // Внутренняя структура Hyperscan (opaque pointer)
struct hs_scratch;   // Рабочая память для Hyperscan

// Доступные движки
// Hyperscan — дефолтный выбор (лучшая производительность)
enum class EngineType { BOOST, RE2, HYPERSCAN };

const char* to_string(EngineType type);
bool parse_engine(const std::string& name, EngineType& out);  // "hs" | "re2" | "boost"

// Одно эвристическое правило
// Пример из sentinel.json:
// {
//   "name": "WriteProcessMemory",
//   "pattern": "WriteProcessMemory",
//   "weight": 4,
//   "category": "trojan"
// }
struct PatternRule {
    std::string name;                 // Имя для rationale (по умолчанию = pattern)
    std::string pattern;              // Регулярное выражение
    int weight = 1;                   // Severity находки (1..10)
    ThreatCategory category = ThreatCategory::UNCLASSIFIED;
};

class PatternEngine {
public:
    virtual ~PatternEngine() = default;

    // Компиляция паттернов. Вызывается один раз до сканирования.
    // Невалидные паттерны пропускаются с предупреждением в лог.
    virtual void prepare(const std::vector<PatternRule>& rules) = 0;

    // Индексы (в векторе, переданном в prepare) совпавших правил, по возрастанию.
    // Потокобезопасен: один движок используется всеми воркерами сессии.
    virtual std::vector<size_t> match(const char* data, size_t size) const = 0;

    // Название движка для отчёта
    virtual std::string name() const = 0;

    // Фабричный метод
    // Пример: auto engine = PatternEngine::create(EngineType::HYPERSCAN);
    static std::unique_ptr<PatternEngine> create(EngineType type);
};

class BoostPatternEngine : public PatternEngine {
public:
    void prepare(const std::vector<PatternRule>& rules) override;
    std::vector<size_t> match(const char* data, size_t size) const override;
    std::string name() const override;
private:
    // Пары (скомпилированный regex, индекс правила)
    std::vector<std::pair<boost::regex, size_t>> m_regexes;
};

// RE2::Set не может быть forward declared — используем type-erased deleter
struct Re2SetDeleter { void operator()(void* p) const noexcept; };

// Google RE2
// Алгоритм: RE2::Set — один проход по данным, "какие паттерны вообще совпали?"
// Если Set не скомпилировался — fallback на индивидуальные regex.
class Re2PatternEngine : public PatternEngine {
public:
    Re2PatternEngine();
    ~Re2PatternEngine() override;
    void prepare(const std::vector<PatternRule>& rules) override;
    std::vector<size_t> match(const char* data, size_t size) const override;
    std::string name() const override;
private:
    std::unique_ptr<void, Re2SetDeleter> m_set;
    std::vector<std::pair<std::unique_ptr<re2::RE2>, size_t>> m_regexes;  // id в Set -> индекс правила
};

// Intel Hyperscan
//
// ВАЖНО: hs_scratch не потокобезопасен!
// Один scratch не может использоваться несколькими потоками одновременно.
// Решение: пул scratch-ов, воркер берёт свободный (или клонирует новый)
// на время одного hs_scan и возвращает обратно.
class HsPatternEngine : public PatternEngine {
public:
    HsPatternEngine();
    ~HsPatternEngine() override;
    HsPatternEngine(const HsPatternEngine&) = delete;
    HsPatternEngine& operator=(const HsPatternEngine&) = delete;

    void prepare(const std::vector<PatternRule>& rules) override;
    std::vector<size_t> match(const char* data, size_t size) const override;
    std::string name() const override;
private:
    hs_database* db = nullptr;         // Скомпилированная база паттернов
    hs_scratch* prototype = nullptr;   // Образец для hs_clone_scratch
    mutable std::mutex m_pool_mutex;
    mutable std::vector<hs_scratch*> m_pool;  // Свободные scratch-и
    std::vector<size_t> m_rule_index;         // id Hyperscan -> индекс правила

    void release_all();
    hs_scratch* acquire_scratch() const;
    void return_scratch(hs_scratch* s) const;
};
