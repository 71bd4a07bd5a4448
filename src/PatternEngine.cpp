#include "PatternEngine.h"
#include "Logger.h"
#include <algorithm>
#include <re2/re2.h>
#include <re2/set.h>
#include <hs/hs.h>

const char* to_string(EngineType type) {
    switch (type) {
    case EngineType::BOOST:     return "boost";
    case EngineType::RE2:       return "re2";
    case EngineType::HYPERSCAN: return "hs";
    }
    return "hs";
}

bool parse_engine(const std::string& name, EngineType& out) {
    std::string e = to_lower(name);
    if (e == "hs" || e == "hyperscan") { out = EngineType::HYPERSCAN; return true; }
    if (e == "re2")                    { out = EngineType::RE2; return true; }
    if (e == "boost")                  { out = EngineType::BOOST; return true; }
    return false;
}

std::unique_ptr<PatternEngine> PatternEngine::create(EngineType type) {
    switch (type) {
    case EngineType::BOOST: return std::make_unique<BoostPatternEngine>();
    case EngineType::RE2:   return std::make_unique<Re2PatternEngine>();
    case EngineType::HYPERSCAN: return std::make_unique<HsPatternEngine>();
    }
    return std::make_unique<HsPatternEngine>();
}

// === Boost ===
std::string BoostPatternEngine::name() const { return "Boost.Regex"; }

void BoostPatternEngine::prepare(const std::vector<PatternRule>& rules) {
    m_regexes.clear();
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& r = rules[i];
        if (r.pattern.empty()) continue;
        try {
            auto flags = boost::regex::optimize | boost::regex::icase;
            m_regexes.emplace_back(boost::regex(r.pattern, flags), i);
        }
        catch (const std::exception& e) {
            Logger::warn("[BoostPatternEngine] Failed to compile pattern for '"
                         + r.name + "': " + e.what());
        }
    }
}

std::vector<size_t> BoostPatternEngine::match(const char* data, size_t size) const {
    std::vector<size_t> matched;
    if (!data || size == 0) return matched;
    const char* end = data + size;
    for (const auto& [re, idx] : m_regexes) {
        if (boost::regex_search(data, end, re)) matched.push_back(idx);
    }
    std::sort(matched.begin(), matched.end());
    return matched;
}

// === RE2 ===
void Re2SetDeleter::operator()(void* p) const noexcept {
    delete static_cast<re2::RE2::Set*>(p);
}

Re2PatternEngine::Re2PatternEngine() = default;  // re2::RE2 is complete here
Re2PatternEngine::~Re2PatternEngine() = default;

std::string Re2PatternEngine::name() const { return "Google RE2"; }

void Re2PatternEngine::prepare(const std::vector<PatternRule>& rules) {
    m_set.reset();
    m_regexes.clear();

    re2::RE2::Options opt;
    opt.set_encoding(re2::RE2::Options::EncodingLatin1);
    opt.set_dot_nl(true);
    opt.set_case_sensitive(false);
    opt.set_log_errors(false);

    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& r = rules[i];
        if (r.pattern.empty()) continue;
        auto re = std::make_unique<re2::RE2>(r.pattern, opt);
        if (re->ok()) {
            m_regexes.emplace_back(std::move(re), i);
        }
        else {
            Logger::warn("[Re2PatternEngine] Failed to compile pattern for '"
                         + r.name + "': " + re->error());
        }
    }

    std::unique_ptr<void, Re2SetDeleter> new_set(new re2::RE2::Set(opt, re2::RE2::UNANCHORED));
    auto* raw = static_cast<re2::RE2::Set*>(new_set.get());
    for (const auto& [re, idx] : m_regexes) {
        std::string err;
        if (raw->Add(re->pattern(), &err) < 0) {
            Logger::warn("[Re2PatternEngine] Set rejected pattern #" + std::to_string(idx) + ": " + err);
            return;  // ids would no longer line up with m_regexes; use the fallback
        }
    }
    if (raw->Compile()) {
        m_set = std::move(new_set);
    }
}

std::vector<size_t> Re2PatternEngine::match(const char* data, size_t size) const {
    std::vector<size_t> matched;
    if (!data || size == 0) return matched;
    re2::StringPiece input(data, size);

    auto* set = static_cast<re2::RE2::Set*>(m_set.get());
    if (!set) {
        // Fallback: no set compiled, check all individually
        for (const auto& [re, idx] : m_regexes) {
            if (re2::RE2::PartialMatch(input, *re)) matched.push_back(idx);
        }
    }
    else {
        std::vector<int> ids;
        set->Match(input, &ids);
        for (int id : ids) matched.push_back(m_regexes[static_cast<size_t>(id)].second);
    }
    std::sort(matched.begin(), matched.end());
    return matched;
}

// === Hyperscan ===
HsPatternEngine::HsPatternEngine() = default;
HsPatternEngine::~HsPatternEngine() { release_all(); }

std::string HsPatternEngine::name() const { return "Hyperscan"; }

void HsPatternEngine::release_all() {
    std::lock_guard<std::mutex> lock(m_pool_mutex);
    for (hs_scratch* s : m_pool) hs_free_scratch(s);
    m_pool.clear();
    if (prototype) { hs_free_scratch(prototype); prototype = nullptr; }
    if (db) { hs_free_database(db); db = nullptr; }
}

void HsPatternEngine::prepare(const std::vector<PatternRule>& rules) {
    release_all();
    m_rule_index.clear();

    std::vector<std::string> patterns;
    std::vector<size_t> rule_of;
    for (size_t i = 0; i < rules.size(); ++i) {
        if (rules[i].pattern.empty()) continue;
        patterns.push_back(rules[i].pattern);
        rule_of.push_back(i);
    }

    // hs_compile_multi fails as a whole on one bad expression; drop it and retry.
    while (!patterns.empty()) {
        std::vector<const char*> exprs;
        std::vector<unsigned int> flags, ids;
        for (size_t i = 0; i < patterns.size(); ++i) {
            exprs.push_back(patterns[i].c_str());
            ids.push_back(static_cast<unsigned int>(i));
            flags.push_back(HS_FLAG_CASELESS | HS_FLAG_DOTALL | HS_FLAG_SINGLEMATCH);
        }

        hs_compile_error_t* err = nullptr;
        if (hs_compile_multi(exprs.data(), flags.data(), ids.data(),
                             static_cast<unsigned int>(exprs.size()),
                             HS_MODE_BLOCK, nullptr, &db, &err) == HS_SUCCESS) {
            break;
        }
        int bad = err ? err->expression : -1;
        Logger::warn(std::string("[HsPatternEngine] Compile error: ")
                     + (err && err->message ? err->message : "unknown"));
        if (err) hs_free_compile_error(err);
        db = nullptr;
        if (bad < 0) return;
        Logger::warn("[HsPatternEngine] Dropping rule '" + rules[rule_of[bad]].name + "'");
        patterns.erase(patterns.begin() + bad);
        rule_of.erase(rule_of.begin() + bad);
    }

    if (!db) return;
    if (hs_alloc_scratch(db, &prototype) != HS_SUCCESS) {
        Logger::error("[HsPatternEngine] hs_alloc_scratch failed");
        hs_free_database(db);
        db = nullptr;
        prototype = nullptr;
        return;
    }
    m_rule_index = std::move(rule_of);
}

hs_scratch* HsPatternEngine::acquire_scratch() const {
    {
        std::lock_guard<std::mutex> lock(m_pool_mutex);
        if (!m_pool.empty()) {
            hs_scratch* s = m_pool.back();
            m_pool.pop_back();
            return s;
        }
    }
    hs_scratch* s = nullptr;
    if (hs_clone_scratch(prototype, &s) != HS_SUCCESS) return nullptr;
    return s;
}

void HsPatternEngine::return_scratch(hs_scratch* s) const {
    std::lock_guard<std::mutex> lock(m_pool_mutex);
    m_pool.push_back(s);
}

std::vector<size_t> HsPatternEngine::match(const char* data, size_t size) const {
    std::vector<size_t> matched;
    if (!db || !data || size == 0) return matched;

    hs_scratch* scratch = acquire_scratch();
    if (!scratch) {
        Logger::error("[HsPatternEngine] hs_clone_scratch failed");
        return matched;
    }

    struct Ctx { std::vector<size_t>* out; const std::vector<size_t>* index; } ctx = { &matched, &m_rule_index };
    auto on_match = [](unsigned int id, unsigned long long, unsigned long long, unsigned int, void* ptr) -> int {
        auto* c = static_cast<Ctx*>(ptr);
        if (id < c->index->size()) c->out->push_back((*c->index)[id]);
        return 0;
    };
    hs_error_t rc = hs_scan(db, data, static_cast<unsigned int>(size), 0, scratch, on_match, &ctx);
    return_scratch(scratch);
    if (rc != HS_SUCCESS) {
        Logger::warn("[HsPatternEngine] hs_scan returned " + std::to_string(rc));
    }

    std::sort(matched.begin(), matched.end());
    matched.erase(std::unique(matched.begin(), matched.end()), matched.end());
    return matched;
}
