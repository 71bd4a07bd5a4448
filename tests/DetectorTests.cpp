#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <string>
#include <vector>
#include <set>
#include <stdexcept>

#include "Detector.h"
#include "ScoreAggregator.h"
#include "ScanConfig.h"
#include "ScanPolicy.h"

namespace fs = std::filesystem;

static const std::string SHA256_ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
static const std::string MD5_ABC = "900150983cd24fb0d6963f7d28e17f72";

static Evidence MakeEvidence(const std::string& name, const std::string& sample = "",
                             std::uintmax_t size = 4096, double entropy = 4.0) {
    Evidence ev;
    ev.path = fs::path("/scan") / name;
    ev.extension = normalized_extension(ev.path);
    ev.size_bytes = size;
    ev.entropy = entropy;
    ev.content_sample = sample;
    ev.sha256 = std::string(64, '0');
    ev.hidden = name.front() == '.';
    ev.permissions = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;
    return ev;
}

static Finding MakeFinding(DetectionMethod m, int severity, const std::string& why,
                           ThreatCategory c = ThreatCategory::UNCLASSIFIED) {
    Finding f;
    f.method = m;
    f.category = c;
    f.severity = severity;
    f.rationale = why;
    return f;
}

// ==========================================
// 1. SIGNATURE
// ==========================================

class SignatureDetectorTest : public ::testing::Test {
protected:
    ScanPolicy policy;
};

TEST_F(SignatureDetectorTest, Sha256_Match_Is_Severity_Ten) {
    auto store = std::make_shared<SignatureStore>();
    ASSERT_TRUE(store->add(SHA256_ABC, "Ransomware.Crypto"));
    SignatureDetector detector(store);

    Evidence ev = MakeEvidence("abc.exe");
    ev.sha256 = SHA256_ABC;
    auto findings = detector.evaluate(ev, policy);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].severity, 10);
    EXPECT_EQ(findings[0].method, DetectionMethod::SIGNATURE);
    EXPECT_EQ(findings[0].category, ThreatCategory::RANSOMWARE);

    Verdict v = aggregate(ev, findings);
    EXPECT_EQ(v.classification, Classification::MALICIOUS);
    EXPECT_EQ(v.digest, SHA256_ABC);
}

TEST_F(SignatureDetectorTest, Md5_Used_When_Present) {
    auto store = std::make_shared<SignatureStore>();
    store->add(MD5_ABC, "Worm.Win32");
    SignatureDetector detector(store);

    Evidence ev = MakeEvidence("abc.exe");
    EXPECT_TRUE(detector.evaluate(ev, policy).empty());

    ev.md5 = MD5_ABC;
    auto findings = detector.evaluate(ev, policy);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].category, ThreatCategory::WORM);
}

TEST_F(SignatureDetectorTest, Uppercase_Digest_Normalized) {
    SignatureStore store;
    EXPECT_TRUE(store.add("44D88612FEA8A8F36DE82E1278ABB02F", "Trojan.Generic"));
    EXPECT_TRUE(store.lookup("44d88612fea8a8f36de82e1278abb02f").has_value());
    EXPECT_FALSE(store.add("44d8", "Short"));
    EXPECT_FALSE(store.add(std::string(64, 'g'), "NonHex"));
}

TEST_F(SignatureDetectorTest, Builtin_Store_Contents) {
    SignatureStore store = SignatureStore::builtin();
    EXPECT_EQ(store.size(), 5u);
    EXPECT_EQ(store.lookup("e6d290a03b70cfa5d4451da444bdea39").value_or(""), "Ransomware.Crypto");
    EXPECT_EQ(category_from_threat_name("Trojan.Generic"), ThreatCategory::TROJAN);
    EXPECT_EQ(category_from_threat_name("Malware.Generic"), ThreatCategory::UNCLASSIFIED);
}

// ==========================================
// 2. HEURISTIC
// ==========================================

TEST(DecodeTest, Invalid_Utf8_Dropped) {
    EXPECT_EQ(decode_permissive("a\xC3\xA9" "b\xFF"), "a\xC3\xA9" "b");
    EXPECT_EQ(decode_permissive("Write\xFF\xFEProcessMemory"), "WriteProcessMemory");
    EXPECT_EQ(decode_permissive(std::string("\xE2\x82", 2)), "");  // truncated sequence
    EXPECT_EQ(decode_permissive(""), "");
}

class HeuristicDetectorTest : public ::testing::TestWithParam<EngineType> {
protected:
    ScanPolicy policy;
};

TEST_P(HeuristicDetectorTest, Content_Rules_Fire_With_Weights) {
    HeuristicDetector detector(default_heuristic_rules(), GetParam());
    Evidence ev = MakeEvidence("loader.ps1", "x = WriteProcessMemory(h); CreateRemoteThread(h)");
    auto findings = detector.evaluate(ev, policy);
    ASSERT_EQ(findings.size(), 2u) << detector.engine_name();
    for (const auto& f : findings) {
        EXPECT_EQ(f.severity, 4);
        EXPECT_EQ(f.category, ThreatCategory::TROJAN);
        EXPECT_EQ(f.method, DetectionMethod::HEURISTIC);
    }
    EXPECT_EQ(aggregate(findings).classification, Classification::MALICIOUS);
}

TEST_P(HeuristicDetectorTest, Clean_Content_No_Findings) {
    HeuristicDetector detector(default_heuristic_rules(), GetParam());
    Evidence ev = MakeEvidence("build.sh", "echo lorem ipsum\nprint done\n");
    EXPECT_TRUE(detector.evaluate(ev, policy).empty()) << detector.engine_name();
}

TEST_P(HeuristicDetectorTest, Invalid_Bytes_Do_Not_Break_Matching) {
    HeuristicDetector detector(default_heuristic_rules(), GetParam());
    Evidence ev = MakeEvidence("x.vbs", "\xFF\xFE" "StartupFolder" "\x80");
    auto findings = detector.evaluate(ev, policy);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].rationale, "Matched pattern: StartupFolder");
}

INSTANTIATE_TEST_SUITE_P(AllEngines, HeuristicDetectorTest,
                         ::testing::Values(EngineType::BOOST, EngineType::RE2, EngineType::HYPERSCAN));

TEST(HeuristicAttributesTest, Hidden_WorldWritable_SmallExe) {
    HeuristicDetector detector({}, EngineType::BOOST);
    ScanPolicy policy;

    Evidence hidden = MakeEvidence(".profile.sh");
    auto f1 = detector.evaluate(hidden, policy);
    ASSERT_EQ(f1.size(), 1u);
    EXPECT_EQ(f1[0].severity, 1);

    Evidence writable = MakeEvidence("open.sh");
    writable.permissions |= fs::perms::others_write;
    auto f2 = detector.evaluate(writable, policy);
    ASSERT_EQ(f2.size(), 1u);
    EXPECT_EQ(f2[0].severity, 2);

    Evidence small = MakeEvidence("tool.dll", "", 512);
    auto f3 = detector.evaluate(small, policy);
    ASSERT_EQ(f3.size(), 1u);
    EXPECT_EQ(f3[0].severity, 2);

    Evidence big = MakeEvidence("tool.dll", "", 1024);
    EXPECT_TRUE(detector.evaluate(big, policy).empty());
}

// ==========================================
// 3. BEHAVIORAL
// ==========================================

class FixedIndicators : public IndicatorSource {
public:
    explicit FixedIndicators(std::set<std::string> tags) : m_tags(std::move(tags)) {}
    std::set<std::string> indicators_for(const fs::path&) const override { return m_tags; }
private:
    std::set<std::string> m_tags;
};

TEST(BehavioralDetectorTest, Catalog_Has_Eight_Patterns) {
    EXPECT_EQ(default_behavior_patterns().size(), 8u);
}

TEST(BehavioralDetectorTest, No_Source_No_Findings) {
    BehavioralDetector detector;
    EXPECT_TRUE(detector.evaluate(MakeEvidence("a.exe"), ScanPolicy{}).empty());
}

TEST(BehavioralDetectorTest, Any_Indicator_Fires_Pattern_Once) {
    auto source = std::make_shared<FixedIndicators>(
        std::set<std::string>{ "keylogging", "screenshot_capture", "self_copying" });
    BehavioralDetector detector(source);
    auto findings = detector.evaluate(MakeEvidence("a.exe"), ScanPolicy{});
    ASSERT_EQ(findings.size(), 2u);

    Verdict v = aggregate(findings);
    EXPECT_EQ(v.findings[0].category, ThreatCategory::SPYWARE);
    EXPECT_EQ(v.findings[1].category, ThreatCategory::WORM);
    EXPECT_EQ(v.risk_score, 100);
}

// ==========================================
// 4. AI MODEL
// ==========================================

TEST(AiModelDetectorTest, Small_Denylisted_Exe_Is_Malicious) {
    AiModelDetector detector(std::make_unique<HeuristicThreatModel>(default_suspicious_names()));
    auto findings = detector.evaluate(MakeEvidence("virus_keygen.exe", "", 512), ScanPolicy{});
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].severity, 10);
    EXPECT_EQ(findings[0].method, DetectionMethod::AI_MODEL);
}

TEST(AiModelDetectorTest, Denylisted_Name_Alone_Is_Suspicious) {
    AiModelDetector detector(std::make_unique<HeuristicThreatModel>(default_suspicious_names()));
    auto findings = detector.evaluate(MakeEvidence("crack.sh"), ScanPolicy{});
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].severity, 5);
}

TEST(AiModelDetectorTest, High_Entropy_Alone_Below_Threshold) {
    AiModelDetector detector(std::make_unique<HeuristicThreatModel>(default_suspicious_names()));
    auto findings = detector.evaluate(MakeEvidence("lib.dll", "", 8192, 7.9), ScanPolicy{});
    EXPECT_TRUE(findings.empty());
}

TEST(AiModelDetectorTest, Only_First_Denylist_Hit_Counts) {
    HeuristicThreatModel model(default_suspicious_names());
    ModelScore s = model.score(MakeEvidence("trojan_hack_crack.sh"));
    EXPECT_NEAR(s.score, 0.5, 1e-9);
    EXPECT_EQ(s.reasons.size(), 1u);
    EXPECT_EQ(s.category, ThreatCategory::TROJAN);
}

TEST(AiModelDetectorTest, Denylist_Matches_Inside_Name) {
    HeuristicThreatModel model(default_suspicious_names());
    ModelScore s = model.score(MakeEvidence("MyKeyGenerator.sh"));
    EXPECT_NEAR(s.score, 0.5, 1e-9);
    EXPECT_NEAR(model.score(MakeEvidence("notes.sh")).score, 0.0, 1e-9);
}

TEST(AiModelDetectorTest, Score_Clamped_To_One) {
    HeuristicThreatModel model(default_suspicious_names());
    ModelScore s = model.score(MakeEvidence("keygen.exe", "", 100, 7.5));
    EXPECT_DOUBLE_EQ(s.score, 1.0);
}

// ==========================================
// 5. ИЗОЛЯЦИЯ ДЕТЕКТОРОВ
// ==========================================

class ThrowingDetector : public Detector {
public:
    std::vector<Finding> evaluate(const Evidence&, const ScanPolicy&) const override {
        throw std::runtime_error("model file corrupted");
    }
    DetectionMethod method() const override { return DetectionMethod::AI_MODEL; }
    std::string name() const override { return "throwing"; }
};

TEST(DetectorIsolationTest, Exception_Becomes_No_Finding) {
    ThrowingDetector detector;
    std::vector<Finding> findings;
    EXPECT_NO_THROW(findings = evaluate_isolated(detector, MakeEvidence("a.exe"), ScanPolicy{}));
    EXPECT_TRUE(findings.empty());
}

TEST(DetectorIsolationTest, Default_Set_Has_Four_Methods) {
    ScanConfig config = ScanConfig::defaults();
    config.engine = EngineType::BOOST;
    DetectorSet set = make_detectors(config);
    ASSERT_EQ(set.size(), 4u);
    EXPECT_EQ(set[0]->method(), DetectionMethod::SIGNATURE);
    EXPECT_EQ(set[1]->method(), DetectionMethod::HEURISTIC);
    EXPECT_EQ(set[2]->method(), DetectionMethod::BEHAVIORAL);
    EXPECT_EQ(set[3]->method(), DetectionMethod::AI_MODEL);
}

// ==========================================
// 6. AGGREGATOR
// ==========================================

TEST(AggregatorTest, No_Findings_Is_Clean_Without_Notes) {
    Verdict v = aggregate({});
    EXPECT_EQ(v.risk_score, 0);
    EXPECT_EQ(v.classification, Classification::CLEAN);
    EXPECT_FALSE(v.has_notes());
}

TEST(AggregatorTest, Thresholds) {
    using M = DetectionMethod;
    EXPECT_EQ(aggregate({ MakeFinding(M::HEURISTIC, 1, "a") }).classification, Classification::CLEAN);
    EXPECT_TRUE(aggregate({ MakeFinding(M::HEURISTIC, 1, "a") }).has_notes());
    EXPECT_EQ(aggregate({ MakeFinding(M::HEURISTIC, 3, "a") }).risk_score, 30);
    EXPECT_EQ(aggregate({ MakeFinding(M::HEURISTIC, 4, "a") }).classification, Classification::SUSPICIOUS);
    EXPECT_EQ(aggregate({ MakeFinding(M::HEURISTIC, 3, "a"), MakeFinding(M::HEURISTIC, 3, "b") }).classification,
              Classification::SUSPICIOUS);
    EXPECT_EQ(aggregate({ MakeFinding(M::HEURISTIC, 7, "a") }).classification, Classification::MALICIOUS);
}

TEST(AggregatorTest, Score_Capped_At_100) {
    std::vector<Finding> findings;
    for (int i = 0; i < 12; ++i) findings.push_back(MakeFinding(DetectionMethod::HEURISTIC, 10, std::to_string(i)));
    EXPECT_EQ(aggregate(findings).risk_score, 100);
}

TEST(AggregatorTest, Severity_Clamped) {
    Verdict v = aggregate({ MakeFinding(DetectionMethod::HEURISTIC, 25, "big"),
                            MakeFinding(DetectionMethod::HEURISTIC, 0, "zero") });
    EXPECT_EQ(v.risk_score, 100);
    ASSERT_EQ(v.findings.size(), 2u);
    EXPECT_EQ(v.findings[0].severity, 10);
    EXPECT_EQ(v.findings[1].severity, 1);
    EXPECT_EQ(aggregate({ MakeFinding(DetectionMethod::HEURISTIC, -5, "neg") }).risk_score, 10);
}

TEST(AggregatorTest, Signature_Hit_Is_Malicious) {
    Verdict v = aggregate({ MakeFinding(DetectionMethod::SIGNATURE, 10, "Known signature: Worm.Win32") });
    EXPECT_EQ(v.classification, Classification::MALICIOUS);
}

TEST(AggregatorTest, Permutation_Invariant) {
    std::vector<Finding> base = {
        MakeFinding(DetectionMethod::AI_MODEL, 5, "model"),
        MakeFinding(DetectionMethod::HEURISTIC, 2, "small exe"),
        MakeFinding(DetectionMethod::HEURISTIC, 4, "WriteProcessMemory", ThreatCategory::TROJAN),
        MakeFinding(DetectionMethod::HEURISTIC, 1, "hidden"),
    };
    Verdict reference = aggregate(base);

    std::vector<size_t> order(base.size());
    std::iota(order.begin(), order.end(), 0);
    while (std::next_permutation(order.begin(), order.end())) {
        std::vector<Finding> shuffled;
        for (size_t i : order) shuffled.push_back(base[i]);
        Verdict v = aggregate(shuffled);
        EXPECT_EQ(v.risk_score, reference.risk_score);
        EXPECT_EQ(v.classification, reference.classification);
        ASSERT_EQ(v.findings.size(), reference.findings.size());
        for (size_t i = 0; i < v.findings.size(); ++i) {
            EXPECT_EQ(v.findings[i].rationale, reference.findings[i].rationale);
            EXPECT_EQ(v.findings[i].severity, reference.findings[i].severity);
        }
    }
}

TEST(AggregatorTest, Adding_Finding_Never_Lowers_Score_Or_Tier) {
    std::vector<Finding> findings;
    int prev_score = 0;
    int prev_tier = static_cast<int>(Classification::CLEAN);
    const int severities[] = { 1, 2, 1, 3, 1, 5, 10 };
    for (int s : severities) {
        findings.push_back(MakeFinding(DetectionMethod::HEURISTIC, s, "r" + std::to_string(findings.size())));
        Verdict v = aggregate(findings);
        EXPECT_GE(v.risk_score, prev_score);
        EXPECT_GE(static_cast<int>(v.classification), prev_tier);
        EXPECT_GE(v.risk_score, 0);
        EXPECT_LE(v.risk_score, 100);
        prev_score = v.risk_score;
        prev_tier = static_cast<int>(v.classification);
    }
}

TEST(AggregatorTest, Recompute_Is_Idempotent) {
    Verdict v1 = aggregate({ MakeFinding(DetectionMethod::HEURISTIC, 3, "a"), MakeFinding(DetectionMethod::AI_MODEL, 5, "b") });
    Verdict v2 = aggregate(v1.findings);
    EXPECT_EQ(v1.risk_score, v2.risk_score);
    EXPECT_EQ(v1.classification, v2.classification);
}
