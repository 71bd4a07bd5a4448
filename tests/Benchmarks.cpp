#include <benchmark/benchmark.h>
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <fstream>
#include <memory>
#include <iomanip>
#include <chrono>

#include "PatternEngine.h"
#include "ConfigLoader.h"
#include "Logger.h"
#include "ScanSession.h"
#include "generator/Generator.h"

namespace fs = std::filesystem;

static constexpr uint32_t BENCH_SEED = 42;
static const fs::path BENCH_DIR = "bench_data_stress";

// Правила загружаются из JSON, при его отсутствии — встроенные
static ScanConfig g_config;

struct FileEntry {
    fs::path path;
    std::string content;
};

static std::vector<FileEntry> g_files;
static size_t g_total_bytes = 0;
static GenStats g_expected_stats;

void LoadDataset(const fs::path& folder, size_t count) {
    if (fs::exists(folder)) fs::remove_all(folder);

    std::cout << "[Setup] Generating dataset in " << folder << " (" << count << " files)...\n";
    ScanTreeGenerator gen(BENCH_SEED);
    g_expected_stats = gen.generate(folder.string(), count, 3);

    g_files.clear();
    g_total_bytes = 0;

    for (const auto& entry : fs::recursive_directory_iterator(folder)) {
        if (!entry.is_regular_file()) continue;
        std::ifstream f(entry.path(), std::ios::binary | std::ios::ate);
        if (!f) continue;
        auto size = f.tellg();
        std::string str(static_cast<size_t>(size), '\0');
        f.seekg(0);
        f.read(&str[0], size);

        g_total_bytes += str.size();
        g_files.push_back({ entry.path(), std::move(str) });
    }
    std::cout << "[Setup] Loaded " << g_files.size() << " files, "
        << (g_total_bytes / 1024) << " KB.\n";
}

void PrintVerificationTable(const std::string& engine_name, const ScanStatistics& st) {
    auto row = [&](const std::string& n, long long exp, long long act) {
        std::string status = (act == exp) ? "OK" : (act < exp ? "MISS" : "FP?");
        std::cout << "| " << std::left << std::setw(12) << n
            << " | " << std::setw(6) << exp
            << " | " << std::setw(6) << act
            << " | " << status << "\n";
        };

    std::cout << "\n--- Accuracy: " << engine_name << " ---\n";
    std::cout << "| COUNTER      | GEN    | SCAN   | STATUS\n";
    std::cout << "|--------------|--------|--------|-------\n";
    row("scanned", g_expected_stats.expected_scanned(), static_cast<long long>(st.files_scanned));
    row("filtered", g_expected_stats.clean_text, static_cast<long long>(st.skipped_extension));
    row("threats", g_expected_stats.expected_threats(),
        static_cast<long long>(st.suspicious_count + st.malicious_count));
    std::cout << "------------------------------------------\n";
}

void VerifyAll() {
    std::cout << "\n[Verify] Running verification...\n";

    for (auto type : { EngineType::RE2, EngineType::BOOST, EngineType::HYPERSCAN }) {
        ScanConfig config = g_config;
        config.engine = type;
        ScanResult r = run_custom_scan(BENCH_DIR, config);
        PrintVerificationTable(PatternEngine::create(type)->name(), r.statistics);
    }
}

// Только сопоставление паттернов, без чтения файлов
template <typename EngineT>
void BM_Match(benchmark::State& state) {
    auto engine = std::make_unique<EngineT>();
    engine->prepare(g_config.heuristic_rules);

    size_t total_files = g_files.size();
    size_t batch_size = (total_files + state.threads() - 1) / state.threads();
    size_t start_idx = state.thread_index() * batch_size;
    size_t end_idx = std::min(start_idx + batch_size, total_files);

    for (auto _ : state) {
        size_t hits = 0;
        for (size_t i = start_idx; i < end_idx; ++i) {
            hits += engine->match(g_files[i].content.data(), g_files[i].content.size()).size();
        }
        benchmark::DoNotOptimize(hits);
    }

    size_t bytes_processed = 0;
    for (size_t i = start_idx; i < end_idx; ++i) bytes_processed += g_files[i].content.size();
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * bytes_processed);
}

BENCHMARK_TEMPLATE(BM_Match, Re2PatternEngine)->Name("RE2")->Unit(benchmark::kMillisecond)->Threads(1)->Threads(8);
BENCHMARK_TEMPLATE(BM_Match, BoostPatternEngine)->Name("Boost")->Unit(benchmark::kMillisecond)->Threads(1)->Threads(8);
BENCHMARK_TEMPLATE(BM_Match, HsPatternEngine)->Name("Hyperscan")->Unit(benchmark::kMillisecond)->Threads(1)->Threads(8);

// Хэши + энтропия + sample (с диска, через кэш ОС)
static void BM_Extract(benchmark::State& state) {
    EvidenceExtractor extractor;
    ExtractOptions opts;
    opts.legacy_digests = state.range(0) != 0;

    for (auto _ : state) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        for (const auto& file : g_files) {
            Evidence ev = extractor.extract(file.path, opts, deadline);
            benchmark::DoNotOptimize(ev.entropy);
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(g_total_bytes));
}

BENCHMARK(BM_Extract)->Name("Extract")->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

// Полная сессия: обход + извлечение + детекторы, число воркеров = аргумент
static void BM_Session(benchmark::State& state) {
    ScanPolicy policy = ScanPolicy::custom(BENCH_DIR, g_config);
    policy.worker_count = static_cast<unsigned int>(state.range(0));
    DetectorSet detectors = make_detectors(g_config);

    for (auto _ : state) {
        ScanSession session(policy, detectors);
        ScanResult r = session.run();
        benchmark::DoNotOptimize(r.statistics.files_scanned);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(g_total_bytes));
}

BENCHMARK(BM_Session)->Name("Session")->Arg(1)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond)->UseRealTime();

int main(int argc, char** argv) {
    g_config = ConfigLoader::load("sentinel.json");
    if (g_config.heuristic_rules.empty()) {
        std::cerr << "[Fatal] No heuristic rules loaded\n";
        return 1;
    }
    Logger::init("logs");

    std::cout << ">>> Preparing Benchmark Data...\n";
    LoadDataset(BENCH_DIR, 300);

    VerifyAll();

    std::cout << "\n[Benchmark] Running performance tests...\n";
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    return 0;
}
