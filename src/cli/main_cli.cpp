#include <iostream>
#include <filesystem>
#include <string>
#include <iomanip>
#include <thread>
#include <future>
#include <atomic>
#include <chrono>
#include <csignal>
#include "ScanSession.h"
#include "ScanErrors.h"
#include "ConfigLoader.h"
#include "Logger.h"
#include "ReportWriter.h"

namespace fs = std::filesystem;

namespace {
    std::atomic<bool> g_interrupted{false};

    void on_sigint(int) { g_interrupted.store(true); }

    struct CliOptions {
        std::string mode;
        std::string target;
        std::string config_path = "sentinel.json";
        std::string engine;
        int threads = -1;
        long long max_filesize_mb = -1;
        std::string output_json;
        std::string output_txt;
        bool no_report = false;
    };

    std::string engine_display_name(const ScanSession& session, const ScanConfig& config) {
        for (const auto& d : session.detectors()) {
            if (auto h = std::dynamic_pointer_cast<const HeuristicDetector>(d)) return h->engine_name();
        }
        return to_string(config.engine);
    }
}

// ---------------------------------------------------------------------------

void print_ui_help() {
    std::cout << "\n"
        << "==================================================================\n"
        << "              SENTINEL SCAN\n"
        << "==================================================================\n\n"
        << "  SentinelScanApp quick  [options]\n"
        << "  SentinelScanApp deep   [options]\n"
        << "  SentinelScanApp custom <path> [options]\n\n"
        << "OPTIONS:\n"
        << "  -c, --config <file>        Config file (default: sentinel.json)\n"
        << "  -e, --engine <type>        Pattern engine: hs (Hyperscan), re2, boost\n"
        << "  -j, --threads <N>          Worker count (default: CPU cores)\n"
        << "  -m, --max-filesize <MB>    Max file size in MB (default: 100)\n"
        << "  --output-json <path>       Export JSON report to path\n"
        << "  --output-txt <path>        Export TXT report to path\n"
        << "  --no-report                Skip report generation\n"
        << "  --version                  Print version\n"
        << "  Ctrl+C cancels the scan; partial results are still reported.\n"
        << "==================================================================\n";
}

// 0 — ok, иначе код выхода
static int parse_args(int argc, char* argv[], CliOptions& opts) {
    opts.mode = argv[1];
    if (opts.mode != "quick" && opts.mode != "deep" && opts.mode != "custom") {
        std::cerr << "Unknown scan mode: " << opts.mode << "\n";
        print_ui_help();
        return 1;
    }

    int i = 2;
    if (opts.mode == "custom") {
        if (argc < 3 || argv[2][0] == '-') {
            std::cerr << "custom scan needs a path\n";
            print_ui_help();
            return 1;
        }
        opts.target = argv[2];
        i = 3;
    }

    try {
        for (; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                opts.config_path = argv[++i];
            }
            else if ((arg == "-e" || arg == "--engine") && i + 1 < argc) {
                opts.engine = argv[++i];
            }
            else if ((arg == "-j" || arg == "--threads") && i + 1 < argc) {
                opts.threads = std::stoi(argv[++i]);
                if (opts.threads <= 0) opts.threads = 1;
            }
            else if ((arg == "-m" || arg == "--max-filesize") && i + 1 < argc) {
                opts.max_filesize_mb = std::stoll(argv[++i]);
            }
            else if (arg == "--output-json" && i + 1 < argc) {
                opts.output_json = argv[++i];
            }
            else if (arg == "--output-txt" && i + 1 < argc) {
                opts.output_txt = argv[++i];
            }
            else if (arg == "--no-report") {
                opts.no_report = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_ui_help();
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

static void apply_overrides(const CliOptions& opts, ScanConfig& config) {
    if (!opts.engine.empty() && !parse_engine(opts.engine, config.engine)) {
        Logger::warn("Unknown engine '" + opts.engine + "', using " + to_string(config.engine));
    }
    if (opts.threads > 0) config.threads = static_cast<unsigned int>(opts.threads);
    if (opts.max_filesize_mb > 0) {
        config.max_file_size_bytes = static_cast<std::uintmax_t>(opts.max_filesize_mb) * 1024 * 1024;
    }
}

static void print_results(const ScanResult& result) {
    const auto& s = result.statistics;
    std::cout << "\n--- SCAN RESULTS (" << result.policy_name << ", " << to_string(result.status) << ") ---\n";

    size_t notes = 0;
    for (const auto& v : result.verdicts) {
        if (v.has_notes()) ++notes;
        if (v.classification == Classification::CLEAN) continue;
        std::cout << std::left << std::setw(11) << to_string(v.classification)
                  << std::right << std::setw(4) << v.risk_score << "  " << v.path.string() << "\n";
        for (const auto& f : v.findings) {
            std::cout << "             - " << f.rationale << "\n";
        }
    }

    std::cout << "Files scanned: " << s.files_scanned
              << "  suspicious: " << s.suspicious_count
              << "  malicious: " << s.malicious_count
              << "  clean with notes: " << notes
              << "  errors: " << s.error_count
              << "  (" << std::fixed << std::setprecision(2) << s.elapsed_seconds() << "s)\n";
}

int main(int argc, char* argv[]) {
    Logger::init();
    Logger::info("SentinelScan started");

    if (argc < 2) {
        print_ui_help();
        return 1;
    }

    {
        std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            print_ui_help();
            return 0;
        }
        if (first == "--version") {
            std::cout << "SentinelScan 1.0.0\n";
            return 0;
        }
    }

    CliOptions opts;
    if (int rc = parse_args(argc, argv, opts)) return rc;

    Logger::info("Loading config: " + opts.config_path);
    ScanConfig config = ConfigLoader::load(opts.config_path);
    apply_overrides(opts, config);

    std::unique_ptr<ScanSession> session;
    try {
        if (opts.mode == "quick") session = std::make_unique<ScanSession>(ScanSession::quick(config));
        else if (opts.mode == "deep") session = std::make_unique<ScanSession>(ScanSession::deep(config));
        else session = std::make_unique<ScanSession>(ScanSession::custom(opts.target, config));
    }
    catch (const PathNotFound& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::string target = opts.target;
    if (target.empty()) {
        for (const auto& r : session->policy().root_paths) {
            target += (target.empty() ? "" : ", ") + r.string();
        }
    }
    std::string engine_name = engine_display_name(*session, config);
    std::cout << "[Scan]    " << opts.mode << ": " << target << "\n";
    std::cout << "[Engine]  " << engine_name << ", workers: " << session->policy().effective_workers() << "\n";

    std::atomic<std::uint64_t> progress{0};
    session->set_progress_callback([&progress](std::uint64_t scanned, const fs::path&) {
        progress.store(scanned);
    });

    std::signal(SIGINT, on_sigint);

    // Progress indicator (print to stderr every 500ms)
    auto future = std::async(std::launch::async, [&session] { return session->run(); });
    bool cancel_sent = false;
    while (future.wait_for(std::chrono::milliseconds(500)) != std::future_status::ready) {
        if (g_interrupted.load() && !cancel_sent) {
            session->cancel();
            cancel_sent = true;
            std::cerr << "\nCancelling, waiting for workers...\n";
            Logger::info("Cancellation requested by user");
        }
        std::cerr << "\r[" << progress.load() << " files] " << std::flush;
    }
    std::cerr << "\n";
    ScanResult result = future.get();
    std::signal(SIGINT, SIG_DFL);

    print_results(result);

    // Reports
    if (!opts.no_report) {
        std::string json_path = opts.output_json.empty() ? "reports/report.json" : opts.output_json;
        std::string txt_path  = opts.output_txt.empty()  ? "reports/report.txt"  : opts.output_txt;

        std::error_code ec;
        fs::create_directories(fs::absolute(json_path).parent_path(), ec);
        fs::create_directories(fs::absolute(txt_path).parent_path(), ec);

        bool ok_json = ReportWriter::write_json(json_path, result, target, engine_name);
        bool ok_txt = ReportWriter::write_txt(txt_path, result, target, engine_name);
        if (ok_json && ok_txt) {
            Logger::info("Reports saved: " + json_path + ", " + txt_path);
            std::cout << "[Reports] " << json_path << ", " << txt_path << "\n";
        } else {
            Logger::error("Failed to write reports: " + json_path + ", " + txt_path);
        }
    }

    std::cout << "[Log]     " << Logger::path() << "\n";
    return 0;
}
