#include "ScanPolicy.h"
#include <cstdlib>
#include <thread>

namespace fs = std::filesystem;

namespace {
    fs::path home_dir() {
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) : fs::path();
    }

    std::vector<fs::path> quick_roots() {
        std::vector<fs::path> roots = { "/tmp", "/var/tmp" };
        fs::path home = home_dir();
        if (!home.empty()) {
            roots.push_back(home / "Downloads");
            roots.push_back(home / "Desktop");
            roots.push_back(home / ".config" / "autostart");
        }
        return roots;
    }

    std::vector<fs::path> deep_roots() {
        std::vector<fs::path> roots = { "/usr/bin", "/usr/local/bin", "/opt", "/etc" };
        fs::path home = home_dir();
        if (!home.empty()) roots.push_back(home);
        return roots;
    }

    ScanPolicy from_config(const ScanConfig& config) {
        ScanPolicy p;
        p.max_file_size_bytes = config.max_file_size_bytes;
        p.content_sample_bytes = config.content_sample_bytes;
        p.worker_count = config.threads;
        p.file_timeout = config.file_timeout;
        return p;
    }
}

const std::set<std::string>& default_target_extensions() {
    static const std::set<std::string> exts = {
        // Executables
        ".exe", ".dll", ".sys", ".drv", ".ocx", ".cpl", ".so", ".elf",
        // Scripts
        ".bat", ".cmd", ".ps1", ".vbs", ".js", ".jse", ".wsf", ".wsh", ".hta", ".sh",
        // Java
        ".jar", ".class",
        // Office macros
        ".doc", ".docm", ".xls", ".xlsm", ".ppt", ".pptm",
        // Other
        ".scr", ".pif", ".msi", ".com"
    };
    return exts;
}

unsigned int ScanPolicy::effective_workers() const {
    if (worker_count > 0) return worker_count;
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

ExtractOptions ScanPolicy::extract_options() const {
    ExtractOptions opts;
    opts.legacy_digests = legacy_digests;
    opts.sample_bytes = content_sample_bytes;
    return opts;
}

ScanPolicy ScanPolicy::quick(const ScanConfig& config) {
    ScanPolicy p = from_config(config);
    p.name = "quick";
    p.root_paths = config.quick_paths.empty() ? quick_roots() : config.quick_paths;
    p.max_depth = 2;
    return p;
}

ScanPolicy ScanPolicy::deep(const ScanConfig& config) {
    ScanPolicy p = from_config(config);
    p.name = "deep";
    p.root_paths = config.deep_paths.empty() ? deep_roots() : config.deep_paths;
    p.max_depth = 5;
    p.legacy_digests = true;
    return p;
}

ScanPolicy ScanPolicy::custom(const fs::path& root, const ScanConfig& config) {
    ScanPolicy p = from_config(config);
    p.name = "custom";
    p.root_paths = { root };
    p.max_depth = 10;
    return p;
}
