#include <filesystem>
#include <string>
#include <iostream>
#include "generator/Generator.h"

namespace fs = std::filesystem;

// generate_dataset [out_dir] [file_count] [max_depth] [seed]
int main(int argc, char** argv) {
    fs::path out_dir = (argc > 1) ? fs::path(argv[1]) : fs::path("test_data");
    size_t file_count = 200;
    int max_depth = 3;
    std::uint32_t seed = std::random_device{}();

    try {
        if (argc > 2) file_count = std::stoul(argv[2]);
        if (argc > 3) max_depth = std::stoi(argv[3]);
        if (argc > 4) seed = static_cast<std::uint32_t>(std::stoul(argv[4]));
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    ScanTreeGenerator gen(seed);
    GenStats stats;
    try {
        stats = gen.generate(out_dir.string(), file_count, max_depth);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Cannot generate into " << out_dir.string() << ": " << e.what() << "\n";
        return 1;
    }

    stats.print();
    std::cout << "Seed: " << seed << ", folder: " << out_dir.string() << "\n";
    std::cout << "Run: SentinelScanApp custom " << out_dir.string() << "\n";
    return 0;
}
