#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <random>

// Ground truth сгенерированного дерева
struct GenStats {
    int clean_text = 0;           // .txt — отсекается фильтром расширений
    int clean_scripts = 0;        // .sh/.js/.bat без подозрительных API → CLEAN
    int suspicious_scripts = 0;   // .ps1/.vbs с API инъекций → MALICIOUS
    int high_entropy = 0;         // .dll со случайными байтами → CLEAN (с заметками)
    int tiny_executables = 0;     // keygen_N.exe < 1 KiB → MALICIOUS
    int directories = 0;

    int total_files = 0;
    size_t total_bytes = 0;

    // Сколько файлов должно дойти до вердикта при custom-скане корня
    int expected_scanned() const { return clean_scripts + suspicious_scripts + high_entropy + tiny_executables; }
    int expected_threats() const { return suspicious_scripts + tiny_executables; }

    void print() const {
        std::cout << "===== GENERATION REPORT (Ground Truth) =====" << std::endl;
        std::cout << "Clean text (.txt): " << clean_text
            << " | Clean scripts: " << clean_scripts << std::endl;
        std::cout << "Suspicious scripts: " << suspicious_scripts
            << " | Tiny executables: " << tiny_executables
            << " | High entropy blobs: " << high_entropy << std::endl;
        std::cout << "----------------" << std::endl;
        std::cout << "Directories: " << directories
            << " | Total Files: " << total_files
            << " | Total Size: " << (total_bytes / 1024) << " KB" << std::endl;
        std::cout << "Expected threats: " << expected_threats() << std::endl;
        std::cout << "============================================" << std::endl;
    }
};

class ScanTreeGenerator {
public:
    explicit ScanTreeGenerator(std::uint32_t seed = std::random_device{}());

    // Пишет file_count файлов в output_dir, раскладывая их по вложенным
    // каталогам глубиной до max_depth (0 — всё в корне).
    GenStats generate(const std::string& output_dir, size_t file_count, int max_depth = 3);

private:
    enum class Kind { CLEAN_TEXT, CLEAN_SCRIPT, SUSPICIOUS_SCRIPT, HIGH_ENTROPY, TINY_EXECUTABLE };

    std::mt19937 rng;

    // Словарь без слов, на которые срабатывают эвристики
    static const std::vector<std::string> dictionary;
    static const std::vector<std::string> suspicious_calls;
    static const std::vector<std::string> denylisted_names;

    Kind pick_kind();
    std::filesystem::path pick_directory(const std::vector<std::filesystem::path>& dirs);

    void fill_text(std::ostream& out, size_t size);
    void fill_script(std::ostream& out, size_t size);
    void fill_suspicious_script(std::ostream& out, size_t size);
    void fill_random(std::ostream& out, size_t size);

    void update_stats(GenStats& stats, Kind kind, size_t bytes);
};
