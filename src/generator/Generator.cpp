#include "generator/Generator.h"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

// Ни одно слово (и их стык через пробел) не совпадает с эвристическими правилами
const std::vector<std::string> ScanTreeGenerator::dictionary = {
    "lorem", "ipsum", "dolor", "sit", "amet", "consectetur", "adipiscing", "elit",
    "the", "and", "is", "in", "at", "of", "to", "for", "with", "on",
    "function", "return", "var", "const", "if", "else", "while",
    "echo", "print", "value", "count", "item", "path", "done", "build"
};

const std::vector<std::string> ScanTreeGenerator::suspicious_calls = {
    "WriteProcessMemory", "CreateRemoteThread", "VirtualAllocEx", "NtCreateThreadEx"
};

const std::vector<std::string> ScanTreeGenerator::denylisted_names = {
    "keygen", "crack", "warez", "trojan"
};

ScanTreeGenerator::ScanTreeGenerator(std::uint32_t seed) {
    rng.seed(seed);
}

ScanTreeGenerator::Kind ScanTreeGenerator::pick_kind() {
    // 20% text, 40% clean scripts, 10% suspicious scripts, 15% blobs, 15% tiny exe
    std::uniform_int_distribution<int> d(0, 99);
    int r = d(rng);
    if (r < 20) return Kind::CLEAN_TEXT;
    if (r < 60) return Kind::CLEAN_SCRIPT;
    if (r < 70) return Kind::SUSPICIOUS_SCRIPT;
    if (r < 85) return Kind::HIGH_ENTROPY;
    return Kind::TINY_EXECUTABLE;
}

fs::path ScanTreeGenerator::pick_directory(const std::vector<fs::path>& dirs) {
    std::uniform_int_distribution<size_t> d(0, dirs.size() - 1);
    return dirs[d(rng)];
}

void ScanTreeGenerator::fill_text(std::ostream& out, size_t size) {
    std::uniform_int_distribution<size_t> pick(0, dictionary.size() - 1);
    size_t written = 0;
    size_t words_in_line = 0;
    while (written < size) {
        const std::string& w = dictionary[pick(rng)];
        out << w;
        written += w.size();
        if (++words_in_line == 12) {
            out << '\n';
            words_in_line = 0;
        } else {
            out << ' ';
        }
        ++written;
    }
}

void ScanTreeGenerator::fill_script(std::ostream& out, size_t size) {
    std::uniform_int_distribution<size_t> pick(0, dictionary.size() - 1);
    out << "#!/bin/sh\n";
    size_t written = 10;
    while (written < size) {
        std::ostringstream line;
        line << "echo " << dictionary[pick(rng)] << " " << dictionary[pick(rng)]
             << " " << dictionary[pick(rng)] << "\n";
        std::string s = line.str();
        out << s;
        written += s.size();
    }
}

void ScanTreeGenerator::fill_suspicious_script(std::ostream& out, size_t size) {
    std::vector<std::string> calls = suspicious_calls;
    std::shuffle(calls.begin(), calls.end(), rng);

    // Минимум три разных вызова: 4 + 4 + 3 → риск выше порога MALICIOUS
    size_t half = size / 2;
    fill_text(out, half);
    out << "\n";
    for (size_t i = 0; i < 3; ++i) {
        out << "$h = [Win32]::" << calls[i] << "($pid, $buf)\n";
    }
    fill_text(out, size - half);
}

void ScanTreeGenerator::fill_random(std::ostream& out, size_t size) {
    std::uniform_int_distribution<int> d(0, 255);
    std::vector<char> buf(size);
    for (size_t i = 0; i < size; ++i) buf[i] = static_cast<char>(d(rng));
    out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
}

void ScanTreeGenerator::update_stats(GenStats& stats, Kind kind, size_t bytes) {
    stats.total_files++;
    stats.total_bytes += bytes;
    switch (kind) {
        case Kind::CLEAN_TEXT:        stats.clean_text++; break;
        case Kind::CLEAN_SCRIPT:      stats.clean_scripts++; break;
        case Kind::SUSPICIOUS_SCRIPT: stats.suspicious_scripts++; break;
        case Kind::HIGH_ENTROPY:      stats.high_entropy++; break;
        case Kind::TINY_EXECUTABLE:   stats.tiny_executables++; break;
    }
}

GenStats ScanTreeGenerator::generate(const std::string& output_dir, size_t file_count, int max_depth) {
    GenStats stats;
    fs::path root = output_dir;
    fs::create_directories(root);

    // Цепочки вложенных каталогов: root/d0, root/d0/d1, ...
    std::vector<fs::path> dirs{ root };
    int branches = std::max(1, max_depth);
    for (int b = 0; b < branches && max_depth > 0; ++b) {
        fs::path dir = root;
        for (int level = 1; level <= max_depth; ++level) {
            dir /= "branch" + std::to_string(b) + "_level" + std::to_string(level);
            fs::create_directories(dir);
            dirs.push_back(dir);
            stats.directories++;
        }
    }

    static const char* script_exts[] = { ".sh", ".js", ".bat" };
    static const char* suspicious_exts[] = { ".ps1", ".vbs" };

    std::uniform_int_distribution<size_t> text_size(256, 4096);
    std::uniform_int_distribution<size_t> blob_size(4096, 16384);
    std::uniform_int_distribution<size_t> tiny_size(256, 900);
    std::uniform_int_distribution<size_t> coin(0, 1);
    std::uniform_int_distribution<size_t> three(0, 2);
    std::uniform_int_distribution<size_t> name_pick(0, denylisted_names.size() - 1);

    for (size_t i = 0; i < file_count; ++i) {
        Kind kind = pick_kind();
        fs::path dir = pick_directory(dirs);
        std::string index = std::to_string(i);

        fs::path path;
        size_t size = 0;
        switch (kind) {
            case Kind::CLEAN_TEXT:
                path = dir / ("notes_" + index + ".txt");
                size = text_size(rng);
                break;
            case Kind::CLEAN_SCRIPT:
                path = dir / ("script_" + index + script_exts[three(rng)]);
                size = text_size(rng);
                break;
            case Kind::SUSPICIOUS_SCRIPT:
                path = dir / ("loader_" + index + suspicious_exts[coin(rng)]);
                size = text_size(rng);
                break;
            case Kind::HIGH_ENTROPY:
                path = dir / ("lib_" + index + ".dll");
                size = blob_size(rng);
                break;
            case Kind::TINY_EXECUTABLE:
                path = dir / (denylisted_names[name_pick(rng)] + "_" + index + ".exe");
                size = tiny_size(rng);
                break;
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "Cannot create " << path.string() << std::endl;
            continue;
        }
        switch (kind) {
            case Kind::CLEAN_TEXT:        fill_text(out, size); break;
            case Kind::CLEAN_SCRIPT:      fill_script(out, size); break;
            case Kind::SUSPICIOUS_SCRIPT: fill_suspicious_script(out, size); break;
            case Kind::HIGH_ENTROPY:
            case Kind::TINY_EXECUTABLE:   fill_random(out, size); break;
        }
        out.close();

        std::error_code ec;
        auto written = fs::file_size(path, ec);
        update_stats(stats, kind, ec ? size : static_cast<size_t>(written));
    }
    return stats;
}
