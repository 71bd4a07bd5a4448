#include "Evidence.h"
#include "ScanErrors.h"
#include "ThreatTypes.h"
#include "Logger.h"
#include <cmath>
#include <algorithm>
#include <ios>
#include <memory>
#include <set>
#include <vector>
#include <system_error>
#include <openssl/evp.h>
#include <zip.h>
#include <boost/iostreams/device/file.hpp>

namespace fs = std::filesystem;

namespace {
    // Deadline is checked once per CHECK_EVERY chunks (256 KiB).
    constexpr size_t CHECK_EVERY = 64;

    const std::string ZIP_MAGIC("\x50\x4B\x03\x04", 4);

    const std::set<std::string> CONTAINER_EXTENSIONS = {
        ".jar", ".docm", ".xlsm", ".pptm", ".zip"
    };

    struct EvpCtxDeleter {
        void operator()(EVP_MD_CTX* p) const noexcept { EVP_MD_CTX_free(p); }
    };
    using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

    struct ZipDeleter {
        void operator()(zip_t* z) const noexcept { zip_discard(z); }
    };

    // One incremental EVP digest. Throws IOError if OpenSSL refuses to run it.
    class Digest {
    public:
        explicit Digest(const EVP_MD* md) : m_ctx(EVP_MD_CTX_new()) {
            if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), md, nullptr) != 1)
                throw IOError("EVP digest init failed");
        }

        void update(const char* data, size_t size) {
            if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1)
                throw IOError("EVP digest update failed");
        }

        std::string hex() {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;
            if (EVP_DigestFinal_ex(m_ctx.get(), hash, &hash_len) != 1)
                throw IOError("EVP digest final failed");
            static const char* digits = "0123456789abcdef";
            std::string out;
            out.reserve(hash_len * 2);
            for (unsigned int i = 0; i < hash_len; ++i) {
                out.push_back(digits[hash[i] >> 4]);
                out.push_back(digits[hash[i] & 0x0F]);
            }
            return out;
        }

    private:
        EvpCtxPtr m_ctx;
    };
}

double shannon_entropy(const std::array<std::uint64_t, 256>& histogram, std::uint64_t length) {
    if (length == 0) return 0.0;
    double entropy = 0.0;
    const double total = static_cast<double>(length);
    for (std::uint64_t count : histogram) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

double shannon_entropy(const char* data, size_t size) {
    std::array<std::uint64_t, 256> histogram{};
    for (size_t i = 0; i < size; ++i)
        histogram[static_cast<unsigned char>(data[i])]++;
    return shannon_entropy(histogram, size);
}

std::string normalized_extension(const fs::path& path) {
    return to_lower(path.extension().string());
}

Evidence EvidenceExtractor::extract(const fs::path& path,
                                    const ExtractOptions& options,
                                    std::chrono::steady_clock::time_point deadline) const {
    if (std::chrono::steady_clock::now() > deadline)
        throw TimeoutError("Deadline expired before reading " + path.string());

    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec) throw IOError("Cannot stat " + path.string() + ": " + ec.message());
    if (!fs::is_regular_file(st)) throw IOError("Not a regular file: " + path.string());
    std::uintmax_t expected_size = fs::file_size(path, ec);
    if (ec) throw IOError("Cannot read size of " + path.string() + ": " + ec.message());

    Evidence ev;
    ev.path = path;
    ev.extension = normalized_extension(path);
    ev.hidden = !path.filename().empty() && path.filename().string().front() == '.';
    ev.permissions = st.permissions();

    Digest sha256(EVP_sha256());
    std::unique_ptr<Digest> md5;
    if (options.legacy_digests) md5 = std::make_unique<Digest>(EVP_md5());

    std::array<std::uint64_t, 256> histogram{};
    std::uint64_t length = 0;

    // Plain reads, not a mapping: a file truncated by another process while we
    // read it must surface as a short read, not as SIGBUS.
    if (expected_size > 0) {
        boost::iostreams::file_source source(path.string(), std::ios::in | std::ios::binary);
        if (!source.is_open()) throw IOError("Cannot open " + path.string());

        ev.content_sample.reserve(static_cast<size_t>(std::min<std::uintmax_t>(expected_size, options.sample_bytes)));

        std::array<char, CHUNK_SIZE> chunk;
        size_t chunk_index = 0;
        while (length < expected_size) {
            if (chunk_index % CHECK_EVERY == 0 && std::chrono::steady_clock::now() > deadline)
                throw TimeoutError("Timed out reading " + path.string() + " at offset "
                                   + std::to_string(length));
            ++chunk_index;

            const auto want = static_cast<std::streamsize>(
                std::min<std::uintmax_t>(CHUNK_SIZE, expected_size - length));
            std::streamsize got = source.read(chunk.data(), want);
            if (got <= 0)
                throw IOError("Short read on " + path.string() + ": " + std::to_string(length)
                              + " of " + std::to_string(expected_size) + " bytes (file changed)");

            const size_t n = static_cast<size_t>(got);
            sha256.update(chunk.data(), n);
            if (md5) md5->update(chunk.data(), n);
            for (size_t i = 0; i < n; ++i)
                histogram[static_cast<unsigned char>(chunk[i])]++;
            if (ev.content_sample.size() < options.sample_bytes) {
                size_t take = std::min(n, options.sample_bytes - ev.content_sample.size());
                ev.content_sample.append(chunk.data(), take);
            }
            length += n;
        }
        source.close();
    }

    ev.size_bytes = length;
    ev.sha256 = sha256.hex();
    if (md5) ev.md5 = md5->hex();
    ev.entropy = shannon_entropy(histogram, length);

    if (options.expand_containers && CONTAINER_EXTENSIONS.count(ev.extension)
        && ev.content_sample.compare(0, ZIP_MAGIC.size(), ZIP_MAGIC) == 0) {
        if (auto expanded = expand_container(path, options.sample_bytes)) {
            ev.content_sample = std::move(*expanded);
        }
        else {
            Logger::info("Container not expanded, using raw sample: " + path.string());
        }
    }

    ev.created_at = std::chrono::system_clock::now();
    return ev;
}

std::optional<std::string> EvidenceExtractor::expand_container(const fs::path& path, size_t limit) {
    int errcode = 0;
    std::unique_ptr<zip_t, ZipDeleter> archive(zip_open(path.c_str(), ZIP_RDONLY, &errcode));
    if (!archive) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        Logger::info("Failed to open container " + path.filename().string()
                     + " - " + zip_error_strerror(&ze));
        zip_error_fini(&ze);
        return std::nullopt;
    }

    zip_int64_t num_entries = zip_get_num_entries(archive.get(), 0);
    if (num_entries < 0 || num_entries > MAX_CONTAINER_ENTRIES) return std::nullopt;

    std::string sample;
    size_t total_size = 0;
    std::vector<char> entry_buf;
    for (zip_int64_t i = 0; i < num_entries && sample.size() < limit; ++i) {
        const char* name = zip_get_name(archive.get(), i, ZIP_FL_ENC_RAW);
        if (!name) continue;
        std::string name_str(name);
        if (name_str.empty() || name_str.back() == '/') continue;

        zip_stat_t stat;
        if (zip_stat_index(archive.get(), i, 0, &stat) != 0) continue;
        if (total_size + stat.size > MAX_UNCOMPRESSED_SIZE) break;

        sample.append(name_str);
        sample.push_back('\n');

        size_t want = std::min<size_t>(stat.size, limit > sample.size() ? limit - sample.size() : 0);
        if (want == 0) break;

        zip_file_t* zf = zip_fopen_index(archive.get(), i, 0);
        if (!zf) continue;
        entry_buf.resize(want);
        zip_int64_t bytes_read = zip_fread(zf, entry_buf.data(), want);
        zip_fclose(zf);
        if (bytes_read <= 0) continue;

        sample.append(entry_buf.data(), static_cast<size_t>(bytes_read));
        sample.push_back('\n');
        total_size += stat.size;
    }
    if (sample.size() > limit) sample.resize(limit);
    return sample;
}
