#include "annual_mosaic/core/utils.hpp"
#include "annual_mosaic/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace annual_mosaic::core {

namespace {

struct DigestContextFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// Incremental SHA-256 over an OpenSSL EVP context.
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw IOError("cannot initialise SHA-256 digest");
        }
    }

    void update(const void* data, size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw IOError("SHA-256 update failed");
        }
    }

    std::string hex() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            throw IOError("SHA-256 finalisation failed");
        }
        static const char* kHex = "0123456789abcdef";
        std::string out;
        out.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            out += kHex[digest[i] >> 4];
            out += kHex[digest[i] & 0x0f];
        }
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, DigestContextFree> ctx_;
};

char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string get_iso_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string get_run_id() {
    const std::time_t secs = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&secs, &local);

    std::random_device rd;
    std::uniform_int_distribution<unsigned int> dist(0, 0xffffffffu);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S") << '_'
        << std::hex << std::setfill('0') << std::setw(8) << dist(rd);
    return oss.str();
}

std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) return files;

    std::vector<std::string> globs;
    for (const auto& p : split(pattern, ';')) {
        if (!trim(p).empty()) globs.push_back(trim(p));
    }

    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        const bool wanted = std::any_of(globs.begin(), globs.end(),
                                        [&](const std::string& g) { return glob_match(g, name); });
        if (wanted) files.push_back(entry.path());
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string sha256_hex(const std::string& data) {
    Sha256 digest;
    digest.update(data.data(), data.size());
    return digest.hex();
}

std::string sha256_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + path.string());
    }
    Sha256 digest;
    std::array<char, 64 * 1024> buffer;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in.gcount() > 0) {
            digest.update(buffer.data(), static_cast<size_t>(in.gcount()));
        }
    }
    if (in.bad()) {
        throw IOError("cannot read " + path.string());
    }
    return digest.hex();
}

float median_of(std::vector<float>& v) {
    if (v.empty()) return kNoData;
    const size_t n = v.size();
    const auto mid = v.begin() + static_cast<std::ptrdiff_t>(n / 2);
    std::nth_element(v.begin(), mid, v.end());
    if (n % 2 == 1) return *mid;
    // Lower middle is the largest element left of `mid`.
    const double lo = *std::max_element(v.begin(), mid);
    return static_cast<float>(0.5 * (lo + static_cast<double>(*mid)));
}

std::string to_lower(const std::string& s) {
    std::string out(s.size(), '\0');
    std::transform(s.begin(), s.end(), out.begin(), fold);
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool iequals(const std::string& a, const std::string& b) {
    return to_lower(trim(a)) == to_lower(trim(b));
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        const size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            if (start < str.size()) parts.push_back(str.substr(start));
            return parts;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    // Greedy wildcard match with single-star backtracking.
    size_t p = 0, s = 0;
    size_t star = std::string::npos, resume = 0;
    while (s < str.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || fold(pattern[p]) == fold(str[s]))) {
            ++p;
            ++s;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = s;
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace annual_mosaic::core
