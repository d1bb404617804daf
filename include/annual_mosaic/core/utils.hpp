#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace annual_mosaic::core {

// UTC, millisecond precision: 2024-03-01T12:00:00.000Z
std::string get_iso_timestamp();

// Local time plus 8 random hex digits: 20240301_120000_1a2b3c4d
std::string get_run_id();

// Regular files in `input_dir` (not recursive) matching any of the
// ';'-separated globs, sorted by path. A missing directory yields nothing.
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern = "*.fit*");

// Lowercase hex digests.
std::string sha256_hex(const std::string& data);
std::string sha256_file(const fs::path& path);

// Partially reorders `v`. Even sizes give the mean of the two middle values,
// an empty input gives kNoData.
float median_of(std::vector<float>& v);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool iequals(const std::string& a, const std::string& b);
bool ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Case-insensitive; '*' matches any run, '?' any single character.
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace annual_mosaic::core
