#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ast_placer::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
bool all_finite(const VectorXd& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// printf-style formatting of a single double ("%.5f", "%.2f", ...)
std::string format_double(const std::string& fmt, double value);

// Shortest "%.<n>g" rendering (n = 15..17) that parses back to `value`
std::string format_double_round_trip(double value);

} // namespace ast_placer::core
