#pragma once

#include "ast_placer/io/table.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace ast_placer::io {

namespace fs = std::filesystem;

// Whitespace-delimited text table: '#' comment lines, a header line with
// column names, then one row per line. Column types are inferred
// (integer, then floating point, then text).
Table parse_ascii_table(const std::string& text, const std::string& source = "<memory>");
Table read_ascii_table(const fs::path& path);

// Cell formats by column name override each column's own format.
std::string format_ascii_table(const Table& table,
                               const std::map<std::string, std::string>& formats = {});

// Writes (overwriting) `path`
void write_ascii_table(const fs::path& path, const Table& table,
                       const std::map<std::string, std::string>& formats = {});

} // namespace ast_placer::io
