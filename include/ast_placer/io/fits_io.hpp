#pragma once

#include "ast_placer/core/types.hpp"
#include "ast_placer/io/table.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace ast_placer::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Floating or integer keyword as double
    std::optional<double> get_number(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool is_fits_path(const fs::path& path);

// Header of HDU `hdu` (0 = primary). When the file has no such HDU
// the primary header is returned instead.
FitsHeader read_fits_header(const fs::path& path, int hdu = 0);

// Table HDU `hdu` (0 = first table HDU in the file). Scalar columns only;
// vector-valued columns are skipped and reported on `log_out`.
Table read_fits_table(const fs::path& path, int hdu = 0, std::ostream* log_out = nullptr);

// FITS table for .fits/.fit/.fts paths, whitespace-delimited text otherwise
Table read_table(const fs::path& path, int hdu = 0, std::ostream* log_out = nullptr);

} // namespace ast_placer::io
