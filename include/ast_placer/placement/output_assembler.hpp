#pragma once

#include "ast_placer/core/types.hpp"
#include "ast_placer/io/table.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ast_placer::placement {

inline const std::string kZerosColumn = "zeros";
inline const std::string kOnesColumn = "ones";
inline const std::string kBinIndexColumn = "bin_index";

// "RA"/"DEC" for sky output, "X"/"Y" for pixel output
std::pair<std::string, std::string> coordinate_column_names(CoordFrame frame);

// [zeros, ones, coord1, coord2, (bin_index), ...stars columns].
// `coord_format` is attached to the coordinate columns.
io::Table assemble_output(const io::Table& stars,
                          CoordFrame frame,
                          std::vector<double> coord1,
                          std::vector<double> coord2,
                          const std::vector<long long>* bin_index,
                          const std::string& coord_format = "");

// Fixed-point format ("%.<precision>f") for every column from `first_column` on
std::map<std::string, std::string> fixed_point_formats(const io::Table& table,
                                                       int precision = 5,
                                                       size_t first_column = 2);

} // namespace ast_placer::placement
