#include "ast_placer/placement/output_assembler.hpp"
#include "ast_placer/core/errors.hpp"

#include <utility>

namespace ast_placer::placement {

std::pair<std::string, std::string> coordinate_column_names(CoordFrame frame) {
    if (frame == CoordFrame::PIXEL) {
        return {"X", "Y"};
    }
    return {"RA", "DEC"};
}

io::Table assemble_output(const io::Table& stars,
                          CoordFrame frame,
                          std::vector<double> coord1,
                          std::vector<double> coord2,
                          const std::vector<long long>* bin_index,
                          const std::string& coord_format) {
    const size_t n = stars.num_rows();
    if (coord1.size() != n || coord2.size() != n) {
        throw ValidationError("coordinate count " + std::to_string(coord1.size()) +
                              " does not match " + std::to_string(n) + " star rows");
    }
    if (bin_index && bin_index->size() != n) {
        throw ValidationError("bin index count does not match star rows");
    }

    const auto [name1, name2] = coordinate_column_names(frame);

    std::vector<io::Column> leading;
    leading.push_back(io::Column::filled_int(kZerosColumn, n, 0));
    leading.push_back(io::Column::filled_int(kOnesColumn, n, 1));
    leading.push_back(io::Column::of_floats(name1, std::move(coord1), coord_format));
    leading.push_back(io::Column::of_floats(name2, std::move(coord2), coord_format));
    if (bin_index) {
        leading.push_back(io::Column::of_ints(kBinIndexColumn, *bin_index));
    }

    io::Table out = stars;
    for (size_t i = 0; i < leading.size(); ++i) {
        if (out.has_column(leading[i].name)) {
            throw ValidationError("star table already has a '" + leading[i].name + "' column");
        }
        out.insert_column(i, std::move(leading[i]));
    }
    return out;
}

std::map<std::string, std::string> fixed_point_formats(const io::Table& table,
                                                       int precision,
                                                       size_t first_column) {
    std::map<std::string, std::string> formats;
    const std::string fmt = "%." + std::to_string(precision) + "f";
    const auto& cols = table.columns();
    for (size_t i = first_column; i < cols.size(); ++i) {
        if (cols[i].is_numeric()) {
            formats[cols[i].name] = fmt;
        }
    }
    return formats;
}

} // namespace ast_placer::placement
