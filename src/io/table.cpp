#include "ast_placer/io/table.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"

#include <utility>

namespace ast_placer::io {

Column Column::of_ints(const std::string& name, std::vector<long long> values) {
    Column c;
    c.name = name;
    c.type = ColumnType::INT;
    c.ints = std::move(values);
    return c;
}

Column Column::of_floats(const std::string& name, std::vector<double> values,
                         const std::string& format) {
    Column c;
    c.name = name;
    c.type = ColumnType::FLOAT;
    c.floats = std::move(values);
    c.format = format;
    return c;
}

Column Column::of_texts(const std::string& name, std::vector<std::string> values) {
    Column c;
    c.name = name;
    c.type = ColumnType::TEXT;
    c.texts = std::move(values);
    return c;
}

Column Column::filled_int(const std::string& name, size_t n, long long value) {
    return of_ints(name, std::vector<long long>(n, value));
}

size_t Column::size() const {
    switch (type) {
        case ColumnType::INT: return ints.size();
        case ColumnType::FLOAT: return floats.size();
        case ColumnType::TEXT: return texts.size();
    }
    return 0;
}

double Column::as_double(size_t row) const {
    switch (type) {
        case ColumnType::INT: return static_cast<double>(ints.at(row));
        case ColumnType::FLOAT: return floats.at(row);
        case ColumnType::TEXT: break;
    }
    throw TableFormatError("Column '" + name + "' is not numeric");
}

std::string Column::cell_to_string(size_t row) const {
    if (format.empty() && type != ColumnType::TEXT && source.size() == size()) {
        return source.at(row);
    }
    switch (type) {
        case ColumnType::INT:
            if (!format.empty()) {
                return core::format_double(format, static_cast<double>(ints.at(row)));
            }
            return std::to_string(ints.at(row));
        case ColumnType::FLOAT:
            if (format.empty()) {
                return core::format_double_round_trip(floats.at(row));
            }
            return core::format_double(format, floats.at(row));
        case ColumnType::TEXT: {
            const std::string& s = texts.at(row);
            if (s.empty() || s.find_first_of(" \t") != std::string::npos) {
                return "\"" + s + "\"";
            }
            return s;
        }
    }
    return "";
}

Column Column::take(const std::vector<size_t>& rows) const {
    Column out;
    out.name = name;
    out.type = type;
    out.format = format;
    if (!source.empty()) {
        out.source.reserve(rows.size());
        for (size_t r : rows) out.source.push_back(source.at(r));
    }
    switch (type) {
        case ColumnType::INT:
            out.ints.reserve(rows.size());
            for (size_t r : rows) out.ints.push_back(ints.at(r));
            break;
        case ColumnType::FLOAT:
            out.floats.reserve(rows.size());
            for (size_t r : rows) out.floats.push_back(floats.at(r));
            break;
        case ColumnType::TEXT:
            out.texts.reserve(rows.size());
            for (size_t r : rows) out.texts.push_back(texts.at(r));
            break;
    }
    return out;
}

std::vector<std::string> Table::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& c : columns_) {
        names.push_back(c.name);
    }
    return names;
}

bool Table::has_column(const std::string& name) const {
    for (const auto& c : columns_) {
        if (c.name == name) return true;
    }
    return false;
}

size_t Table::index_of(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return i;
    }
    throw TableFormatError("Missing column '" + name + "'");
}

const Column& Table::column(const std::string& name) const {
    return columns_[index_of(name)];
}

Column& Table::column(const std::string& name) {
    return columns_[index_of(name)];
}

VectorXd Table::numeric_column(const std::string& name) const {
    const Column& c = column(name);
    if (!c.is_numeric()) {
        throw TableFormatError("Column '" + name + "' is not numeric");
    }
    VectorXd out(static_cast<Eigen::Index>(num_rows_));
    for (size_t i = 0; i < num_rows_; ++i) {
        out[static_cast<Eigen::Index>(i)] = c.as_double(i);
    }
    return out;
}

void Table::check_new_column(const Column& column) const {
    if (column.name.empty()) {
        throw TableFormatError("Column name must not be empty");
    }
    if (has_column(column.name)) {
        throw TableFormatError("Duplicate column '" + column.name + "'");
    }
    if (!columns_.empty() && column.size() != num_rows_) {
        throw TableFormatError("Column '" + column.name + "' has " +
                               std::to_string(column.size()) + " rows, table has " +
                               std::to_string(num_rows_));
    }
}

void Table::add_column(Column column) {
    insert_column(columns_.size(), std::move(column));
}

void Table::insert_column(size_t index, Column column) {
    check_new_column(column);
    if (index > columns_.size()) {
        throw TableFormatError("Column index out of range: " + std::to_string(index));
    }
    if (columns_.empty()) {
        num_rows_ = column.size();
    }
    columns_.insert(columns_.begin() + static_cast<std::ptrdiff_t>(index), std::move(column));
}

Table Table::take_rows(const std::vector<size_t>& rows) const {
    Table out;
    for (const auto& c : columns_) {
        out.columns_.push_back(c.take(rows));
    }
    out.num_rows_ = rows.size();
    return out;
}

} // namespace ast_placer::io
