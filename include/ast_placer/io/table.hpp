#pragma once

#include "ast_placer/core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ast_placer::io {

enum class ColumnType {
    INT,
    FLOAT,
    TEXT
};

// One named table column. Exactly one of the value vectors is populated,
// selected by `type`.
struct Column {
    std::string name;
    ColumnType type = ColumnType::FLOAT;
    std::vector<long long> ints;
    std::vector<double> floats;
    std::vector<std::string> texts;
    std::string format;  // printf-style cell format; empty = default
    // Cell text as read from a text table; written back verbatim when
    // `format` is empty
    std::vector<std::string> source;

    static Column of_ints(const std::string& name, std::vector<long long> values);
    static Column of_floats(const std::string& name, std::vector<double> values,
                            const std::string& format = "");
    static Column of_texts(const std::string& name, std::vector<std::string> values);
    static Column filled_int(const std::string& name, size_t n, long long value);

    size_t size() const;
    bool is_numeric() const { return type != ColumnType::TEXT; }

    double as_double(size_t row) const;
    std::string cell_to_string(size_t row) const;

    // New column with rows in the given order (indices may repeat)
    Column take(const std::vector<size_t>& rows) const;
};

// Column-oriented table with ordered, uniquely named columns of equal length
class Table {
public:
    Table() = default;

    size_t num_rows() const { return num_rows_; }
    size_t num_columns() const { return columns_.size(); }

    const std::vector<Column>& columns() const { return columns_; }
    std::vector<std::string> column_names() const;

    bool has_column(const std::string& name) const;
    const Column& column(const std::string& name) const;
    Column& column(const std::string& name);

    // Numeric column as a vector; throws TableFormatError for text columns
    VectorXd numeric_column(const std::string& name) const;

    void add_column(Column column);
    void insert_column(size_t index, Column column);

    Table take_rows(const std::vector<size_t>& rows) const;

private:
    size_t index_of(const std::string& name) const;
    void check_new_column(const Column& column) const;

    std::vector<Column> columns_;
    size_t num_rows_ = 0;
};

} // namespace ast_placer::io
