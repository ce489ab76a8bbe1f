#include "ast_placer/io/ascii_table.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace ast_placer::io {

namespace {

std::vector<std::string> tokenize_line(const std::string& line, const std::string& source,
                                       int line_no) {
    std::vector<std::string> tokens;
    size_t i = 0;
    const size_t n = line.size();
    while (i < n) {
        while (i < n && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) ++i;
        if (i >= n) break;

        if (line[i] == '"') {
            size_t end = line.find('"', i + 1);
            if (end == std::string::npos) {
                throw TableFormatError(source + ":" + std::to_string(line_no) +
                                       ": unterminated quoted value");
            }
            tokens.push_back(line.substr(i + 1, end - i - 1));
            i = end + 1;
        } else {
            size_t start = i;
            while (i < n && line[i] != ' ' && line[i] != '\t' && line[i] != '\r') ++i;
            tokens.push_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

bool parse_int(const std::string& s, long long& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

bool parse_float(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

Column infer_column(const std::string& name, const std::vector<std::string>& cells) {
    std::vector<long long> ints;
    ints.reserve(cells.size());
    bool all_int = true;
    for (const auto& c : cells) {
        long long v = 0;
        if (!parse_int(c, v)) {
            all_int = false;
            break;
        }
        ints.push_back(v);
    }
    if (all_int) {
        Column c = Column::of_ints(name, std::move(ints));
        c.source = cells;
        return c;
    }

    std::vector<double> floats;
    floats.reserve(cells.size());
    bool all_float = true;
    for (const auto& c : cells) {
        double v = 0.0;
        if (!parse_float(c, v)) {
            all_float = false;
            break;
        }
        floats.push_back(v);
    }
    if (all_float) {
        Column c = Column::of_floats(name, std::move(floats));
        c.source = cells;
        return c;
    }

    return Column::of_texts(name, cells);
}

} // namespace

Table parse_ascii_table(const std::string& text, const std::string& source) {
    std::istringstream iss(text);
    std::string line;
    int line_no = 0;

    std::vector<std::string> header;
    std::vector<std::vector<std::string>> cells;

    while (std::getline(iss, line)) {
        ++line_no;
        std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;

        auto tokens = tokenize_line(t, source, line_no);
        if (header.empty()) {
            header = tokens;
            cells.resize(header.size());
            continue;
        }
        if (tokens.size() != header.size()) {
            throw TableFormatError(source + ":" + std::to_string(line_no) + ": expected " +
                                   std::to_string(header.size()) + " values, found " +
                                   std::to_string(tokens.size()));
        }
        for (size_t c = 0; c < tokens.size(); ++c) {
            cells[c].push_back(tokens[c]);
        }
    }

    if (header.empty()) {
        throw TableFormatError(source + ": no header line");
    }

    Table table;
    for (size_t c = 0; c < header.size(); ++c) {
        table.add_column(infer_column(header[c], cells[c]));
    }
    return table;
}

Table read_ascii_table(const fs::path& path) {
    return parse_ascii_table(core::read_text(path), path.string());
}

std::string format_ascii_table(const Table& table,
                               const std::map<std::string, std::string>& formats) {
    std::ostringstream oss;
    oss << core::join(table.column_names(), " ") << "\n";

    std::vector<Column> cols = table.columns();
    for (auto& c : cols) {
        auto it = formats.find(c.name);
        if (it != formats.end()) {
            c.format = it->second;
        }
    }

    for (size_t r = 0; r < table.num_rows(); ++r) {
        for (size_t c = 0; c < cols.size(); ++c) {
            if (c > 0) oss << ' ';
            oss << cols[c].cell_to_string(r);
        }
        oss << "\n";
    }
    return oss.str();
}

void write_ascii_table(const fs::path& path, const Table& table,
                       const std::map<std::string, std::string>& formats) {
    core::write_text(path, format_ascii_table(table, formats));
}

} // namespace ast_placer::io
