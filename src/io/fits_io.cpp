#include "ast_placer/io/fits_io.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"
#include "ast_placer/io/ascii_table.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstring>
#include <limits>
#include <vector>

namespace ast_placer::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_number(const std::string& key) const {
    if (auto d = get_double(key)) return d;
    if (auto i = get_int(key)) return static_cast<double>(*i);
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

// Closes the file on scope exit; status of the close is not reported
struct FitsFileGuard {
    fitsfile* fptr = nullptr;
    ~FitsFileGuard() {
        if (fptr) {
            int status = 0;
            fits_close_file(fptr, &status);
        }
    }
};

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

FitsHeader parse_current_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        throw FitsError("Cannot read header size: " + fits_status_text(status));
    }

    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        std::string val_str(value);
        if (val_str.empty()) continue;

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    // Out of int range: keep full precision as floating
                    try {
                        header.set(key, std::stod(val_str));
                    } catch (const std::exception&) {
                        header.set(key, val_str);
                    }
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    return header;
}

Column read_string_column(fitsfile* fptr, int colnum, const std::string& name,
                          LONGLONG nrows, long width, const fs::path& path) {
    std::vector<std::string> values;
    values.reserve(static_cast<size_t>(nrows));
    if (nrows == 0) {
        return Column::of_texts(name, std::move(values));
    }

    std::vector<std::vector<char>> storage(static_cast<size_t>(nrows),
                                           std::vector<char>(static_cast<size_t>(width) + 1, '\0'));
    std::vector<char*> ptrs;
    ptrs.reserve(storage.size());
    for (auto& s : storage) ptrs.push_back(s.data());

    int status = 0;
    int anynul = 0;
    char nulstr[] = "";
    fits_read_col_str(fptr, colnum, 1, 1, nrows, nulstr, ptrs.data(), &anynul, &status);
    if (status) {
        throw FitsError("Cannot read column '" + name + "' of " + path.string() + ": " +
                        fits_status_text(status));
    }
    for (auto* p : ptrs) {
        values.push_back(core::trim(std::string(p)));
    }
    return Column::of_texts(name, std::move(values));
}

} // namespace

FitsHeader read_fits_header(const fs::path& path, int hdu) {
    FitsFileGuard guard;
    int status = 0;

    if (fits_open_file(&guard.fptr, path.string().c_str(), READONLY, &status)) {
        guard.fptr = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int nhdus = 0;
    fits_get_num_hdus(guard.fptr, &nhdus, &status);
    if (status) {
        throw FitsError("Cannot count HDUs in " + path.string());
    }

    int hdunum = (hdu >= 0 && hdu < nhdus) ? hdu + 1 : 1;
    int hdutype = 0;
    if (fits_movabs_hdu(guard.fptr, hdunum, &hdutype, &status)) {
        throw FitsError("Cannot move to HDU " + std::to_string(hdunum - 1) + " of " +
                        path.string());
    }

    return parse_current_header(guard.fptr);
}

Table read_fits_table(const fs::path& path, int hdu, std::ostream* log_out) {
    FitsFileGuard guard;
    int status = 0;

    if (fits_open_file(&guard.fptr, path.string().c_str(), READONLY, &status)) {
        guard.fptr = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int nhdus = 0;
    fits_get_num_hdus(guard.fptr, &nhdus, &status);
    if (status) {
        throw FitsError("Cannot count HDUs in " + path.string());
    }

    int hdutype = IMAGE_HDU;
    if (hdu > 0) {
        if (hdu >= nhdus || fits_movabs_hdu(guard.fptr, hdu + 1, &hdutype, &status)) {
            throw FitsError("No HDU " + std::to_string(hdu) + " in " + path.string());
        }
    } else {
        for (int h = 1; h <= nhdus; ++h) {
            status = 0;
            if (fits_movabs_hdu(guard.fptr, h, &hdutype, &status)) continue;
            if (hdutype == BINARY_TBL || hdutype == ASCII_TBL) break;
        }
    }
    if (hdutype != BINARY_TBL && hdutype != ASCII_TBL) {
        throw FitsError("No table HDU in " + path.string());
    }

    status = 0;
    LONGLONG nrows = 0;
    int ncols = 0;
    fits_get_num_rowsll(guard.fptr, &nrows, &status);
    fits_get_num_cols(guard.fptr, &ncols, &status);
    if (status) {
        throw FitsError("Cannot read table shape of " + path.string());
    }

    Table table;
    for (int col = 1; col <= ncols; ++col) {
        status = 0;
        char ttype[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        std::string key = "TTYPE" + std::to_string(col);
        fits_read_key(guard.fptr, TSTRING, key.c_str(), ttype, comment, &status);
        if (status) {
            throw FitsError("Column " + std::to_string(col) + " of " + path.string() +
                            " has no name");
        }
        std::string name = core::trim(ttype);

        int typecode = 0;
        long repeat = 0;
        long width = 0;
        fits_get_eqcoltype(guard.fptr, col, &typecode, &repeat, &width, &status);
        if (status) {
            throw FitsError("Cannot read type of column '" + name + "'");
        }

        if (typecode == TSTRING) {
            table.add_column(read_string_column(guard.fptr, col, name, nrows, width, path));
            continue;
        }
        if (repeat != 1) {
            if (log_out) {
                *log_out << "[TABLE] Skipping vector column '" << name << "' (repeat="
                         << repeat << ") in " << path.string() << std::endl;
            }
            continue;
        }

        int anynul = 0;
        switch (typecode) {
            case TLOGICAL: {
                std::vector<char> buf(static_cast<size_t>(nrows), 0);
                std::vector<char> nulls(static_cast<size_t>(nrows), 0);
                fits_read_colnull(guard.fptr, TLOGICAL, col, 1, 1, nrows, buf.data(),
                                  nulls.data(), &anynul, &status);
                if (!status && anynul) {
                    throw TableFormatError("Logical column '" + name + "' of " + path.string() +
                                           " has undefined values");
                }
                std::vector<long long> vals(buf.begin(), buf.end());
                if (!status) table.add_column(Column::of_ints(name, std::move(vals)));
                break;
            }
            case TBYTE:
            case TSBYTE:
            case TSHORT:
            case TUSHORT:
            case TINT:
            case TUINT:
            case TLONG:
            case TULONG:
            case TLONGLONG: {
                std::vector<LONGLONG> buf(static_cast<size_t>(nrows));
                std::vector<char> nulls(static_cast<size_t>(nrows), 0);
                fits_read_colnull(guard.fptr, TLONGLONG, col, 1, 1, nrows, buf.data(),
                                  nulls.data(), &anynul, &status);
                if (!status && anynul) {
                    throw TableFormatError("Integer column '" + name + "' of " + path.string() +
                                           " has undefined values");
                }
                std::vector<long long> vals(buf.begin(), buf.end());
                if (!status) table.add_column(Column::of_ints(name, std::move(vals)));
                break;
            }
            default: {
                // Undefined cells read as NaN and are rejected downstream
                std::vector<double> buf(static_cast<size_t>(nrows));
                double nulval = std::numeric_limits<double>::quiet_NaN();
                fits_read_col(guard.fptr, TDOUBLE, col, 1, 1, nrows, &nulval, buf.data(),
                              &anynul, &status);
                if (!status) table.add_column(Column::of_floats(name, std::move(buf)));
                break;
            }
        }
        if (status) {
            throw FitsError("Cannot read column '" + name + "' of " + path.string() + ": " +
                            fits_status_text(status));
        }
    }

    return table;
}

Table read_table(const fs::path& path, int hdu, std::ostream* log_out) {
    if (!fs::exists(path)) {
        throw IOError("Table not found: " + path.string());
    }
    if (is_fits_path(path)) {
        return read_fits_table(path, hdu, log_out);
    }
    return read_ascii_table(path);
}

} // namespace ast_placer::io
