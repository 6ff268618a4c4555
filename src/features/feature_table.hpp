#pragma once

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// TableCell — missing, numeric, or raw text as it arrived from the source.
// A NaN numeric cell is treated as missing.
// ---------------------------------------------------------------------------
using TableCell = std::variant<std::monostate, double, std::string>;

constexpr double MISSING_VALUE = std::numeric_limits<double>::quiet_NaN();

// Strict full-string numeric parse. Leading/trailing whitespace is allowed,
// anything else after the number is not ("1.5abc" fails). Non-finite
// results ("inf", "nan") and hexadecimal forms are rejected.
inline std::optional<double> parse_number(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(begin, end - begin + 1);
    // strtod also takes hex ("0x1A", "0x1p3"); plain decimal only
    if (trimmed.find_first_of("xXpP") != std::string::npos) return std::nullopt;

    errno = 0;
    char* parse_end = nullptr;
    double value = std::strtod(trimmed.c_str(), &parse_end);
    if (parse_end != trimmed.c_str() + trimmed.size() || errno == ERANGE) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

inline bool cell_is_missing(const TableCell& cell) {
    if (std::holds_alternative<std::monostate>(cell)) return true;
    if (const auto* v = std::get_if<double>(&cell)) return std::isnan(*v);
    return false;
}

inline std::optional<double> cell_to_number(const TableCell& cell) {
    if (const auto* v = std::get_if<double>(&cell)) {
        if (std::isnan(*v)) return std::nullopt;
        return *v;
    }
    if (const auto* s = std::get_if<std::string>(&cell)) {
        return parse_number(*s);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// FeatureTable — date-indexed table of named columns.
//
// Rows are trading sessions, indexed by date (int YYYYMMDD). Columns keep
// their insertion order. The table is a value type: scoring returns an
// augmented copy and leaves the caller's table untouched.
// ---------------------------------------------------------------------------
class FeatureTable {
public:
    FeatureTable() = default;
    explicit FeatureTable(std::vector<int> dates) : dates_(std::move(dates)) {}

    size_t num_rows() const { return dates_.size(); }
    size_t num_columns() const { return names_.size(); }

    const std::vector<int>& dates() const { return dates_; }
    int date(size_t row) const { return dates_.at(row); }

    const std::vector<std::string>& column_names() const { return names_; }

    bool has_column(const std::string& name) const {
        return columns_.find(name) != columns_.end();
    }

    void set_column(const std::string& name, const std::vector<double>& values) {
        std::vector<TableCell> cells(values.begin(), values.end());
        set_cells(name, std::move(cells));
    }

    void set_text_column(const std::string& name, const std::vector<std::string>& values) {
        std::vector<TableCell> cells;
        cells.reserve(values.size());
        for (const auto& v : values) {
            if (v.empty()) cells.emplace_back(std::monostate{});
            else cells.emplace_back(v);
        }
        set_cells(name, std::move(cells));
    }

    void set_cells(const std::string& name, std::vector<TableCell> cells) {
        if (cells.size() != dates_.size()) {
            throw std::invalid_argument("Column '" + name + "' has " +
                                        std::to_string(cells.size()) + " values, table has " +
                                        std::to_string(dates_.size()) + " rows");
        }
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            names_.push_back(name);
            columns_.emplace(name, std::move(cells));
        } else {
            it->second = std::move(cells);
        }
    }

    // Creates the column when absent.
    void fill_column(const std::string& name, double value) {
        set_cells(name, std::vector<TableCell>(dates_.size(), TableCell{value}));
    }

    void drop_column(const std::string& name) {
        if (columns_.erase(name) == 0) return;
        names_.erase(std::remove(names_.begin(), names_.end(), name), names_.end());
    }

    const std::vector<TableCell>& cells(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            throw std::invalid_argument("Unknown column: " + name);
        }
        return it->second;
    }

    const TableCell& cell(const std::string& name, size_t row) const {
        return cells(name).at(row);
    }

    void set_value(const std::string& name, size_t row, double value) {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            throw std::invalid_argument("Unknown column: " + name);
        }
        it->second.at(row) = value;
    }

    // Column as doubles; missing and unparseable cells become NaN.
    std::vector<double> numeric_column(const std::string& name) const {
        const auto& col = cells(name);
        std::vector<double> out(col.size(), MISSING_VALUE);
        for (size_t i = 0; i < col.size(); ++i) {
            if (auto v = cell_to_number(col[i])) out[i] = *v;
        }
        return out;
    }

private:
    std::vector<int> dates_;
    std::vector<std::string> names_;
    std::map<std::string, std::vector<TableCell>> columns_;
};
