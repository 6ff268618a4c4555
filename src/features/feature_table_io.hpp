#pragma once

#include "features/feature_table.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// FeatureTable file I/O.
//
// CSV: header row, a "date" column (or an unnamed first column, as written
// by dataframe exports) holding YYYY-MM-DD or YYYYMMDD, then any columns.
// Empty fields are missing, fields that parse as numbers become numeric
// cells, everything else is kept as text for the feature preparer to reject.
//
// Parquet: int32 "date" column (YYYYMMDD) plus float64 / utf8 columns.
// ---------------------------------------------------------------------------
namespace table_io {

constexpr const char* DATE_COLUMN = "date";

namespace detail {

inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

inline std::string csv_quote(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

inline std::string format_double(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

inline std::string format_cell(const TableCell& cell) {
    if (cell_is_missing(cell)) return "";
    if (const auto* v = std::get_if<double>(&cell)) return format_double(*v);
    return std::get<std::string>(cell);
}

inline TableCell parse_cell(const std::string& text) {
    if (text.empty()) return std::monostate{};
    if (auto v = parse_number(text)) return *v;
    return text;
}

inline bool is_numeric_column(const std::vector<TableCell>& cells) {
    for (const auto& c : cells) {
        if (std::holds_alternative<std::string>(c)) return false;
    }
    return true;
}

inline void check_arrow(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw std::runtime_error(context + ": " + status.ToString());
    }
}

}  // namespace detail

// ===========================================================================
// CSV
// ===========================================================================

inline FeatureTable read_feature_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open feature CSV: " + path);
    }

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Feature CSV is empty: " + path);
    }
    auto header = detail::split_csv_line(line);

    size_t date_idx = header.size();
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == DATE_COLUMN) {
            date_idx = i;
            break;
        }
    }
    if (date_idx == header.size() && !header.empty() && header[0].empty()) {
        date_idx = 0;
    }
    if (date_idx == header.size()) {
        throw std::runtime_error("Feature CSV has no '" + std::string(DATE_COLUMN) +
                                 "' column: " + path);
    }

    std::vector<int> dates;
    std::vector<std::vector<std::string>> raw(header.size());
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto fields = detail::split_csv_line(line);
        if (fields.size() != header.size()) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(header.size()) + " fields, got " +
                                     std::to_string(fields.size()));
        }
        auto date = time_utils::parse_date(fields[date_idx]);
        if (!date) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                     ": invalid date '" + fields[date_idx] + "'");
        }
        dates.push_back(*date);
        for (size_t c = 0; c < fields.size(); ++c) raw[c].push_back(fields[c]);
    }

    FeatureTable table(std::move(dates));
    for (size_t c = 0; c < header.size(); ++c) {
        if (c == date_idx) continue;
        std::vector<TableCell> cells;
        cells.reserve(raw[c].size());
        for (const auto& text : raw[c]) cells.push_back(detail::parse_cell(text));
        table.set_cells(header[c], std::move(cells));
    }
    return table;
}

inline void write_feature_csv(const FeatureTable& table, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }

    out << DATE_COLUMN;
    for (const auto& name : table.column_names()) out << "," << detail::csv_quote(name);
    out << "\n";

    for (size_t r = 0; r < table.num_rows(); ++r) {
        out << time_utils::format_date(table.date(r));
        for (const auto& name : table.column_names()) {
            out << "," << detail::csv_quote(detail::format_cell(table.cell(name, r)));
        }
        out << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed to write feature CSV: " + path);
    }
}

// ===========================================================================
// Parquet
// ===========================================================================

inline void write_feature_parquet(const FeatureTable& table, const std::string& path) {
    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;

    fields.push_back(arrow::field(DATE_COLUMN, arrow::int32()));
    {
        arrow::Int32Builder b;
        detail::check_arrow(b.AppendValues(table.dates()), "append dates");
        detail::check_arrow(b.Finish(&arr), "finish dates");
        arrays.push_back(arr);
    }

    for (const auto& name : table.column_names()) {
        const auto& cells = table.cells(name);
        if (detail::is_numeric_column(cells)) {
            fields.push_back(arrow::field(name, arrow::float64()));
            arrow::DoubleBuilder b;
            for (const auto& c : cells) {
                if (cell_is_missing(c)) detail::check_arrow(b.AppendNull(), name);
                else detail::check_arrow(b.Append(std::get<double>(c)), name);
            }
            detail::check_arrow(b.Finish(&arr), name);
        } else {
            fields.push_back(arrow::field(name, arrow::utf8()));
            arrow::StringBuilder b;
            for (const auto& c : cells) {
                if (cell_is_missing(c)) detail::check_arrow(b.AppendNull(), name);
                else detail::check_arrow(b.Append(detail::format_cell(c)), name);
            }
            detail::check_arrow(b.Finish(&arr), name);
        }
        arrays.push_back(arr);
    }

    auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto num_rows = static_cast<int64_t>(std::max<size_t>(table.num_rows(), 1));
    detail::check_arrow(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(),
                                                   outfile, num_rows, props),
                        "Failed to write Parquet " + path);
    detail::check_arrow(outfile->Close(), "Failed to close Parquet " + path);
}

inline FeatureTable read_feature_parquet(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + path);
    }

    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw std::runtime_error("Not a Parquet file: " + path + " (" +
                                 file_reader_result.status().ToString() + ")");
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> arrow_table;
    detail::check_arrow(reader->ReadTable(&arrow_table), "Failed to read Parquet " + path);

    auto date_col = arrow_table->GetColumnByName(DATE_COLUMN);
    if (!date_col) {
        throw std::runtime_error("Parquet file has no '" + std::string(DATE_COLUMN) +
                                 "' column: " + path);
    }

    std::vector<int> dates;
    for (const auto& chunk : date_col->chunks()) {
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) throw std::runtime_error("Null date in " + path);
            if (auto a32 = std::dynamic_pointer_cast<arrow::Int32Array>(chunk)) {
                dates.push_back(a32->Value(i));
            } else if (auto a64 = std::dynamic_pointer_cast<arrow::Int64Array>(chunk)) {
                dates.push_back(static_cast<int>(a64->Value(i)));
            } else if (auto s = std::dynamic_pointer_cast<arrow::StringArray>(chunk)) {
                auto d = time_utils::parse_date(s->GetString(i));
                if (!d) throw std::runtime_error("Invalid date '" + s->GetString(i) + "' in " + path);
                dates.push_back(*d);
            } else {
                throw std::runtime_error("Unsupported date column type in " + path + ": " +
                                         chunk->type()->ToString());
            }
        }
    }

    FeatureTable table(std::move(dates));
    for (int c = 0; c < arrow_table->num_columns(); ++c) {
        const auto& name = arrow_table->field(c)->name();
        if (name == DATE_COLUMN) continue;

        std::vector<TableCell> cells;
        cells.reserve(table.num_rows());
        for (const auto& chunk : arrow_table->column(c)->chunks()) {
            for (int64_t i = 0; i < chunk->length(); ++i) {
                if (chunk->IsNull(i)) {
                    cells.emplace_back(std::monostate{});
                } else if (auto d = std::dynamic_pointer_cast<arrow::DoubleArray>(chunk)) {
                    cells.emplace_back(d->Value(i));
                } else if (auto f = std::dynamic_pointer_cast<arrow::FloatArray>(chunk)) {
                    cells.emplace_back(static_cast<double>(f->Value(i)));
                } else if (auto i64 = std::dynamic_pointer_cast<arrow::Int64Array>(chunk)) {
                    cells.emplace_back(static_cast<double>(i64->Value(i)));
                } else if (auto i32 = std::dynamic_pointer_cast<arrow::Int32Array>(chunk)) {
                    cells.emplace_back(static_cast<double>(i32->Value(i)));
                } else if (auto s = std::dynamic_pointer_cast<arrow::StringArray>(chunk)) {
                    cells.emplace_back(s->GetString(i));
                } else {
                    throw std::runtime_error("Unsupported type for column '" + name + "' in " +
                                             path + ": " + chunk->type()->ToString());
                }
            }
        }
        table.set_cells(name, std::move(cells));
    }
    return table;
}

}  // namespace table_io
