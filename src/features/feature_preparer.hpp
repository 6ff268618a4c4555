#pragma once

#include "anomaly_errors.hpp"
#include "features/feature_table.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Recognized feature vocabulary, in the fixed order used to lay out the
// feature matrix.
// ---------------------------------------------------------------------------
constexpr int FEATURE_VOCAB_SIZE = 8;
constexpr const char* LABEL_COLUMN = "anomaly";

inline const std::vector<std::string>& feature_vocabulary() {
    static const std::vector<std::string> names = {
        "return", "volatility", "rsi", "macd", "macd_diff",
        "relative_volume", "bollinger_band_width", "log_return",
    };
    return names;
}

// Vocabulary ∩ table columns, in vocabulary order.
inline std::vector<std::string> available_features(const FeatureTable& table) {
    std::vector<std::string> active;
    for (const auto& name : feature_vocabulary()) {
        if (table.has_column(name)) active.push_back(name);
    }
    return active;
}

// ---------------------------------------------------------------------------
// ColumnCoercion — typed outcome of converting one column to numeric over a
// set of candidate rows. values[i] corresponds to rows[i]; NaN marks a cell
// that failed to convert.
// ---------------------------------------------------------------------------
struct ColumnCoercion {
    std::string column;
    std::vector<double> values;
    int converted = 0;
    int failed = 0;

    bool ok() const { return failed == 0; }
};

inline ColumnCoercion coerce_column(const FeatureTable& table,
                                    const std::string& column,
                                    const std::vector<size_t>& rows) {
    ColumnCoercion result;
    result.column = column;
    result.values.assign(rows.size(), MISSING_VALUE);

    const auto& cells = table.cells(column);
    for (size_t i = 0; i < rows.size(); ++i) {
        // The matrix is float; values outside its range would become inf
        auto v = cell_to_number(cells.at(rows[i]));
        if (v && std::isfinite(*v) && std::abs(*v) <= std::numeric_limits<float>::max()) {
            result.values[i] = *v;
            result.converted++;
        } else {
            result.failed++;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// PreparedFeatures — immutable output of prepare_features().
//
// matrix is row-major (num_rows x num_features) in active_features order.
// rows holds the position of each surviving row in the source table.
// ---------------------------------------------------------------------------
struct PreparedFeatures {
    std::vector<std::string> active_features;
    std::vector<size_t> rows;
    std::vector<float> matrix;
    std::vector<int> labels;
    std::vector<ColumnCoercion> coercions;

    size_t num_rows() const { return rows.size(); }
    size_t num_features() const { return active_features.size(); }
    bool empty() const { return rows.empty(); }
};

// Select, validate and clean the feature columns of a table.
//
// Phase 1 drops rows with a missing cell in any active feature column.
// Phase 2 converts each active column to numeric; cells that do not
// convert are dropped (logged per column, never fatal). With require_label
// the label column is extracted as well and rows with an unusable label
// are dropped.
inline PreparedFeatures prepare_features(const FeatureTable& table, bool require_label) {
    PreparedFeatures out;
    out.active_features = available_features(table);
    if (out.active_features.empty()) {
        spdlog::error("No recognized feature columns in table ({} columns)",
                      table.num_columns());
        throw NoFeaturesAvailable();
    }
    if (require_label && !table.has_column(LABEL_COLUMN)) {
        spdlog::error("Label column '{}' not found", LABEL_COLUMN);
        throw LabelColumnMissing(LABEL_COLUMN);
    }

    // Phase 1: complete rows only
    std::vector<size_t> candidates;
    candidates.reserve(table.num_rows());
    for (size_t r = 0; r < table.num_rows(); ++r) {
        bool complete = true;
        for (const auto& name : out.active_features) {
            if (cell_is_missing(table.cell(name, r))) {
                complete = false;
                break;
            }
        }
        if (complete) candidates.push_back(r);
    }

    // Phase 2: numeric coercion
    std::vector<bool> usable(candidates.size(), true);
    for (const auto& name : out.active_features) {
        auto coercion = coerce_column(table, name, candidates);
        if (!coercion.ok()) {
            spdlog::warn("Column '{}': {} of {} values are not numeric and will be dropped",
                         name, coercion.failed, candidates.size());
        }
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (std::isnan(coercion.values[i])) usable[i] = false;
        }
        out.coercions.push_back(std::move(coercion));
    }

    ColumnCoercion label_values;
    if (require_label) {
        label_values = coerce_column(table, LABEL_COLUMN, candidates);
        if (!label_values.ok()) {
            spdlog::warn("Label column '{}': {} rows without a usable label dropped",
                         LABEL_COLUMN, label_values.failed);
        }
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (std::isnan(label_values.values[i])) usable[i] = false;
        }
    }

    size_t n_features = out.active_features.size();
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!usable[i]) continue;
        out.rows.push_back(candidates[i]);
        for (size_t f = 0; f < n_features; ++f) {
            out.matrix.push_back(static_cast<float>(out.coercions[f].values[i]));
        }
        if (require_label) {
            out.labels.push_back(label_values.values[i] != 0.0 ? 1 : 0);
        }
    }

    return out;
}
