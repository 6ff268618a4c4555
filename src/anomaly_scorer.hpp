#pragma once

#include "anomaly_errors.hpp"
#include "classifier.hpp"
#include "features/feature_preparer.hpp"
#include "features/feature_table.hpp"
#include "trained_model.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>
#include <vector>

constexpr const char* PROBABILITY_COLUMN = "anomaly_probability";
constexpr const char* PREDICTION_COLUMN = "anomaly_prediction";
constexpr const char* SEVERITY_COLUMN = "anomaly_severity";

// Divides probability x |return| to keep severity in a small numeric range.
// Policy constant, not derived from the data.
constexpr double SEVERITY_NORMALIZER = 5.0;

// Fill value for every derived column when scoring crashed. Distinct from
// the NaN written when nothing was scorable.
constexpr double DEGRADED_SCORE_VALUE = 0.0;

// ---------------------------------------------------------------------------
// ScoreStatus — outcome of the last scoring call
// ---------------------------------------------------------------------------
enum class ScoreStatus {
    NOT_RUN,
    OK,
    NOTHING_SCORABLE,  // no row survived preparation; derived columns NaN
    DEGRADED,          // scoring failed; derived columns 0
};

inline const char* score_status_str(ScoreStatus s) {
    switch (s) {
        case ScoreStatus::NOT_RUN:          return "NOT_RUN";
        case ScoreStatus::OK:               return "OK";
        case ScoreStatus::NOTHING_SCORABLE: return "NOTHING_SCORABLE";
        case ScoreStatus::DEGRADED:         return "DEGRADED";
        default: return "UNKNOWN";
    }
}

struct ScoreResult {
    FeatureTable table;
    ScoreStatus status = ScoreStatus::NOT_RUN;
    size_t rows_scored = 0;
    size_t anomalies = 0;
};

inline double compute_severity(double probability, double return_value) {
    return probability * std::abs(return_value) / SEVERITY_NORMALIZER;
}

// Copy of table with all three derived columns set to value on every row.
inline FeatureTable with_filled_scores(const FeatureTable& table, double value) {
    FeatureTable out = table;
    out.fill_column(PROBABILITY_COLUMN, value);
    out.fill_column(PREDICTION_COLUMN, value);
    out.fill_column(SEVERITY_COLUMN, value);
    return out;
}

// ---------------------------------------------------------------------------
// score_prepared — run inference for rows that survived preparation and
// write results back into a copy of the source table.
//
// Rows absent from prepared.rows keep their previous value of the derived
// columns (NaN when the column is new). Throws ScoringFailure when the
// prepared features do not match the model or the classifier output is
// malformed; classifier exceptions pass through unchanged.
// ---------------------------------------------------------------------------
inline ScoreResult score_prepared(const TrainedModel& model,
                                  const FeatureTable& table,
                                  const PreparedFeatures& prepared) {
    ScoreResult result;

    if (prepared.empty()) {
        spdlog::warn("No valid rows to score after cleaning {} input rows", table.num_rows());
        result.table = with_filled_scores(table, MISSING_VALUE);
        result.status = ScoreStatus::NOTHING_SCORABLE;
        return result;
    }

    if (prepared.active_features != model.features) {
        throw ScoringFailure("Feature mismatch: model expects [" + join_names(model.features) +
                             "], table provides [" + join_names(prepared.active_features) + "]");
    }

    FeatureMatrix matrix(prepared.matrix, prepared.num_rows(), prepared.num_features());
    auto probs = model.classifier->predict_probability(matrix);
    auto preds = model.classifier->predict(matrix);

    size_t n = prepared.num_rows();
    if (probs.size() != n || preds.size() != n) {
        throw ScoringFailure("Classifier returned " + std::to_string(probs.size()) +
                             " probabilities and " + std::to_string(preds.size()) +
                             " predictions for " + std::to_string(n) + " rows");
    }
    for (size_t i = 0; i < n; ++i) {
        if (!(probs[i] >= 0.0f && probs[i] <= 1.0f)) {
            throw ScoringFailure("Probability out of range at row " +
                                 std::to_string(prepared.rows[i]) + ": " +
                                 std::to_string(probs[i]));
        }
    }

    FeatureTable out = table;
    for (const char* name : {PROBABILITY_COLUMN, PREDICTION_COLUMN, SEVERITY_COLUMN}) {
        if (!out.has_column(name)) out.fill_column(name, MISSING_VALUE);
    }

    for (size_t i = 0; i < n; ++i) {
        size_t row = prepared.rows[i];
        out.set_value(PROBABILITY_COLUMN, row, static_cast<double>(probs[i]));
        out.set_value(PREDICTION_COLUMN, row, preds[i] != 0 ? 1.0 : 0.0);
        if (preds[i] != 0) result.anomalies++;
    }

    if (table.has_column("return")) {
        for (size_t i = 0; i < n; ++i) {
            size_t row = prepared.rows[i];
            auto ret = cell_to_number(table.cell("return", row));
            if (!ret) continue;
            out.set_value(SEVERITY_COLUMN, row,
                          compute_severity(static_cast<double>(probs[i]), *ret));
        }
    }

    spdlog::info("Anomalies detected: {} of {} scored rows ({} input rows)",
                 result.anomalies, n, table.num_rows());

    result.table = std::move(out);
    result.status = ScoreStatus::OK;
    result.rows_scored = n;
    return result;
}
