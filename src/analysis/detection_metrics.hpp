#pragma once

#include "anomaly_scorer.hpp"
#include "features/feature_preparer.hpp"
#include "features/feature_table.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// DetectionMetrics — predicted anomalies vs. the reference label
// ---------------------------------------------------------------------------
struct DetectionMetrics {
    std::optional<std::string> error;
    int n_evaluated = 0;
    int tp = 0;
    int fp = 0;
    int tn = 0;
    int fn = 0;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    int actual_anomalies = 0;
    int detected_anomalies = 0;
    double actual_percentage = 0.0;
    double detected_percentage = 0.0;
};

// Compares LABEL_COLUMN against PREDICTION_COLUMN over rows where both are
// present. Ratios with a zero denominator are 0. Never throws for missing
// columns; the problem is reported through error.
inline DetectionMetrics evaluate_detection(const FeatureTable& scored) {
    DetectionMetrics m;
    if (!scored.has_column(LABEL_COLUMN) || !scored.has_column(PREDICTION_COLUMN)) {
        spdlog::error("Cannot evaluate detection: '{}' or '{}' column missing",
                      LABEL_COLUMN, PREDICTION_COLUMN);
        m.error = "Required columns not found";
        return m;
    }

    auto truth = scored.numeric_column(LABEL_COLUMN);
    auto pred = scored.numeric_column(PREDICTION_COLUMN);

    for (size_t r = 0; r < scored.num_rows(); ++r) {
        if (std::isnan(truth[r]) || std::isnan(pred[r])) continue;
        bool actual = truth[r] != 0.0;
        bool detected = pred[r] != 0.0;
        m.n_evaluated++;
        if (actual && detected) m.tp++;
        else if (!actual && detected) m.fp++;
        else if (actual && !detected) m.fn++;
        else m.tn++;
    }

    m.actual_anomalies = m.tp + m.fn;
    m.detected_anomalies = m.tp + m.fp;

    if (m.detected_anomalies > 0) {
        m.precision = static_cast<double>(m.tp) / m.detected_anomalies;
    }
    if (m.actual_anomalies > 0) {
        m.recall = static_cast<double>(m.tp) / m.actual_anomalies;
    }
    if (m.precision + m.recall > 0.0) {
        m.f1 = 2.0 * m.precision * m.recall / (m.precision + m.recall);
    }
    if (m.n_evaluated > 0) {
        m.actual_percentage = 100.0 * m.actual_anomalies / m.n_evaluated;
        m.detected_percentage = 100.0 * m.detected_anomalies / m.n_evaluated;
    }

    spdlog::info("Detection quality over {} rows: precision={:.3f} recall={:.3f} f1={:.3f}",
                 m.n_evaluated, m.precision, m.recall, m.f1);
    return m;
}
