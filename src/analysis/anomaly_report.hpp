#pragma once

#include "anomaly_errors.hpp"
#include "anomaly_scorer.hpp"
#include "features/feature_table.hpp"
#include "time_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <map>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

constexpr int TOP_ANOMALY_COUNT = 5;

// ---------------------------------------------------------------------------
// AnomalyEvent — one of the most severe detected anomalies.
// An absent field means the source column is missing; NaN means the cell is.
// ---------------------------------------------------------------------------
struct AnomalyEvent {
    int date = 0;
    std::optional<double> return_value;
    std::optional<double> relative_volume;
    std::optional<double> severity;
};

// ---------------------------------------------------------------------------
// AnomalyReport — summary of the rows predicted anomalous
// ---------------------------------------------------------------------------
struct AnomalyReport {
    std::optional<std::string> error;
    int total = 0;
    double percentage = 0.0;
    std::map<int, int> per_year;
    std::optional<double> mean_return;
    std::optional<double> mean_volatility;
    std::vector<AnomalyEvent> top_events;
};

namespace detail {

inline double nan_mean(const std::vector<double>& values, const std::vector<size_t>& rows) {
    double sum = 0.0;
    int count = 0;
    for (size_t r : rows) {
        if (std::isnan(values[r])) continue;
        sum += values[r];
        count++;
    }
    return count > 0 ? sum / count : std::numeric_limits<double>::quiet_NaN();
}

inline std::optional<double> optional_cell(const FeatureTable& table, const std::string& column,
                                           size_t row) {
    if (!table.has_column(column)) return std::nullopt;
    auto v = cell_to_number(table.cell(column, row));
    return v ? *v : std::numeric_limits<double>::quiet_NaN();
}

inline AnomalyReport summarize(const FeatureTable& scored) {
    AnomalyReport report;

    auto predictions = scored.numeric_column(PREDICTION_COLUMN);
    std::vector<size_t> anomalous;
    for (size_t r = 0; r < predictions.size(); ++r) {
        if (predictions[r] == 1.0) anomalous.push_back(r);
    }

    report.total = static_cast<int>(anomalous.size());
    report.percentage = scored.num_rows() > 0
        ? 100.0 * static_cast<double>(anomalous.size()) / static_cast<double>(scored.num_rows())
        : 0.0;

    for (size_t r : anomalous) {
        report.per_year[time_utils::date_year(scored.date(r))]++;
    }

    if (scored.has_column("return")) {
        report.mean_return = nan_mean(scored.numeric_column("return"), anomalous);
    }
    if (scored.has_column("volatility")) {
        report.mean_volatility = nan_mean(scored.numeric_column("volatility"), anomalous);
    }

    if (scored.has_column(SEVERITY_COLUMN) && !anomalous.empty()) {
        auto severity = scored.numeric_column(SEVERITY_COLUMN);
        std::vector<size_t> ranked = anomalous;
        // Descending severity, NaN last
        std::stable_sort(ranked.begin(), ranked.end(), [&](size_t a, size_t b) {
            if (std::isnan(severity[a])) return false;
            if (std::isnan(severity[b])) return true;
            return severity[a] > severity[b];
        });
        ranked.resize(std::min(ranked.size(), static_cast<size_t>(TOP_ANOMALY_COUNT)));

        for (size_t r : ranked) {
            AnomalyEvent ev;
            ev.date = scored.date(r);
            ev.return_value = optional_cell(scored, "return", r);
            ev.relative_volume = optional_cell(scored, "relative_volume", r);
            ev.severity = severity[r];
            report.top_events.push_back(ev);
        }
    }

    return report;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// analyze_anomalies — diagnostic summary of a scored table.
//
// Throws PredictionColumnMissing when the table was never scored. Any other
// failure is reported through AnomalyReport::error with zero counts.
// ---------------------------------------------------------------------------
inline AnomalyReport analyze_anomalies(const FeatureTable& scored) {
    spdlog::info("Analyzing detected anomalies over {} rows", scored.num_rows());

    if (!scored.has_column(PREDICTION_COLUMN)) {
        spdlog::error("Column '{}' not found in scored table", PREDICTION_COLUMN);
        throw PredictionColumnMissing(PREDICTION_COLUMN);
    }

    try {
        return detail::summarize(scored);
    } catch (const std::exception& e) {
        spdlog::error("Error analyzing anomalies: {}", e.what());
        AnomalyReport report;
        report.error = e.what();
        return report;
    }
}

namespace report_io {

inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

inline void write_number(std::ostringstream& ss, const std::optional<double>& v) {
    if (!v || !std::isfinite(*v)) ss << "null";
    else ss << *v;
}

// Serialize an AnomalyReport to JSON
inline std::string to_json(const AnomalyReport& report) {
    std::ostringstream ss;
    ss.precision(10);
    ss << "{";
    if (report.error) {
        ss << "\"error\":\"" << json_escape(*report.error) << "\",";
    }
    ss << "\"total\":" << report.total;
    ss << ",\"percentage\":" << report.percentage;

    ss << ",\"per_year\":{";
    bool first = true;
    for (const auto& [year, count] : report.per_year) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << year << "\":" << count;
    }
    ss << "}";

    ss << ",\"mean_return\":";
    write_number(ss, report.mean_return);
    ss << ",\"mean_volatility\":";
    write_number(ss, report.mean_volatility);

    ss << ",\"top_events\":[";
    for (size_t i = 0; i < report.top_events.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& ev = report.top_events[i];
        ss << "{";
        ss << "\"date\":\"" << time_utils::format_date(ev.date) << "\"";
        ss << ",\"return\":";
        write_number(ss, ev.return_value);
        ss << ",\"relative_volume\":";
        write_number(ss, ev.relative_volume);
        ss << ",\"severity\":";
        write_number(ss, ev.severity);
        ss << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

}  // namespace report_io
