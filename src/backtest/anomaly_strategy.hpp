#pragma once

#include "anomaly_scorer.hpp"
#include "features/feature_table.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <optional>
#include <string>
#include <vector>

constexpr const char* CLOSE_COLUMN = "close";

// ---------------------------------------------------------------------------
// AnomalyStrategyConfig — long-only "buy the anomaly" backtest
// ---------------------------------------------------------------------------
struct AnomalyStrategyConfig {
    double initial_capital = 10000.0;
    double commission_pct = 0.1;        // percent of capital, charged per side
    double probability_threshold = 0.7; // enter when probability is strictly above
    int holding_days = 5;
    double test_fraction = 0.2;         // trailing share of sessions evaluated; 1 = all
};

// ---------------------------------------------------------------------------
// StrategyResult
//
// trades counts entries and scheduled exits. A position still open on the
// last session is closed at that price (commission charged) but not counted.
// strategy_return_pct is absent when the table carries no probabilities.
// ---------------------------------------------------------------------------
struct StrategyResult {
    std::optional<std::string> error;
    int n_sessions = 0;
    double buy_hold_return_pct = 0.0;
    std::optional<double> strategy_return_pct;
    int trades = 0;
    double final_capital = 0.0;
};

namespace detail {

struct PricedSession {
    double close = 0.0;
    double probability = 0.0;  // NaN when unscored
};

// Sessions of the trailing test window with a usable (positive) close.
inline std::vector<PricedSession> strategy_window(const FeatureTable& scored,
                                                  double test_fraction) {
    size_t n = scored.num_rows();
    size_t n_test = test_fraction >= 1.0
        ? n
        : static_cast<size_t>(static_cast<double>(n) * test_fraction);

    auto close = scored.numeric_column(CLOSE_COLUMN);
    std::vector<double> prob(n, MISSING_VALUE);
    if (scored.has_column(PROBABILITY_COLUMN)) prob = scored.numeric_column(PROBABILITY_COLUMN);

    std::vector<PricedSession> window;
    for (size_t r = n - n_test; r < n; ++r) {
        if (std::isnan(close[r]) || close[r] <= 0.0) continue;
        window.push_back({close[r], prob[r]});
    }
    return window;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// evaluate_anomaly_strategy — profitability of trading on detected anomalies
// against buy-and-hold over the same sessions.
//
// Buy at the close of a session whose probability exceeds the threshold,
// sell at the close holding_days sessions later. Never throws for missing
// columns; the problem is reported through error.
// ---------------------------------------------------------------------------
inline StrategyResult evaluate_anomaly_strategy(const FeatureTable& scored,
                                                const AnomalyStrategyConfig& config = {}) {
    StrategyResult res;
    if (!scored.has_column(CLOSE_COLUMN)) {
        spdlog::error("Cannot evaluate strategy: column '{}' not found", CLOSE_COLUMN);
        res.error = "Column close not found";
        return res;
    }

    auto window = detail::strategy_window(scored, config.test_fraction);
    res.n_sessions = static_cast<int>(window.size());
    if (window.empty()) {
        spdlog::error("Cannot evaluate strategy: no priced sessions in the test window");
        res.error = "No priced sessions in test window";
        return res;
    }

    res.buy_hold_return_pct = (window.back().close / window.front().close - 1.0) * 100.0;
    res.final_capital = config.initial_capital;

    if (!scored.has_column(PROBABILITY_COLUMN)) {
        spdlog::warn("Column '{}' not found; only buy-and-hold evaluated", PROBABILITY_COLUMN);
        return res;
    }

    double commission = config.commission_pct / 100.0;
    double capital = config.initial_capital;
    bool in_position = false;
    double entry_price = 0.0;
    int held = 0;

    for (const auto& s : window) {
        if (!in_position && s.probability > config.probability_threshold) {
            entry_price = s.close;
            in_position = true;
            capital -= capital * commission;
            held = 0;
            res.trades++;
        } else if (in_position) {
            held++;
            if (held >= config.holding_days) {
                capital *= s.close / entry_price;
                capital -= capital * commission;
                in_position = false;
                res.trades++;
            }
        }
    }

    if (in_position) {
        capital *= window.back().close / entry_price;
        capital -= capital * commission;
    }

    res.final_capital = capital;
    res.strategy_return_pct = (capital / config.initial_capital - 1.0) * 100.0;

    spdlog::info("Anomaly strategy over {} sessions: return={:.2f}% ({} trades), "
                 "buy-and-hold={:.2f}%",
                 res.n_sessions, *res.strategy_return_pct, res.trades,
                 res.buy_hold_return_pct);
    return res;
}
