#pragma once

#include "anomaly_errors.hpp"
#include "classifier.hpp"
#include "features/feature_preparer.hpp"
#include "features/feature_table.hpp"
#include "xgb_classifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// FeatureImportance — one entry of the descending importance ranking
// ---------------------------------------------------------------------------
struct FeatureImportance {
    std::string feature;
    float weight = 0.0f;
};

// ---------------------------------------------------------------------------
// TrainedModel — fitted classifier plus the ordered feature list it was fit
// on. Inference must present exactly these columns in this order.
// importance is absent for models restored from files written without it.
// ---------------------------------------------------------------------------
struct TrainedModel {
    std::unique_ptr<Classifier> classifier;
    std::vector<std::string> features;
    std::optional<std::vector<FeatureImportance>> importance;
};

inline ClassifierFactory make_default_classifier_factory(const XGBClassifierConfig& config = {}) {
    return [config](const std::string& kind) -> std::unique_ptr<Classifier> {
        if (kind == XGB_CLASSIFIER_KIND) return std::make_unique<XGBClassifier>(config);
        return nullptr;
    };
}

// Pair weights with feature names and sort descending by weight. Ties keep
// vocabulary order.
inline std::vector<FeatureImportance> rank_importances(const std::vector<std::string>& features,
                                                       const std::vector<float>& weights) {
    if (features.size() != weights.size()) {
        throw std::runtime_error("Classifier reported " + std::to_string(weights.size()) +
                                 " importances for " + std::to_string(features.size()) +
                                 " features");
    }
    std::vector<FeatureImportance> ranked;
    ranked.reserve(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        ranked.push_back({features[i], weights[i]});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const FeatureImportance& a, const FeatureImportance& b) {
                         return a.weight > b.weight;
                     });
    return ranked;
}

inline std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

inline std::string format_top_importances(const std::vector<FeatureImportance>& ranked, size_t k) {
    std::ostringstream ss;
    for (size_t i = 0; i < std::min(k, ranked.size()); ++i) {
        if (i > 0) ss << ", ";
        ss << ranked[i].feature << "=" << ranked[i].weight;
    }
    return ss.str();
}

// ---------------------------------------------------------------------------
// train_model — fit an untrained classifier on a labeled table.
//
// Throws LabelColumnMissing / NoFeaturesAvailable for structural problems and
// rethrows any fitting error after logging it. Nothing is returned on
// failure, so a caller holding a previous TrainedModel keeps it.
// ---------------------------------------------------------------------------
inline TrainedModel train_model(const FeatureTable& table, std::unique_ptr<Classifier> classifier) {
    if (!classifier) {
        throw std::invalid_argument("train_model requires a classifier instance");
    }
    if (!table.has_column(LABEL_COLUMN)) {
        spdlog::error("Cannot train: label column '{}' not found", LABEL_COLUMN);
        throw LabelColumnMissing(LABEL_COLUMN);
    }

    auto prepared = prepare_features(table, /*require_label=*/true);
    if (prepared.empty()) {
        spdlog::error("Cannot train: no valid rows left after cleaning {} input rows",
                      table.num_rows());
        throw std::invalid_argument("No valid training rows after feature preparation");
    }

    size_t n_pos = static_cast<size_t>(
        std::count(prepared.labels.begin(), prepared.labels.end(), 1));
    spdlog::info("Training anomaly classifier on {} rows x {} features "
                 "(class balance: {} normal, {} anomalous)",
                 prepared.num_rows(), prepared.num_features(),
                 prepared.num_rows() - n_pos, n_pos);

    TrainedModel model;
    try {
        FeatureMatrix matrix(prepared.matrix, prepared.num_rows(), prepared.num_features());
        classifier->fit(matrix, prepared.labels);
        model.importance = rank_importances(prepared.active_features,
                                            classifier->feature_importances());
    } catch (const std::exception& e) {
        spdlog::error("Error training anomaly classifier ({} rows, features [{}]): {}",
                      prepared.num_rows(), join_names(prepared.active_features), e.what());
        throw;
    }

    spdlog::info("Top feature importances: {}", format_top_importances(*model.importance, 3));

    model.classifier = std::move(classifier);
    model.features = prepared.active_features;
    return model;
}
