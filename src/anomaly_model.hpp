#pragma once

#include "analysis/anomaly_report.hpp"
#include "anomaly_errors.hpp"
#include "anomaly_scorer.hpp"
#include "classifier.hpp"
#include "features/feature_preparer.hpp"
#include "features/feature_table.hpp"
#include "model_io.hpp"
#include "trained_model.hpp"
#include "xgb_classifier.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AnomalyModelConfig
// ---------------------------------------------------------------------------
struct AnomalyModelConfig {
    int n_estimators = 100;
    int max_depth = 10;
    int random_seed = 42;
    float learning_rate = 0.1f;

    XGBClassifierConfig classifier_config() const {
        XGBClassifierConfig c;
        c.n_estimators = n_estimators;
        c.max_depth = max_depth;
        c.seed = random_seed;
        c.learning_rate = learning_rate;
        return c;
    }
};

// ---------------------------------------------------------------------------
// AnomalyModel — train / score / persist / analyze for one instrument.
//
// Not thread-safe; one caller at a time. Structural errors (missing label
// or feature columns, untrained model, missing model file) throw. Runtime
// scoring faults are absorbed: predict() then returns the table with every
// derived column set to 0 and last_status() reports DEGRADED.
// ---------------------------------------------------------------------------
class AnomalyModel {
public:
    AnomalyModel() : AnomalyModel(AnomalyModelConfig{}) {}

    explicit AnomalyModel(const AnomalyModelConfig& config)
        : config_(config),
          factory_(make_default_classifier_factory(config.classifier_config())),
          classifier_kind_(XGB_CLASSIFIER_KIND) {}

    // Custom classifier implementations. factory must accept classifier_kind
    // and, for load(), whatever kinds may appear in model files.
    AnomalyModel(const AnomalyModelConfig& config, ClassifierFactory factory,
                 std::string classifier_kind)
        : config_(config),
          factory_(std::move(factory)),
          classifier_kind_(std::move(classifier_kind)) {}

    const AnomalyModelConfig& config() const { return config_; }

    bool is_trained() const { return model_.has_value(); }

    // Features seen by the most recent preparation (train or predict).
    const std::vector<std::string>& active_features() const { return active_features_; }

    // Descending importance ranking of the current model, if recorded.
    std::optional<std::vector<FeatureImportance>> feature_importance() const {
        if (!model_) return std::nullopt;
        return model_->importance;
    }

    const TrainedModel& trained_model() const {
        if (!model_) throw ModelNotTrained();
        return *model_;
    }

    ScoreStatus last_status() const { return last_status_; }

    // Replaces the current model only when training succeeds.
    const TrainedModel& train(const FeatureTable& table) {
        spdlog::info("Training anomaly model on {} rows", table.num_rows());

        auto classifier = factory_(classifier_kind_);
        if (!classifier) {
            throw std::runtime_error("Classifier factory cannot build kind '" +
                                     classifier_kind_ + "'");
        }

        TrainedModel trained = train_model(table, std::move(classifier));
        active_features_ = trained.features;
        model_ = std::move(trained);
        return *model_;
    }

    FeatureTable predict(const FeatureTable& table) {
        if (!model_) {
            spdlog::error("predict() called before the model was trained or loaded");
            throw ModelNotTrained();
        }
        spdlog::info("Predicting anomalies for {} rows", table.num_rows());

        auto prepared = prepare_features(table, /*require_label=*/false);
        active_features_ = prepared.active_features;

        try {
            auto result = score_prepared(*model_, table, prepared);
            last_status_ = result.status;
            return std::move(result.table);
        } catch (const std::exception& e) {
            spdlog::error("Error predicting anomalies ({} rows, {} scorable, features [{}]): {}; "
                          "returning default scores",
                          table.num_rows(), prepared.num_rows(),
                          join_names(prepared.active_features), e.what());
            last_status_ = ScoreStatus::DEGRADED;
            return with_filled_scores(table, DEGRADED_SCORE_VALUE);
        }
    }

    // Never throws for data problems: any failure yields default scores.
    FeatureTable train_and_predict(const FeatureTable& table) {
        try {
            train(table);
            return predict(table);
        } catch (const std::exception& e) {
            spdlog::error("Error in train_and_predict ({} rows): {}; returning default scores",
                          table.num_rows(), e.what());
            last_status_ = ScoreStatus::DEGRADED;
            return with_filled_scores(table, DEGRADED_SCORE_VALUE);
        }
    }

    void save(const std::string& path) const {
        if (!model_) throw ModelNotTrained();
        model_io::save_model(*model_, path);
    }

    void load(const std::string& path) {
        TrainedModel loaded = model_io::load_model(path, factory_);
        active_features_ = loaded.features;
        model_ = std::move(loaded);
    }

    AnomalyReport analyze(const FeatureTable& scored) const {
        return analyze_anomalies(scored);
    }

private:
    AnomalyModelConfig config_;
    ClassifierFactory factory_;
    std::string classifier_kind_;
    std::optional<TrainedModel> model_;
    std::vector<std::string> active_features_;
    ScoreStatus last_status_ = ScoreStatus::NOT_RUN;
};
