#pragma once

#include "classifier.hpp"

#include <xgboost/c_api.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// XGBClassifierConfig
// ---------------------------------------------------------------------------
struct XGBClassifierConfig {
    int n_estimators = 100;
    int max_depth = 10;
    float learning_rate = 0.1f;
    int seed = 42;
    int nthread = 1;
};

constexpr float DECISION_THRESHOLD = 0.5f;
constexpr const char* XGB_CLASSIFIER_KIND = "xgboost";

// ---------------------------------------------------------------------------
// XGBClassifier — XGBoost C API wrapper for binary anomaly classification.
//
// Positive (anomalous) rows are up-weighted by n_negative / n_positive so the
// rare class carries the same total weight as the normal class.
// ---------------------------------------------------------------------------
class XGBClassifier : public Classifier {
public:
    XGBClassifier() : booster_(nullptr) {}
    explicit XGBClassifier(const XGBClassifierConfig& config)
        : config_(config), booster_(nullptr) {}

    ~XGBClassifier() override {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }
    }

    // Non-copyable
    XGBClassifier(const XGBClassifier&) = delete;
    XGBClassifier& operator=(const XGBClassifier&) = delete;

    // Move semantics
    XGBClassifier(XGBClassifier&& other) noexcept
        : config_(other.config_), booster_(other.booster_) {
        other.booster_ = nullptr;
    }
    XGBClassifier& operator=(XGBClassifier&& other) noexcept {
        if (this != &other) {
            if (booster_) XGBoosterFree(booster_);
            config_ = other.config_;
            booster_ = other.booster_;
            other.booster_ = nullptr;
        }
        return *this;
    }

    const XGBClassifierConfig& config() const { return config_; }
    bool is_fitted() const { return booster_ != nullptr; }

    std::string kind() const override { return XGB_CLASSIFIER_KIND; }

    void fit(const FeatureMatrix& features, const std::vector<int>& labels) override {
        if (features.rows == 0 || labels.empty()) {
            throw std::invalid_argument("Training data must not be empty");
        }
        if (features.rows != labels.size()) {
            throw std::invalid_argument("features.rows != labels.size()");
        }

        size_t n = features.rows;
        std::vector<float> flabels(n);
        size_t n_pos = 0;
        for (size_t i = 0; i < n; ++i) {
            flabels[i] = labels[i] != 0 ? 1.0f : 0.0f;
            if (labels[i] != 0) n_pos++;
        }
        size_t n_neg = n - n_pos;
        double scale_pos_weight =
            (n_pos > 0 && n_neg > 0) ? static_cast<double>(n_neg) / static_cast<double>(n_pos)
                                     : 1.0;

        // Create DMatrix (RAII — freed automatically)
        auto dmat = make_dmatrix(features);
        check(XGDMatrixSetFloatInfo(dmat.handle, "label", flabels.data(),
                                    static_cast<bst_ulong>(n)));

        // Build into a local booster so a failed fit leaves the previous one intact
        BoosterHandle fresh = nullptr;
        DMatrixHandle dmats[] = {dmat.handle};
        check(XGBoosterCreate(dmats, 1, &fresh));
        BoosterGuard guard(fresh);

        set_param(fresh, "objective", "binary:logistic");
        set_param(fresh, "eval_metric", "logloss");
        set_param(fresh, "max_depth", std::to_string(config_.max_depth));
        set_param(fresh, "learning_rate", std::to_string(config_.learning_rate));
        set_param(fresh, "subsample", "1.0");
        set_param(fresh, "colsample_bytree", "1.0");
        set_param(fresh, "min_child_weight", "1");
        set_param(fresh, "scale_pos_weight", std::to_string(scale_pos_weight));
        set_param(fresh, "seed", std::to_string(config_.seed));
        set_param(fresh, "nthread", std::to_string(config_.nthread));
        if (n_pos == 0 || n_neg == 0) {
            // Label mean is 0 or 1 here; base_score must stay inside (0, 1)
            set_param(fresh, "base_score", "0.5");
        }

        for (int i = 0; i < config_.n_estimators; ++i) {
            check(XGBoosterUpdateOneIter(fresh, i, dmat.handle));
        }

        if (booster_) XGBoosterFree(booster_);
        booster_ = guard.release();
    }

    std::vector<float> predict_probability(const FeatureMatrix& features) const override {
        require_fitted();
        if (features.rows == 0) return {};

        auto dmat = make_dmatrix(features);

        bst_ulong out_len = 0;
        const float* out_result = nullptr;
        check(XGBoosterPredict(booster_, dmat.handle, 0, 0, 0, &out_len, &out_result));
        if (out_len != features.rows) {
            throw std::runtime_error("XGBoost returned " + std::to_string(out_len) +
                                     " predictions for " + std::to_string(features.rows) +
                                     " rows");
        }

        // out_result is owned by the booster and overwritten by the next call
        return std::vector<float>(out_result, out_result + out_len);
    }

    std::vector<int> predict(const FeatureMatrix& features) const override {
        auto probs = predict_probability(features);
        std::vector<int> predictions(probs.size());
        for (size_t i = 0; i < probs.size(); ++i) {
            predictions[i] = probs[i] >= DECISION_THRESHOLD ? 1 : 0;
        }
        return predictions;
    }

    // Total split gain per feature, normalized to sum to 1. Features that
    // never appear in a split get 0.
    std::vector<float> feature_importances() const override {
        require_fitted();

        bst_ulong n_features = 0;
        check(XGBoosterGetNumFeature(booster_, &n_features));
        std::vector<float> importances(n_features, 0.0f);

        bst_ulong out_n = 0;
        const char** out_dump = nullptr;
        check(XGBoosterDumpModel(booster_, "", 1, &out_n, &out_dump));

        for (bst_ulong t = 0; t < out_n; ++t) {
            accumulate_tree_gain(out_dump[t], importances);
        }

        float total = 0.0f;
        for (float v : importances) total += v;
        if (total > 0.0f) {
            for (float& v : importances) v /= total;
        }
        return importances;
    }

    std::string serialize() const override {
        require_fitted();
        bst_ulong out_len = 0;
        const char* out_buf = nullptr;
        check(XGBoosterSaveModelToBuffer(booster_, R"({"format": "ubj"})", &out_len, &out_buf));
        return std::string(out_buf, out_len);
    }

    void deserialize(const std::string& state) override {
        BoosterHandle fresh = nullptr;
        check(XGBoosterCreate(nullptr, 0, &fresh));
        BoosterGuard guard(fresh);

        check(XGBoosterLoadModelFromBuffer(fresh, state.data(),
                                           static_cast<bst_ulong>(state.size())));
        set_param(fresh, "nthread", std::to_string(config_.nthread));

        if (booster_) XGBoosterFree(booster_);
        booster_ = guard.release();
    }

private:
    XGBClassifierConfig config_;
    BoosterHandle booster_;

    // RAII guard for DMatrixHandle — prevents leaks on exception
    struct DMatrixGuard {
        DMatrixHandle handle = nullptr;
        explicit DMatrixGuard(DMatrixHandle h) : handle(h) {}
        ~DMatrixGuard() { if (handle) XGDMatrixFree(handle); }
        DMatrixGuard(DMatrixGuard&& other) noexcept : handle(other.handle) {
            other.handle = nullptr;
        }
        DMatrixGuard(const DMatrixGuard&) = delete;
        DMatrixGuard& operator=(const DMatrixGuard&) = delete;
    };

    // RAII guard for BoosterHandle
    struct BoosterGuard {
        BoosterHandle handle = nullptr;
        explicit BoosterGuard(BoosterHandle h) : handle(h) {}
        ~BoosterGuard() { if (handle) XGBoosterFree(handle); }
        BoosterGuard(const BoosterGuard&) = delete;
        BoosterGuard& operator=(const BoosterGuard&) = delete;

        BoosterHandle release() {
            BoosterHandle h = handle;
            handle = nullptr;
            return h;
        }
    };

    void require_fitted() const {
        if (!booster_) {
            throw std::runtime_error("Model not trained - call fit() or deserialize() first");
        }
    }

    static DMatrixGuard make_dmatrix(const FeatureMatrix& features) {
        DMatrixHandle dmat;
        check(XGDMatrixCreateFromMat(features.data,
                                     static_cast<bst_ulong>(features.rows),
                                     static_cast<bst_ulong>(features.cols),
                                     std::numeric_limits<float>::quiet_NaN(), &dmat));
        return DMatrixGuard(dmat);
    }

    // Split lines in a text dump with stats look like
    //   "\t1:[f3<0.0125] yes=3,no=4,missing=3,gain=12.5,cover=40"
    static void accumulate_tree_gain(const std::string& tree, std::vector<float>& importances) {
        size_t pos = 0;
        while ((pos = tree.find("[f", pos)) != std::string::npos) {
            pos += 2;
            char* end = nullptr;
            long idx = std::strtol(tree.c_str() + pos, &end, 10);
            if (end == tree.c_str() + pos || *end != '<') continue;

            size_t line_end = tree.find('\n', pos);
            size_t gain_pos = tree.find("gain=", pos);
            if (gain_pos == std::string::npos || gain_pos > line_end) continue;

            float gain = std::strtof(tree.c_str() + gain_pos + 5, nullptr);
            if (idx >= 0 && static_cast<size_t>(idx) < importances.size() && gain > 0.0f) {
                importances[static_cast<size_t>(idx)] += gain;
            }
        }
    }

    static void set_param(BoosterHandle h, const char* name, const std::string& value) {
        check(XGBoosterSetParam(h, name, value.c_str()));
    }

    static void check(int rc) {
        if (rc != 0) {
            throw std::runtime_error(std::string("XGBoost error: ") + XGBGetLastError());
        }
    }
};
