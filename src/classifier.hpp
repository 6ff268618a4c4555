#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// FeatureMatrix — borrowed view of a row-major float matrix.
// ---------------------------------------------------------------------------
struct FeatureMatrix {
    const float* data = nullptr;
    size_t rows = 0;
    size_t cols = 0;

    FeatureMatrix() = default;
    FeatureMatrix(const std::vector<float>& values, size_t n_rows, size_t n_cols)
        : data(values.data()), rows(n_rows), cols(n_cols) {}
};

// ---------------------------------------------------------------------------
// Classifier — binary classifier seam of the anomaly engine.
//
// Implementations must be deterministic for a fixed configuration so that
// repeated predictions and save/load round trips are reproducible.
// serialize()/deserialize() carry the complete fitted state.
// ---------------------------------------------------------------------------
class Classifier {
public:
    virtual ~Classifier() = default;

    // Identifier stored in model files and used to pick a factory on load.
    virtual std::string kind() const = 0;

    virtual void fit(const FeatureMatrix& features, const std::vector<int>& labels) = 0;

    virtual std::vector<int> predict(const FeatureMatrix& features) const = 0;

    // P(class 1) per row.
    virtual std::vector<float> predict_probability(const FeatureMatrix& features) const = 0;

    // One non-negative weight per feature column of the training matrix.
    virtual std::vector<float> feature_importances() const = 0;

    virtual std::string serialize() const = 0;
    virtual void deserialize(const std::string& state) = 0;
};

// Builds an untrained classifier of the given kind; returns nullptr for an
// unknown kind.
using ClassifierFactory = std::function<std::unique_ptr<Classifier>(const std::string& kind)>;
