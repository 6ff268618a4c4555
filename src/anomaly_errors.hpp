#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Error taxonomy of the anomaly-scoring engine.
//
// Structural errors (caller misconfiguration) propagate to the caller.
// ScoringFailure is raised for runtime inference faults and is normally
// absorbed by AnomalyModel::predict into a degraded result.
// ---------------------------------------------------------------------------

struct NoFeaturesAvailable : std::runtime_error {
    NoFeaturesAvailable()
        : std::runtime_error("No recognized feature columns available for the model") {}
};

struct LabelColumnMissing : std::runtime_error {
    explicit LabelColumnMissing(const std::string& column)
        : std::runtime_error("Label column '" + column + "' not found in table") {}
};

struct PredictionColumnMissing : std::runtime_error {
    explicit PredictionColumnMissing(const std::string& column)
        : std::runtime_error("Prediction column '" + column + "' not found in table") {}
};

struct ModelFileNotFound : std::runtime_error {
    explicit ModelFileNotFound(const std::string& path)
        : std::runtime_error("Model file does not exist: " + path) {}
};

struct ModelNotTrained : std::runtime_error {
    ModelNotTrained()
        : std::runtime_error("Model not trained - call train() or load() first") {}
};

struct ScoringFailure : std::runtime_error {
    explicit ScoringFailure(const std::string& what) : std::runtime_error(what) {}
};
