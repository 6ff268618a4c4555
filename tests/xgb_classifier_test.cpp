// xgb_classifier_test.cpp — XGBoost binary classifier wrapper
//
// Covers fitting on imbalanced data, probability output, determinism,
// gain importances, and in-memory state round trips.

#include <gtest/gtest.h>
#include "xgb_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// Helpers — synthetic training data
// ---------------------------------------------------------------------------

constexpr size_t N_COLS = 4;

struct SyntheticData {
    std::vector<float> matrix;
    std::vector<int> labels;
    size_t rows = 0;

    FeatureMatrix view() const { return FeatureMatrix(matrix, rows, N_COLS); }
};

// Column 0 separates the classes (positive rows sit far above the rest);
// the other columns are deterministic filler. Every 20th row is positive.
SyntheticData make_synthetic_data(int n) {
    SyntheticData data;
    data.rows = static_cast<size_t>(n);
    for (int i = 0; i < n; ++i) {
        int label = (i % 20 == 7) ? 1 : 0;
        data.matrix.push_back(label ? 5.0f + 0.01f * i : 0.01f * (i % 13));
        data.matrix.push_back(static_cast<float>((i * 7) % 100) / 100.0f);
        data.matrix.push_back(static_cast<float>((i * 31) % 17) / 17.0f);
        data.matrix.push_back(std::sin(static_cast<float>(i)));
        data.labels.push_back(label);
    }
    return data;
}

XGBClassifierConfig small_config() {
    XGBClassifierConfig c;
    c.n_estimators = 30;
    c.max_depth = 3;
    return c;
}

}  // anonymous namespace

// ===========================================================================
// Fit / predict
// ===========================================================================

TEST(XGBClassifierTest, ProbabilitiesInUnitInterval) {
    auto data = make_synthetic_data(100);

    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);

    auto probs = model.predict_probability(data.view());
    ASSERT_EQ(probs.size(), 100u);
    for (size_t i = 0; i < probs.size(); ++i) {
        EXPECT_GE(probs[i], 0.0f) << "row " << i;
        EXPECT_LE(probs[i], 1.0f) << "row " << i;
    }
}

TEST(XGBClassifierTest, LearnsRarePositiveClass) {
    auto data = make_synthetic_data(100);

    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);

    auto preds = model.predict(data.view());
    int correct = 0;
    int positives = 0;
    for (size_t i = 0; i < preds.size(); ++i) {
        if (preds[i] == data.labels[i]) correct++;
        if (preds[i] == 1) positives++;
    }
    EXPECT_GT(positives, 0) << "positive class never predicted";
    EXPECT_GE(correct, 95);
}

TEST(XGBClassifierTest, PredictMatchesThresholdedProbability) {
    auto data = make_synthetic_data(60);

    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);

    auto probs = model.predict_probability(data.view());
    auto preds = model.predict(data.view());
    ASSERT_EQ(probs.size(), preds.size());
    for (size_t i = 0; i < probs.size(); ++i) {
        EXPECT_EQ(preds[i], probs[i] >= DECISION_THRESHOLD ? 1 : 0);
    }
}

TEST(XGBClassifierTest, SingleClassTrainingStillPredicts) {
    auto data = make_synthetic_data(40);
    std::fill(data.labels.begin(), data.labels.end(), 0);

    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);

    auto preds = model.predict(data.view());
    EXPECT_EQ(std::accumulate(preds.begin(), preds.end(), 0), 0);
}

// ===========================================================================
// Determinism
// ===========================================================================

TEST(XGBClassifierTest, SameSeedSameProbabilities) {
    auto data = make_synthetic_data(100);

    XGBClassifier a(small_config());
    XGBClassifier b(small_config());
    a.fit(data.view(), data.labels);
    b.fit(data.view(), data.labels);

    EXPECT_EQ(a.predict_probability(data.view()), b.predict_probability(data.view()));
}

TEST(XGBClassifierTest, RepeatedPredictIdentical) {
    auto data = make_synthetic_data(50);
    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);

    EXPECT_EQ(model.predict_probability(data.view()), model.predict_probability(data.view()));
}

// ===========================================================================
// Importances
// ===========================================================================

TEST(XGBClassifierTest, ImportancesNormalizedAndInformativeFeatureFirst) {
    auto data = make_synthetic_data(100);

    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);

    auto imp = model.feature_importances();
    ASSERT_EQ(imp.size(), N_COLS);

    float total = std::accumulate(imp.begin(), imp.end(), 0.0f);
    EXPECT_NEAR(total, 1.0f, 1e-4f);
    for (float v : imp) EXPECT_GE(v, 0.0f);

    auto best = std::max_element(imp.begin(), imp.end()) - imp.begin();
    EXPECT_EQ(best, 0) << "separating column should dominate gain";
}

// ===========================================================================
// Serialization
// ===========================================================================

TEST(XGBClassifierTest, SerializeDeserialize_BitIdenticalPredictions) {
    auto data = make_synthetic_data(100);

    XGBClassifier model(small_config());
    model.fit(data.view(), data.labels);
    auto state = model.serialize();
    ASSERT_FALSE(state.empty());

    XGBClassifier restored;
    restored.deserialize(state);

    EXPECT_EQ(model.predict_probability(data.view()), restored.predict_probability(data.view()));
    EXPECT_EQ(model.feature_importances(), restored.feature_importances());
}

// ===========================================================================
// Error handling
// ===========================================================================

TEST(XGBClassifierTest, PredictBeforeFitThrows) {
    auto data = make_synthetic_data(10);
    XGBClassifier model;
    EXPECT_THROW(model.predict_probability(data.view()), std::runtime_error);
    EXPECT_THROW(model.serialize(), std::runtime_error);
}

TEST(XGBClassifierTest, EmptyTrainingDataThrows) {
    XGBClassifier model;
    std::vector<float> empty;
    EXPECT_THROW(model.fit(FeatureMatrix(empty, 0, N_COLS), {}), std::invalid_argument);
}

TEST(XGBClassifierTest, LabelCountMismatchThrows) {
    auto data = make_synthetic_data(10);
    data.labels.pop_back();
    XGBClassifier model;
    EXPECT_THROW(model.fit(data.view(), data.labels), std::invalid_argument);
}

TEST(XGBClassifierTest, MoveTransfersBooster) {
    auto data = make_synthetic_data(40);
    XGBClassifier a(small_config());
    a.fit(data.view(), data.labels);
    auto expected = a.predict_probability(data.view());

    XGBClassifier b(std::move(a));
    EXPECT_FALSE(a.is_fitted());
    EXPECT_TRUE(b.is_fitted());
    EXPECT_EQ(b.predict_probability(data.view()), expected);
}
