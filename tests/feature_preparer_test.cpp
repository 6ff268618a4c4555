// feature_preparer_test.cpp — feature selection, cleaning and coercion

#include <gtest/gtest.h>
#include "features/feature_preparer.hpp"
#include "anomaly_errors.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using test_helpers::make_dates;
using test_helpers::make_feature_table;

// ===========================================================================
// Feature selection
// ===========================================================================

TEST(FeaturePreparerTest, AllFeaturesPresent_FullMatrix) {
    auto data = make_feature_table(100, 5);

    auto prepared = prepare_features(data.table, /*require_label=*/true);

    EXPECT_EQ(prepared.num_rows(), 100u);
    EXPECT_EQ(prepared.num_features(), static_cast<size_t>(FEATURE_VOCAB_SIZE));
    EXPECT_EQ(prepared.matrix.size(), 100u * FEATURE_VOCAB_SIZE);
    EXPECT_EQ(prepared.labels.size(), 100u);
    EXPECT_EQ(prepared.active_features, feature_vocabulary());
}

TEST(FeaturePreparerTest, SubsetOfFeatures_KeepsVocabularyOrder) {
    FeatureTable table(make_dates(3));
    table.set_column("rsi", {50.0, 60.0, 40.0});
    table.set_column("unrelated", {1.0, 2.0, 3.0});
    table.set_column("return", {0.01, -0.02, 0.03});

    auto prepared = prepare_features(table, false);

    std::vector<std::string> expected = {"return", "rsi"};
    EXPECT_EQ(prepared.active_features, expected);
    ASSERT_EQ(prepared.matrix.size(), 6u);
    // Row 1 laid out as [return, rsi]
    EXPECT_FLOAT_EQ(prepared.matrix[2], -0.02f);
    EXPECT_FLOAT_EQ(prepared.matrix[3], 60.0f);
}

TEST(FeaturePreparerTest, NoRecognizedFeatures_Throws) {
    FeatureTable table(make_dates(3));
    table.set_column("other_column", {1.0, 2.0, 3.0});
    table.set_column(LABEL_COLUMN, {0.0, 0.0, 1.0});

    EXPECT_THROW(prepare_features(table, true), NoFeaturesAvailable);
    EXPECT_THROW(prepare_features(table, false), NoFeaturesAvailable);
}

TEST(FeaturePreparerTest, RequireLabel_MissingLabelThrows) {
    FeatureTable table(make_dates(3));
    table.set_column("return", {0.01, 0.02, -0.01});
    table.set_column("volatility", {0.02, 0.03, 0.02});

    EXPECT_THROW(prepare_features(table, true), LabelColumnMissing);
    EXPECT_NO_THROW(prepare_features(table, false));
}

TEST(FeaturePreparerTest, WithoutLabel_LabelsEmpty) {
    auto data = make_feature_table(20, 2);
    auto prepared = prepare_features(data.table, false);
    EXPECT_TRUE(prepared.labels.empty());
    EXPECT_EQ(prepared.num_rows(), 20u);
}

// ===========================================================================
// Phase 1 — missing cells
// ===========================================================================

TEST(FeaturePreparerTest, MissingCellsDropRow) {
    FeatureTable table(make_dates(5));
    table.set_column("return", {0.01, MISSING_VALUE, 0.03, 0.04, 0.05});
    table.set_cells("rsi", {TableCell{50.0}, TableCell{51.0}, TableCell{},
                            TableCell{53.0}, TableCell{54.0}});

    auto prepared = prepare_features(table, false);

    std::vector<size_t> expected_rows = {0, 3, 4};
    EXPECT_EQ(prepared.rows, expected_rows);
    EXPECT_EQ(prepared.matrix.size(), 6u);
}

// ===========================================================================
// Phase 2 — numeric coercion
// ===========================================================================

TEST(FeaturePreparerTest, NonNumericText_DroppedAndReported) {
    FeatureTable table(make_dates(4));
    table.set_column("return", {0.01, 0.02, 0.03, 0.04});
    table.set_cells("macd", {TableCell{0.1}, TableCell{std::string("n/a")},
                             TableCell{0.3}, TableCell{std::string("0.4")}});

    auto prepared = prepare_features(table, false);

    std::vector<size_t> expected_rows = {0, 2, 3};
    EXPECT_EQ(prepared.rows, expected_rows);

    ASSERT_EQ(prepared.coercions.size(), 2u);
    EXPECT_TRUE(prepared.coercions[0].ok());
    EXPECT_EQ(prepared.coercions[1].column, "macd");
    EXPECT_FALSE(prepared.coercions[1].ok());
    EXPECT_EQ(prepared.coercions[1].failed, 1);
    EXPECT_EQ(prepared.coercions[1].converted, 3);

    // Numeric text "0.4" converted, laid out at the last row
    EXPECT_FLOAT_EQ(prepared.matrix[5], 0.4f);
}

TEST(FeaturePreparerTest, OnlyNonNumericValues_ZeroRowsNoThrow) {
    FeatureTable table(make_dates(3));
    table.set_text_column("return", {"abc", "def", "ghi"});
    table.set_text_column("rsi", {"x", "y", "z"});

    auto prepared = prepare_features(table, false);

    EXPECT_TRUE(prepared.empty());
    EXPECT_TRUE(prepared.matrix.empty());
    EXPECT_EQ(prepared.active_features.size(), 2u);
}

TEST(FeaturePreparerTest, InfiniteValuesRejected) {
    FeatureTable table(make_dates(3));
    table.set_column("return", {0.01, std::numeric_limits<double>::infinity(), 0.03});

    auto prepared = prepare_features(table, false);

    std::vector<size_t> expected_rows = {0, 2};
    EXPECT_EQ(prepared.rows, expected_rows);
}

TEST(FeaturePreparerTest, ValuesBeyondFloatRangeRejected) {
    FeatureTable table(make_dates(4));
    table.set_column("return", {0.01, 1e300, 0.02, -1e39});

    auto prepared = prepare_features(table, false);

    std::vector<size_t> expected_rows = {0, 2};
    EXPECT_EQ(prepared.rows, expected_rows);
    ASSERT_EQ(prepared.coercions.size(), 1u);
    EXPECT_EQ(prepared.coercions[0].failed, 2);
    for (float v : prepared.matrix) {
        EXPECT_TRUE(std::isfinite(v));
    }
}

TEST(FeaturePreparerTest, FloatMaxStillAccepted) {
    FeatureTable table(make_dates(2));
    double fmax = static_cast<double>(std::numeric_limits<float>::max());
    table.set_column("return", {fmax, -fmax});

    auto prepared = prepare_features(table, false);

    EXPECT_EQ(prepared.num_rows(), 2u);
    EXPECT_FLOAT_EQ(prepared.matrix[0], std::numeric_limits<float>::max());
}

TEST(FeaturePreparerTest, CoerceColumn_TypedResultPerRow) {
    FeatureTable table(make_dates(4));
    table.set_text_column("rsi", {"55.5", " 60 ", "sixty", "1e2"});

    auto result = coerce_column(table, "rsi", {0, 1, 2, 3});

    EXPECT_EQ(result.column, "rsi");
    EXPECT_EQ(result.converted, 3);
    EXPECT_EQ(result.failed, 1);
    ASSERT_EQ(result.values.size(), 4u);
    EXPECT_DOUBLE_EQ(result.values[0], 55.5);
    EXPECT_DOUBLE_EQ(result.values[1], 60.0);
    EXPECT_TRUE(std::isnan(result.values[2]));
    EXPECT_DOUBLE_EQ(result.values[3], 100.0);
}

TEST(FeaturePreparerTest, CoerceColumn_OnlyRequestedRows) {
    FeatureTable table(make_dates(3));
    table.set_text_column("rsi", {"bad", "10", "20"});

    auto result = coerce_column(table, "rsi", {1, 2});

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.converted, 2);
}

// ===========================================================================
// Labels
// ===========================================================================

TEST(FeaturePreparerTest, LabelsBinarizedAndUnusableLabelsDropped) {
    FeatureTable table(make_dates(4));
    table.set_column("return", {0.01, 0.02, 0.03, 0.04});
    table.set_cells(LABEL_COLUMN, {TableCell{0.0}, TableCell{2.0},
                                   TableCell{}, TableCell{0.5}});

    auto prepared = prepare_features(table, true);

    // Any nonzero label is anomalous, fractional values included
    std::vector<size_t> expected_rows = {0, 1, 3};
    std::vector<int> expected_labels = {0, 1, 1};
    EXPECT_EQ(prepared.rows, expected_rows);
    EXPECT_EQ(prepared.labels, expected_labels);
}

TEST(FeaturePreparerTest, AvailableFeatures_EmptyForUnrelatedTable) {
    FeatureTable table(make_dates(2));
    table.set_column("close", {1.0, 2.0});
    EXPECT_TRUE(available_features(table).empty());
}
