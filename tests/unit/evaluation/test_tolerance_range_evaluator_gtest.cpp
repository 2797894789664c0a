#include <gtest/gtest.h>
#include "src/core/evaluation/ToleranceRangeEvaluator.hpp"

using pipeline_tuner::PipelineOutput;
using pipeline_tuner::SignalKind;
using pipeline_tuner::ToleranceRange;
using pipeline_tuner::evaluation::ToleranceRangeEvaluator;

namespace {

ToleranceRange range(const std::string& name, double min, double max) {
    ToleranceRange r;
    r.measurement = name;
    r.min = min;
    r.max = max;
    return r;
}

} // namespace

TEST(ToleranceRangeEvaluator, AllObjectsInRangeScoreOne) {
    ToleranceRangeEvaluator evaluator({range("area", 50, 400)});
    PipelineOutput output;
    output.measurements["area"] = {60, 120, 399};

    auto signal = evaluator.evaluate(output);
    ASSERT_EQ(signal.kind, SignalKind::AUTOMATED);
    EXPECT_DOUBLE_EQ(signal.value, 1.0);
}

TEST(ToleranceRangeEvaluator, DeviationIsRelativeToViolatedBound) {
    const auto r = range("area", 100, 200);
    // 50 below min: 50%, 300 above max: 50%, 150 inside: 0
    EXPECT_DOUBLE_EQ(ToleranceRangeEvaluator::meanDeviationPercent({50, 300, 150}, r), 100.0 / 3.0);
    EXPECT_DOUBLE_EQ(ToleranceRangeEvaluator::meanDeviationPercent({}, r), 0.0);
}

TEST(ToleranceRangeEvaluator, ZeroBoundUsesRangeWidth) {
    const auto r = range("offset", 0.0, 4.0);
    EXPECT_DOUBLE_EQ(ToleranceRangeEvaluator::meanDeviationPercent({-1.0}, r), 25.0);
}

TEST(ToleranceRangeEvaluator, AveragesAcrossMeasurements) {
    ToleranceRangeEvaluator evaluator({range("area", 100, 200), range("circularity", 0.5, 1.0)});
    PipelineOutput output;
    output.measurements["area"] = {50};              // 50 %
    output.measurements["circularity"] = {0.75};     // 0 %

    auto signal = evaluator.evaluate(output);
    ASSERT_EQ(signal.kind, SignalKind::AUTOMATED);
    EXPECT_NEAR(signal.value, 0.75, 1e-12);
}

TEST(ToleranceRangeEvaluator, LargeDeviationClampsToZero) {
    ToleranceRangeEvaluator evaluator({range("area", 10, 20)});
    PipelineOutput output;
    output.measurements["area"] = {500};

    auto signal = evaluator.evaluate(output);
    EXPECT_DOUBLE_EQ(signal.value, 0.0);
}

TEST(ToleranceRangeEvaluator, NoMeasurementsGiveAbsent) {
    ToleranceRangeEvaluator evaluator({range("area", 10, 20)});
    PipelineOutput output;
    output.measurements["perimeter"] = {5};

    EXPECT_TRUE(evaluator.evaluate(output).isAbsent());
}

TEST(ToleranceRangeEvaluator, RejectsInvalidRanges) {
    EXPECT_THROW(ToleranceRangeEvaluator({range("", 0, 1)}), std::runtime_error);
    EXPECT_THROW(ToleranceRangeEvaluator({range("area", 5, 1)}), std::runtime_error);
}
