#include <gtest/gtest.h>
#include "cli/tuning_session/operator_input.hpp"

namespace cli = pipeline_tuner::cli::tuning_session_cli;
using pipeline_tuner::EvaluationParams;
using pipeline_tuner::SignalKind;

namespace {

EvaluationParams ratingScale() {
    EvaluationParams params;
    params.manual_quality_threshold = 9;
    params.manual_max_rating = 10;
    return params;
}

} // namespace

TEST(OperatorInput, ScoreOnly) {
    const auto input = cli::parseOperatorInput("0.75", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT);
    EXPECT_EQ(input.automated.kind, SignalKind::AUTOMATED);
    EXPECT_DOUBLE_EQ(input.automated.value, 0.75);
    EXPECT_TRUE(input.manual.isAbsent());
}

TEST(OperatorInput, ScoreAndRating) {
    const auto input = cli::parseOperatorInput("  0.5   6 ", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT);
    EXPECT_DOUBLE_EQ(input.automated.value, 0.5);
    ASSERT_EQ(input.manual.kind, SignalKind::MANUAL);
    EXPECT_NEAR(input.manual.value, 2.0 / 3.0, 1e-9);
}

TEST(OperatorInput, RatingOnly) {
    const auto input = cli::parseOperatorInput("- 10", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT);
    EXPECT_TRUE(input.automated.isAbsent());
    ASSERT_EQ(input.manual.kind, SignalKind::MANUAL);
    EXPECT_DOUBLE_EQ(input.manual.value, 1.0);
}

TEST(OperatorInput, ZeroRatingMeansNotRated) {
    const auto input = cli::parseOperatorInput("0.4 0", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT);
    EXPECT_TRUE(input.manual.isAbsent());
}

TEST(OperatorInput, Rejection) {
    auto input = cli::parseOperatorInput("r", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT);
    EXPECT_TRUE(input.manual.isRejection());
    EXPECT_TRUE(input.automated.isAbsent());

    input = cli::parseOperatorInput("0.9 r", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT);
    EXPECT_TRUE(input.manual.isRejection());
    EXPECT_EQ(input.automated.kind, SignalKind::AUTOMATED);
}

TEST(OperatorInput, SkipAndEmptyLine) {
    for (const char* line : {"", "s", "   "}) {
        const auto input = cli::parseOperatorInput(line, ratingScale());
        ASSERT_EQ(input.command, cli::OperatorCommand::SUBMIT) << "line '" << line << "'";
        EXPECT_TRUE(input.automated.isAbsent());
        EXPECT_TRUE(input.manual.isAbsent());
    }
}

TEST(OperatorInput, PipelineFailure) {
    auto input = cli::parseOperatorInput("f out of memory", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::PIPELINE_FAILURE);
    EXPECT_EQ(input.message, "out of memory");

    input = cli::parseOperatorInput("f", ratingScale());
    ASSERT_EQ(input.command, cli::OperatorCommand::PIPELINE_FAILURE);
    EXPECT_EQ(input.message, "reported by operator");
}

TEST(OperatorInput, Cancel) {
    EXPECT_EQ(cli::parseOperatorInput("q", ratingScale()).command, cli::OperatorCommand::CANCEL);
}

TEST(OperatorInput, InvalidLines) {
    const auto params = ratingScale();
    for (const char* line : {"1.5", "-0.1", "abc", "0.5 11", "0.5 2.5", "0.5 x", "0.5 3 1", "s now", "r 3", "nan"}) {
        const auto input = cli::parseOperatorInput(line, params);
        EXPECT_EQ(input.command, cli::OperatorCommand::INVALID) << "line '" << line << "'";
        EXPECT_FALSE(input.message.empty());
    }
}
