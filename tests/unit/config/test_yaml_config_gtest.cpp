#include <gtest/gtest.h>
#include "src/core/config/YAMLConfigLoader.hpp"
#include "pipeline_tuner/types.hpp"
#include <cstdio>
#include <filesystem>

using pipeline_tuner::config::YAMLConfigLoader;
using pipeline_tuner::config::TunerConfig;
using pipeline_tuner::AcquisitionKind;
using pipeline_tuner::ParameterKind;

namespace {

std::filesystem::path repoRoot() {
    auto source_path = std::filesystem::path(__FILE__);
    return source_path.parent_path().parent_path().parent_path().parent_path();
}

const char* kMinimalParameters = R"YAML(
parameters:
  - { name: threshold, type: continuous, low: 0.0, high: 1.0 }
)YAML";

void expectValidationError(const std::string& yaml, const std::string& fragment) {
    try {
        auto cfg = YAMLConfigLoader::loadFromString(yaml);
        (void)cfg;
        FAIL() << "expected a validation error mentioning '" << fragment << "'";
    } catch (const std::runtime_error& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find(fragment), std::string::npos) << message;
    }
}

} // namespace

TEST(YAMLConfigLoader, LoadsFullConfiguration) {
    const char* yaml = R"YAML(
session:
  name: segmentation
  seed: 7
  initial_design_size: 3
  warm_start:
    - { threshold: 0.4, window: 5, smoothing: median }
parameters:
  - name: threshold
    type: continuous
    low: 0.0
    high: 1.0
    step: 0.05
    default: 0.5
  - name: window
    type: int
    low: 3
    high: 15
    default: 7
  - name: smoothing
    type: categorical
    choices: [none, gaussian, median]
    default: gaussian
evaluation:
  automated_weight: 3
  manual_weight: 1
  manual_rating: { threshold: 8, max: 10 }
  tolerance_ranges:
    - { measurement: area, min: 100, max: 200 }
acquisition:
  function: UCB
  kappa: 1.5
termination:
  max_iterations: 30
  patience: 6
  target_objective: 0.95
database:
  connection: sessions.db
  enabled: false
logging:
  level: DEBUG
)YAML";

    TunerConfig cfg = YAMLConfigLoader::loadFromString(yaml);

    EXPECT_EQ(cfg.session.name, "segmentation");
    EXPECT_EQ(cfg.session.seed, 7u);
    EXPECT_EQ(cfg.session.initial_design_size, 3);
    ASSERT_EQ(cfg.session.warm_start.size(), 1u);
    EXPECT_DOUBLE_EQ(cfg.session.warm_start[0].at("smoothing"), 2.0);
    EXPECT_DOUBLE_EQ(cfg.session.warm_start[0].at("window"), 5.0);

    ASSERT_EQ(cfg.parameters.size(), 3u);
    EXPECT_EQ(cfg.parameters[0].kind, ParameterKind::CONTINUOUS);
    EXPECT_DOUBLE_EQ(cfg.parameters[0].step, 0.05);
    EXPECT_EQ(cfg.parameters[1].kind, ParameterKind::INTEGER);
    EXPECT_DOUBLE_EQ(cfg.parameters[1].default_value, 7.0);
    EXPECT_EQ(cfg.parameters[2].kind, ParameterKind::CATEGORICAL);
    EXPECT_EQ(cfg.parameters[2].choices.size(), 3u);
    EXPECT_DOUBLE_EQ(cfg.parameters[2].high, 2.0);
    EXPECT_DOUBLE_EQ(cfg.parameters[2].default_value, 1.0);

    EXPECT_DOUBLE_EQ(cfg.evaluation.automated_weight, 3.0);
    EXPECT_EQ(cfg.evaluation.manual_quality_threshold, 8);
    ASSERT_EQ(cfg.evaluation.tolerance_ranges.size(), 1u);
    EXPECT_EQ(cfg.evaluation.tolerance_ranges[0].measurement, "area");

    EXPECT_EQ(cfg.acquisition.kind, AcquisitionKind::UPPER_CONFIDENCE_BOUND);
    EXPECT_DOUBLE_EQ(cfg.acquisition.kappa, 1.5);
    EXPECT_EQ(cfg.termination.max_iterations, 30);
    ASSERT_TRUE(cfg.termination.target_objective.has_value());
    EXPECT_DOUBLE_EQ(*cfg.termination.target_objective, 0.95);
    EXPECT_EQ(cfg.database.connection_string, "sessions.db");
    EXPECT_FALSE(cfg.database.enabled);
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(YAMLConfigLoader, OptionalSectionsUseDefaults) {
    TunerConfig cfg = YAMLConfigLoader::loadFromString(kMinimalParameters);
    EXPECT_EQ(cfg.session.initial_design_size, 4);
    EXPECT_EQ(cfg.acquisition.kind, AcquisitionKind::EXPECTED_IMPROVEMENT);
    EXPECT_FALSE(cfg.termination.target_objective.has_value());
    EXPECT_TRUE(cfg.database.enabled);
    EXPECT_DOUBLE_EQ(cfg.parameters[0].default_value, 0.0);
}

TEST(YAMLConfigLoader, ExampleConfigurationLoads) {
    const auto path = repoRoot() / "config" / "tuning" / "segmentation_example.yaml";
    TunerConfig cfg;
    ASSERT_NO_THROW(cfg = YAMLConfigLoader::loadFromFile(path.string()));
    EXPECT_EQ(cfg.session.name, "nucleus_segmentation");
    EXPECT_EQ(cfg.parameters.size(), 4u);
    EXPECT_EQ(cfg.evaluation.tolerance_ranges.size(), 2u);
}

TEST(YAMLConfigLoader, MissingFileThrows) {
    EXPECT_THROW(YAMLConfigLoader::loadFromFile("does/not/exist.yaml"), std::runtime_error);
}

TEST(YAMLConfigLoader, UnknownTypesThrow) {
    EXPECT_THROW(YAMLConfigLoader::stringToParameterKind("complex"), std::runtime_error);
    EXPECT_THROW(YAMLConfigLoader::stringToAcquisitionKind("thompson"), std::runtime_error);
    EXPECT_EQ(YAMLConfigLoader::stringToParameterKind("Choice"), ParameterKind::CATEGORICAL);
    EXPECT_EQ(YAMLConfigLoader::stringToAcquisitionKind("pi"), AcquisitionKind::PROBABILITY_OF_IMPROVEMENT);

    const char* yaml = R"YAML(
parameters:
  - { name: gain, type: complex, low: 0, high: 1 }
)YAML";
    expectValidationError(yaml, "Unknown parameter type");
}

TEST(YAMLConfigLoader, ParametersMustBeSequence) {
    expectValidationError("parameters: { name: threshold }\n", "YAML validation error: parameters must be a sequence");
}

TEST(YAMLValidationErrors, EmptyParameters) {
    expectValidationError("parameters: []\n", "must not be empty");
}

TEST(YAMLValidationErrors, DuplicateParameterNames) {
    const char* yaml = R"YAML(
parameters:
  - { name: threshold, low: 0, high: 1 }
  - { name: threshold, low: 0, high: 2 }
)YAML";
    expectValidationError(yaml, "must be unique");
}

TEST(YAMLValidationErrors, InvertedBounds) {
    const char* yaml = R"YAML(
parameters:
  - { name: threshold, low: 1.0, high: 0.5, default: 0.7 }
)YAML";
    expectValidationError(yaml, "low must be < high");
}

TEST(YAMLValidationErrors, FractionalIntegerBounds) {
    const char* yaml = R"YAML(
parameters:
  - { name: window, type: integer, low: 2.5, high: 9 }
)YAML";
    expectValidationError(yaml, "integer bounds must be integral");
}

TEST(YAMLValidationErrors, DefaultOutsideBounds) {
    const char* yaml = R"YAML(
parameters:
  - { name: threshold, low: 0, high: 1, default: 1.5 }
)YAML";
    expectValidationError(yaml, "default must lie in");
}

TEST(YAMLValidationErrors, CategoricalNeedsTwoChoices) {
    const char* yaml = R"YAML(
parameters:
  - { name: smoothing, type: categorical, choices: [gaussian] }
)YAML";
    expectValidationError(yaml, "YAML validation error");
}

TEST(YAMLValidationErrors, CategoricalDefaultIndexOutOfRange) {
    const char* yaml = R"YAML(
parameters:
  - { name: smoothing, type: categorical, choices: [none, gaussian], default: 5 }
)YAML";
    expectValidationError(yaml, "default is not one of the choices");
}

TEST(YAMLValidationErrors, NegativeWeight) {
    std::string yaml = std::string(kMinimalParameters) + "evaluation: { automated_weight: -1 }\n";
    expectValidationError(yaml, "weights must be >= 0");
}

TEST(YAMLValidationErrors, BothWeightsZero) {
    std::string yaml = std::string(kMinimalParameters) +
                       "evaluation: { automated_weight: 0, manual_weight: 0 }\n";
    expectValidationError(yaml, "must not both be zero");
}

TEST(YAMLValidationErrors, RatingThresholdAboveScale) {
    std::string yaml = std::string(kMinimalParameters) +
                       "evaluation: { manual_rating: { threshold: 12, max: 10 } }\n";
    expectValidationError(yaml, "YAML validation error");
}

TEST(YAMLValidationErrors, InvertedToleranceRange) {
    const char* yaml = R"YAML(
parameters:
  - { name: threshold, low: 0, high: 1 }
evaluation:
  tolerance_ranges:
    - { measurement: area, min: 300, max: 100 }
)YAML";
    expectValidationError(yaml, "YAML validation error");
}

TEST(YAMLValidationErrors, ToleranceRangeWithoutMeasurement) {
    const char* yaml = R"YAML(
parameters:
  - { name: threshold, low: 0, high: 1 }
evaluation:
  tolerance_ranges:
    - { min: 100, max: 300 }
)YAML";
    expectValidationError(yaml, "must have 'measurement' field");
}

TEST(YAMLValidationErrors, NonPositiveLengthScale) {
    std::string yaml = std::string(kMinimalParameters) + "surrogate: { length_scale: 0 }\n";
    expectValidationError(yaml, "length_scale must be > 0");
}

TEST(YAMLValidationErrors, NegativeExploration) {
    std::string yaml = std::string(kMinimalParameters) + "acquisition: { xi: -0.1 }\n";
    expectValidationError(yaml, "xi and kappa must be >= 0");
}

TEST(YAMLValidationErrors, ZeroPatience) {
    std::string yaml = std::string(kMinimalParameters) + "termination: { patience: 0 }\n";
    expectValidationError(yaml, "patience must be >= 1");
}

TEST(YAMLValidationErrors, IterationBudgetBelowInitialDesign) {
    std::string yaml = std::string(kMinimalParameters) +
                       "session: { initial_design_size: 6 }\ntermination: { max_iterations: 4 }\n";
    expectValidationError(yaml, "YAML validation error");
}

TEST(YAMLValidationErrors, ZeroRetries) {
    std::string yaml = std::string(kMinimalParameters) +
                       "termination: { max_retries_per_configuration: 0 }\n";
    expectValidationError(yaml, "max_retries_per_configuration must be >= 1");
}

TEST(YAMLValidationErrors, UnknownLogLevel) {
    std::string yaml = std::string(kMinimalParameters) + "logging: { level: verbose }\n";
    expectValidationError(yaml, "logging.level");
}

TEST(YAMLValidationErrors, NonMappingDocument) {
    expectValidationError("- just\n- a list\n", "document must be a mapping");
}

class YAMLConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "test_tuner_config_roundtrip.yaml";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(YAMLConfigFileTest, SavedConfigurationLoadsBack) {
    const char* yaml = R"YAML(
session:
  name: saved
  seed: 3
  initial_design_size: 2
  warm_start:
    - { threshold: 0.25, smoothing: none }
parameters:
  - { name: threshold, type: continuous, low: 0.0, high: 1.0, step: 0.25, default: 0.5 }
  - { name: smoothing, type: categorical, choices: [none, gaussian], default: gaussian }
evaluation:
  tolerance_ranges:
    - { measurement: area, min: 10, max: 20 }
acquisition:
  function: pi
termination:
  max_iterations: 12
  target_objective: 0.5
database:
  enabled: false
)YAML";

    const TunerConfig original = YAMLConfigLoader::loadFromString(yaml);
    YAMLConfigLoader::saveToFile(original, path_);
    const TunerConfig reloaded = YAMLConfigLoader::loadFromFile(path_);

    EXPECT_EQ(reloaded.session.name, "saved");
    EXPECT_EQ(reloaded.session.seed, 3u);
    ASSERT_EQ(reloaded.session.warm_start.size(), 1u);
    EXPECT_EQ(reloaded.session.warm_start[0], original.session.warm_start[0]);
    ASSERT_EQ(reloaded.parameters.size(), 2u);
    EXPECT_EQ(reloaded.parameters[1].choices, original.parameters[1].choices);
    EXPECT_DOUBLE_EQ(reloaded.parameters[1].default_value, 1.0);
    EXPECT_DOUBLE_EQ(reloaded.parameters[0].step, 0.25);
    EXPECT_EQ(reloaded.acquisition.kind, AcquisitionKind::PROBABILITY_OF_IMPROVEMENT);
    EXPECT_EQ(reloaded.termination.max_iterations, 12);
    ASSERT_TRUE(reloaded.termination.target_objective.has_value());
    EXPECT_DOUBLE_EQ(*reloaded.termination.target_objective, 0.5);
    EXPECT_EQ(reloaded.evaluation.tolerance_ranges.size(), 1u);
    EXPECT_FALSE(reloaded.database.enabled);
}
