#include <gtest/gtest.h>
#include "src/core/space/ParameterSpace.hpp"
#include "pipeline_tuner/errors.hpp"
#include <iomanip>
#include <random>
#include <set>

using pipeline_tuner::Configuration;
using pipeline_tuner::OutOfDomainError;
using pipeline_tuner::ParameterKind;
using pipeline_tuner::ParameterSpec;
using pipeline_tuner::space::ParameterSpace;

namespace {

ParameterSpec continuous(const std::string& name, double low, double high, double step = 0.0) {
    ParameterSpec spec;
    spec.name = name;
    spec.kind = ParameterKind::CONTINUOUS;
    spec.low = low;
    spec.high = high;
    spec.step = step;
    spec.default_value = low;
    return spec;
}

ParameterSpec integer(const std::string& name, double low, double high) {
    ParameterSpec spec;
    spec.name = name;
    spec.kind = ParameterKind::INTEGER;
    spec.low = low;
    spec.high = high;
    spec.default_value = low;
    return spec;
}

ParameterSpec categorical(const std::string& name, std::vector<std::string> choices) {
    ParameterSpec spec;
    spec.name = name;
    spec.kind = ParameterKind::CATEGORICAL;
    spec.choices = std::move(choices);
    return spec;
}

ParameterSpace segmentationSpace() {
    return ParameterSpace({
        continuous("threshold", 0.0, 1.0),
        integer("window", 3, 15),
        categorical("smoothing", {"none", "gaussian", "median"})
    });
}

} // namespace

TEST(ParameterSpace, EncodesInDeclarationOrder) {
    auto space = segmentationSpace();
    Configuration config{{"threshold", 0.25}, {"window", 9}, {"smoothing", 2}};

    auto encoded = space.encode(config);
    ASSERT_EQ(encoded.size(), 3u);
    EXPECT_DOUBLE_EQ(encoded[0], 0.25);
    EXPECT_DOUBLE_EQ(encoded[1], 0.5);
    EXPECT_DOUBLE_EQ(encoded[2], 1.0);
}

TEST(ParameterSpace, DecodeInvertsEncodeForAdmissibleConfigurations) {
    auto space = segmentationSpace();
    const std::vector<Configuration> configs = {
        {{"threshold", 0.0}, {"window", 3}, {"smoothing", 0}},
        {{"threshold", 0.731}, {"window", 8}, {"smoothing", 1}},
        {{"threshold", 1.0}, {"window", 15}, {"smoothing", 2}},
    };
    for (const auto& config : configs) {
        EXPECT_EQ(space.decode(space.encode(config)), config);
    }
}

TEST(ParameterSpace, ContinuousRoundTripIsBitExact) {
    ParameterSpace space({continuous("sigma", 0.1, 0.7)});
    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> value(0.1, 0.7);

    int mismatches = 0;
    for (int i = 0; i < 10000; ++i) {
        const Configuration config{{"sigma", value(rng)}};
        const Configuration decoded = space.decode(space.encode(config));
        if (decoded != config) {
            ++mismatches;
            ADD_FAILURE() << std::setprecision(17) << "sigma " << config.at("sigma")
                          << " decoded as " << decoded.at("sigma");
            if (mismatches > 5) {
                break;
            }
        }
    }
    EXPECT_EQ(mismatches, 0);

    const Configuration low{{"sigma", 0.1}};
    const Configuration high{{"sigma", 0.7}};
    EXPECT_EQ(space.decode(space.encode(low)), low);
    EXPECT_EQ(space.decode(space.encode(high)), high);
}

TEST(ParameterSpace, DecodeRoundsIntegerAndCategoricalCoordinates) {
    auto space = segmentationSpace();
    auto config = space.decode({0.5, 0.49, 0.4});
    EXPECT_EQ(config.at("window"), 9.0);      // 3 + 0.49 * 12 = 8.88
    EXPECT_EQ(config.at("smoothing"), 1.0);   // 0.4 * 2 = 0.8
}

TEST(ParameterSpace, RejectsOutOfDomainValues) {
    auto space = segmentationSpace();
    EXPECT_THROW(space.encode({{"threshold", 1.5}, {"window", 9}, {"smoothing", 0}}), OutOfDomainError);
    EXPECT_THROW(space.encode({{"threshold", 0.5}, {"window", 9.5}, {"smoothing", 0}}), OutOfDomainError);
    EXPECT_THROW(space.encode({{"threshold", 0.5}, {"window", 9}, {"smoothing", 3}}), OutOfDomainError);
    EXPECT_THROW(space.encode({{"threshold", 0.5}, {"window", 9}}), OutOfDomainError);
    EXPECT_THROW(space.encode({{"threshold", 0.5}, {"window", 9}, {"smoothing", 0}, {"extra", 1}}),
                 OutOfDomainError);
    EXPECT_THROW(space.decode({0.5, 0.5}), OutOfDomainError);
    EXPECT_THROW(space.decode({0.5, 1.2, 0.0}), OutOfDomainError);
}

TEST(ParameterSpace, ContainsReportsWithoutThrowing) {
    auto space = segmentationSpace();
    EXPECT_TRUE(space.contains({{"threshold", 0.5}, {"window", 4}, {"smoothing", 1}}));
    EXPECT_FALSE(space.contains({{"threshold", -0.1}, {"window", 4}, {"smoothing", 1}}));
}

TEST(ParameterSpace, ConstructorRejectsMalformedSpecs) {
    EXPECT_THROW(ParameterSpace(std::vector<ParameterSpec>{}), std::runtime_error);
    EXPECT_THROW(ParameterSpace({continuous("a", 1.0, 1.0)}), std::runtime_error);
    EXPECT_THROW(ParameterSpace({integer("a", 0.5, 4)}), std::runtime_error);
    EXPECT_THROW(ParameterSpace({categorical("a", {"only"})}), std::runtime_error);
    EXPECT_THROW(ParameterSpace({categorical("a", {"x", "x"})}), std::runtime_error);
    EXPECT_THROW(ParameterSpace({continuous("a", 0, 1), continuous("a", 0, 1)}), std::runtime_error);
    EXPECT_THROW(ParameterSpace({continuous("a=b", 0, 1)}), std::runtime_error);
}

TEST(ParameterSpace, QuantizeSnapsContinuousStepGrid) {
    ParameterSpace space({continuous("sigma", 0.5, 2.0, 0.25)});
    auto snapped = space.quantize({{"sigma", 1.13}});
    EXPECT_DOUBLE_EQ(snapped.at("sigma"), 1.25);

    auto upper = space.quantize({{"sigma", 1.99}});
    EXPECT_DOUBLE_EQ(upper.at("sigma"), 2.0);
}

TEST(ParameterSpace, QuantizeDoesNotOvershootUpperBound) {
    ParameterSpace space({continuous("gain", 0.0, 1.0, 0.3)});
    auto snapped = space.quantize({{"gain", 0.99}});
    EXPECT_LE(snapped.at("gain"), 1.0);
    EXPECT_NEAR(snapped.at("gain"), 0.9, 1e-12);
}

TEST(ParameterSpace, SnapReturnsAdmissibleEncodedVector) {
    auto space = segmentationSpace();
    auto snapped = space.snap({1.3, 0.51, -0.2});
    auto config = space.decode(snapped);
    EXPECT_TRUE(space.contains(config));
    EXPECT_DOUBLE_EQ(config.at("threshold"), 1.0);
    EXPECT_DOUBLE_EQ(config.at("smoothing"), 0.0);
}

TEST(ParameterSpace, LatinHypercubeUsesEveryStratumOnce) {
    ParameterSpace space({continuous("a", 0.0, 1.0), continuous("b", 10.0, 20.0)});
    std::mt19937 rng(7);
    const int n = 8;
    auto design = space.sampleLatinHypercube(n, rng);
    ASSERT_EQ(design.size(), static_cast<size_t>(n));

    for (size_t d = 0; d < 2; ++d) {
        std::set<int> strata;
        for (const auto& config : design) {
            auto u = space.encode(config)[d];
            strata.insert(std::min(n - 1, static_cast<int>(u * n)));
        }
        EXPECT_EQ(strata.size(), static_cast<size_t>(n)) << "coordinate " << d;
    }
}

TEST(ParameterSpace, LatinHypercubeIsReproducibleForSeed) {
    auto space = segmentationSpace();
    std::mt19937 first(42);
    std::mt19937 second(42);
    EXPECT_EQ(space.sampleLatinHypercube(5, first), space.sampleLatinHypercube(5, second));
}

TEST(ParameterSpace, SamplesAreAlwaysAdmissible) {
    auto space = segmentationSpace();
    std::mt19937 rng(3);
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(space.contains(space.sampleUniform(rng)));
    }
}

TEST(ParameterSpace, SignatureChangesWithBounds) {
    auto a = segmentationSpace();
    ParameterSpace b({
        continuous("threshold", 0.0, 2.0),
        integer("window", 3, 15),
        categorical("smoothing", {"none", "gaussian", "median"})
    });
    EXPECT_EQ(a.signature(), segmentationSpace().signature());
    EXPECT_NE(a.signature(), b.signature());
}

TEST(ParameterSpace, FormatsCategoricalLabels) {
    auto space = segmentationSpace();
    EXPECT_EQ(space.formatValue("smoothing", 1), "gaussian");
    EXPECT_EQ(space.formatValue("window", 7), "7");
    EXPECT_EQ(space.describe({{"threshold", 0.5}, {"window", 7}, {"smoothing", 2}}),
              "threshold=0.5, window=7, smoothing=median");
}
