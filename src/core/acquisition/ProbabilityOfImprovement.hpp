#pragma once

#include "AcquisitionFunction.hpp"

namespace pipeline_tuner::acquisition {

/**
 * @brief Probability that the candidate beats the incumbent by at least xi
 */
class ProbabilityOfImprovement : public AcquisitionFunction {
public:
    explicit ProbabilityOfImprovement(double xi = 0.01);

    double evaluate(const surrogate::Prediction& prediction, double incumbent) const override;

    std::string getName() const override { return "ProbabilityOfImprovement"; }

    AcquisitionKind kind() const override { return AcquisitionKind::PROBABILITY_OF_IMPROVEMENT; }

private:
    double xi_;
};

} // namespace pipeline_tuner::acquisition
