#pragma once

#include "AcquisitionFunction.hpp"

namespace pipeline_tuner::acquisition {

/**
 * @brief Expected improvement over the incumbent
 *
 * EI = (mu - f* - xi) * Phi(z) + sigma * phi(z), z = (mu - f* - xi) / sigma.
 * Zero posterior variance gives zero.
 */
class ExpectedImprovement : public AcquisitionFunction {
public:
    explicit ExpectedImprovement(double xi = 0.01);

    double evaluate(const surrogate::Prediction& prediction, double incumbent) const override;

    std::string getName() const override { return "ExpectedImprovement"; }

    AcquisitionKind kind() const override { return AcquisitionKind::EXPECTED_IMPROVEMENT; }

    double getXi() const { return xi_; }

private:
    double xi_;   ///< Exploration margin
};

} // namespace pipeline_tuner::acquisition
