#pragma once

#include "AcquisitionFunction.hpp"

namespace pipeline_tuner::acquisition {

/**
 * @brief Optimistic bound mu + kappa * sigma (incumbent is not used)
 */
class UpperConfidenceBound : public AcquisitionFunction {
public:
    explicit UpperConfidenceBound(double kappa = 2.0);

    double evaluate(const surrogate::Prediction& prediction, double incumbent) const override;

    std::string getName() const override { return "UpperConfidenceBound"; }

    AcquisitionKind kind() const override { return AcquisitionKind::UPPER_CONFIDENCE_BOUND; }

    double getKappa() const { return kappa_; }

private:
    double kappa_;
};

} // namespace pipeline_tuner::acquisition
