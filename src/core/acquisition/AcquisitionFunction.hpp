#pragma once

#include "src/core/surrogate/GaussianProcess.hpp"
#include "pipeline_tuner/types.hpp"
#include <cmath>
#include <memory>
#include <string>

namespace pipeline_tuner::acquisition {

/**
 * @brief Abstract base class for acquisition functions
 *
 * An acquisition function scores a posterior prediction against the incumbent
 * (best observed objective). Higher is better; the optimizer maximises it.
 * Implementations must return finite values, including for zero variance.
 */
class AcquisitionFunction {
public:
    virtual ~AcquisitionFunction() = default;

    /**
     * @brief Acquisition value of one posterior prediction
     * @param prediction Posterior mean and variance at the candidate
     * @param incumbent Best objective observed so far
     */
    virtual double evaluate(const surrogate::Prediction& prediction, double incumbent) const = 0;

    virtual std::string getName() const = 0;

    virtual AcquisitionKind kind() const = 0;

protected:
    static double normalPdf(double z) {
        return 0.3989422804014327 * std::exp(-0.5 * z * z);
    }

    static double normalCdf(double z) {
        return 0.5 * std::erfc(-z * 0.7071067811865476);
    }
};

using AcquisitionFunctionPtr = std::unique_ptr<AcquisitionFunction>;

} // namespace pipeline_tuner::acquisition
