#pragma once

#include "AcquisitionFunction.hpp"
#include "pipeline_tuner/types.hpp"
#include <string>
#include <vector>

namespace pipeline_tuner::acquisition {

/**
 * @brief Factory for acquisition function instances
 *
 * Supported functions:
 * - ExpectedImprovement (default): exploration margin xi
 * - UpperConfidenceBound: exploration weight kappa
 * - ProbabilityOfImprovement: exploration margin xi
 */
class AcquisitionFactory {
public:
    /**
     * @brief Create the acquisition function selected in the acquisition parameters
     * @throws std::runtime_error If the kind is unknown
     */
    static AcquisitionFunctionPtr create(const AcquisitionParams& params);

    static std::vector<std::string> getAvailableFunctions();

private:
    AcquisitionFactory() = default;
};

} // namespace pipeline_tuner::acquisition
