#include "AcquisitionFactory.hpp"
#include "ExpectedImprovement.hpp"
#include "ProbabilityOfImprovement.hpp"
#include "UpperConfidenceBound.hpp"
#include <stdexcept>

namespace pipeline_tuner::acquisition {

AcquisitionFunctionPtr AcquisitionFactory::create(const AcquisitionParams& params) {
    switch (params.kind) {
        case AcquisitionKind::EXPECTED_IMPROVEMENT:
            return std::make_unique<ExpectedImprovement>(params.xi);

        case AcquisitionKind::UPPER_CONFIDENCE_BOUND:
            return std::make_unique<UpperConfidenceBound>(params.kappa);

        case AcquisitionKind::PROBABILITY_OF_IMPROVEMENT:
            return std::make_unique<ProbabilityOfImprovement>(params.xi);

        default:
            throw std::runtime_error("Unknown acquisition function: " + std::to_string(static_cast<int>(params.kind)));
    }
}

std::vector<std::string> AcquisitionFactory::getAvailableFunctions() {
    return {
        "ExpectedImprovement",
        "UpperConfidenceBound",
        "ProbabilityOfImprovement"
    };
}

} // namespace pipeline_tuner::acquisition
