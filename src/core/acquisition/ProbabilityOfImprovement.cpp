#include "ProbabilityOfImprovement.hpp"
#include <algorithm>

namespace pipeline_tuner::acquisition {

ProbabilityOfImprovement::ProbabilityOfImprovement(double xi)
    : xi_(xi) {}

double ProbabilityOfImprovement::evaluate(const surrogate::Prediction& prediction, double incumbent) const {
    const double sigma = std::sqrt(std::max(0.0, prediction.variance));
    if (sigma < 1e-12) {
        return 0.0;
    }
    return normalCdf((prediction.mean - incumbent - xi_) / sigma);
}

} // namespace pipeline_tuner::acquisition
