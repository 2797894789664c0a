#include "ExpectedImprovement.hpp"
#include <algorithm>

namespace pipeline_tuner::acquisition {

ExpectedImprovement::ExpectedImprovement(double xi)
    : xi_(xi) {}

double ExpectedImprovement::evaluate(const surrogate::Prediction& prediction, double incumbent) const {
    const double sigma = std::sqrt(std::max(0.0, prediction.variance));
    if (sigma < 1e-12) {
        return 0.0;
    }
    const double improvement = prediction.mean - incumbent - xi_;
    const double z = improvement / sigma;
    return std::max(0.0, improvement * normalCdf(z) + sigma * normalPdf(z));
}

} // namespace pipeline_tuner::acquisition
