#include "UpperConfidenceBound.hpp"
#include <algorithm>

namespace pipeline_tuner::acquisition {

UpperConfidenceBound::UpperConfidenceBound(double kappa)
    : kappa_(kappa) {}

double UpperConfidenceBound::evaluate(const surrogate::Prediction& prediction, double /*incumbent*/) const {
    return prediction.mean + kappa_ * std::sqrt(std::max(0.0, prediction.variance));
}

} // namespace pipeline_tuner::acquisition
