#include "ManualRating.hpp"
#include <stdexcept>
#include <string>

namespace pipeline_tuner::evaluation {

double ratingDeviationPercent(int rating, int quality_threshold) {
    if (quality_threshold <= 0 || rating >= quality_threshold) {
        return 0.0;
    }
    return static_cast<double>(quality_threshold - rating) * 100.0 / quality_threshold;
}

EvaluationSignal ratingToSignal(int rating, const EvaluationParams& params) {
    if (rating == 0) {
        return EvaluationSignal::absent();
    }
    if (rating < 0 || rating > params.manual_max_rating) {
        throw std::runtime_error("Rating " + std::to_string(rating) + " outside 1.." +
                                 std::to_string(params.manual_max_rating));
    }
    const double deviation = ratingDeviationPercent(rating, params.manual_quality_threshold);
    return EvaluationSignal::manual(1.0 - deviation / 100.0);
}

} // namespace pipeline_tuner::evaluation
