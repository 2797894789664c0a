#pragma once

#include "EvaluationSignal.hpp"
#include "pipeline_tuner/types.hpp"

namespace pipeline_tuner::evaluation {

    /**
     * @brief Percentage shortfall of an operator rating below the quality threshold
     *
     * (threshold - rating) * 100 / threshold when the rating is below threshold, else 0.
     */
    double ratingDeviationPercent(int rating, int quality_threshold);

    /**
     * @brief Convert an operator rating on the 1..max_rating scale to a manual signal
     *
     * A rating of 0 means the operator skipped (ABSENT). Ratings at or above the
     * quality threshold score 1.0.
     * @throws std::runtime_error for ratings outside 0..max_rating
     */
    EvaluationSignal ratingToSignal(int rating, const EvaluationParams& params);

} // namespace pipeline_tuner::evaluation
