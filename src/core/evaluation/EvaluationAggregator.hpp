#pragma once

#include "EvaluationSignal.hpp"
#include "pipeline_tuner/types.hpp"
#include <optional>

namespace pipeline_tuner::evaluation {

/**
 * @brief Single objective value (maximised) with its noise estimate
 */
struct AggregatedObjective {
    double objective = 0.0;
    double noise = 0.0;
    ObservationSource source = ObservationSource::AUTOMATED;
};

/**
 * @brief Merges automated and manual feedback into one optimisation objective
 *
 * - Only one score present: that score, with the configured noise of its source.
 * - Both present: weighted blend of scores and of noises (weights renormalised to
 *   sum to one); the noise never drops below the more confident source.
 * - Rejection from either side: the rejection objective, with manual noise, so
 *   the surrogate learns to avoid the region.
 * - Nothing present: NoSignalError.
 */
class EvaluationAggregator {
public:
    /**
     * @throws std::runtime_error if weights are negative or both zero, or a noise is negative
     */
    explicit EvaluationAggregator(const EvaluationParams& params);

    /**
     * @brief Aggregate plain scores
     * @throws NoSignalError if both are absent
     */
    AggregatedObjective aggregate(std::optional<double> automated_score,
                                  std::optional<double> manual_score) const;

    /**
     * @brief Aggregate tagged evaluator results (handles rejection)
     * @throws NoSignalError if neither signal carries a score or a rejection
     */
    AggregatedObjective aggregate(const EvaluationSignal& automated,
                                  const EvaluationSignal& manual) const;

    double automatedWeight() const { return automated_weight_; }
    double manualWeight() const { return manual_weight_; }

private:
    EvaluationParams params_;
    double automated_weight_ = 0.5;
    double manual_weight_ = 0.5;
};

} // namespace pipeline_tuner::evaluation
