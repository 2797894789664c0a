#include "EvaluationAggregator.hpp"
#include "pipeline_tuner/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pipeline_tuner::evaluation {

EvaluationAggregator::EvaluationAggregator(const EvaluationParams& params)
    : params_(params) {
    if (params.automated_weight < 0.0 || params.manual_weight < 0.0) {
        throw std::runtime_error("Evaluation weights must be >= 0");
    }
    const double total = params.automated_weight + params.manual_weight;
    if (total <= 0.0) {
        throw std::runtime_error("At least one evaluation weight must be > 0");
    }
    if (params.automated_noise < 0.0 || params.manual_noise < 0.0) {
        throw std::runtime_error("Evaluation noise levels must be >= 0");
    }
    automated_weight_ = params.automated_weight / total;
    manual_weight_ = params.manual_weight / total;
}

AggregatedObjective EvaluationAggregator::aggregate(std::optional<double> automated_score,
                                                    std::optional<double> manual_score) const {
    if (automated_score && !std::isfinite(*automated_score)) {
        automated_score.reset();
    }
    if (manual_score && !std::isfinite(*manual_score)) {
        manual_score.reset();
    }

    if (!automated_score && !manual_score) {
        throw NoSignalError();
    }

    AggregatedObjective result;
    if (automated_score && !manual_score) {
        result.objective = *automated_score;
        result.noise = params_.automated_noise;
        result.source = ObservationSource::AUTOMATED;
        return result;
    }
    if (manual_score && !automated_score) {
        result.objective = *manual_score;
        result.noise = params_.manual_noise;
        result.source = ObservationSource::MANUAL;
        return result;
    }

    result.objective = automated_weight_ * *automated_score + manual_weight_ * *manual_score;
    const double blended_noise = automated_weight_ * params_.automated_noise +
                                 manual_weight_ * params_.manual_noise;
    result.noise = std::max(blended_noise, std::min(params_.automated_noise, params_.manual_noise));
    result.source = ObservationSource::BLENDED;
    return result;
}

AggregatedObjective EvaluationAggregator::aggregate(const EvaluationSignal& automated,
                                                    const EvaluationSignal& manual) const {
    if (automated.isRejection() || manual.isRejection()) {
        AggregatedObjective result;
        result.objective = params_.rejection_objective;
        result.noise = params_.manual_noise;
        result.source = ObservationSource::MANUAL;
        return result;
    }

    std::optional<double> automated_score;
    std::optional<double> manual_score;
    if (automated.hasScore()) {
        automated_score = automated.value;
    }
    if (manual.hasScore()) {
        manual_score = manual.value;
    }
    return aggregate(automated_score, manual_score);
}

} // namespace pipeline_tuner::evaluation
