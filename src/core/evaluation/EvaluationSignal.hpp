#pragma once

#include "pipeline_tuner/types.hpp"
#include <string>

namespace pipeline_tuner::evaluation {

/**
 * @brief Result of one evaluator collaborator for one round
 *
 * Tagged value: automated | manual | absent | rejected. Only the scored kinds
 * carry a meaningful value.
 */
struct EvaluationSignal {
    SignalKind kind = SignalKind::ABSENT;
    double value = 0.0;

    static EvaluationSignal automated(double score) {
        return EvaluationSignal{SignalKind::AUTOMATED, score};
    }

    static EvaluationSignal manual(double score) {
        return EvaluationSignal{SignalKind::MANUAL, score};
    }

    static EvaluationSignal absent() {
        return EvaluationSignal{SignalKind::ABSENT, 0.0};
    }

    static EvaluationSignal rejected() {
        return EvaluationSignal{SignalKind::REJECTED, 0.0};
    }

    bool hasScore() const {
        return kind == SignalKind::AUTOMATED || kind == SignalKind::MANUAL;
    }

    bool isRejection() const { return kind == SignalKind::REJECTED; }
    bool isAbsent() const { return kind == SignalKind::ABSENT; }

    std::string toString() const {
        if (hasScore()) {
            return pipeline_tuner::toString(kind) + "(" + std::to_string(value) + ")";
        }
        return pipeline_tuner::toString(kind);
    }
};

} // namespace pipeline_tuner::evaluation
