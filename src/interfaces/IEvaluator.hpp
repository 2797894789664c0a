#pragma once

#include "interfaces/IPipelineExecutor.hpp"
#include "src/core/evaluation/EvaluationSignal.hpp"
#include <string>

namespace pipeline_tuner {

    /**
     * @brief Scores processed pipeline output without human involvement
     *
     * Returns an AUTOMATED signal, or ABSENT when there is nothing to score.
     */
    class IAutomatedEvaluator {
    public:
        virtual ~IAutomatedEvaluator() = default;

        virtual evaluation::EvaluationSignal evaluate(const PipelineOutput& output) = 0;

        virtual std::string name() const = 0;
    };

    /**
     * @brief Presents processed output to the operator and collects a judgement
     *
     * Returns a MANUAL score, an explicit REJECTED, or ABSENT when the operator skipped.
     * Implementations may block for as long as the operator needs.
     */
    class IManualEvaluator {
    public:
        virtual ~IManualEvaluator() = default;

        virtual evaluation::EvaluationSignal evaluate(
            const PipelineOutput& output,
            const Configuration& configuration
        ) = 0;

        virtual std::string name() const = 0;
    };

} // namespace pipeline_tuner
