#pragma once

#include <stdexcept>
#include <string>

namespace pipeline_tuner {

    /**
     * @brief A configuration or raw value violates the parameter space bounds
     */
    class OutOfDomainError : public std::runtime_error {
    public:
        explicit OutOfDomainError(const std::string& what)
            : std::runtime_error("OutOfDomain: " + what) {}
    };

    /**
     * @brief Neither evaluator produced a usable score for a round
     */
    class NoSignalError : public std::runtime_error {
    public:
        NoSignalError() : std::runtime_error("NoSignal: no automated or manual score for this round") {}
    };

    /**
     * @brief Surrogate covariance could not be factorised even with maximum jitter
     */
    class IllConditionedModelError : public std::runtime_error {
    public:
        explicit IllConditionedModelError(const std::string& what)
            : std::runtime_error("IllConditionedModel: " + what) {}
    };

    /**
     * @brief The pipeline execution collaborator failed to run a configuration
     */
    class PipelineExecutionError : public std::runtime_error {
    public:
        explicit PipelineExecutionError(const std::string& what)
            : std::runtime_error("PipelineExecutionFailure: " + what) {}
    };

    /**
     * @brief Evaluation kept failing beyond the configured retry bound
     */
    class StalledSessionError : public std::runtime_error {
    public:
        explicit StalledSessionError(const std::string& what)
            : std::runtime_error("StalledSession: " + what) {}
    };

    /**
     * @brief No admissible configuration is left that has not been observed
     */
    class SpaceExhaustedError : public std::runtime_error {
    public:
        explicit SpaceExhaustedError(const std::string& what)
            : std::runtime_error("SpaceExhausted: " + what) {}
    };

    /**
     * @brief Operation not permitted in the controller's current phase
     */
    class InvalidTransitionError : public std::runtime_error {
    public:
        explicit InvalidTransitionError(const std::string& what)
            : std::runtime_error("InvalidTransition: " + what) {}
    };

} // namespace pipeline_tuner
