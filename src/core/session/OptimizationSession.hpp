#pragma once

#include "pipeline_tuner/types.hpp"
#include "interfaces/IEvaluator.hpp"
#include "interfaces/IPipelineExecutor.hpp"
#include "src/core/acquisition/AcquisitionOptimizer.hpp"
#include "src/core/config/TunerConfig.hpp"
#include "src/core/evaluation/EvaluationAggregator.hpp"
#include "src/core/evaluation/EvaluationSignal.hpp"
#include "src/core/space/ParameterSpace.hpp"
#include "src/core/surrogate/GaussianProcess.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace pipeline_tuner::session {

/**
 * @brief Controller of one interactive Bayesian-optimisation session
 *
 * State machine:
 *   INITIALIZING -> AWAITING_EVALUATION -> UPDATING -> (AWAITING_EVALUATION | CONVERGED | CANCELLED)
 *
 * The session is the only writer of its observation log. Evaluation rounds are
 * delivered as discrete submissions (submitEvaluation / reportPipelineFailure), so
 * the host can suspend for as long as the operator needs between proposal and
 * result. Failed rounds never throw: they are reported through SubmissionOutcome.
 *
 * Only cancel() may be called from another thread. It is honoured immediately
 * while awaiting evaluation and at the next checkpoint while updating; work in
 * flight is discarded and the log keeps every completed observation.
 */
class OptimizationSession {
public:
    /**
     * @throws std::runtime_error if the parameter list or evaluation weights are invalid
     */
    explicit OptimizationSession(const config::TunerConfig& config);

    OptimizationSession(const OptimizationSession&) = delete;
    OptimizationSession& operator=(const OptimizationSession&) = delete;

    /**
     * @brief Build the initial design and queue the first configuration
     * @throws InvalidTransitionError unless the session is INITIALIZING
     * @throws OutOfDomainError if a warm-start configuration lies outside the space
     */
    void start();

    /**
     * @brief Record one evaluation round for the pending configuration
     *
     * Both signals absent (or neither scored nor rejected) counts as a failed round.
     * @return RECORDED, DISCARDED, STALLED, or IGNORED when not awaiting evaluation
     */
    SubmissionOutcome submitEvaluation(const evaluation::EvaluationSignal& automated,
                                       const evaluation::EvaluationSignal& manual);

    /**
     * @brief Report that the pipeline could not run the pending configuration
     */
    SubmissionOutcome reportPipelineFailure(const std::string& reason);

    /**
     * @brief Run the pending configuration through the collaborators and submit the result
     *
     * Either evaluator may be null (not available for this session).
     */
    SubmissionOutcome runRound(IPipelineExecutor& executor,
                               IAutomatedEvaluator* automated,
                               IManualEvaluator* manual);

    /**
     * @brief Drive rounds until the session is terminal
     * @param on_round Called after every round with its outcome (may be empty)
     * @throws StalledSessionError when a round ends STALLED
     */
    void runUntilTerminal(IPipelineExecutor& executor,
                          IAutomatedEvaluator* automated,
                          IManualEvaluator* manual,
                          const std::function<void(SubmissionOutcome)>& on_round = {});

    /// Request cancellation. Safe to call from any thread, at any time.
    void cancel();

    SessionPhase phase() const { return phase_.load(); }
    bool isTerminal() const;
    TerminationReason terminationReason() const;

    /// Configuration waiting for evaluation (empty unless AWAITING_EVALUATION).
    std::optional<Configuration> pendingConfiguration() const;

    int iterationCount() const { return iteration_count_; }
    const std::vector<Observation>& observations() const { return observations_; }

    /// Observation with the highest objective so far (first one wins ties).
    std::optional<Observation> bestObservation() const;
    std::optional<double> bestObjective() const;

    /// Retry bound was exhausted on some configuration since the last recorded round.
    bool isStalled() const { return stalled_; }
    /// Configurations abandoned after the retry bound; never proposed again.
    const std::vector<Configuration>& abandonedConfigurations() const { return abandoned_; }
    /// The last surrogate fit fell back to the prior because the covariance was ill-conditioned.
    bool isDegraded() const { return degraded_; }
    int retryCount() const { return retry_count_; }
    size_t remainingInitialDesign() const { return design_queue_.size(); }

    const std::string& name() const { return name_; }
    const space::ParameterSpace& space() const { return space_; }

    /**
     * @brief Serializable state for persistence
     */
    SessionSnapshot snapshot() const;

    /**
     * @brief Resume from a snapshot instead of calling start()
     * @throws InvalidTransitionError unless the session is INITIALIZING
     * @throws std::runtime_error if the snapshot was taken over a different parameter space
     */
    void restore(const SessionSnapshot& snapshot);

private:
    config::TunerConfig config_;
    std::string name_;
    space::ParameterSpace space_;
    evaluation::EvaluationAggregator aggregator_;
    surrogate::GaussianProcess surrogate_;
    acquisition::AcquisitionOptimizer optimizer_;
    std::mt19937 rng_;

    std::atomic<SessionPhase> phase_{SessionPhase::INITIALIZING};
    std::atomic<bool> cancel_requested_{false};
    TerminationReason termination_reason_ = TerminationReason::NONE;

    std::vector<Observation> observations_;
    std::deque<Configuration> design_queue_;
    std::optional<Configuration> pending_;
    std::vector<Configuration> abandoned_;
    int iteration_count_ = 0;
    int retry_count_ = 0;
    int non_improving_iterations_ = 0;
    bool stalled_ = false;
    bool degraded_ = false;
    std::string created_at_;

    bool claimRound();
    void enterAwaiting(SessionPhase from);
    void finish(SessionPhase terminal, TerminationReason reason);
    bool cancelCheckpoint();

    SubmissionOutcome handleFailedRound(const std::string& reason);
    void update(double previous_best);
    bool checkTermination(double previous_best);
    bool queueNextConfiguration();
    std::optional<Configuration> nextDesignPoint();
    std::vector<std::vector<double>> abandonedVectors() const;
};

} // namespace pipeline_tuner::session
