#include "OptimizationSession.hpp"
#include "pipeline_tuner/errors.hpp"
#include "pipeline_tuner/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pipeline_tuner::session {

namespace {

void validateTermination(const TerminationParams& params) {
    if (params.max_iterations < 1) {
        throw std::runtime_error("termination.max_iterations must be >= 1");
    }
    if (params.patience < 1) {
        throw std::runtime_error("termination.patience must be >= 1");
    }
    if (params.max_retries_per_configuration < 1) {
        throw std::runtime_error("termination.max_retries_per_configuration must be >= 1");
    }
}

} // namespace

OptimizationSession::OptimizationSession(const config::TunerConfig& config)
    : config_(config),
      name_(config.session.name),
      space_(config.parameters),
      aggregator_(config.evaluation),
      surrogate_(config.surrogate),
      optimizer_(config.acquisition, config.session.initial_design_size),
      rng_(config.session.seed),
      created_at_(logging::currentTimestamp()) {
    validateTermination(config.termination);
}

// ================================
// STATE TRANSITIONS
// ================================

bool OptimizationSession::isTerminal() const {
    const SessionPhase current = phase();
    return current == SessionPhase::CONVERGED || current == SessionPhase::CANCELLED;
}

TerminationReason OptimizationSession::terminationReason() const {
    // cancel() may flip the phase from another thread without touching the reason
    if (phase() == SessionPhase::CANCELLED) {
        return TerminationReason::OPERATOR_CANCEL;
    }
    return termination_reason_;
}

std::optional<Configuration> OptimizationSession::pendingConfiguration() const {
    if (phase() != SessionPhase::AWAITING_EVALUATION) {
        return std::nullopt;
    }
    return pending_;
}

bool OptimizationSession::claimRound() {
    if (!pending_) {
        return false;
    }
    SessionPhase expected = SessionPhase::AWAITING_EVALUATION;
    return phase_.compare_exchange_strong(expected, SessionPhase::UPDATING);
}

void OptimizationSession::enterAwaiting(SessionPhase from) {
    SessionPhase expected = from;
    if (!phase_.compare_exchange_strong(expected, SessionPhase::AWAITING_EVALUATION)) {
        return;
    }
    LOG_DEBUG("Session '" + name_ + "': " + toString(from) + " -> awaiting_evaluation");

    // A cancel that arrived while updating only raised the flag.
    if (cancel_requested_.load()) {
        expected = SessionPhase::AWAITING_EVALUATION;
        phase_.compare_exchange_strong(expected, SessionPhase::CANCELLED);
    }
}

void OptimizationSession::finish(SessionPhase terminal, TerminationReason reason) {
    termination_reason_ = reason;
    pending_.reset();
    phase_.store(terminal);

    const auto best = bestObservation();
    if (best) {
        LOG_INFO("Session '" + name_ + "' " + toString(terminal) + " (" + toString(reason) + ") after " +
                 std::to_string(iteration_count_) + " iterations; best objective " +
                 std::to_string(best->objective) + " at " + space_.describe(best->configuration));
    } else {
        LOG_INFO("Session '" + name_ + "' " + toString(terminal) + " (" + toString(reason) +
                 ") without observations");
    }
}

bool OptimizationSession::cancelCheckpoint() {
    if (!cancel_requested_.load()) {
        return false;
    }
    finish(SessionPhase::CANCELLED, TerminationReason::OPERATOR_CANCEL);
    return true;
}

void OptimizationSession::cancel() {
    cancel_requested_.store(true);

    SessionPhase expected = SessionPhase::AWAITING_EVALUATION;
    if (phase_.compare_exchange_strong(expected, SessionPhase::CANCELLED)) {
        LOG_INFO("Session '" + name_ + "' cancelled by operator while awaiting evaluation");
        return;
    }
    expected = SessionPhase::INITIALIZING;
    if (phase_.compare_exchange_strong(expected, SessionPhase::CANCELLED)) {
        LOG_INFO("Session '" + name_ + "' cancelled before start");
        return;
    }
    if (expected == SessionPhase::UPDATING) {
        LOG_INFO("Session '" + name_ + "' cancel requested, stopping at next checkpoint");
    }
}

// ================================
// SESSION LIFECYCLE
// ================================

void OptimizationSession::start() {
    if (phase() != SessionPhase::INITIALIZING) {
        throw InvalidTransitionError("start() requires phase initializing, session is " + toString(phase()));
    }

    LOG_INFO("Starting tuning session '" + name_ + "' over " + std::to_string(space_.dimension()) +
             " parameter(s)");

    for (const auto& warm : config_.session.warm_start) {
        space_.validate(warm);
        design_queue_.push_back(warm);
    }

    const int remaining = config_.session.initial_design_size - static_cast<int>(design_queue_.size());
    if (remaining > 0) {
        for (auto& point : space_.sampleLatinHypercube(remaining, rng_)) {
            design_queue_.push_back(std::move(point));
        }
    }
    LOG_DEBUG("Initial design: " + std::to_string(config_.session.warm_start.size()) + " warm start, " +
              std::to_string(std::max(0, remaining)) + " latin hypercube");

    if (cancelCheckpoint()) {
        return;
    }
    if (queueNextConfiguration()) {
        enterAwaiting(SessionPhase::INITIALIZING);
    }
}

std::vector<std::vector<double>> OptimizationSession::abandonedVectors() const {
    std::vector<std::vector<double>> vectors;
    vectors.reserve(abandoned_.size());
    for (const auto& configuration : abandoned_) {
        vectors.push_back(space_.encode(configuration));
    }
    return vectors;
}

std::optional<Configuration> OptimizationSession::nextDesignPoint() {
    using acquisition::AcquisitionOptimizer;
    const double tolerance = config_.acquisition.duplicate_tolerance;
    const auto abandoned = abandonedVectors();
    while (!design_queue_.empty()) {
        Configuration candidate = design_queue_.front();
        design_queue_.pop_front();
        const auto encoded = space_.encode(candidate);
        if (AcquisitionOptimizer::isDuplicate(encoded, observations_, tolerance)) {
            LOG_DEBUG("Skipping design point already observed: " + space_.describe(candidate));
            continue;
        }
        if (AcquisitionOptimizer::isDuplicate(encoded, abandoned, tolerance)) {
            LOG_DEBUG("Skipping abandoned design point: " + space_.describe(candidate));
            continue;
        }
        return candidate;
    }
    return std::nullopt;
}

bool OptimizationSession::queueNextConfiguration() {
    auto design_point = nextDesignPoint();
    if (design_point) {
        pending_ = std::move(design_point);
        LOG_INFO("Next configuration (initial design): " + space_.describe(*pending_));
        return true;
    }

    std::optional<surrogate::FittedModel> model;
    try {
        model = surrogate_.fit(observations_, space_.dimension());
        degraded_ = false;
    } catch (const IllConditionedModelError& e) {
        degraded_ = true;
        LOG_WARNING(std::string("Surrogate fit degraded to prior-only predictions: ") + e.what());
        model = surrogate_.fitPriorOnly(observations_, space_.dimension());
    }

    if (cancelCheckpoint()) {
        return false;
    }

    std::vector<double> encoded;
    try {
        encoded = optimizer_.proposeEncoded(*model, space_, observations_, rng_, abandonedVectors());
    } catch (const SpaceExhaustedError& e) {
        LOG_WARNING(e.what());
        finish(SessionPhase::CONVERGED, TerminationReason::SPACE_EXHAUSTED);
        return false;
    }

    if (cancelCheckpoint()) {
        return false;
    }

    pending_ = space_.quantize(space_.decode(encoded));
    LOG_INFO("Next configuration (" + optimizer_.function().getName() + "): " + space_.describe(*pending_));
    return true;
}

// ================================
// EVALUATION ROUNDS
// ================================

SubmissionOutcome OptimizationSession::submitEvaluation(const evaluation::EvaluationSignal& automated,
                                                        const evaluation::EvaluationSignal& manual) {
    if (!claimRound()) {
        LOG_WARNING("Evaluation ignored, session '" + name_ + "' is " + toString(phase()));
        return SubmissionOutcome::IGNORED;
    }

    evaluation::AggregatedObjective aggregated;
    try {
        aggregated = aggregator_.aggregate(automated, manual);
    } catch (const NoSignalError& e) {
        return handleFailedRound(e.what());
    }

    Observation observation;
    observation.configuration = *pending_;
    observation.encoded = space_.encode(*pending_);
    observation.objective = aggregated.objective;
    observation.noise = aggregated.noise;
    observation.source = aggregated.source;
    observation.order_index = static_cast<int>(observations_.size());
    observation.timestamp = logging::currentTimestamp();

    const double previous_best = bestObjective().value_or(-std::numeric_limits<double>::infinity());

    observations_.push_back(std::move(observation));
    iteration_count_++;
    retry_count_ = 0;
    stalled_ = false;
    pending_.reset();

    const Observation& recorded = observations_.back();
    LOG_INFO("Iteration " + std::to_string(iteration_count_) + ": objective " +
             std::to_string(recorded.objective) + " (" + toString(recorded.source) + ", automated " +
             automated.toString() + ", manual " + manual.toString() + ")");

    update(previous_best);
    return SubmissionOutcome::RECORDED;
}

SubmissionOutcome OptimizationSession::reportPipelineFailure(const std::string& reason) {
    if (!claimRound()) {
        LOG_WARNING("Pipeline failure ignored, session '" + name_ + "' is " + toString(phase()));
        return SubmissionOutcome::IGNORED;
    }
    return handleFailedRound(reason);
}

SubmissionOutcome OptimizationSession::handleFailedRound(const std::string& reason) {
    retry_count_++;
    const int bound = config_.termination.max_retries_per_configuration;
    LOG_WARNING("Round discarded for " + space_.describe(*pending_) + ": " + reason + " (attempt " +
                std::to_string(retry_count_) + "/" + std::to_string(bound) + ")");

    if (retry_count_ < bound) {
        if (!cancelCheckpoint()) {
            enterAwaiting(SessionPhase::UPDATING);
        }
        return SubmissionOutcome::DISCARDED;
    }

    stalled_ = true;
    retry_count_ = 0;
    LOG_ERROR("Session '" + name_ + "' stalled: " + std::to_string(bound) +
              " consecutive failed rounds on " + space_.describe(*pending_) + ", moving to a fresh proposal");
    abandoned_.push_back(*pending_);
    pending_.reset();

    if (!cancelCheckpoint() && queueNextConfiguration()) {
        enterAwaiting(SessionPhase::UPDATING);
    }
    return SubmissionOutcome::STALLED;
}

void OptimizationSession::update(double previous_best) {
    if (cancelCheckpoint()) {
        return;
    }
    if (checkTermination(previous_best)) {
        return;
    }
    if (queueNextConfiguration()) {
        enterAwaiting(SessionPhase::UPDATING);
    }
}

bool OptimizationSession::checkTermination(double previous_best) {
    const double best = bestObjective().value_or(previous_best);
    const auto& policy = config_.termination;

    if (!std::isfinite(previous_best) || best - previous_best >= policy.improvement_threshold) {
        non_improving_iterations_ = 0;
    } else {
        non_improving_iterations_++;
    }

    if (policy.target_objective && best >= *policy.target_objective) {
        finish(SessionPhase::CONVERGED, TerminationReason::TARGET_REACHED);
        return true;
    }
    if (iteration_count_ >= policy.max_iterations) {
        finish(SessionPhase::CONVERGED, TerminationReason::MAX_ITERATIONS);
        return true;
    }
    if (non_improving_iterations_ >= policy.patience) {
        finish(SessionPhase::CONVERGED, TerminationReason::NO_IMPROVEMENT);
        return true;
    }
    return false;
}

SubmissionOutcome OptimizationSession::runRound(IPipelineExecutor& executor,
                                                IAutomatedEvaluator* automated,
                                                IManualEvaluator* manual) {
    const auto configuration = pendingConfiguration();
    if (!configuration) {
        LOG_WARNING("runRound ignored, session '" + name_ + "' is " + toString(phase()));
        return SubmissionOutcome::IGNORED;
    }

    PipelineOutput output;
    try {
        output = executor.execute(*configuration);
    } catch (const PipelineExecutionError& e) {
        return reportPipelineFailure(e.what());
    } catch (const std::exception& e) {
        return reportPipelineFailure(executor.name() + " failed: " + e.what());
    }

    const auto automated_signal = automated ? automated->evaluate(output) : evaluation::EvaluationSignal::absent();
    const auto manual_signal = manual ? manual->evaluate(output, *configuration) : evaluation::EvaluationSignal::absent();
    return submitEvaluation(automated_signal, manual_signal);
}

void OptimizationSession::runUntilTerminal(IPipelineExecutor& executor,
                                           IAutomatedEvaluator* automated,
                                           IManualEvaluator* manual,
                                           const std::function<void(SubmissionOutcome)>& on_round) {
    if (phase() == SessionPhase::INITIALIZING) {
        start();
    }
    while (!isTerminal()) {
        const SubmissionOutcome outcome = runRound(executor, automated, manual);
        if (on_round) {
            on_round(outcome);
        }
        if (outcome == SubmissionOutcome::STALLED) {
            throw StalledSessionError("session '" + name_ + "' exceeded " +
                                      std::to_string(config_.termination.max_retries_per_configuration) +
                                      " failed rounds on one configuration");
        }
        if (outcome == SubmissionOutcome::IGNORED && !isTerminal()) {
            throw InvalidTransitionError("session '" + name_ + "' is " + toString(phase()) +
                                         " and cannot run a round");
        }
    }
}

// ================================
// RESULTS
// ================================

std::optional<Observation> OptimizationSession::bestObservation() const {
    const Observation* best = nullptr;
    for (const auto& obs : observations_) {
        if (!best || obs.objective > best->objective) {
            best = &obs;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

std::optional<double> OptimizationSession::bestObjective() const {
    const auto best = bestObservation();
    if (!best) {
        return std::nullopt;
    }
    return best->objective;
}

// ================================
// PERSISTENCE
// ================================

SessionSnapshot OptimizationSession::snapshot() const {
    SessionSnapshot snapshot;
    snapshot.name = name_;
    snapshot.space_signature = space_.signature();
    snapshot.seed = config_.session.seed;
    snapshot.iteration_count = iteration_count_;
    snapshot.phase = phase();
    if (snapshot.phase == SessionPhase::UPDATING || snapshot.phase == SessionPhase::INITIALIZING) {
        snapshot.phase = SessionPhase::AWAITING_EVALUATION;
    }
    snapshot.termination_reason = terminationReason();
    snapshot.retry_count = retry_count_;
    snapshot.stalled = stalled_;
    snapshot.non_improving_iterations = non_improving_iterations_;
    snapshot.pending = pendingConfiguration();
    snapshot.design_queue.assign(design_queue_.begin(), design_queue_.end());
    snapshot.abandoned = abandoned_;
    snapshot.observations = observations_;
    snapshot.created_at = created_at_;
    snapshot.updated_at = logging::currentTimestamp();
    return snapshot;
}

void OptimizationSession::restore(const SessionSnapshot& snapshot) {
    if (phase() != SessionPhase::INITIALIZING) {
        throw InvalidTransitionError("restore() requires phase initializing, session is " + toString(phase()));
    }
    if (snapshot.space_signature != space_.signature()) {
        throw std::runtime_error("Session '" + snapshot.name +
                                 "' was recorded over a different parameter space");
    }

    observations_.clear();
    for (const auto& stored : snapshot.observations) {
        Observation obs = stored;
        if (obs.encoded.size() != space_.dimension()) {
            obs.encoded = space_.encode(obs.configuration);
        }
        observations_.push_back(std::move(obs));
    }

    iteration_count_ = snapshot.iteration_count;
    retry_count_ = snapshot.retry_count;
    stalled_ = snapshot.stalled;
    non_improving_iterations_ = snapshot.non_improving_iterations;
    design_queue_.assign(snapshot.design_queue.begin(), snapshot.design_queue.end());
    abandoned_.clear();
    for (const auto& configuration : snapshot.abandoned) {
        if (space_.contains(configuration)) {
            abandoned_.push_back(configuration);
        }
    }
    if (!snapshot.created_at.empty()) {
        created_at_ = snapshot.created_at;
    }

    // Proposals after a resume stay reproducible for a given log length.
    rng_.seed(config_.session.seed + 7919u * static_cast<unsigned int>(observations_.size()));

    LOG_INFO("Resumed session '" + name_ + "' at iteration " + std::to_string(iteration_count_) + " (" +
             toString(snapshot.phase) + ")");

    if (snapshot.phase == SessionPhase::CONVERGED || snapshot.phase == SessionPhase::CANCELLED) {
        termination_reason_ = snapshot.termination_reason;
        phase_.store(snapshot.phase);
        return;
    }

    if (cancelCheckpoint()) {
        return;
    }
    if (snapshot.pending && space_.contains(*snapshot.pending)) {
        pending_ = snapshot.pending;
        enterAwaiting(SessionPhase::INITIALIZING);
        return;
    }
    if (queueNextConfiguration()) {
        enterAwaiting(SessionPhase::INITIALIZING);
    }
}

} // namespace pipeline_tuner::session
