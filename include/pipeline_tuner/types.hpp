#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipeline_tuner {

    // ================================
    // PARAMETER SPACE ENUMS
    // ================================

    /**
     * @brief Domain kind of a tunable pipeline parameter
     */
    enum class ParameterKind {
        CONTINUOUS,            ///< Real value in [low, high]
        INTEGER,               ///< Integral value in [low, high]
        CATEGORICAL            ///< One of a fixed list of choices (stored as choice index)
    };

    /**
     * @brief Which evaluator(s) produced an observation's objective
     */
    enum class ObservationSource {
        AUTOMATED,             ///< Automated score only
        MANUAL,                ///< Manual score or rejection only
        BLENDED                ///< Weighted combination of both
    };

    /**
     * @brief Tag of a single evaluator result
     */
    enum class SignalKind {
        AUTOMATED,             ///< Automated evaluator produced a score
        MANUAL,                ///< Operator produced a score
        ABSENT,                ///< No usable score (skipped or nothing to measure)
        REJECTED               ///< Operator explicitly marked the configuration unacceptable
    };

    /**
     * @brief Acquisition functions available to the optimizer
     */
    enum class AcquisitionKind {
        EXPECTED_IMPROVEMENT,
        UPPER_CONFIDENCE_BOUND,
        PROBABILITY_OF_IMPROVEMENT
    };

    /**
     * @brief States of the optimisation session controller
     */
    enum class SessionPhase {
        INITIALIZING,
        AWAITING_EVALUATION,
        UPDATING,
        CONVERGED,             ///< Terminal
        CANCELLED              ///< Terminal
    };

    enum class TerminationReason {
        NONE,
        MAX_ITERATIONS,
        NO_IMPROVEMENT,
        TARGET_REACHED,
        OPERATOR_CANCEL,
        SPACE_EXHAUSTED        ///< Every admissible configuration has been observed
    };

    /**
     * @brief Result of handing one evaluation round to the controller
     */
    enum class SubmissionOutcome {
        RECORDED,              ///< Observation appended, next configuration queued (or session terminated)
        DISCARDED,             ///< Failed round, same configuration re-requested
        STALLED,               ///< Retry bound exhausted; host must be told, fresh proposal queued
        IGNORED                ///< Session not awaiting evaluation (terminal or not started)
    };

    // ================================
    // STRING CONVERSION FUNCTIONS
    // ================================

    inline std::string toString(ParameterKind kind) {
        switch (kind) {
            case ParameterKind::CONTINUOUS: return "continuous";
            case ParameterKind::INTEGER: return "integer";
            case ParameterKind::CATEGORICAL: return "categorical";
            default: return "unknown";
        }
    }

    inline std::string toString(ObservationSource source) {
        switch (source) {
            case ObservationSource::AUTOMATED: return "automated";
            case ObservationSource::MANUAL: return "manual";
            case ObservationSource::BLENDED: return "blended";
            default: return "unknown";
        }
    }

    inline std::string toString(SignalKind kind) {
        switch (kind) {
            case SignalKind::AUTOMATED: return "automated";
            case SignalKind::MANUAL: return "manual";
            case SignalKind::ABSENT: return "absent";
            case SignalKind::REJECTED: return "rejected";
            default: return "unknown";
        }
    }

    inline std::string toString(AcquisitionKind kind) {
        switch (kind) {
            case AcquisitionKind::EXPECTED_IMPROVEMENT: return "expected_improvement";
            case AcquisitionKind::UPPER_CONFIDENCE_BOUND: return "upper_confidence_bound";
            case AcquisitionKind::PROBABILITY_OF_IMPROVEMENT: return "probability_of_improvement";
            default: return "unknown";
        }
    }

    inline std::string toString(SessionPhase phase) {
        switch (phase) {
            case SessionPhase::INITIALIZING: return "initializing";
            case SessionPhase::AWAITING_EVALUATION: return "awaiting_evaluation";
            case SessionPhase::UPDATING: return "updating";
            case SessionPhase::CONVERGED: return "converged";
            case SessionPhase::CANCELLED: return "cancelled";
            default: return "unknown";
        }
    }

    inline std::string toString(TerminationReason reason) {
        switch (reason) {
            case TerminationReason::NONE: return "none";
            case TerminationReason::MAX_ITERATIONS: return "max_iterations";
            case TerminationReason::NO_IMPROVEMENT: return "no_improvement";
            case TerminationReason::TARGET_REACHED: return "target_reached";
            case TerminationReason::OPERATOR_CANCEL: return "operator_cancel";
            case TerminationReason::SPACE_EXHAUSTED: return "space_exhausted";
            default: return "unknown";
        }
    }

    inline std::string toString(SubmissionOutcome outcome) {
        switch (outcome) {
            case SubmissionOutcome::RECORDED: return "recorded";
            case SubmissionOutcome::DISCARDED: return "discarded";
            case SubmissionOutcome::STALLED: return "stalled";
            case SubmissionOutcome::IGNORED: return "ignored";
            default: return "unknown";
        }
    }

    inline ObservationSource observationSourceFromString(const std::string& str) {
        if (str == "manual") return ObservationSource::MANUAL;
        if (str == "blended") return ObservationSource::BLENDED;
        return ObservationSource::AUTOMATED;
    }

    inline SessionPhase sessionPhaseFromString(const std::string& str) {
        if (str == "initializing") return SessionPhase::INITIALIZING;
        if (str == "updating") return SessionPhase::UPDATING;
        if (str == "converged") return SessionPhase::CONVERGED;
        if (str == "cancelled") return SessionPhase::CANCELLED;
        return SessionPhase::AWAITING_EVALUATION;
    }

    inline TerminationReason terminationReasonFromString(const std::string& str) {
        if (str == "max_iterations") return TerminationReason::MAX_ITERATIONS;
        if (str == "no_improvement") return TerminationReason::NO_IMPROVEMENT;
        if (str == "target_reached") return TerminationReason::TARGET_REACHED;
        if (str == "operator_cancel") return TerminationReason::OPERATOR_CANCEL;
        if (str == "space_exhausted") return TerminationReason::SPACE_EXHAUSTED;
        return TerminationReason::NONE;
    }

    // ================================
    // DOMAIN STRUCTURES
    // ================================

    /**
     * @brief One tunable pipeline parameter
     *
     * For CATEGORICAL parameters low/high are ignored and the value stored in a
     * Configuration is the index into choices.
     */
    struct ParameterSpec {
        std::string name;
        ParameterKind kind = ParameterKind::CONTINUOUS;
        double low = 0.0;
        double high = 1.0;
        double step = 0.0;                  // proposal granularity for continuous params, 0 = none
        double default_value = 0.0;
        std::vector<std::string> choices;   // CATEGORICAL only
    };

    /// Flat mapping parameter name -> concrete value.
    using Configuration = std::map<std::string, double>;

    /**
     * @brief One completed evaluation round
     */
    struct Observation {
        Configuration configuration;
        std::vector<double> encoded;        ///< Normalised vector, fixed for the session
        double objective = 0.0;
        double noise = 0.0;
        ObservationSource source = ObservationSource::AUTOMATED;
        int order_index = 0;
        std::string timestamp;
    };

    // ================================
    // PARAMETER STRUCTURES FOR CONFIGURATION
    // ================================

    struct SessionParams {
        std::string name = "default";
        unsigned int seed = 42;
        int initial_design_size = 4;                  // model-free proposals at session start
        std::vector<Configuration> warm_start;        // used before the latin hypercube fill
    };

    struct ToleranceRange {
        std::string measurement;
        double min = 0.0;
        double max = 100.0;
    };

    struct EvaluationParams {
        double automated_weight = 0.5;                // renormalised with manual_weight
        double manual_weight = 0.5;
        double automated_noise = 0.01;
        double manual_noise = 0.0025;
        double rejection_objective = -1.0;            // sentinel for operator rejections
        int manual_quality_threshold = 9;             // ratings below count as deviation
        int manual_max_rating = 10;
        std::vector<ToleranceRange> tolerance_ranges; // automated measurement quality ranges
    };

    struct SurrogateParams {
        double length_scale = 0.2;                    // in normalised [0,1] units
        double signal_variance = 1.0;                 // on standardised targets
        double noise_floor = 1e-6;
        double jitter = 1e-10;
        double max_jitter = 1e-4;
        bool optimize_hyperparameters = true;
        int min_observations_for_optimization = 5;
        int optimizer_restarts = 3;
        int optimizer_max_iterations = 300;
    };

    struct AcquisitionParams {
        AcquisitionKind kind = AcquisitionKind::EXPECTED_IMPROVEMENT;
        double xi = 0.01;                             // EI / PI exploration margin
        double kappa = 2.0;                           // UCB exploration weight
        int random_candidates = 2000;
        int refine_starts = 5;
        int refine_iterations = 100;
        double duplicate_tolerance = 1e-3;            // in normalised units (max-norm)
        int max_resample_attempts = 50;
    };

    struct TerminationParams {
        int max_iterations = 150;
        double improvement_threshold = 1e-3;
        int patience = 10;                            // consecutive non-improving iterations
        std::optional<double> target_objective;
        int max_retries_per_configuration = 3;
    };

    /**
     * @brief Serializable session state, sufficient to resume at the next evaluation
     */
    struct SessionSnapshot {
        std::string name;
        std::string space_signature;            ///< ParameterSpace::signature() of the session
        unsigned int seed = 42;
        int iteration_count = 0;
        SessionPhase phase = SessionPhase::AWAITING_EVALUATION;
        TerminationReason termination_reason = TerminationReason::NONE;
        int retry_count = 0;
        bool stalled = false;
        int non_improving_iterations = 0;
        std::optional<Configuration> pending;
        std::vector<Configuration> design_queue;  ///< Remaining initial design points
        std::vector<Configuration> abandoned;     ///< Configurations given up on after the retry bound
        std::vector<Observation> observations;
        std::string created_at;
        std::string updated_at;
    };

    struct DatabaseParams {
        std::string connection_string = "tuning_sessions.db";
        bool enabled = true;
    };

} // namespace pipeline_tuner
