#include "src/core/config/YAMLConfigLoader.hpp"
#include "src/core/session/OptimizationSession.hpp"
#include "pipeline_tuner/database/DatabaseManager.hpp"
#include "pipeline_tuner/errors.hpp"
#include "pipeline_tuner/logging.hpp"
#include "pipeline_tuner/types.hpp"
#include "cli/tuning_session/cli_args.hpp"
#include "cli/tuning_session/operator_input.hpp"
#include <iomanip>
#include <iostream>
#include <string>

using namespace pipeline_tuner;
namespace tuning_cli = pipeline_tuner::cli::tuning_session_cli;

static void printSessions(const database::DatabaseManager& db) {
    const auto sessions = db.listSessions();
    if (sessions.empty()) {
        std::cout << "No stored sessions" << std::endl;
        return;
    }
    std::cout << std::left << std::setw(24) << "name" << std::setw(12) << "iterations"
              << std::setw(22) << "phase" << std::setw(18) << "reason" << std::setw(12) << "best"
              << "updated" << std::endl;
    for (const auto& s : sessions) {
        std::cout << std::left << std::setw(24) << s.name << std::setw(12) << s.iteration_count
                  << std::setw(22) << toString(s.phase) << std::setw(18) << toString(s.termination_reason)
                  << std::setw(12) << (s.best_objective ? std::to_string(*s.best_objective) : "-")
                  << s.updated_at << std::endl;
    }
}

static void saveProgress(const database::DatabaseManager& db, const session::OptimizationSession& session) {
    if (!db.saveSession(session.snapshot())) {
        LOG_WARNING("Session '" + session.name() + "' could not be saved; progress is only kept in memory");
    }
}

static void printSummary(const session::OptimizationSession& session) {
    std::cout << std::endl << "Session '" << session.name() << "': " << toString(session.phase());
    if (session.isTerminal()) {
        std::cout << " (" << toString(session.terminationReason()) << ")";
    }
    std::cout << " after " << session.iterationCount() << " iteration(s)" << std::endl;

    const auto best = session.bestObservation();
    if (!best) {
        std::cout << "No configuration has been evaluated yet" << std::endl;
        return;
    }
    std::cout << "Best objective: " << best->objective << " (" << toString(best->source) << ")" << std::endl;
    for (const auto& [name, value] : best->configuration) {
        std::cout << "  " << name << " = " << session.space().formatValue(name, value) << std::endl;
    }
}

// Returns false when stdin closed before the operator answered.
static bool runConsoleLoop(session::OptimizationSession& session,
                           const database::DatabaseManager& db,
                           const EvaluationParams& evaluation) {
    tuning_cli::printInputHelp(evaluation);

    while (!session.isTerminal()) {
        const auto pending = session.pendingConfiguration();
        if (!pending) {
            LOG_ERROR("Session '" + session.name() + "' has no configuration awaiting evaluation");
            return true;
        }

        std::cout << std::endl << "[" << (session.iterationCount() + 1) << "] Evaluate: "
                  << session.space().describe(*pending);
        if (session.retryCount() > 0) {
            std::cout << " (retry " << session.retryCount() << ")";
        }
        std::cout << std::endl << "> " << std::flush;

        std::string line;
        if (!std::getline(std::cin, line)) {
            return false;
        }

        const auto input = tuning_cli::parseOperatorInput(line, evaluation);
        SubmissionOutcome outcome = SubmissionOutcome::IGNORED;
        switch (input.command) {
            case tuning_cli::OperatorCommand::INVALID:
                std::cout << "Invalid input: " << input.message << std::endl;
                tuning_cli::printInputHelp(evaluation);
                continue;
            case tuning_cli::OperatorCommand::CANCEL:
                session.cancel();
                saveProgress(db, session);
                return true;
            case tuning_cli::OperatorCommand::PIPELINE_FAILURE:
                outcome = session.reportPipelineFailure(input.message);
                break;
            case tuning_cli::OperatorCommand::SUBMIT:
                outcome = session.submitEvaluation(input.automated, input.manual);
                break;
        }

        if (outcome == SubmissionOutcome::STALLED) {
            std::cout << "Configuration kept failing; moving on to a new proposal" << std::endl;
        } else if (outcome == SubmissionOutcome::DISCARDED) {
            std::cout << "No usable score, the same configuration is requested again" << std::endl;
        } else if (outcome == SubmissionOutcome::RECORDED) {
            const auto best = session.bestObjective();
            if (best) {
                std::cout << "Recorded. Best objective so far: " << *best << std::endl;
            }
        }

        saveProgress(db, session);
    }
    return true;
}

int main(int argc, char** argv) {
    tuning_cli::CliOptions options;
    if (!tuning_cli::parseArgs(argc, argv, options)) {
        return 1;
    }

    config::TunerConfig config;
    try {
        config = config::YAMLConfigLoader::loadFromFile(options.config_path);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to load configuration: ") + e.what());
        return 1;
    }
    logging::setLogLevel(logging::logLevelFromString(config.logging.level));

    database::DatabaseManager db(database::DatabaseConfig::fromParams(config.database));

    if (options.mode == tuning_cli::CliMode::LIST) {
        printSessions(db);
        return 0;
    }

    if (options.mode == tuning_cli::CliMode::DELETE) {
        if (!db.deleteSession(config.session.name)) {
            LOG_ERROR("Failed to delete session '" + config.session.name + "'");
            return 1;
        }
        LOG_INFO("Deleted session '" + config.session.name + "'");
        return 0;
    }

    try {
        session::OptimizationSession tuning(config);

        std::optional<SessionSnapshot> stored;
        if (options.mode == tuning_cli::CliMode::RESUME) {
            stored = db.loadSession(config.session.name);
            if (!stored) {
                LOG_WARNING("No stored session '" + config.session.name + "', starting a new one");
            }
        } else if (db.getSessionId(config.session.name) >= 0) {
            LOG_WARNING("Stored session '" + config.session.name + "' will be replaced (use --resume to continue it)");
        }

        if (stored) {
            tuning.restore(*stored);
        } else {
            tuning.start();
        }
        saveProgress(db, tuning);

        if (!runConsoleLoop(tuning, db, config.evaluation)) {
            std::cout << std::endl << "Input closed; session saved and can be resumed with --resume" << std::endl;
        }

        printSummary(tuning);
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Tuning session failed: ") + e.what());
        return 1;
    }
}
