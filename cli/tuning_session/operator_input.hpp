#pragma once

#include "pipeline_tuner/types.hpp"
#include "src/core/evaluation/EvaluationSignal.hpp"
#include <string>

namespace pipeline_tuner::cli::tuning_session_cli {

enum class OperatorCommand {
    SUBMIT,             ///< Submit the parsed signals
    PIPELINE_FAILURE,   ///< The pipeline could not run the configuration
    CANCEL,             ///< Stop the session
    INVALID             ///< Unparseable line, ask again
};

struct OperatorInput {
    OperatorCommand command = OperatorCommand::INVALID;
    evaluation::EvaluationSignal automated;
    evaluation::EvaluationSignal manual;
    std::string message;    ///< Failure reason or parse error
};

/**
 * @brief Parse one console line typed by the operator
 *
 * Accepted forms:
 *   <score> [<rating> | r]   automated score in [0,1] ("-" for none), optional rating
 *   r                        reject the configuration
 *   s | <empty>              skip (no usable score this round)
 *   f [reason]               pipeline failed on this configuration
 *   q                        cancel the session
 *
 * Ratings follow the manual scale in params (0 = not rated).
 */
OperatorInput parseOperatorInput(const std::string& line, const EvaluationParams& params);

void printInputHelp(const EvaluationParams& params);

} // namespace pipeline_tuner::cli::tuning_session_cli
