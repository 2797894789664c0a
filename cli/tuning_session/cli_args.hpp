#pragma once

#include <string>

namespace pipeline_tuner::cli::tuning_session_cli {

enum class CliMode {
    RUN,        ///< Start (or restart) the session named in the config
    RESUME,     ///< Continue the stored session of the same name
    LIST,       ///< Print stored sessions and exit
    DELETE      ///< Remove the stored session of the same name and exit
};

struct CliOptions {
    std::string config_path;
    CliMode mode = CliMode::RUN;
};

void printUsage(const std::string& binaryName);

// Parse argv for config path and mode flag, handling --help/-h and argument count validation.
// Returns false on help or validation failure (after printing usage).
bool parseArgs(int argc, char** argv, CliOptions& options);

} // namespace pipeline_tuner::cli::tuning_session_cli
