#include "cli_args.hpp"
#include <iostream>

namespace pipeline_tuner::cli::tuning_session_cli {

void printUsage(const std::string& binaryName) {
    std::cout << "Usage: " << binaryName << " <config.yaml> [--resume | --list | --delete]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --resume          Continue the stored session named in the config" << std::endl;
    std::cout << "  --list            List stored sessions and exit" << std::endl;
    std::cout << "  --delete          Delete the stored session named in the config and exit" << std::endl;
    std::cout << "  -h, --help        Show this help message and exit" << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << binaryName << " ../config/tuning/segmentation_example.yaml --resume" << std::endl;
}

bool parseArgs(int argc, char** argv, CliOptions& options) {
    const std::string binary = argc > 0 ? argv[0] : "tuning_session";
    if (argc < 2) {
        printUsage(binary);
        return false;
    }

    options = CliOptions{};
    bool mode_seen = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(binary);
            return false;
        }

        CliMode mode = CliMode::RUN;
        if (arg == "--resume") {
            mode = CliMode::RESUME;
        } else if (arg == "--list") {
            mode = CliMode::LIST;
        } else if (arg == "--delete") {
            mode = CliMode::DELETE;
        } else if (arg.rfind("-", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(binary);
            return false;
        } else {
            if (!options.config_path.empty()) {
                printUsage(binary);
                return false;
            }
            options.config_path = arg;
            continue;
        }

        if (mode_seen) {
            std::cerr << "Only one of --resume, --list, --delete may be given" << std::endl;
            printUsage(binary);
            return false;
        }
        mode_seen = true;
        options.mode = mode;
    }

    if (options.config_path.empty()) {
        printUsage(binary);
        return false;
    }
    return true;
}

} // namespace pipeline_tuner::cli::tuning_session_cli
