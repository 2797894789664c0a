#include "operator_input.hpp"
#include "src/core/evaluation/ManualRating.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>

namespace pipeline_tuner::cli::tuning_session_cli {

namespace {

OperatorInput invalid(const std::string& message) {
    OperatorInput input;
    input.command = OperatorCommand::INVALID;
    input.message = message;
    return input;
}

bool parseNumber(const std::string& token, double& value) {
    char* end = nullptr;
    value = std::strtod(token.c_str(), &end);
    return end == token.c_str() + token.size() && std::isfinite(value);
}

}

OperatorInput parseOperatorInput(const std::string& line, const EvaluationParams& params) {
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    OperatorInput input;
    input.command = OperatorCommand::SUBMIT;

    if (tokens.empty() || tokens[0] == "s") {
        if (tokens.size() > 1) {
            return invalid("'s' takes no arguments");
        }
        return input;   // both signals absent
    }

    if (tokens[0] == "q") {
        input.command = OperatorCommand::CANCEL;
        return input;
    }

    if (tokens[0] == "f") {
        input.command = OperatorCommand::PIPELINE_FAILURE;
        const auto pos = line.find('f');
        input.message = line.substr(pos + 1);
        const auto first = input.message.find_first_not_of(" \t");
        input.message = first == std::string::npos ? "reported by operator" : input.message.substr(first);
        return input;
    }

    if (tokens[0] == "r") {
        if (tokens.size() > 1) {
            return invalid("'r' takes no arguments");
        }
        input.manual = evaluation::EvaluationSignal::rejected();
        return input;
    }

    if (tokens.size() > 2) {
        return invalid("expected '<score> [rating]'");
    }

    if (tokens[0] != "-") {
        double score = 0.0;
        if (!parseNumber(tokens[0], score) || score < 0.0 || score > 1.0) {
            return invalid("automated score must be a number in [0, 1] or '-'");
        }
        input.automated = evaluation::EvaluationSignal::automated(score);
    }

    if (tokens.size() == 2) {
        if (tokens[1] == "r") {
            input.manual = evaluation::EvaluationSignal::rejected();
        } else {
            double rating = 0.0;
            if (!parseNumber(tokens[1], rating) || std::floor(rating) != rating ||
                rating < 0.0 || rating > params.manual_max_rating) {
                return invalid("rating must be an integer in [0, " +
                               std::to_string(params.manual_max_rating) + "] or 'r'");
            }
            input.manual = evaluation::ratingToSignal(static_cast<int>(rating), params);
        }
    }

    return input;
}

void printInputHelp(const EvaluationParams& params) {
    std::cout << "Enter: <score 0..1 | -> [rating 1.." << params.manual_max_rating
              << " | 0 | r]   (r = reject, s = skip, f [reason] = pipeline failed, q = cancel)" << std::endl;
}

} // namespace pipeline_tuner::cli::tuning_session_cli
