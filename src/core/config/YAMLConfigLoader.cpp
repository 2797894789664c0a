#include "YAMLConfigLoader.hpp"
#include "pipeline_tuner/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <unordered_set>

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const pipeline_tuner::ParameterSpec* findSpec(const std::vector<pipeline_tuner::ParameterSpec>& specs,
                                              const std::string& name) {
    for (const auto& spec : specs) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

// Categorical values may be written as a choice label or as the choice index.
double parseParameterValue(const YAML::Node& node, const pipeline_tuner::ParameterSpec* spec) {
    if (spec && spec->kind == pipeline_tuner::ParameterKind::CATEGORICAL) {
        const auto label = node.as<std::string>();
        const auto it = std::find(spec->choices.begin(), spec->choices.end(), label);
        if (it != spec->choices.end()) {
            return static_cast<double>(it - spec->choices.begin());
        }
    }
    return node.as<double>();
}

void emitParameterValue(YAML::Emitter& out, const pipeline_tuner::ParameterSpec& spec, double value) {
    if (spec.kind == pipeline_tuner::ParameterKind::CATEGORICAL) {
        const auto index = static_cast<long>(std::lround(value));
        if (index >= 0 && index < static_cast<long>(spec.choices.size())) {
            out << spec.choices[static_cast<size_t>(index)];
            return;
        }
    }
    if (spec.kind == pipeline_tuner::ParameterKind::INTEGER) {
        out << static_cast<long>(std::lround(value));
        return;
    }
    out << value;
}

bool isIntegral(double value) {
    return std::isfinite(value) && std::floor(value) == value;
}

}


namespace pipeline_tuner::config {

    TunerConfig YAMLConfigLoader::loadFromFile(const std::string& yaml_path) {
        try {
            YAML::Node root = YAML::LoadFile(yaml_path);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("YAML parsing error in " + yaml_path + ": " + e.what());
        } catch (const std::exception& e) {
            throw std::runtime_error("Error loading " + yaml_path + ": " + e.what());
        }
    }

    TunerConfig YAMLConfigLoader::loadFromString(const std::string& yaml_content) {
        try {
            YAML::Node root = YAML::Load(yaml_content);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
        }
    }

    TunerConfig YAMLConfigLoader::loadFromYAML(const YAML::Node& root) {
        TunerConfig config;

        if (!root.IsMap()) {
            throw std::runtime_error("YAML validation error: document must be a mapping");
        }

        // Parameters first: warm-start entries may refer to categorical labels
        if (root["parameters"]) {
            parseParameters(root["parameters"], config.parameters);
        }

        if (root["session"]) {
            parseSession(root["session"], config.session, config.parameters);
        }

        if (root["evaluation"]) {
            parseEvaluation(root["evaluation"], config.evaluation);
        }

        if (root["surrogate"]) {
            parseSurrogate(root["surrogate"], config.surrogate);
        }

        if (root["acquisition"]) {
            parseAcquisition(root["acquisition"], config.acquisition);
        }

        if (root["termination"]) {
            parseTermination(root["termination"], config.termination);
        }

        if (root["database"]) {
            parseDatabase(root["database"], config.database);
        }

        if (root["logging"]) {
            parseLogging(root["logging"], config.logging);
        }

        validate(config);

        return config;
    }

    void YAMLConfigLoader::parseParameters(const YAML::Node& node, std::vector<ParameterSpec>& parameters) {
        if (!node.IsSequence()) {
            throw std::runtime_error("YAML validation error: parameters must be a sequence");
        }

        parameters.clear();
        for (const auto& param_node : node) {
            ParameterSpec spec;

            if (!param_node["name"]) {
                throw std::runtime_error("YAML validation error: parameter.name is required");
            }
            spec.name = param_node["name"].as<std::string>();

            if (param_node["type"]) {
                spec.kind = stringToParameterKind(param_node["type"].as<std::string>());
            }

            if (spec.kind == ParameterKind::CATEGORICAL) {
                if (param_node["choices"] && param_node["choices"].IsSequence()) {
                    for (const auto& choice : param_node["choices"]) {
                        spec.choices.push_back(choice.as<std::string>());
                    }
                }
                spec.low = 0.0;
                spec.high = spec.choices.empty() ? 0.0 : static_cast<double>(spec.choices.size() - 1);
            } else {
                if (param_node["low"]) spec.low = param_node["low"].as<double>();
                if (param_node["high"]) spec.high = param_node["high"].as<double>();
                if (param_node["step"]) spec.step = param_node["step"].as<double>();
            }

            // Without an explicit default the lower bound (or first choice) is used
            spec.default_value = spec.low;
            if (param_node["default"]) {
                spec.default_value = parseParameterValue(param_node["default"], &spec);
            }

            parameters.push_back(std::move(spec));
        }
    }

    void YAMLConfigLoader::parseSession(const YAML::Node& node, SessionParams& session,
                                        const std::vector<ParameterSpec>& parameters) {
        if (node["name"]) session.name = node["name"].as<std::string>();
        if (node["seed"]) session.seed = node["seed"].as<unsigned int>();
        if (node["initial_design_size"]) session.initial_design_size = node["initial_design_size"].as<int>();

        if (node["warm_start"]) {
            if (!node["warm_start"].IsSequence()) {
                throw std::runtime_error("YAML validation error: session.warm_start must be a sequence");
            }
            session.warm_start.clear();
            for (const auto& entry : node["warm_start"]) {
                if (!entry.IsMap()) {
                    throw std::runtime_error("YAML validation error: warm_start entries must be mappings");
                }
                Configuration configuration;
                for (const auto& kv : entry) {
                    const auto name = kv.first.as<std::string>();
                    configuration[name] = parseParameterValue(kv.second, findSpec(parameters, name));
                }
                session.warm_start.push_back(std::move(configuration));
            }
        }
    }

    void YAMLConfigLoader::parseEvaluation(const YAML::Node& node, EvaluationParams& evaluation) {
        if (node["automated_weight"]) evaluation.automated_weight = node["automated_weight"].as<double>();
        if (node["manual_weight"]) evaluation.manual_weight = node["manual_weight"].as<double>();
        if (node["automated_noise"]) evaluation.automated_noise = node["automated_noise"].as<double>();
        if (node["manual_noise"]) evaluation.manual_noise = node["manual_noise"].as<double>();
        if (node["rejection_objective"]) evaluation.rejection_objective = node["rejection_objective"].as<double>();

        if (node["manual_rating"]) {
            const auto& rating = node["manual_rating"];
            if (rating["threshold"]) evaluation.manual_quality_threshold = rating["threshold"].as<int>();
            if (rating["max"]) evaluation.manual_max_rating = rating["max"].as<int>();
        }

        if (node["tolerance_ranges"]) {
            if (!node["tolerance_ranges"].IsSequence()) {
                throw std::runtime_error("YAML validation error: evaluation.tolerance_ranges must be a sequence");
            }
            evaluation.tolerance_ranges.clear();
            for (const auto& range_node : node["tolerance_ranges"]) {
                ToleranceRange range;
                if (!range_node["measurement"]) {
                    throw std::runtime_error("YAML validation error: tolerance range must have 'measurement' field");
                }
                range.measurement = range_node["measurement"].as<std::string>();
                if (range_node["min"]) range.min = range_node["min"].as<double>();
                if (range_node["max"]) range.max = range_node["max"].as<double>();
                evaluation.tolerance_ranges.push_back(std::move(range));
            }
        }
    }

    void YAMLConfigLoader::parseSurrogate(const YAML::Node& node, SurrogateParams& surrogate) {
        if (node["length_scale"]) surrogate.length_scale = node["length_scale"].as<double>();
        if (node["signal_variance"]) surrogate.signal_variance = node["signal_variance"].as<double>();
        if (node["noise_floor"]) surrogate.noise_floor = node["noise_floor"].as<double>();
        if (node["jitter"]) surrogate.jitter = node["jitter"].as<double>();
        if (node["max_jitter"]) surrogate.max_jitter = node["max_jitter"].as<double>();
        if (node["optimize_hyperparameters"]) {
            surrogate.optimize_hyperparameters = node["optimize_hyperparameters"].as<bool>();
        }
        if (node["min_observations_for_optimization"]) {
            surrogate.min_observations_for_optimization = node["min_observations_for_optimization"].as<int>();
        }
        if (node["optimizer_restarts"]) surrogate.optimizer_restarts = node["optimizer_restarts"].as<int>();
        if (node["optimizer_max_iterations"]) {
            surrogate.optimizer_max_iterations = node["optimizer_max_iterations"].as<int>();
        }
    }

    void YAMLConfigLoader::parseAcquisition(const YAML::Node& node, AcquisitionParams& acquisition) {
        if (node["function"]) {
            acquisition.kind = stringToAcquisitionKind(node["function"].as<std::string>());
        }
        if (node["xi"]) acquisition.xi = node["xi"].as<double>();
        if (node["kappa"]) acquisition.kappa = node["kappa"].as<double>();
        if (node["random_candidates"]) acquisition.random_candidates = node["random_candidates"].as<int>();
        if (node["refine_starts"]) acquisition.refine_starts = node["refine_starts"].as<int>();
        if (node["refine_iterations"]) acquisition.refine_iterations = node["refine_iterations"].as<int>();
        if (node["duplicate_tolerance"]) acquisition.duplicate_tolerance = node["duplicate_tolerance"].as<double>();
        if (node["max_resample_attempts"]) {
            acquisition.max_resample_attempts = node["max_resample_attempts"].as<int>();
        }
    }

    void YAMLConfigLoader::parseTermination(const YAML::Node& node, TerminationParams& termination) {
        if (node["max_iterations"]) termination.max_iterations = node["max_iterations"].as<int>();
        if (node["improvement_threshold"]) {
            termination.improvement_threshold = node["improvement_threshold"].as<double>();
        }
        if (node["patience"]) termination.patience = node["patience"].as<int>();
        if (node["target_objective"] && !node["target_objective"].IsNull()) {
            termination.target_objective = node["target_objective"].as<double>();
        }
        if (node["max_retries_per_configuration"]) {
            termination.max_retries_per_configuration = node["max_retries_per_configuration"].as<int>();
        }
    }

    void YAMLConfigLoader::parseDatabase(const YAML::Node& node, DatabaseParams& database) {
        if (node["connection"]) database.connection_string = node["connection"].as<std::string>();
        if (node["enabled"]) database.enabled = node["enabled"].as<bool>();
    }

    void YAMLConfigLoader::parseLogging(const YAML::Node& node, TunerConfig::Logging& logging) {
        if (node["level"]) logging.level = toLowerCopy(node["level"].as<std::string>());
    }

    void YAMLConfigLoader::validate(const TunerConfig& config) {
        // Parameters
        if (config.parameters.empty()) {
            throw std::runtime_error("YAML validation error: parameters list must not be empty");
        }
        std::unordered_set<std::string> names;
        for (const auto& p : config.parameters) {
            if (p.name.empty()) {
                throw std::runtime_error("YAML validation error: parameter.name is required");
            }
            if (!names.insert(p.name).second) {
                throw std::runtime_error("YAML validation error: parameter.name must be unique: " + p.name);
            }

            if (p.kind == ParameterKind::CATEGORICAL) {
                const std::set<std::string> unique_choices(p.choices.begin(), p.choices.end());
                if (p.choices.size() < 2 || unique_choices.size() != p.choices.size()) {
                    throw std::runtime_error(
                        "YAML validation error: categorical parameter needs at least 2 unique choices: " + p.name);
                }
                if (!isIntegral(p.default_value) || p.default_value < 0 ||
                    p.default_value >= static_cast<double>(p.choices.size())) {
                    throw std::runtime_error("YAML validation error: default is not one of the choices for " + p.name);
                }
                continue;
            }

            if (!std::isfinite(p.low) || !std::isfinite(p.high) || !(p.low < p.high)) {
                throw std::runtime_error("YAML validation error: low must be < high for " + p.name);
            }
            if (p.kind == ParameterKind::INTEGER && (!isIntegral(p.low) || !isIntegral(p.high))) {
                throw std::runtime_error("YAML validation error: integer bounds must be integral for " + p.name);
            }
            if (p.step < 0.0) {
                throw std::runtime_error("YAML validation error: step must be >= 0 for " + p.name);
            }
            if (!(p.default_value >= p.low && p.default_value <= p.high)) {
                throw std::runtime_error("YAML validation error: default must lie in [low, high] for " + p.name);
            }
            if (p.kind == ParameterKind::INTEGER && !isIntegral(p.default_value)) {
                throw std::runtime_error("YAML validation error: default must be integral for " + p.name);
            }
        }

        // Session
        if (config.session.initial_design_size < 1) {
            throw std::runtime_error("YAML validation error: session.initial_design_size must be >= 1");
        }

        // Evaluation
        const auto& ev = config.evaluation;
        if (ev.automated_weight < 0.0 || ev.manual_weight < 0.0) {
            throw std::runtime_error("YAML validation error: evaluation weights must be >= 0");
        }
        if (ev.automated_weight + ev.manual_weight <= 0.0) {
            throw std::runtime_error("YAML validation error: evaluation weights must not both be zero");
        }
        if (ev.automated_noise < 0.0 || ev.manual_noise < 0.0) {
            throw std::runtime_error("YAML validation error: evaluation noise must be >= 0");
        }
        if (ev.manual_max_rating < 1) {
            throw std::runtime_error("YAML validation error: evaluation.manual_rating.max must be >= 1");
        }
        if (ev.manual_quality_threshold < 1 || ev.manual_quality_threshold > ev.manual_max_rating) {
            throw std::runtime_error(
                "YAML validation error: evaluation.manual_rating.threshold must be in [1, max]");
        }
        for (const auto& range : ev.tolerance_ranges) {
            if (range.measurement.empty()) {
                throw std::runtime_error("YAML validation error: tolerance range measurement is required");
            }
            if (range.min > range.max) {
                throw std::runtime_error(
                    "YAML validation error: tolerance range min must be <= max for " + range.measurement);
            }
        }

        // Surrogate
        const auto& sg = config.surrogate;
        if (!(sg.length_scale > 0.0)) {
            throw std::runtime_error("YAML validation error: surrogate.length_scale must be > 0");
        }
        if (!(sg.signal_variance > 0.0)) {
            throw std::runtime_error("YAML validation error: surrogate.signal_variance must be > 0");
        }
        if (sg.noise_floor < 0.0 || sg.jitter < 0.0 || sg.max_jitter < sg.jitter) {
            throw std::runtime_error(
                "YAML validation error: surrogate noise_floor and jitter must be >= 0 with max_jitter >= jitter");
        }
        if (sg.optimizer_restarts < 0 || sg.optimizer_max_iterations < 1) {
            throw std::runtime_error("YAML validation error: surrogate optimizer settings out of range");
        }

        // Acquisition
        const auto& aq = config.acquisition;
        if (aq.xi < 0.0 || aq.kappa < 0.0) {
            throw std::runtime_error("YAML validation error: acquisition xi and kappa must be >= 0");
        }
        if (aq.random_candidates < 1 || aq.refine_starts < 0 || aq.refine_iterations < 1) {
            throw std::runtime_error("YAML validation error: acquisition candidate counts out of range");
        }
        if (!(aq.duplicate_tolerance > 0.0) || aq.max_resample_attempts < 1) {
            throw std::runtime_error(
                "YAML validation error: acquisition.duplicate_tolerance must be > 0 and max_resample_attempts >= 1");
        }

        // Termination
        const auto& tm = config.termination;
        if (tm.patience < 1) {
            throw std::runtime_error("YAML validation error: termination.patience must be >= 1");
        }
        if (tm.max_iterations < config.session.initial_design_size) {
            throw std::runtime_error(
                "YAML validation error: termination.max_iterations must be >= session.initial_design_size");
        }
        if (tm.max_retries_per_configuration < 1) {
            throw std::runtime_error("YAML validation error: termination.max_retries_per_configuration must be >= 1");
        }
        if (tm.improvement_threshold < 0.0) {
            throw std::runtime_error("YAML validation error: termination.improvement_threshold must be >= 0");
        }

        // Logging
        const auto& level = config.logging.level;
        if (level != "debug" && level != "info" && level != "warning" && level != "warn" && level != "error") {
            throw std::runtime_error("YAML validation error: logging.level must be debug, info, warning or error");
        }
    }

    ParameterKind YAMLConfigLoader::stringToParameterKind(const std::string& str) {
        const auto lower = toLowerCopy(str);
        if (lower == "continuous" || lower == "float" || lower == "real") return ParameterKind::CONTINUOUS;
        if (lower == "integer" || lower == "int") return ParameterKind::INTEGER;
        if (lower == "categorical" || lower == "choice") return ParameterKind::CATEGORICAL;
        throw std::runtime_error("Unknown parameter type: " + str);
    }

    AcquisitionKind YAMLConfigLoader::stringToAcquisitionKind(const std::string& str) {
        const auto lower = toLowerCopy(str);
        if (lower == "expected_improvement" || lower == "ei") return AcquisitionKind::EXPECTED_IMPROVEMENT;
        if (lower == "upper_confidence_bound" || lower == "ucb") return AcquisitionKind::UPPER_CONFIDENCE_BOUND;
        if (lower == "probability_of_improvement" || lower == "pi") return AcquisitionKind::PROBABILITY_OF_IMPROVEMENT;
        throw std::runtime_error("Unknown acquisition function: " + str);
    }

    void YAMLConfigLoader::saveToFile(const TunerConfig& config, const std::string& yaml_path) {
        YAML::Emitter out;

        out << YAML::BeginMap;

        // Session section
        out << YAML::Key << "session";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << config.session.name;
        out << YAML::Key << "seed" << YAML::Value << config.session.seed;
        out << YAML::Key << "initial_design_size" << YAML::Value << config.session.initial_design_size;
        if (!config.session.warm_start.empty()) {
            out << YAML::Key << "warm_start" << YAML::Value << YAML::BeginSeq;
            for (const auto& configuration : config.session.warm_start) {
                out << YAML::BeginMap;
                for (const auto& [name, value] : configuration) {
                    out << YAML::Key << name << YAML::Value;
                    const auto* spec = findSpec(config.parameters, name);
                    if (spec) {
                        emitParameterValue(out, *spec, value);
                    } else {
                        out << value;
                    }
                }
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;

        // Parameters section
        out << YAML::Key << "parameters";
        out << YAML::Value << YAML::BeginSeq;
        for (const auto& p : config.parameters) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << p.name;
            out << YAML::Key << "type" << YAML::Value << toString(p.kind);
            if (p.kind == ParameterKind::CATEGORICAL) {
                out << YAML::Key << "choices" << YAML::Value << p.choices;
            } else {
                out << YAML::Key << "low" << YAML::Value << p.low;
                out << YAML::Key << "high" << YAML::Value << p.high;
                if (p.step > 0.0) {
                    out << YAML::Key << "step" << YAML::Value << p.step;
                }
            }
            out << YAML::Key << "default" << YAML::Value;
            emitParameterValue(out, p, p.default_value);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        // Evaluation section
        const auto& ev = config.evaluation;
        out << YAML::Key << "evaluation";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "automated_weight" << YAML::Value << ev.automated_weight;
        out << YAML::Key << "manual_weight" << YAML::Value << ev.manual_weight;
        out << YAML::Key << "automated_noise" << YAML::Value << ev.automated_noise;
        out << YAML::Key << "manual_noise" << YAML::Value << ev.manual_noise;
        out << YAML::Key << "rejection_objective" << YAML::Value << ev.rejection_objective;
        out << YAML::Key << "manual_rating" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "threshold" << YAML::Value << ev.manual_quality_threshold;
        out << YAML::Key << "max" << YAML::Value << ev.manual_max_rating;
        out << YAML::EndMap;
        if (!ev.tolerance_ranges.empty()) {
            out << YAML::Key << "tolerance_ranges" << YAML::Value << YAML::BeginSeq;
            for (const auto& range : ev.tolerance_ranges) {
                out << YAML::BeginMap;
                out << YAML::Key << "measurement" << YAML::Value << range.measurement;
                out << YAML::Key << "min" << YAML::Value << range.min;
                out << YAML::Key << "max" << YAML::Value << range.max;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;

        // Surrogate section
        const auto& sg = config.surrogate;
        out << YAML::Key << "surrogate";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "length_scale" << YAML::Value << sg.length_scale;
        out << YAML::Key << "signal_variance" << YAML::Value << sg.signal_variance;
        out << YAML::Key << "noise_floor" << YAML::Value << sg.noise_floor;
        out << YAML::Key << "jitter" << YAML::Value << sg.jitter;
        out << YAML::Key << "max_jitter" << YAML::Value << sg.max_jitter;
        out << YAML::Key << "optimize_hyperparameters" << YAML::Value << sg.optimize_hyperparameters;
        out << YAML::Key << "min_observations_for_optimization" << YAML::Value << sg.min_observations_for_optimization;
        out << YAML::Key << "optimizer_restarts" << YAML::Value << sg.optimizer_restarts;
        out << YAML::Key << "optimizer_max_iterations" << YAML::Value << sg.optimizer_max_iterations;
        out << YAML::EndMap;

        // Acquisition section
        const auto& aq = config.acquisition;
        out << YAML::Key << "acquisition";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "function" << YAML::Value << toString(aq.kind);
        out << YAML::Key << "xi" << YAML::Value << aq.xi;
        out << YAML::Key << "kappa" << YAML::Value << aq.kappa;
        out << YAML::Key << "random_candidates" << YAML::Value << aq.random_candidates;
        out << YAML::Key << "refine_starts" << YAML::Value << aq.refine_starts;
        out << YAML::Key << "refine_iterations" << YAML::Value << aq.refine_iterations;
        out << YAML::Key << "duplicate_tolerance" << YAML::Value << aq.duplicate_tolerance;
        out << YAML::Key << "max_resample_attempts" << YAML::Value << aq.max_resample_attempts;
        out << YAML::EndMap;

        // Termination section
        const auto& tm = config.termination;
        out << YAML::Key << "termination";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_iterations" << YAML::Value << tm.max_iterations;
        out << YAML::Key << "improvement_threshold" << YAML::Value << tm.improvement_threshold;
        out << YAML::Key << "patience" << YAML::Value << tm.patience;
        if (tm.target_objective) {
            out << YAML::Key << "target_objective" << YAML::Value << *tm.target_objective;
        }
        out << YAML::Key << "max_retries_per_configuration" << YAML::Value << tm.max_retries_per_configuration;
        out << YAML::EndMap;

        // Database section
        out << YAML::Key << "database";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "connection" << YAML::Value << config.database.connection_string;
        out << YAML::Key << "enabled" << YAML::Value << config.database.enabled;
        out << YAML::EndMap;

        // Logging section
        out << YAML::Key << "logging";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.logging.level;
        out << YAML::EndMap;

        out << YAML::EndMap;

        // Write to file
        std::ofstream file(yaml_path);
        if (!file) {
            throw std::runtime_error("Cannot write configuration to " + yaml_path);
        }
        file << out.c_str();
        LOG_DEBUG("Configuration written to " + yaml_path);
    }

} // namespace pipeline_tuner::config
