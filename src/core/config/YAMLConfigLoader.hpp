#pragma once

#include "TunerConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace pipeline_tuner::config {

    /**
     * @brief Loads and validates tuning session configurations from YAML
     *
     * Top-level sections: session, parameters, evaluation, surrogate,
     * acquisition, termination, database, logging. Every section except
     * parameters is optional.
     */
    class YAMLConfigLoader {
    public:
        /**
         * @throws std::runtime_error on parse or validation errors
         */
        static TunerConfig loadFromFile(const std::string& yaml_path);

        static TunerConfig loadFromString(const std::string& yaml_content);

        /**
         * @brief Write a configuration back out (loadable by loadFromFile)
         * @throws std::runtime_error if the file cannot be written
         */
        static void saveToFile(const TunerConfig& config, const std::string& yaml_path);

        /**
         * @brief Check cross-field constraints
         * @throws std::runtime_error prefixed with "YAML validation error: "
         */
        static void validate(const TunerConfig& config);

        static ParameterKind stringToParameterKind(const std::string& str);
        static AcquisitionKind stringToAcquisitionKind(const std::string& str);

    private:
        static TunerConfig loadFromYAML(const YAML::Node& root);

        static void parseSession(const YAML::Node& node, SessionParams& session,
                                 const std::vector<ParameterSpec>& parameters);
        static void parseParameters(const YAML::Node& node, std::vector<ParameterSpec>& parameters);
        static void parseEvaluation(const YAML::Node& node, EvaluationParams& evaluation);
        static void parseSurrogate(const YAML::Node& node, SurrogateParams& surrogate);
        static void parseAcquisition(const YAML::Node& node, AcquisitionParams& acquisition);
        static void parseTermination(const YAML::Node& node, TerminationParams& termination);
        static void parseDatabase(const YAML::Node& node, DatabaseParams& database);
        static void parseLogging(const YAML::Node& node, TunerConfig::Logging& logging);
    };

} // namespace pipeline_tuner::config
