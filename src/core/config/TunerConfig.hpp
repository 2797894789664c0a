#pragma once

#include "pipeline_tuner/types.hpp"
#include <string>
#include <vector>

namespace pipeline_tuner::config {

    /**
     * @brief Complete configuration of one tuning session
     *
     * Loaded from YAML by YAMLConfigLoader; every block falls back to the
     * defaults of its parameter struct when omitted.
     */
    struct TunerConfig {
        // Session metadata and initial design
        SessionParams session;

        // Tunable pipeline parameters, in encoding order
        std::vector<ParameterSpec> parameters;

        EvaluationParams evaluation;

        SurrogateParams surrogate;

        AcquisitionParams acquisition;

        TerminationParams termination;

        DatabaseParams database;

        // Logging configuration
        struct Logging {
            std::string level = "info";
        } logging;
    };

}
