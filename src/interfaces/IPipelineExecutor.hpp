#pragma once

#include "pipeline_tuner/types.hpp"
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace pipeline_tuner {

    /**
     * @brief Everything the host pipeline produced for one configuration
     */
    struct PipelineOutput {
        std::vector<cv::Mat> images;                                ///< Processed image(s) shown to evaluators
        std::map<std::string, std::vector<double>> measurements;    ///< Per-object measurements by name
        std::map<std::string, double> metrics;                      ///< Collaborator-produced scalar metrics
    };

    /**
     * @brief Interface to the host application that runs the image pipeline
     *
     * The tuner never retries a failed run by itself; failures are reported back
     * to the session controller as a failed evaluation round.
     */
    class IPipelineExecutor {
    public:
        virtual ~IPipelineExecutor() = default;

        /**
         * @brief Run the pipeline with the given parameter values
         * @param configuration Flat mapping of parameter name -> value
         * @return Processed images and measurements
         * @throws PipelineExecutionError if the pipeline crashed or rejected the configuration
         */
        virtual PipelineOutput execute(const Configuration& configuration) = 0;

        /**
         * @brief Human-readable collaborator name for logging
         */
        virtual std::string name() const = 0;
    };

} // namespace pipeline_tuner
