#pragma once

#include "AcquisitionFunction.hpp"
#include "src/core/space/ParameterSpace.hpp"
#include "src/core/surrogate/GaussianProcess.hpp"
#include "pipeline_tuner/types.hpp"
#include <random>
#include <vector>

namespace pipeline_tuner::acquisition {

/**
 * @brief One scored candidate in normalised coordinates
 */
struct ScoredCandidate {
    std::vector<double> encoded;
    double acquisition = 0.0;
    double variance = 0.0;
};

/**
 * @brief Chooses the next configuration by maximising an acquisition function
 *
 * Search: random candidates scored in one batch, the best few refined with a
 * Nelder-Mead simplex (cv::DownhillSolver), every candidate snapped onto the
 * parameter grid, then ranked by acquisition value with ties going to the higher
 * posterior variance. The first candidate that is not within duplicate_tolerance
 * (max-norm) of an observed or excluded vector is returned; if all collide, the
 * neighbourhood of the best one is resampled with a growing radius.
 *
 * With no observations at all the model is bypassed and the first point of a
 * latin hypercube design is returned.
 */
class AcquisitionOptimizer {
public:
    /**
     * @param params Search settings
     * @param initial_design_size Size of the space-filling design used when the log is empty
     */
    explicit AcquisitionOptimizer(AcquisitionParams params, int initial_design_size = 1);

    /**
     * @brief Propose the next configuration
     * @param model Posterior fitted to the observations
     * @param space Parameter space the observations were encoded in
     * @param observations Read-only view of the observation log
     * @param rng Session random source
     * @param excluded Encoded vectors that must not be proposed again (configurations
     *        abandoned after repeated failed rounds), checked with the same tolerance
     * @throws SpaceExhaustedError if no unobserved admissible configuration was found
     */
    Configuration propose(const surrogate::FittedModel& model,
                          const space::ParameterSpace& space,
                          const std::vector<Observation>& observations,
                          std::mt19937& rng,
                          const std::vector<std::vector<double>>& excluded = {}) const;

    /**
     * @brief Same as propose(), returning the snapped normalised vector
     */
    std::vector<double> proposeEncoded(const surrogate::FittedModel& model,
                                       const space::ParameterSpace& space,
                                       const std::vector<Observation>& observations,
                                       std::mt19937& rng,
                                       const std::vector<std::vector<double>>& excluded = {}) const;

    /**
     * @brief True if vector lies within tolerance (max-norm) of any observed vector
     */
    static bool isDuplicate(const std::vector<double>& vector,
                            const std::vector<Observation>& observations,
                            double tolerance);

    /**
     * @brief True if vector lies within tolerance (max-norm) of any of the given vectors
     */
    static bool isDuplicate(const std::vector<double>& vector,
                            const std::vector<std::vector<double>>& vectors,
                            double tolerance);

    const AcquisitionFunction& function() const { return *function_; }
    const AcquisitionParams& params() const { return params_; }

private:
    AcquisitionParams params_;
    int initial_design_size_;
    std::shared_ptr<const AcquisitionFunction> function_;

    std::vector<ScoredCandidate> scoreCandidates(const surrogate::FittedModel& model,
                                                 const std::vector<std::vector<double>>& points,
                                                 double incumbent) const;

    std::vector<double> refine(const surrogate::FittedModel& model,
                               const std::vector<double>& start,
                               double incumbent) const;

    std::vector<double> resampleNeighbourhood(const surrogate::FittedModel& model,
                                              const space::ParameterSpace& space,
                                              const std::vector<double>& centre,
                                              const std::vector<Observation>& observations,
                                              const std::vector<std::vector<double>>& excluded,
                                              double incumbent,
                                              std::mt19937& rng) const;

    bool isTaken(const std::vector<double>& vector,
                 const std::vector<Observation>& observations,
                 const std::vector<std::vector<double>>& excluded) const;
};

} // namespace pipeline_tuner::acquisition
