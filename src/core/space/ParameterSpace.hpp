#pragma once

#include "pipeline_tuner/types.hpp"
#include <random>
#include <string>
#include <vector>

namespace pipeline_tuner::space {

/**
 * @brief Ordered, fixed-dimension domain of the tunable pipeline parameters
 *
 * Every parameter occupies exactly one coordinate of the normalised vector,
 * in declaration order:
 * - CONTINUOUS / INTEGER: (value - low) / (high - low)
 * - CATEGORICAL: choice_index / (choices - 1) (fixed ordinal mapping)
 *
 * The mapping is fixed at construction, so vectors encoded early in a session
 * still decode to the same configurations later on.
 */
class ParameterSpace {
public:
    /**
     * @brief Build a space from parameter specs
     * @throws std::runtime_error if a spec is malformed (empty, duplicate or unserializable name,
     *         low >= high, non-integral integer bounds, fewer than 2 choices)
     */
    explicit ParameterSpace(std::vector<ParameterSpec> specs);

    size_t dimension() const { return specs_.size(); }
    const std::vector<ParameterSpec>& specs() const { return specs_; }

    /**
     * @brief Look up a parameter by name
     * @throws OutOfDomainError for unknown names
     */
    const ParameterSpec& spec(const std::string& name) const;

    /**
     * @brief Map a configuration to its normalised vector
     * @throws OutOfDomainError if a parameter is missing, unknown or out of bounds
     */
    std::vector<double> encode(const Configuration& configuration) const;

    /**
     * @brief Map a normalised vector back to a configuration
     *
     * Integer and categorical coordinates are rounded to the nearest admissible value.
     * @throws OutOfDomainError if the dimension is wrong or a coordinate lies outside [0,1]
     */
    Configuration decode(const std::vector<double>& vector) const;

    /// Throws OutOfDomainError describing the first violation, if any.
    void validate(const Configuration& configuration) const;
    bool contains(const Configuration& configuration) const;

    /// Snap continuous values with a step onto their grid and clamp into bounds.
    Configuration quantize(const Configuration& configuration) const;

    /// Clamp into [0,1], decode, quantize and re-encode. Used on raw optimizer output.
    std::vector<double> snap(const std::vector<double>& vector) const;

    Configuration defaults() const;

    Configuration sampleUniform(std::mt19937& rng) const;

    /**
     * @brief Latin hypercube design of n configurations
     *
     * Each coordinate is split into n equal strata; every stratum is used exactly once
     * per coordinate, with a random position inside the stratum.
     */
    std::vector<Configuration> sampleLatinHypercube(int n, std::mt19937& rng) const;

    /// Stable text fingerprint of the space, used to refuse resuming into a different space.
    std::string signature() const;

    /// Human-readable value (choice label for categorical parameters).
    std::string formatValue(const std::string& name, double value) const;
    std::string describe(const Configuration& configuration) const;

private:
    std::vector<ParameterSpec> specs_;

    double encodeValue(const ParameterSpec& spec, double value) const;
    double decodeValue(const ParameterSpec& spec, double unit) const;
    void validateValue(const ParameterSpec& spec, double value) const;
    double quantizeValue(const ParameterSpec& spec, double value) const;
};

} // namespace pipeline_tuner::space
