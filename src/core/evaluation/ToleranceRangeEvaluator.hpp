#pragma once

#include "interfaces/IEvaluator.hpp"
#include <vector>

namespace pipeline_tuner::evaluation {

/**
 * @brief Automated evaluator scoring per-object measurements against quality ranges
 *
 * For each configured range whose measurement is present in the pipeline output,
 * every object outside [min, max] contributes its percentage deviation from the
 * violated bound. Deviations are averaged over the objects of a measurement, then
 * over measurements, and the score is 1 - min(deviation, 100%) so that a fully
 * in-range result scores 1.0.
 */
class ToleranceRangeEvaluator : public IAutomatedEvaluator {
public:
    /**
     * @throws std::runtime_error if a range has an empty name or min > max
     */
    explicit ToleranceRangeEvaluator(std::vector<ToleranceRange> ranges);

    /// ABSENT when none of the configured measurements appear in the output.
    EvaluationSignal evaluate(const PipelineOutput& output) override;

    std::string name() const override { return "tolerance_range"; }

    /**
     * @brief Mean percentage deviation of the objects of one measurement (0 when empty)
     */
    static double meanDeviationPercent(const std::vector<double>& values, const ToleranceRange& range);

    const std::vector<ToleranceRange>& ranges() const { return ranges_; }

private:
    std::vector<ToleranceRange> ranges_;
};

} // namespace pipeline_tuner::evaluation
