#include "ToleranceRangeEvaluator.hpp"
#include "pipeline_tuner/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pipeline_tuner::evaluation {

namespace {

// Relative deviation needs a non-zero reference; a zero bound falls back to the range width.
double referenceScale(double bound, const ToleranceRange& range) {
    if (std::abs(bound) > 1e-12) {
        return std::abs(bound);
    }
    const double width = range.max - range.min;
    return width > 1e-12 ? width : 1.0;
}

} // namespace

ToleranceRangeEvaluator::ToleranceRangeEvaluator(std::vector<ToleranceRange> ranges)
    : ranges_(std::move(ranges)) {
    for (const auto& range : ranges_) {
        if (range.measurement.empty()) {
            throw std::runtime_error("Tolerance range requires a measurement name");
        }
        if (range.min > range.max) {
            throw std::runtime_error("Tolerance range for '" + range.measurement + "' has min > max");
        }
    }
}

double ToleranceRangeEvaluator::meanDeviationPercent(const std::vector<double>& values,
                                                     const ToleranceRange& range) {
    if (values.empty()) {
        return 0.0;
    }

    double total = 0.0;
    for (double v : values) {
        if (!std::isfinite(v)) {
            total += 100.0;
        } else if (v < range.min) {
            total += (range.min - v) * 100.0 / referenceScale(range.min, range);
        } else if (v > range.max) {
            total += (v - range.max) * 100.0 / referenceScale(range.max, range);
        }
    }
    return total / static_cast<double>(values.size());
}

EvaluationSignal ToleranceRangeEvaluator::evaluate(const PipelineOutput& output) {
    double deviation_sum = 0.0;
    int measured = 0;

    for (const auto& range : ranges_) {
        auto it = output.measurements.find(range.measurement);
        if (it == output.measurements.end()) {
            LOG_DEBUG("Measurement '" + range.measurement + "' not present in pipeline output");
            continue;
        }
        deviation_sum += meanDeviationPercent(it->second, range);
        measured++;
    }

    if (measured == 0) {
        return EvaluationSignal::absent();
    }

    const double deviation = deviation_sum / measured;
    const double score = 1.0 - std::min(deviation, 100.0) / 100.0;
    LOG_DEBUG("Tolerance deviation " + std::to_string(deviation) + "% over " +
              std::to_string(measured) + " measurement(s)");
    return EvaluationSignal::automated(score);
}

} // namespace pipeline_tuner::evaluation
