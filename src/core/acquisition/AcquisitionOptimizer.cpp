#include "AcquisitionOptimizer.hpp"
#include "AcquisitionFactory.hpp"
#include "pipeline_tuner/errors.hpp"
#include "pipeline_tuner/logging.hpp"
#include <opencv2/core/optim.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace pipeline_tuner::acquisition {

namespace {

constexpr double kTieTolerance = 1e-12;
constexpr int kResampleBatch = 32;

/**
 * @brief Negative acquisition on the unit box, for the simplex minimiser
 *
 * Points outside [0,1]^d are clamped for evaluation and penalised by their distance
 * to the box.
 */
class AcquisitionObjective : public cv::DownhillSolver::Function {
public:
    AcquisitionObjective(const surrogate::FittedModel& model, const AcquisitionFunction& function,
                         double incumbent)
        : model_(model), function_(function), incumbent_(incumbent) {}

    int getDims() const override { return static_cast<int>(model_.dimension()); }

    double calc(const double* x) const override {
        double penalty = 0.0;
        const std::vector<double> point = clampToBox(x, penalty);
        const double value = function_.evaluate(model_.predict(point), incumbent_);
        return -value + 10.0 * penalty;
    }

    std::vector<double> clampToBox(const double* x, double& penalty) const {
        std::vector<double> point(model_.dimension());
        penalty = 0.0;
        for (size_t i = 0; i < point.size(); ++i) {
            double v = x[i];
            if (!std::isfinite(v)) {
                v = 0.5;
                penalty += 1.0;
            }
            if (v < 0.0) {
                penalty += -v;
                v = 0.0;
            } else if (v > 1.0) {
                penalty += v - 1.0;
                v = 1.0;
            }
            point[i] = v;
        }
        return point;
    }

private:
    const surrogate::FittedModel& model_;
    const AcquisitionFunction& function_;
    double incumbent_;
};

bool betterCandidate(const ScoredCandidate& a, const ScoredCandidate& b) {
    const double scale = std::max(1.0, std::max(std::abs(a.acquisition), std::abs(b.acquisition)));
    if (a.acquisition > b.acquisition + kTieTolerance * scale) {
        return true;
    }
    if (std::abs(a.acquisition - b.acquisition) <= kTieTolerance * scale) {
        return a.variance > b.variance;
    }
    return false;
}

bool withinTolerance(const std::vector<double>& a, const std::vector<double>& b, double tolerance) {
    if (a.size() != b.size()) {
        return false;
    }
    double distance = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        distance = std::max(distance, std::abs(a[i] - b[i]));
    }
    return distance <= tolerance;
}

double incumbentOf(const std::vector<Observation>& observations) {
    double best = -std::numeric_limits<double>::infinity();
    for (const auto& obs : observations) {
        best = std::max(best, obs.objective);
    }
    return best;
}

} // namespace

AcquisitionOptimizer::AcquisitionOptimizer(AcquisitionParams params, int initial_design_size)
    : params_(std::move(params)),
      initial_design_size_(std::max(1, initial_design_size)),
      function_(AcquisitionFactory::create(params_)) {}

bool AcquisitionOptimizer::isDuplicate(const std::vector<double>& vector,
                                       const std::vector<std::vector<double>>& vectors,
                                       double tolerance) {
    for (const auto& other : vectors) {
        if (withinTolerance(vector, other, tolerance)) {
            return true;
        }
    }
    return false;
}

bool AcquisitionOptimizer::isDuplicate(const std::vector<double>& vector,
                                       const std::vector<Observation>& observations,
                                       double tolerance) {
    for (const auto& obs : observations) {
        if (withinTolerance(vector, obs.encoded, tolerance)) {
            return true;
        }
    }
    return false;
}

bool AcquisitionOptimizer::isTaken(const std::vector<double>& vector,
                                   const std::vector<Observation>& observations,
                                   const std::vector<std::vector<double>>& excluded) const {
    return isDuplicate(vector, observations, params_.duplicate_tolerance) ||
           isDuplicate(vector, excluded, params_.duplicate_tolerance);
}

std::vector<ScoredCandidate> AcquisitionOptimizer::scoreCandidates(const surrogate::FittedModel& model,
                                                                   const std::vector<std::vector<double>>& points,
                                                                   double incumbent) const {
    const std::vector<surrogate::Prediction> predictions = model.predictBatch(points);
    std::vector<ScoredCandidate> scored;
    scored.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        ScoredCandidate candidate;
        candidate.encoded = points[i];
        candidate.acquisition = function_->evaluate(predictions[i], incumbent);
        candidate.variance = predictions[i].variance;
        scored.push_back(std::move(candidate));
    }
    return scored;
}

std::vector<double> AcquisitionOptimizer::refine(const surrogate::FittedModel& model,
                                                 const std::vector<double>& start,
                                                 double incumbent) const {
    const int dims = static_cast<int>(start.size());
    auto objective = cv::makePtr<AcquisitionObjective>(model, *function_, incumbent);
    cv::Ptr<cv::MinProblemSolver::Function> function = objective;

    cv::Mat step(1, dims, CV_64F, cv::Scalar(0.05));
    cv::TermCriteria criteria(cv::TermCriteria::MAX_ITER + cv::TermCriteria::EPS,
                              std::max(1, params_.refine_iterations), 1e-8);
    cv::Ptr<cv::DownhillSolver> solver = cv::DownhillSolver::create(function, step, criteria);

    cv::Mat x(1, dims, CV_64F);
    std::copy(start.begin(), start.end(), x.ptr<double>());
    solver->minimize(x);

    double penalty = 0.0;
    return objective->clampToBox(x.ptr<double>(), penalty);
}

std::vector<double> AcquisitionOptimizer::resampleNeighbourhood(const surrogate::FittedModel& model,
                                                                const space::ParameterSpace& space,
                                                                const std::vector<double>& centre,
                                                                const std::vector<Observation>& observations,
                                                                const std::vector<std::vector<double>>& excluded,
                                                                double incumbent,
                                                                std::mt19937& rng) const {
    std::uniform_real_distribution<double> unit(-1.0, 1.0);
    const int attempts = std::max(1, params_.max_resample_attempts);

    for (int attempt = 0; attempt < attempts; ++attempt) {
        // Radius grows linearly until the neighbourhood covers the whole box.
        const double radius = std::min(1.0, 2.0 * params_.duplicate_tolerance + 0.05 * (attempt + 1));

        std::vector<std::vector<double>> points;
        points.reserve(kResampleBatch);
        for (int k = 0; k < kResampleBatch; ++k) {
            std::vector<double> point(centre.size());
            for (size_t i = 0; i < centre.size(); ++i) {
                point[i] = std::clamp(centre[i] + radius * unit(rng), 0.0, 1.0);
            }
            point = space.snap(point);
            if (!isTaken(point, observations, excluded)) {
                points.push_back(std::move(point));
            }
        }

        if (points.empty()) {
            continue;
        }

        const std::vector<ScoredCandidate> scored = scoreCandidates(model, points, incumbent);
        const ScoredCandidate* best = &scored.front();
        for (const auto& candidate : scored) {
            if (betterCandidate(candidate, *best)) {
                best = &candidate;
            }
        }
        LOG_DEBUG("Proposal collided with an observed configuration, resampled at radius " +
                  std::to_string(radius));
        return best->encoded;
    }
    return {};
}

std::vector<double> AcquisitionOptimizer::proposeEncoded(const surrogate::FittedModel& model,
                                                         const space::ParameterSpace& space,
                                                         const std::vector<Observation>& observations,
                                                         std::mt19937& rng,
                                                         const std::vector<std::vector<double>>& excluded) const {
    if (observations.empty()) {
        for (int attempt = 0; attempt < std::max(1, params_.max_resample_attempts); ++attempt) {
            for (const auto& point : space.sampleLatinHypercube(initial_design_size_, rng)) {
                std::vector<double> encoded = space.encode(point);
                if (!isDuplicate(encoded, excluded, params_.duplicate_tolerance)) {
                    return encoded;
                }
            }
        }
        throw SpaceExhaustedError("every space-filling design point was excluded");
    }

    const size_t dimension = space.dimension();
    const double incumbent = incumbentOf(observations);

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const int candidate_count = std::max(1, params_.random_candidates);
    std::vector<std::vector<double>> raw(static_cast<size_t>(candidate_count), std::vector<double>(dimension));
    for (auto& point : raw) {
        for (auto& v : point) {
            v = unit(rng);
        }
    }

    std::vector<std::vector<double>> points = raw;

    // A prior-only model has a flat acquisition surface; refinement would not move.
    if (!model.isPriorOnly() && params_.refine_starts > 0) {
        std::vector<ScoredCandidate> scored = scoreCandidates(model, raw, incumbent);
        const size_t starts = std::min(scored.size(), static_cast<size_t>(params_.refine_starts));
        std::partial_sort(scored.begin(), scored.begin() + static_cast<long>(starts), scored.end(),
                          [](const ScoredCandidate& a, const ScoredCandidate& b) {
                              return a.acquisition > b.acquisition;
                          });
        for (size_t i = 0; i < starts; ++i) {
            points.push_back(refine(model, scored[i].encoded, incumbent));
        }
    }

    for (auto& point : points) {
        point = space.snap(point);
    }

    const std::vector<ScoredCandidate> snapped = scoreCandidates(model, points, incumbent);
    const ScoredCandidate* best_overall = nullptr;
    const ScoredCandidate* best_fresh = nullptr;
    for (const auto& candidate : snapped) {
        if (!best_overall || betterCandidate(candidate, *best_overall)) {
            best_overall = &candidate;
        }
        if (isTaken(candidate.encoded, observations, excluded)) {
            continue;
        }
        if (!best_fresh || betterCandidate(candidate, *best_fresh)) {
            best_fresh = &candidate;
        }
    }

    if (best_fresh) {
        return best_fresh->encoded;
    }

    std::vector<double> resampled = resampleNeighbourhood(model, space, best_overall->encoded,
                                                          observations, excluded, incumbent, rng);
    if (resampled.empty()) {
        throw SpaceExhaustedError("no unobserved configuration found after " +
                                  std::to_string(params_.max_resample_attempts) + " resample attempts");
    }
    return resampled;
}

Configuration AcquisitionOptimizer::propose(const surrogate::FittedModel& model,
                                            const space::ParameterSpace& space,
                                            const std::vector<Observation>& observations,
                                            std::mt19937& rng,
                                            const std::vector<std::vector<double>>& excluded) const {
    return space.quantize(space.decode(proposeEncoded(model, space, observations, rng, excluded)));
}

} // namespace pipeline_tuner::acquisition
