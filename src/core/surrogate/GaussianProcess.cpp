#include "GaussianProcess.hpp"
#include "pipeline_tuner/errors.hpp"
#include "pipeline_tuner/logging.hpp"
#include <opencv2/core/hal/hal.hpp>
#include <opencv2/core/optim.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <utility>

namespace pipeline_tuner::surrogate {

namespace {

constexpr double kLog2Pi = 1.8378770664093453;
constexpr double kMinLengthScale = 1e-3;
constexpr double kMaxLengthScale = 1e2;
constexpr double kMinSignalVariance = 1e-3;
constexpr double kMaxSignalVariance = 1e3;
constexpr double kMinNoiseFloor = 1e-8;
constexpr double kMaxNoiseFloor = 1e-1;
constexpr unsigned int kRestartSeed = 0x9e3779b9u;

/**
 * @brief NLML over log hyperparameters [log l_1 .. log l_d, log sigma_f^2, log noise floor]
 *
 * Out-of-box parameters return a large penalty so the simplex walks back in.
 */
class MarginalLikelihoodObjective : public cv::DownhillSolver::Function {
public:
    MarginalLikelihoodObjective(cv::Mat x, cv::Mat y, cv::Mat noise, double jitter, double max_jitter)
        : x_(std::move(x)), y_(std::move(y)), noise_(std::move(noise)),
          jitter_(jitter), max_jitter_(max_jitter) {}

    int getDims() const override { return x_.cols + 2; }

    double calc(const double* theta) const override {
        double penalty = 0.0;
        const Hyperparameters hyper = decode(theta, penalty);
        if (penalty > 0.0) {
            return 1e10 * (1.0 + penalty);
        }
        const double value = detail::negativeLogMarginalLikelihood(x_, y_, noise_, hyper,
                                                                    jitter_, max_jitter_);
        return std::isfinite(value) ? value : 1e10;
    }

    Hyperparameters decode(const double* theta, double& penalty) const {
        Hyperparameters hyper;
        hyper.length_scales.resize(static_cast<size_t>(x_.cols));
        penalty = 0.0;
        for (int i = 0; i < x_.cols; ++i) {
            hyper.length_scales[static_cast<size_t>(i)] =
                clampLog(theta[i], kMinLengthScale, kMaxLengthScale, penalty);
        }
        hyper.signal_variance = clampLog(theta[x_.cols], kMinSignalVariance, kMaxSignalVariance, penalty);
        hyper.noise_floor = clampLog(theta[x_.cols + 1], kMinNoiseFloor, kMaxNoiseFloor, penalty);
        return hyper;
    }

private:
    static double clampLog(double log_value, double lo, double hi, double& penalty) {
        const double log_lo = std::log(lo);
        const double log_hi = std::log(hi);
        if (!std::isfinite(log_value)) {
            penalty += 1.0;
            return lo;
        }
        if (log_value < log_lo) {
            penalty += log_lo - log_value;
            return lo;
        }
        if (log_value > log_hi) {
            penalty += log_value - log_hi;
            return hi;
        }
        return std::exp(log_value);
    }

    cv::Mat x_;
    cv::Mat y_;
    cv::Mat noise_;
    double jitter_;
    double max_jitter_;
};

} // namespace

// ================================
// FittedModel
// ================================

FittedModel FittedModel::priorOnly(size_t dimension, double prior_mean, double prior_variance) {
    FittedModel model;
    model.dimension_ = dimension;
    model.prior_only_ = true;
    model.prior_mean_ = prior_mean;
    model.prior_variance_ = std::max(0.0, prior_variance);
    return model;
}

Prediction FittedModel::predict(const std::vector<double>& x) const {
    if (x.size() != dimension_) {
        throw OutOfDomainError("prediction point has dimension " + std::to_string(x.size()) +
                               ", expected " + std::to_string(dimension_));
    }

    if (prior_only_) {
        return Prediction{prior_mean_, prior_variance_};
    }

    const int n = train_x_.rows;
    cv::Mat k_star(n, 1, CV_64F);
    for (int i = 0; i < n; ++i) {
        k_star.at<double>(i) = GaussianProcess::kernel(train_x_.ptr<double>(i), x.data(), hyper_);
    }

    const double mean_std = k_star.dot(alpha_);
    const cv::Mat projected = k_inv_ * k_star;
    const double variance_std = hyper_.signal_variance - k_star.dot(projected);

    Prediction prediction;
    prediction.mean = mean_std * y_std_ + y_mean_;
    prediction.variance = std::max(0.0, variance_std) * y_std_ * y_std_;
    return prediction;
}

std::vector<Prediction> FittedModel::predictBatch(const std::vector<std::vector<double>>& points) const {
    std::vector<Prediction> predictions(points.size());
    for (const auto& point : points) {
        if (point.size() != dimension_) {
            throw OutOfDomainError("prediction point has dimension " + std::to_string(point.size()) +
                                   ", expected " + std::to_string(dimension_));
        }
    }

    const int count = static_cast<int>(points.size());
    #pragma omp parallel for schedule(static)
    for (int i = 0; i < count; ++i) {
        predictions[static_cast<size_t>(i)] = predict(points[static_cast<size_t>(i)]);
    }
    return predictions;
}

// ================================
// GaussianProcess
// ================================

GaussianProcess::GaussianProcess(SurrogateParams params)
    : params_(std::move(params)) {}

double GaussianProcess::kernel(const double* a, const double* b, const Hyperparameters& hyper) {
    double r2 = 0.0;
    for (size_t i = 0; i < hyper.length_scales.size(); ++i) {
        const double d = (a[i] - b[i]) / hyper.length_scales[i];
        r2 += d * d;
    }
    return hyper.signal_variance * std::exp(-0.5 * r2);
}

Hyperparameters GaussianProcess::initialHyperparameters(size_t dimension) const {
    Hyperparameters hyper;
    hyper.length_scales.assign(dimension, params_.length_scale);
    hyper.signal_variance = params_.signal_variance;
    hyper.noise_floor = std::clamp(params_.noise_floor, kMinNoiseFloor, kMaxNoiseFloor);
    return hyper;
}

FittedModel GaussianProcess::fitPriorOnly(const std::vector<Observation>& observations, size_t dimension) const {
    double mean = 0.0;
    double variance = 1.0;
    if (!observations.empty()) {
        for (const auto& obs : observations) {
            mean += obs.objective;
        }
        mean /= static_cast<double>(observations.size());
    }
    if (observations.size() >= 2) {
        double ss = 0.0;
        for (const auto& obs : observations) {
            ss += (obs.objective - mean) * (obs.objective - mean);
        }
        const double sample_variance = ss / static_cast<double>(observations.size());
        if (sample_variance > 1e-24) {
            variance = sample_variance;
        }
    }
    return FittedModel::priorOnly(dimension, mean, params_.signal_variance * variance);
}

FittedModel GaussianProcess::fit(const std::vector<Observation>& observations, size_t dimension) const {
    if (observations.size() < 2) {
        return fitPriorOnly(observations, dimension);
    }

    const int n = static_cast<int>(observations.size());
    const int d = static_cast<int>(dimension);
    cv::Mat x(n, d, CV_64F);
    cv::Mat y_raw(n, 1, CV_64F);
    cv::Mat noise_raw(n, 1, CV_64F);

    for (int i = 0; i < n; ++i) {
        const auto& obs = observations[static_cast<size_t>(i)];
        if (obs.encoded.size() != dimension) {
            throw OutOfDomainError("observation " + std::to_string(obs.order_index) +
                                   " has encoded dimension " + std::to_string(obs.encoded.size()) +
                                   ", expected " + std::to_string(dimension));
        }
        std::copy(obs.encoded.begin(), obs.encoded.end(), x.ptr<double>(i));
        y_raw.at<double>(i) = obs.objective;
        noise_raw.at<double>(i) = std::max(0.0, obs.noise);
    }

    cv::Scalar mean_scalar, std_scalar;
    cv::meanStdDev(y_raw, mean_scalar, std_scalar);
    const double y_mean = mean_scalar[0];
    double y_std = std_scalar[0];
    if (!(y_std > 1e-12)) {
        y_std = 1.0;
    }

    cv::Mat y = (y_raw - y_mean) / y_std;
    cv::Mat noise = noise_raw / (y_std * y_std);

    Hyperparameters hyper = initialHyperparameters(dimension);
    if (params_.optimize_hyperparameters && n >= params_.min_observations_for_optimization) {
        hyper = optimizeHyperparameters(x, y, noise);
    }

    const cv::Mat k = detail::buildCovariance(x, noise, hyper);
    cv::Mat lower;
    double jitter = params_.jitter;
    if (!detail::choleskyWithJitter(k, lower, jitter, params_.max_jitter)) {
        throw IllConditionedModelError("covariance of " + std::to_string(n) +
                                       " observations not positive definite with jitter up to " +
                                       std::to_string(params_.max_jitter));
    }
    if (jitter > 0.0) {
        LOG_DEBUG("Surrogate covariance regularised with jitter " + std::to_string(jitter));
    }

    const cv::Mat alpha = detail::choleskySolve(k, jitter, y);
    const cv::Mat k_inv = detail::choleskySolve(k, jitter, cv::Mat::eye(n, n, CV_64F));
    if (alpha.empty() || k_inv.empty()) {
        throw IllConditionedModelError("covariance of " + std::to_string(n) +
                                       " observations could not be solved at jitter " + std::to_string(jitter));
    }

    FittedModel model;
    model.dimension_ = dimension;
    model.prior_only_ = false;
    model.hyper_ = hyper;
    model.train_x_ = x;
    model.k_inv_ = k_inv;
    model.alpha_ = alpha;
    model.y_mean_ = y_mean;
    model.y_std_ = y_std;
    model.jitter_ = jitter;
    model.prior_mean_ = y_mean;
    model.prior_variance_ = hyper.signal_variance * y_std * y_std;

    model.nlml_ = 0.5 * y.dot(alpha) + 0.5 * detail::logDeterminant(lower) + 0.5 * n * kLog2Pi;
    return model;
}

Hyperparameters GaussianProcess::optimizeHyperparameters(const cv::Mat& x, const cv::Mat& y,
                                                         const cv::Mat& noise) const {
    const int dims = x.cols + 2;
    auto objective = cv::makePtr<MarginalLikelihoodObjective>(x, y, noise, params_.jitter, params_.max_jitter);
    cv::Ptr<cv::MinProblemSolver::Function> function = objective;

    cv::Mat init_step(1, dims, CV_64F, cv::Scalar(0.5));
    cv::TermCriteria criteria(cv::TermCriteria::MAX_ITER + cv::TermCriteria::EPS,
                              params_.optimizer_max_iterations, 1e-6);
    cv::Ptr<cv::DownhillSolver> solver = cv::DownhillSolver::create(function, init_step, criteria);

    // Restarts are drawn from a fixed seed so that refits are reproducible.
    std::mt19937 rng(kRestartSeed + static_cast<unsigned int>(x.rows));
    std::uniform_real_distribution<double> log_length(std::log(0.05), std::log(2.0));
    std::uniform_real_distribution<double> log_variance(std::log(0.1), std::log(10.0));

    Hyperparameters best = initialHyperparameters(static_cast<size_t>(x.cols));
    std::vector<double> initial_theta(static_cast<size_t>(dims));
    for (int i = 0; i < x.cols; ++i) {
        initial_theta[static_cast<size_t>(i)] = std::log(best.length_scales[static_cast<size_t>(i)]);
    }
    initial_theta[static_cast<size_t>(x.cols)] = std::log(best.signal_variance);
    initial_theta[static_cast<size_t>(x.cols) + 1] = std::log(best.noise_floor);
    double best_value = objective->calc(initial_theta.data());

    const int starts = 1 + std::max(0, params_.optimizer_restarts);
    for (int start = 0; start < starts; ++start) {
        cv::Mat theta(1, dims, CV_64F);
        for (int i = 0; i < x.cols; ++i) {
            theta.at<double>(i) = start == 0 ? std::log(params_.length_scale) : log_length(rng);
        }
        theta.at<double>(x.cols) = start == 0 ? std::log(params_.signal_variance) : log_variance(rng);
        theta.at<double>(x.cols + 1) = std::log(best.noise_floor);

        const double value = solver->minimize(theta);
        if (!std::isfinite(value)) {
            continue;
        }
        double penalty = 0.0;
        const Hyperparameters candidate = objective->decode(theta.ptr<double>(), penalty);
        const double candidate_value = objective->calc(theta.ptr<double>());
        if (penalty == 0.0 && candidate_value < best_value) {
            best_value = candidate_value;
            best = candidate;
        }
    }

    LOG_DEBUG("Surrogate hyperparameters fitted, NLML " + std::to_string(best_value) +
              ", signal variance " + std::to_string(best.signal_variance));
    return best;
}

// ================================
// Linear algebra helpers
// ================================

namespace detail {

cv::Mat buildCovariance(const cv::Mat& x, const cv::Mat& noise, const Hyperparameters& hyper) {
    const int n = x.rows;
    cv::Mat k(n, n, CV_64F);

    #pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j <= i; ++j) {
            const double value = GaussianProcess::kernel(x.ptr<double>(i), x.ptr<double>(j), hyper);
            k.at<double>(i, j) = value;
            k.at<double>(j, i) = value;
        }
    }
    for (int i = 0; i < n; ++i) {
        k.at<double>(i, i) += noise.at<double>(i) + hyper.noise_floor;
    }
    return k;
}

namespace {

cv::Mat regularised(const cv::Mat& k, double jitter) {
    cv::Mat out = k.clone();
    if (jitter > 0.0) {
        cv::Mat diagonal = out.diag();
        diagonal += cv::Scalar(jitter);
    }
    return out;
}

bool tryCholesky(const cv::Mat& k, double jitter, cv::Mat& lower) {
    lower = regularised(k, jitter);
    if (!cv::hal::Cholesky64f(lower.ptr<double>(), lower.step, lower.rows, nullptr, 0, 0) ||
        !cv::checkRange(lower)) {
        return false;
    }
    // Cholesky64f leaves the input above the diagonal.
    for (int i = 0; i + 1 < lower.rows; ++i) {
        lower.row(i).colRange(i + 1, lower.cols).setTo(cv::Scalar(0.0));
    }
    return true;
}

} // namespace

bool choleskyWithJitter(const cv::Mat& k, cv::Mat& lower, double& jitter, double max_jitter) {
    if (tryCholesky(k, 0.0, lower)) {
        jitter = 0.0;
        return true;
    }
    double current = jitter > 0.0 ? jitter : 1e-12;
    while (current <= max_jitter * (1.0 + 1e-9)) {
        if (tryCholesky(k, current, lower)) {
            jitter = current;
            return true;
        }
        current *= 10.0;
    }
    return false;
}

cv::Mat choleskySolve(const cv::Mat& k, double jitter, const cv::Mat& b) {
    cv::Mat x;
    if (!cv::solve(regularised(k, jitter), b, x, cv::DECOMP_CHOLESKY)) {
        return cv::Mat();
    }
    return x;
}

double logDeterminant(const cv::Mat& lower) {
    cv::Mat log_diagonal;
    cv::log(lower.diag(), log_diagonal);
    return 2.0 * cv::sum(log_diagonal)[0];
}

double negativeLogMarginalLikelihood(const cv::Mat& x, const cv::Mat& y, const cv::Mat& noise,
                                     const Hyperparameters& hyper, double jitter, double max_jitter) {
    const cv::Mat k = buildCovariance(x, noise, hyper);
    cv::Mat lower;
    double used = jitter;
    if (!choleskyWithJitter(k, lower, used, max_jitter)) {
        return std::numeric_limits<double>::infinity();
    }
    const cv::Mat alpha = choleskySolve(k, used, y);
    if (alpha.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    return 0.5 * y.dot(alpha) + 0.5 * logDeterminant(lower) + 0.5 * lower.rows * kLog2Pi;
}

} // namespace detail

} // namespace pipeline_tuner::surrogate
