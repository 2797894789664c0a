#pragma once

#include "pipeline_tuner/types.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace pipeline_tuner::surrogate {

/**
 * @brief Posterior at one point, in objective units
 */
struct Prediction {
    double mean = 0.0;
    double variance = 0.0;   ///< Latent-function variance, always >= 0
};

/**
 * @brief Squared-exponential ARD kernel hyperparameters (standardised target units)
 */
struct Hyperparameters {
    std::vector<double> length_scales;
    double signal_variance = 1.0;
    double noise_floor = 1e-6;   ///< Homoscedastic noise added on top of per-observation noise
};

/**
 * @brief Immutable posterior of a Gaussian process fit to one observation log
 *
 * Pure function of the observations and hyperparameters it was built from;
 * holds no reference to the log itself.
 */
class FittedModel {
public:
    /**
     * @brief Model that ignores the data and returns the prior everywhere
     * @param prior_mean Constant mean in objective units
     * @param prior_variance Constant variance in objective units
     */
    static FittedModel priorOnly(size_t dimension, double prior_mean, double prior_variance);

    /**
     * @throws OutOfDomainError if x has the wrong dimension
     */
    Prediction predict(const std::vector<double>& x) const;

    std::vector<Prediction> predictBatch(const std::vector<std::vector<double>>& points) const;

    bool isPriorOnly() const { return prior_only_; }
    size_t dimension() const { return dimension_; }
    size_t observationCount() const { return static_cast<size_t>(train_x_.rows); }
    const Hyperparameters& hyperparameters() const { return hyper_; }

    /// Diagonal jitter that was needed to factorise the covariance.
    double jitter() const { return jitter_; }

    /// Negative log marginal likelihood of the standardised targets (0 for prior-only models).
    double negativeLogMarginalLikelihood() const { return nlml_; }

private:
    friend class GaussianProcess;

    FittedModel() = default;

    size_t dimension_ = 0;
    bool prior_only_ = true;
    Hyperparameters hyper_;
    double prior_mean_ = 0.0;
    double prior_variance_ = 1.0;

    cv::Mat train_x_;        // n x d, CV_64F
    cv::Mat alpha_;          // n x 1, K^-1 y (standardised)
    cv::Mat k_inv_;          // n x n, (K + jitter I)^-1
    double y_mean_ = 0.0;
    double y_std_ = 1.0;
    double jitter_ = 0.0;
    double nlml_ = 0.0;
};

/**
 * @brief Heteroscedastic Gaussian-process regression over normalised vectors
 *
 * - Targets are standardised before fitting; each observation contributes its own
 *   noise (noise_i / y_std^2 + noise_floor) on the covariance diagonal.
 * - Length scales, signal variance and noise floor are the fitted hyperparameters.
 * - Hyperparameters are fitted by minimising the negative log marginal likelihood
 *   with OpenCV's DownhillSolver from deterministic starts, so refitting the same
 *   log with the same settings reproduces the same posterior.
 * - Fewer than two observations give a prior-only model.
 */
class GaussianProcess {
public:
    explicit GaussianProcess(SurrogateParams params);

    /**
     * @brief Fit the posterior to an observation log
     * @param observations Completed observations (encoded vectors of size dimension)
     * @param dimension Dimension of the parameter space
     * @throws IllConditionedModelError if the covariance cannot be factorised even with max_jitter
     * @throws OutOfDomainError if an observation has a wrong-sized encoding
     */
    FittedModel fit(const std::vector<Observation>& observations, size_t dimension) const;

    /**
     * @brief Prior-only model matching the scale of the given observations
     */
    FittedModel fitPriorOnly(const std::vector<Observation>& observations, size_t dimension) const;

    const SurrogateParams& params() const { return params_; }

    /**
     * @brief Squared-exponential ARD covariance between two points
     */
    static double kernel(const double* a, const double* b, const Hyperparameters& hyper);

private:
    SurrogateParams params_;

    Hyperparameters initialHyperparameters(size_t dimension) const;
    Hyperparameters optimizeHyperparameters(const cv::Mat& x, const cv::Mat& y,
                                            const cv::Mat& noise) const;
};

namespace detail {

    /**
     * @brief Covariance matrix with per-point noise plus the noise floor on the diagonal
     */
    cv::Mat buildCovariance(const cv::Mat& x, const cv::Mat& noise, const Hyperparameters& hyper);

    /**
     * @brief Cholesky factorisation with escalating diagonal jitter
     *
     * Tries the plain matrix first, then jitter, 10 * jitter, ... up to max_jitter.
     * The factorisation itself is cv::hal::Cholesky64f.
     * @param k Symmetric covariance (unchanged)
     * @param lower Output lower-triangular factor
     * @param jitter In: first jitter to try. Out: jitter actually applied (0 if none was needed)
     * @return false if factorisation failed even at max_jitter
     */
    bool choleskyWithJitter(const cv::Mat& k, cv::Mat& lower, double& jitter, double max_jitter);

    /// Solves (K + jitter I) x = b with cv::solve(DECOMP_CHOLESKY). Empty if the matrix is not positive definite.
    cv::Mat choleskySolve(const cv::Mat& k, double jitter, const cv::Mat& b);

    /// log|K| from its Cholesky factor.
    double logDeterminant(const cv::Mat& lower);

    /**
     * @brief NLML for given hyperparameters, or +inf if the covariance cannot be factorised
     */
    double negativeLogMarginalLikelihood(const cv::Mat& x, const cv::Mat& y, const cv::Mat& noise,
                                         const Hyperparameters& hyper, double jitter, double max_jitter);

} // namespace detail

} // namespace pipeline_tuner::surrogate
