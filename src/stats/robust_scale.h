/**
 * @file robust_scale.h
 * @brief robscout - Robust location, scale and bounded transforms
 *
 * Implements:
 *   - median / MAD (normal-consistent)
 *   - one-step Huber M-estimate of location
 *   - column standardization with selectable center/scale functions
 *   - wrapping transform (bounded psi, Raymaekers & Rousseeuw)
 *   - bivariate-winsorized (Huber) correlation
 */
#ifndef ROBSCOUT_ROBUST_SCALE_H
#define ROBSCOUT_ROBUST_SCALE_H

#include <Eigen/Dense>
#include <string>
#include <utility>

namespace robscout {
namespace stats {

/// Consistency factor making the MAD unbiased for sigma under normality.
constexpr double kMadConsistency = 1.482602218505602;

/// qchisq(0.95, 2): squared Mahalanobis cutoff for bivariate winsorization.
constexpr double kBivariateCutoffSq = 5.991464547107979;

/// Center/scale pair used to standardize a data matrix.
enum class ScaleMethod {
    MeanSd,     // column mean, sample standard deviation
    MedianMad   // column median, normal-consistent MAD
};

ScaleMethod scale_method_from_string(const std::string& name);

double median(const Eigen::VectorXd& x);

/// Normal-consistent median absolute deviation around the median.
double mad(const Eigen::VectorXd& x);

/// Sample standard deviation (n-1 denominator); 0 for fewer than 2 values.
double sample_sd(const Eigen::VectorXd& x);

/**
 * @brief One-step Huber M-estimate of location
 *
 * Starts at the median with MAD scale and takes one Newton step on the
 * Huber estimating equation with threshold b.
 */
double huber_location(const Eigen::VectorXd& x, double b = 1.5);

struct Standardization {
    Eigen::VectorXd center;
    Eigen::VectorXd scale;   // zero scales are replaced by 1
};

/// Column centers and scales of X according to method.
Standardization fit_standardization(const Eigen::MatrixXd& X, ScaleMethod method);

/// (X - center) / scale, column by column.
Eigen::MatrixXd apply_standardization(const Eigen::MatrixXd& X, const Standardization& st);

/// Center/scale of a single vector (scale 0 replaced by 1).
std::pair<double, double> vector_center_scale(const Eigen::VectorXd& y, ScaleMethod method);

/// Robust per-column location (one-step Huber) and scale (MAD).
Standardization estimate_loc_scale(const Eigen::MatrixXd& X);

/**
 * @brief Bounded wrapping function
 *
 *   psi(z) = z                               |z| <= b
 *          = q1 tanh(q2 (c - |z|)) sign(z)   b < |z| <= c
 *          = 0                               |z| > c
 * with b = 1.5, c = 4, q1 = 1.540793, q2 = 0.8622731.
 */
double wrap_psi(double z);

/// loc + scale * psi((X - loc) / scale), column by column.
Eigen::MatrixXd wrap_columns(const Eigen::MatrixXd& X, const Standardization& loc_scale);

double pearson(const Eigen::VectorXd& x, const Eigen::VectorXd& y);

/**
 * @brief Huber-type correlation via bivariate winsorization
 *
 * Inputs are assumed robustly standardized. An initial correlation comes
 * from univariate winsorization at +-2; points whose Mahalanobis distance
 * under that correlation exceeds the 95% chi-square(2) quantile are shrunk
 * onto the tolerance ellipse, and the Pearson correlation of the shrunken
 * pairs is returned.
 */
double huber_correlation(const Eigen::VectorXd& x, const Eigen::VectorXd& y);

} // namespace stats
} // namespace robscout

#endif // ROBSCOUT_ROBUST_SCALE_H
