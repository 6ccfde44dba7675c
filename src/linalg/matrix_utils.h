/**
 * @file matrix_utils.h
 * @brief robscout - Dense covariance and matrix helpers
 *
 * Provides:
 *   - Sample covariance / correlation (n-1 denominator)
 *   - Cross-covariance with a response
 *   - Nearest positive-(semi)definite projection
 *   - Log-determinant with positive-definiteness check
 *   - SVD pseudo-inverse for rank-deficient systems
 */
#ifndef ROBSCOUT_MATRIX_UTILS_H
#define ROBSCOUT_MATRIX_UTILS_H

#include <Eigen/Dense>
#include <vector>

namespace robscout {
namespace linalg {

/// Sample covariance of the columns of X. Requires X.rows() >= 2.
Eigen::MatrixXd sample_covariance(const Eigen::MatrixXd& X);

/// Pearson correlation of the columns of X. Zero-variance columns get a
/// unit diagonal and zero off-diagonal entries.
Eigen::MatrixXd sample_correlation(const Eigen::MatrixXd& X);

/// Covariance of every column of X with y (length p).
Eigen::VectorXd cross_covariance(const Eigen::MatrixXd& X, const Eigen::VectorXd& y);

/// Correlation of every column of X with y (length p).
Eigen::VectorXd cross_correlation(const Eigen::MatrixXd& X, const Eigen::VectorXd& y);

/**
 * @brief Nearest symmetric positive-definite matrix (eigenvalue projection)
 *
 * Symmetrizes A, clips eigenvalues below posd_tol * max eigenvalue to that
 * floor, and reassembles. Equivalent to one Higham projection onto the PSD
 * cone followed by a definiteness floor.
 */
Eigen::MatrixXd nearest_psd(const Eigen::MatrixXd& A, double posd_tol = 1e-8);

/**
 * @brief log|A| for a symmetric matrix
 * @param ok Set to false if A is not positive definite (result is then +inf)
 */
double log_determinant(const Eigen::MatrixXd& A, bool& ok);

/// Moore-Penrose inverse via JacobiSVD; singular values below tol * max are dropped.
Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& A, double tol = 1e-10);

/// Largest eigenvalue of a symmetric matrix.
double max_eigenvalue(const Eigen::MatrixXd& A);

/// max |A_ij| over i != j (0 for 1x1 matrices).
double max_abs_off_diagonal(const Eigen::MatrixXd& A);

bool is_off_diag_zero(const Eigen::MatrixXd& A);

/// Rows of X selected by idx (in the given order).
Eigen::MatrixXd select_rows(const Eigen::MatrixXd& X, const std::vector<int>& idx);
Eigen::VectorXd select_rows(const Eigen::VectorXd& y, const std::vector<int>& idx);

} // namespace linalg
} // namespace robscout

#endif // ROBSCOUT_MATRIX_UTILS_H
