/**
 * @file penalty_path.h
 * @brief robscout - Regularization path construction for both stages
 *
 * Graph stage (lambda1): penalty on the predictor precision matrix.
 * Coefficient stage (lambda2): penalty on the regression coefficients.
 *
 * All paths are strictly decreasing and log-spaced between lambda_max and
 * lambda_min_ratio * lambda_max. A zero lambda_max (nothing to shrink)
 * collapses the path to {0}; callers must handle single-element paths.
 */
#ifndef ROBSCOUT_PENALTY_PATH_H
#define ROBSCOUT_PENALTY_PATH_H

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace robscout {

/// Norm of a penalty term. None means "no regularization" (path {0}).
enum class PenaltyNorm {
    None = 0,
    L1 = 1,
    L2 = 2
};

/// Converts 0 / 1 / 2; anything else throws std::invalid_argument.
PenaltyNorm penalty_norm_from_int(int p);

std::string to_string(PenaltyNorm norm);

/**
 * @brief nlambda log-spaced values from lambda_max down to ratio * lambda_max
 *
 * Returns {0} if lambda_max == 0 and {lambda_max} if nlambda == 1.
 * Throws std::invalid_argument for nlambda < 1, ratio outside (0, 1) or a
 * negative / non-finite lambda_max.
 */
std::vector<double> log_spaced_path(double lambda_max, int nlambda, double lambda_min_ratio);

/// max |S_ij| over i != j: the smallest L1 penalty giving a diagonal precision.
double glasso_lambda_max(const Eigen::MatrixXd& S);

std::vector<double> build_glasso_path(const Eigen::MatrixXd& S, int nlambda,
                                      double lambda_min_ratio = 0.1);

/// Square of the largest eigenvalue of S (0 if S has no positive eigenvalue).
double ridge_precision_lambda_max(const Eigen::MatrixXd& S);

/// Graph-stage path for the given norm (None -> {0}).
std::vector<double> build_graph_path(const Eigen::MatrixXd& S, PenaltyNorm norm,
                                     int nlambda = 100, double lambda_min_ratio = 0.1);

/// max_j |cov_xy_j|: the smallest L1 penalty giving all-zero coefficients.
double lasso_lambda_max(const Eigen::VectorXd& cov_xy);

/// Upper end for the ridge path, following glmnet's alpha = 1e-3 convention.
double ridge_lambda_max(const Eigen::VectorXd& cov_xy);

/// Coefficient-stage path for the given norm (None -> {0}).
std::vector<double> build_coefficient_path(const Eigen::VectorXd& cov_xy, PenaltyNorm norm,
                                           int nlambda = 100, double lambda_min_ratio = 0.01);

/// Checks a caller-supplied path: non-empty, finite, non-negative, strictly decreasing.
void validate_path(const std::vector<double>& path, const std::string& what);

} // namespace robscout

#endif // ROBSCOUT_PENALTY_PATH_H
