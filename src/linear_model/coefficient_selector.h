/**
 * @file coefficient_selector.h
 * @brief robscout - Coefficient-stage fit and held-out selection
 *
 * With the graph penalty lambda1 held fixed, a training split is turned into
 * one coefficient vector per coefficient penalty lambda2:
 *
 *   1. repair cells if method_xx does so ("ddc"), then standardize X and y
 *      (training center/scale)
 *   2. S_xx, s_xy from the configured covariance strategies
 *   3. S~ = inverse of the regularized precision of S_xx at lambda1
 *   4. b~(lambda2) = argmin 0.5 b' S~ b - s_xy' b + P_lambda2(b)
 *   5. optional rescaling b = c b~,  c = b~' s_xy / b~' S_xx b~
 *
 * Coefficients live on the standardized scale; original_coefficients()
 * maps them back with y_scale / x_scale_j.
 */
#ifndef ROBSCOUT_COEFFICIENT_SELECTOR_H
#define ROBSCOUT_COEFFICIENT_SELECTOR_H

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "coefficient_solver.h"
#include "../graphical/penalty_path.h"
#include "../graphical/precision_solver.h"
#include "../stats/robust_scale.h"

namespace robscout {

struct CoefficientSelectOptions {
    std::string method_xx = "default";    // covariance strategy for S_xx
    std::string method_xy = "default";    // covariance strategy for s_xy
    PenaltyNorm graph_norm = PenaltyNorm::L1;
    PenaltyNorm coef_norm = PenaltyNorm::L1;
    int nlambda = 100;                    // used when no path is supplied
    double lambda_min_ratio = 0.01;
    bool rescale = true;
    bool standardize = true;
    stats::ScaleMethod scaling = stats::ScaleMethod::MeanSd;
    std::shared_ptr<const PrecisionPathSolver> precision_solver;       // nullptr -> default for graph_norm
    std::shared_ptr<const CoefficientPathSolver> coefficient_solver;   // nullptr -> default for coef_norm
    bool verbose = false;
};

/// Coefficient candidates for one training split.
struct CoefficientPath {
    std::vector<double> path;
    std::vector<Eigen::VectorXd> coefficients;   // standardized scale, rescaled if requested
    Eigen::VectorXd x_center;
    Eigen::VectorXd x_scale;
    double y_center = 0.0;
    double y_scale = 1.0;
    Eigen::VectorXd cov_xy;                      // s_xy on the standardized scale
    std::vector<std::string> warnings;

    /// b_j * y_scale / x_scale_j for candidate i.
    Eigen::VectorXd original_coefficients(int i) const;

    /// y_center - x_center' * original_coefficients(i).
    double intercept(int i) const;

    /// X * original_coefficients(i) + intercept(i).
    Eigen::VectorXd predict(const Eigen::MatrixXd& X, int i) const;
};

/**
 * @brief Candidates over a coefficient path on a single training split
 * @param path Coefficient penalties; built from the split's s_xy when absent
 */
CoefficientPath fit_coefficient_path(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, double lambda1,
                                     const std::optional<std::vector<double>>& path,
                                     const CoefficientSelectOptions& options = CoefficientSelectOptions());

/// Standardized-scale cross-covariance used to build the coefficient path.
Eigen::VectorXd standardized_cross_covariance(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                              const CoefficientSelectOptions& options,
                                              std::vector<std::string>* warnings = nullptr);

struct CoefficientSelection {
    Eigen::VectorXd coefficients;     // original scale, at best_penalty
    double intercept = 0.0;
    double best_penalty = 0.0;
    int best_index = 0;
    std::vector<double> path;
    std::vector<double> errors;       // held-out RMSPE per penalty
    std::vector<std::string> warnings;
};

/**
 * @brief Fits on (X_train, Y_train) and picks lambda2 by RMSPE on (X_val, Y_val)
 *
 * Validation rows are repaired against the training rows when method_xx
 * repairs cells. Ties go to the first (largest) penalty.
 */
CoefficientSelection select_coefficients(const Eigen::MatrixXd& X_train, const Eigen::VectorXd& Y_train,
                                         const Eigen::MatrixXd& X_val, const Eigen::VectorXd& Y_val,
                                         double lambda1,
                                         const std::optional<std::vector<double>>& path,
                                         const CoefficientSelectOptions& options = CoefficientSelectOptions());

} // namespace robscout

#endif // ROBSCOUT_COEFFICIENT_SELECTOR_H
