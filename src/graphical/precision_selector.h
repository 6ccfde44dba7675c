/**
 * @file precision_selector.h
 * @brief robscout - Graph-stage penalty selection
 *
 * Fits a path of regularized precision matrices to a (robust) covariance
 * estimate and picks one penalty, either by an information criterion on a
 * single sample or by K-fold cross-validation of the held-out likelihood.
 *
 * Criteria (n = rows of the training data, p = columns):
 *   loglik : -log|T| + tr(T S)
 *   bic    : loglik + log(n)/n * E        E     = #{i >= j : |T_ij| > 1e-8}
 *   ebic   : loglik + log(n)/n * E_off
 *                   + E_off * 4 * gamma * log(p) / n,   gamma = 0.5,
 *                                         E_off = #{i >  j : |T_ij| > 1e-8}
 * A candidate that is not positive definite scores +inf.
 */
#ifndef ROBSCOUT_PRECISION_SELECTOR_H
#define ROBSCOUT_PRECISION_SELECTOR_H

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "penalty_path.h"
#include "precision_solver.h"
#include "../stats/robust_scale.h"
#include "../validation/folds.h"

namespace robscout {

enum class Criterion {
    LogLik,
    Bic,
    Ebic
};

/// "loglik" / "bic" / "ebic"; anything else throws std::invalid_argument("unsupported criterion").
Criterion criterion_from_string(const std::string& name);

std::string to_string(Criterion criterion);

/// Entries with |T_ij| above this count as edges.
constexpr double kEdgeTolerance = 1e-8;

/// EBIC graph-size weight.
constexpr double kEbicGamma = 0.5;

/**
 * @brief Score of one precision candidate
 * @param Theta Candidate precision matrix (p x p)
 * @param Sigma Covariance the candidate is evaluated against
 * @param n Number of rows the candidate was fitted on
 * @return Criterion value (lower is better), +inf if Theta is not PD
 */
double criterion_score(const Eigen::MatrixXd& Theta, const Eigen::MatrixXd& Sigma, int n,
                       Criterion criterion);

double criterion_score(const Eigen::MatrixXd& Theta, const Eigen::MatrixXd& Sigma, int n,
                       const std::string& criterion);

struct PrecisionSelectOptions {
    std::string method = "default";        // covariance strategy
    std::string criterion = "ebic";
    PenaltyNorm norm = PenaltyNorm::L1;    // L1 (graphical lasso) or L2 (ridge)
    int nlambda = 100;
    double lambda_min_ratio = 0.1;
    std::optional<std::vector<double>> lambdas;   // caller-supplied path
    bool standardize = false;
    stats::ScaleMethod scaling = stats::ScaleMethod::MeanSd;
    std::shared_ptr<const PrecisionPathSolver> solver;   // nullptr -> default for norm
    bool verbose = false;
};

struct PrecisionSelection {
    Eigen::MatrixXd precision;         // candidate at best_penalty
    Eigen::MatrixXd covariance;        // its inverse (regularized covariance)
    double best_penalty = 0.0;
    int best_index = 0;
    std::vector<double> path;          // realized penalty sequence
    std::vector<double> scores;        // one per penalty
    Eigen::MatrixXd input_covariance;  // unregularized estimate the path was fitted to
    std::vector<std::string> warnings;
};

/**
 * @brief Information-criterion selection on one sample
 *
 * When X_test is given the candidates are scored against its covariance
 * (standardized with X's center/scale if requested); n stays rows(X).
 */
PrecisionSelection select_precision(const Eigen::MatrixXd& X,
                                    const std::optional<Eigen::MatrixXd>& X_test,
                                    const PrecisionSelectOptions& options = PrecisionSelectOptions());

struct PrecisionCVResult {
    Eigen::MatrixXd precision;         // full-data candidate at best_penalty
    Eigen::MatrixXd covariance;
    double best_penalty = 0.0;
    int best_index = 0;
    std::vector<double> path;          // built from the full-data covariance
    Eigen::MatrixXd fold_scores;       // path.size() x K
    Eigen::VectorXd mean_scores;       // row means of fold_scores
    FoldAssignment folds;
    std::vector<std::string> warnings;
};

/**
 * @brief K-fold cross-validated graph penalty
 *
 * The path comes from the full-data covariance. Each fold fits the path on
 * its held-in rows and scores every candidate against the held-out
 * covariance; the penalty with the smallest mean score is refitted on all
 * rows. Folds run in parallel when OpenMP is available (n_jobs <= 0 uses
 * every core); results do not depend on the thread count.
 */
PrecisionCVResult cross_validate_precision(const Eigen::MatrixXd& X,
                                           const FoldAssignment& folds,
                                           const PrecisionSelectOptions& options = PrecisionSelectOptions(),
                                           int n_jobs = 1);

} // namespace robscout

#endif // ROBSCOUT_PRECISION_SELECTOR_H
