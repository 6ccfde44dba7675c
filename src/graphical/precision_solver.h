/**
 * @file precision_solver.h
 * @brief robscout - Regularized precision-matrix path solvers
 *
 * A PrecisionPathSolver maps a covariance estimate S and a decreasing
 * penalty sequence to one precision candidate per penalty. The sequence the
 * solver actually used is returned with the candidates; callers must read
 * it from the result rather than assume their request was used verbatim.
 *
 *   GraphicalLasso  : min -log|T| + tr(S T) + lambda ||T||_1
 *                     (block coordinate descent, Friedman et al. 2008)
 *   RidgePrecision  : min -log|T| + tr(S T) + lambda ||T||_F^2
 *                     (closed form through the eigendecomposition of S)
 */
#ifndef ROBSCOUT_PRECISION_SOLVER_H
#define ROBSCOUT_PRECISION_SOLVER_H

#include <Eigen/Dense>
#include <memory>
#include <vector>
#include "penalty_path.h"

namespace robscout {

struct PrecisionPath {
    std::vector<double> lambdas;               // realized penalty sequence
    std::vector<Eigen::MatrixXd> precision;    // one candidate per penalty
    std::vector<Eigen::MatrixXd> covariance;   // regularized covariance (inverse of precision)
};

class PrecisionPathSolver {
public:
    virtual ~PrecisionPathSolver() = default;

    /// Candidates for an explicit decreasing sequence.
    virtual PrecisionPath solve(const Eigen::MatrixXd& S, const std::vector<double>& lambdas) const = 0;

    virtual PenaltyNorm norm() const = 0;

    /// Candidates for a sequence the solver derives from S.
    PrecisionPath solve_path(const Eigen::MatrixXd& S, int nlambda, double lambda_min_ratio) const {
        return solve(S, build_graph_path(S, norm(), nlambda, lambda_min_ratio));
    }
};

/**
 * @brief Graphical lasso along a decreasing path
 *
 * Each penalty is warm-started from the previous solution when that W is
 * still positive definite under the new diagonal S + lambda; otherwise, or
 * if the warm run breaks down, it restarts from W = S + lambda I.
 */
class GraphicalLasso : public PrecisionPathSolver {
public:
    int max_iter = 100;          // outer sweeps over columns
    double tol = 1e-4;           // relative mean absolute change in W
    int inner_max_iter = 1000;   // coordinate descent passes per column
    double inner_tol = 1e-6;

    PrecisionPath solve(const Eigen::MatrixXd& S, const std::vector<double>& lambdas) const override;

    PenaltyNorm norm() const override { return PenaltyNorm::L1; }
};

class RidgePrecision : public PrecisionPathSolver {
public:
    PrecisionPath solve(const Eigen::MatrixXd& S, const std::vector<double>& lambdas) const override;

    PenaltyNorm norm() const override { return PenaltyNorm::L2; }
};

/// Default solver for L1 / L2. PenaltyNorm::None has no solver and throws.
std::shared_ptr<const PrecisionPathSolver> make_precision_solver(PenaltyNorm norm);

/**
 * @brief Regularized covariance for a single graph penalty
 *
 * Returns S itself for PenaltyNorm::None or lambda == 0, otherwise the
 * inverse of the solver's precision estimate at lambda.
 */
Eigen::MatrixXd regularized_covariance(const Eigen::MatrixXd& S, PenaltyNorm norm, double lambda,
                                       const PrecisionPathSolver* solver = nullptr);

} // namespace robscout

#endif // ROBSCOUT_PRECISION_SOLVER_H
