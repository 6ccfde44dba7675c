/**
 * @file coefficient_solver.h
 * @brief robscout - Penalized regression in covariance form
 *
 * Every solver minimizes, for each penalty lambda on a decreasing path,
 *
 *   0.5 b' S b - c' b + P_lambda(b)
 *
 * where S is a (regularized) predictor covariance and c the predictor /
 * response cross-covariance, so only second moments of the data are used.
 *
 *   CovarianceLasso     : P = lambda ||b||_1          (FISTA, warm starts)
 *   CovarianceRidge     : P = lambda / 2 ||b||_2^2    (b = (S + lambda I)^-1 c)
 *   CovarianceLeastSquares : P = 0                    (b = S^+ c)
 */
#ifndef ROBSCOUT_COEFFICIENT_SOLVER_H
#define ROBSCOUT_COEFFICIENT_SOLVER_H

#include <Eigen/Dense>
#include <memory>
#include <vector>
#include "../graphical/penalty_path.h"
#include "../optimization/proximal_gradient.h"

namespace robscout {

class CoefficientPathSolver {
public:
    virtual ~CoefficientPathSolver() = default;

    /// One coefficient vector per entry of lambdas.
    virtual std::vector<Eigen::VectorXd> solve(const Eigen::MatrixXd& S,
                                               const Eigen::VectorXd& c,
                                               const std::vector<double>& lambdas) const = 0;

    virtual PenaltyNorm norm() const = 0;
};

class CovarianceLasso : public CoefficientPathSolver {
public:
    ProximalGradient optimizer;

    std::vector<Eigen::VectorXd> solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& c,
                                       const std::vector<double>& lambdas) const override;

    PenaltyNorm norm() const override { return PenaltyNorm::L1; }
};

class CovarianceRidge : public CoefficientPathSolver {
public:
    std::vector<Eigen::VectorXd> solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& c,
                                       const std::vector<double>& lambdas) const override;

    PenaltyNorm norm() const override { return PenaltyNorm::L2; }
};

/// Unpenalized fit; every lambda on the path gives the minimum-norm solution.
class CovarianceLeastSquares : public CoefficientPathSolver {
public:
    std::vector<Eigen::VectorXd> solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& c,
                                       const std::vector<double>& lambdas) const override;

    PenaltyNorm norm() const override { return PenaltyNorm::None; }
};

std::shared_ptr<const CoefficientPathSolver> make_coefficient_solver(PenaltyNorm norm);

} // namespace robscout

#endif // ROBSCOUT_COEFFICIENT_SOLVER_H
