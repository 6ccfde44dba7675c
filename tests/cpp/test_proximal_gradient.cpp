#include "optimization/objective.h"
#include "optimization/penalizer.h"
#include "optimization/proximal_gradient.h"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace robscout;

// f(x) = 0.5 ||A x - b||^2 without a Lipschitz hint, to exercise backtracking
class LeastSquares : public Objective {
public:
    LeastSquares(const Eigen::MatrixXd& A, const Eigen::VectorXd& b) : A_(A), b_(b) {}

    double value(const Eigen::VectorXd& x) const override {
        return 0.5 * (A_ * x - b_).squaredNorm();
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return A_.transpose() * (A_ * x - b_);
    }

private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd b_;
};

int main() {
    std::cout << "--- Proximal Gradient Test ---" << std::endl;

    // Soft thresholding
    assert(L1Penalty::soft_threshold(3.0, 1.0) == 2.0);
    assert(L1Penalty::soft_threshold(-3.0, 1.0) == -2.0);
    assert(L1Penalty::soft_threshold(0.5, 1.0) == 0.0);
    assert(L1Penalty::soft_threshold(-1.0, 1.0) == 0.0);

    // Quadratic objective: Lipschitz bound is the top eigenvalue
    Eigen::MatrixXd S(3, 3);
    S << 4.0, 1.0, 0.0,
         1.0, 3.0, 0.5,
         0.0, 0.5, 2.0;
    Eigen::VectorXd c(3);
    c << 1.0, -2.0, 0.3;
    QuadraticObjective quad(S, c);
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(S);
    assert(std::abs(quad.lipschitz_bound() - es.eigenvalues().maxCoeff()) < 1e-10);
    assert(quad.dimension() == 3);

    // Zero penalty: converges to S^-1 c
    {
        ProximalGradient pg;
        L1Penalty none(0.0);
        OptimizerResult res = pg.minimize(quad, none, Eigen::VectorXd::Zero(3));
        assert(res.converged);
        assert((res.x - S.ldlt().solve(c)).cwiseAbs().maxCoeff() < 1e-6);
        std::cout << "unpenalized: " << res.iterations << " iterations" << std::endl;
    }

    // L1 penalty: KKT conditions
    {
        const double lambda = 0.8;
        ProximalGradient pg;
        L1Penalty l1(lambda);
        OptimizerResult res = pg.minimize(quad, l1, Eigen::VectorXd::Zero(3));
        assert(res.converged);
        Eigen::VectorXd g = quad.gradient(res.x);
        for (int j = 0; j < 3; ++j) {
            if (res.x(j) != 0.0) {
                assert(std::abs(g(j) + lambda * (res.x(j) > 0 ? 1.0 : -1.0)) < 1e-5);
            } else {
                assert(std::abs(g(j)) <= lambda + 1e-6);
            }
        }
        std::cout << "lasso x = " << res.x.transpose() << std::endl;

        // ISTA reaches the same point
        ProximalGradient ista;
        ista.use_fista = false;
        ista.max_iter = 50000;
        OptimizerResult slow = ista.minimize(quad, l1, Eigen::VectorXd::Zero(3));
        assert((slow.x - res.x).cwiseAbs().maxCoeff() < 1e-5);
    }

    // Backtracking from a too-large initial step
    {
        Eigen::MatrixXd A(4, 2);
        A << 10.0, 0.0,
              0.0, 1.0,
              1.0, 1.0,
              2.0, -1.0;
        Eigen::VectorXd b(4);
        b << 1.0, 2.0, 3.0, 4.0;
        LeastSquares ls(A, b);
        assert(ls.lipschitz_bound() < 0.0);

        ProximalGradient pg;
        pg.initial_step = 10.0;
        L1Penalty none(0.0);
        OptimizerResult res = pg.minimize(ls, none, Eigen::VectorXd::Zero(2));
        Eigen::VectorXd expected = A.colPivHouseholderQr().solve(b);
        assert((res.x - expected).cwiseAbs().maxCoeff() < 1e-5);
    }

    std::cout << "Proximal Gradient Test Passed!" << std::endl;
    return 0;
}
