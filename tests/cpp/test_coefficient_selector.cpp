#include "linear_model/coefficient_selector.h"
#include "linear_model/coefficient_solver.h"
#include "optimization/penalizer.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace robscout;

struct Sample {
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
};

// y = 3 x0 - 2 x2 + noise, other columns irrelevant
static Sample sparse_sample(int n, int p, double noise, std::mt19937& gen) {
    std::normal_distribution<double> N(0.0, 1.0);
    Sample s;
    s.X.resize(n, p);
    s.y.resize(n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < p; ++j) s.X(i, j) = 5.0 + 2.0 * N(gen);
        s.y(i) = 10.0 + 3.0 * s.X(i, 0) - 2.0 * s.X(i, 2) + noise * N(gen);
    }
    return s;
}

// Returns the first unit vector for every penalty
class FirstAxisSolver : public CoefficientPathSolver {
public:
    std::vector<Eigen::VectorXd> solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& /*c*/,
                                       const std::vector<double>& lambdas) const override {
        return std::vector<Eigen::VectorXd>(lambdas.size(), Eigen::VectorXd::Unit(S.rows(), 0));
    }

    PenaltyNorm norm() const override { return PenaltyNorm::L1; }
};

int main() {
    std::cout << "--- Coefficient Selector Test ---" << std::endl;
    std::mt19937 gen(99);

    // Lasso on an identity covariance is soft thresholding
    {
        Eigen::MatrixXd S = Eigen::MatrixXd::Identity(4, 4);
        Eigen::VectorXd c(4);
        c << 1.0, -0.3, 0.05, 2.0;
        CovarianceLasso lasso;
        std::vector<Eigen::VectorXd> path = lasso.solve(S, c, {0.5, 0.1});
        for (int j = 0; j < 4; ++j) {
            assert(std::abs(path[0](j) - L1Penalty::soft_threshold(c(j), 0.5)) < 1e-6);
            assert(std::abs(path[1](j) - L1Penalty::soft_threshold(c(j), 0.1)) < 1e-6);
        }
        assert(path[0](1) == 0.0 && path[0](2) == 0.0);
    }

    // Ridge closed form and unpenalized minimum-norm solution
    {
        Eigen::MatrixXd A = Eigen::MatrixXd::Random(6, 3);
        Eigen::MatrixXd S = A.transpose() * A;
        Eigen::VectorXd c = Eigen::VectorXd::Random(3);

        CovarianceRidge ridge;
        std::vector<Eigen::VectorXd> path = ridge.solve(S, c, {2.0, 0.0});
        Eigen::VectorXd expected = (S + 2.0 * Eigen::MatrixXd::Identity(3, 3)).ldlt().solve(c);
        assert((path[0] - expected).cwiseAbs().maxCoeff() < 1e-10);
        assert((path[1] - S.ldlt().solve(c)).cwiseAbs().maxCoeff() < 1e-6);

        // Rank-deficient S: pseudo-inverse answer
        Eigen::MatrixXd S2 = Eigen::MatrixXd::Zero(3, 3);
        S2(0, 0) = 2.0;
        Eigen::VectorXd c2(3);
        c2 << 4.0, 0.0, 0.0;
        CovarianceLeastSquares ls;
        Eigen::VectorXd b = ls.solve(S2, c2, {0.0}).front();
        assert(std::abs(b(0) - 2.0) < 1e-12 && b(1) == 0.0 && b(2) == 0.0);

        assert(make_coefficient_solver(PenaltyNorm::L1)->norm() == PenaltyNorm::L1);
        assert(make_coefficient_solver(PenaltyNorm::None)->norm() == PenaltyNorm::None);
    }

    // Coefficient path on one split, mapped back to the original scale
    {
        Sample train = sparse_sample(200, 5, 0.5, gen);
        CoefficientSelectOptions opt;
        opt.graph_norm = PenaltyNorm::None;
        opt.coef_norm = PenaltyNorm::None;
        opt.rescale = false;
        CoefficientPath fitted = fit_coefficient_path(train.X, train.y, 0.0, std::nullopt, opt);
        assert(fitted.path.size() == 1 && fitted.path[0] == 0.0);

        // Unpenalized fit on standardized data equals OLS
        Eigen::VectorXd b = fitted.original_coefficients(0);
        Eigen::MatrixXd Xd(train.X.rows(), 6);
        Xd.col(0).setOnes();
        Xd.rightCols(5) = train.X;
        Eigen::VectorXd ols = Xd.colPivHouseholderQr().solve(train.y);
        assert((b - ols.tail(5)).cwiseAbs().maxCoeff() < 1e-6);
        assert(std::abs(fitted.intercept(0) - ols(0)) < 1e-6);
        std::cout << "unpenalized b = " << b.transpose() << std::endl;
    }

    // Held-out selection
    {
        Sample train = sparse_sample(80, 10, 1.0, gen);
        Sample val = sparse_sample(80, 10, 1.0, gen);
        CoefficientSelectOptions opt;
        opt.nlambda = 20;
        CoefficientSelection sel = select_coefficients(train.X, train.y, val.X, val.y, 0.05, std::nullopt, opt);

        assert(sel.path.size() == 20);
        assert(sel.errors.size() == 20);
        assert(sel.path[sel.best_index] == sel.best_penalty);
        double best = *std::min_element(sel.errors.begin(), sel.errors.end());
        assert(sel.errors[sel.best_index] == best);
        for (int i = 0; i < sel.best_index; ++i) assert(sel.errors[i] > best);
        // The all-zero fit at lambda_max predicts the mean only
        assert(sel.errors.front() > 2.0 * best);
        assert(std::abs(sel.coefficients(0) - 3.0) < 0.6);
        assert(std::abs(sel.coefficients(2) + 2.0) < 0.6);
        std::cout << "lambda2 = " << sel.best_penalty << ", RMSPE = " << best
                  << ", b = " << sel.coefficients.transpose() << std::endl;

        // Supplied path and robust covariance strategies
        opt.method_xx = "wrap";
        opt.method_xy = "winsor";
        opt.coef_norm = PenaltyNorm::L2;
        opt.graph_norm = PenaltyNorm::L2;
        opt.scaling = stats::ScaleMethod::MedianMad;
        std::vector<double> path = {10.0, 1.0, 0.1};
        CoefficientSelection robust = select_coefficients(train.X, train.y, val.X, val.y, 0.1, path, opt);
        assert(robust.path == path);
        assert(std::isfinite(robust.errors[robust.best_index]));
    }

    // Rescaling restores the scale shrunk away by the penalty
    {
        Sample train = sparse_sample(100, 4, 0.1, gen);
        CoefficientSelectOptions opt;
        opt.graph_norm = PenaltyNorm::None;
        std::vector<double> path = {0.3};

        opt.rescale = false;
        Eigen::VectorXd shrunk = fit_coefficient_path(train.X, train.y, 0.0, path, opt).original_coefficients(0);
        opt.rescale = true;
        Eigen::VectorXd rescaled = fit_coefficient_path(train.X, train.y, 0.0, path, opt).original_coefficients(0);
        assert(std::abs(rescaled(0)) > std::abs(shrunk(0)));
        assert(std::abs(rescaled(0) - 3.0) < std::abs(shrunk(0) - 3.0));
    }

    // A candidate along a zero-variance direction cannot be rescaled; the fit says so
    {
        Sample train = sparse_sample(40, 4, 1.0, gen);
        train.X.col(0).setConstant(1.0);
        CoefficientSelectOptions opt;
        opt.graph_norm = PenaltyNorm::None;
        opt.coefficient_solver = std::make_shared<FirstAxisSolver>();
        CoefficientPath fitted = fit_coefficient_path(train.X, train.y, 0.0, std::vector<double>{0.5, 0.1}, opt);
        assert(fitted.coefficients[0](0) == 1.0);
        assert(fitted.warnings.size() == 1);
        assert(fitted.warnings[0].find("rescaling skipped for 2") != std::string::npos);

        // An all-zero candidate needs no rescaling and is not reported
        CoefficientSelectOptions lasso;
        lasso.graph_norm = PenaltyNorm::None;
        Sample clean = sparse_sample(60, 4, 1.0, gen);
        CoefficientPath zero = fit_coefficient_path(clean.X, clean.y, 0.0, std::nullopt, lasso);
        assert(zero.coefficients.front().isZero(0.0));
        assert(zero.warnings.empty());
    }

    // Cell-repaired validation rows: a gross outlier in X_val does not decide lambda2
    {
        Sample train = sparse_sample(80, 6, 1.0, gen);
        Sample val = sparse_sample(40, 6, 1.0, gen);
        val.X(3, 0) = 500.0;
        CoefficientSelectOptions opt;
        opt.nlambda = 10;
        opt.method_xx = "ddc";
        opt.method_xy = "ddc";
        opt.scaling = stats::ScaleMethod::MedianMad;
        CoefficientSelection sel = select_coefficients(train.X, train.y, val.X, val.y, 0.0, std::nullopt, opt);
        assert(sel.best_index > 0);
        assert(std::abs(sel.coefficients(0) - 3.0) < 0.6);
        std::cout << "ddc validation: lambda2 = " << sel.best_penalty
                  << ", RMSPE = " << sel.errors[sel.best_index] << std::endl;
    }

    // Mismatched inputs
    {
        Sample train = sparse_sample(30, 3, 1.0, gen);
        bool threw = false;
        try {
            select_coefficients(train.X, train.y, Eigen::MatrixXd::Zero(5, 2), Eigen::VectorXd::Zero(5), 0.0,
                                std::nullopt, CoefficientSelectOptions());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            fit_coefficient_path(train.X, train.y.head(20), 0.0, std::nullopt, CoefficientSelectOptions());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "Coefficient Selector Test Passed!" << std::endl;
    return 0;
}
