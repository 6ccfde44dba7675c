#include "precision_solver.h"
#include "../linalg/matrix_utils.h"
#include "../optimization/penalizer.h"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace robscout {

namespace {

void check_square(const Eigen::MatrixXd& S) {
    if (S.rows() == 0 || S.rows() != S.cols()) {
        throw std::invalid_argument("Precision solver: covariance must be a non-empty square matrix");
    }
    if (!S.allFinite()) {
        throw std::invalid_argument("Precision solver: covariance contains non-finite values");
    }
}

/**
 * Lasso sub-problem for column j:
 *   min_b 0.5 b' W11 b - s12' b + lambda ||b||_1
 * where W11 is W without row/column j and s12 = S(-j, j).
 * beta has length p with beta(j) == 0; it is used as a warm start.
 */
void lasso_column(const Eigen::MatrixXd& W, const Eigen::MatrixXd& S, int j, double lambda,
                  Eigen::VectorXd& beta, int max_iter, double tol) {
    const int p = static_cast<int>(W.rows());
    Eigen::VectorXd wb = W * beta;  // W11 b on the indices != j

    for (int iter = 0; iter < max_iter; ++iter) {
        double max_change = 0.0;
        for (int k = 0; k < p; ++k) {
            if (k == j) continue;
            const double wkk = W(k, k);
            const double r = S(k, j) - (wb(k) - wkk * beta(k));
            const double b_new = (wkk > 0.0) ? L1Penalty::soft_threshold(r, lambda) / wkk : 0.0;
            const double delta = b_new - beta(k);
            if (delta != 0.0) {
                wb += W.col(k) * delta;
                beta(k) = b_new;
                max_change = std::max(max_change, std::abs(delta));
            }
        }
        if (max_change < tol) break;
    }
}

/**
 * Block coordinate descent at one penalty from the starting point (W, B).
 * Returns false if the iterates leave the positive-definite cone; W, B and
 * Theta are then unusable.
 */
bool glasso_fit(const GraphicalLasso& opt, const Eigen::MatrixXd& S, double lambda, double scale,
                Eigen::MatrixXd& W, Eigen::MatrixXd& B, Eigen::MatrixXd& Theta) {
    const int p = static_cast<int>(S.rows());
    for (int sweep = 0; sweep < opt.max_iter; ++sweep) {
        Eigen::MatrixXd W_old = W;
        for (int j = 0; j < p; ++j) {
            Eigen::VectorXd beta = B.col(j);
            beta(j) = 0.0;
            lasso_column(W, S, j, lambda, beta, opt.inner_max_iter, opt.inner_tol);
            B.col(j) = beta;

            Eigen::VectorXd w12 = W * beta;
            for (int k = 0; k < p; ++k) {
                if (k == j) continue;
                W(k, j) = w12(k);
                W(j, k) = w12(k);
            }
        }
        if (!W.allFinite()) return false;
        double mean_change = (W - W_old).cwiseAbs().sum() / (static_cast<double>(p) * p);
        if (mean_change < opt.tol * scale) break;
    }

    Theta = Eigen::MatrixXd::Zero(p, p);
    for (int j = 0; j < p; ++j) {
        Eigen::VectorXd beta = B.col(j);
        beta(j) = 0.0;
        double denom = W(j, j) - W.col(j).dot(beta);
        if (!(denom > 0.0)) return false;
        const double theta_jj = 1.0 / denom;
        Theta.col(j) = -beta * theta_jj;
        Theta(j, j) = theta_jj;
    }
    Theta = 0.5 * (Theta + Theta.transpose());
    return true;
}

void cold_start(const Eigen::MatrixXd& S, double lambda, Eigen::MatrixXd& W, Eigen::MatrixXd& B) {
    W = S;
    W.diagonal() = S.diagonal().array() + lambda;
    B.setZero();
}

} // namespace

// ---------------------------------------------------------------------------
// Graphical lasso
// ---------------------------------------------------------------------------

PrecisionPath GraphicalLasso::solve(const Eigen::MatrixXd& S, const std::vector<double>& lambdas) const {
    check_square(S);
    validate_path(lambdas, "GraphicalLasso");

    const int p = static_cast<int>(S.rows());
    double scale = 0.0;
    if (p > 1) {
        scale = (S.cwiseAbs().sum() - S.diagonal().cwiseAbs().sum()) / (p * (p - 1.0));
    }
    if (scale <= 0.0) scale = 1.0;

    PrecisionPath out;
    out.lambdas = lambdas;

    Eigen::MatrixXd W = S;
    Eigen::MatrixXd B = Eigen::MatrixXd::Zero(p, p);  // column j: regression of node j on the rest
    Eigen::MatrixXd Theta;

    for (double lambda : lambdas) {
        if (lambda == 0.0 && (S.diagonal().array() <= 0.0).any()) {
            throw std::runtime_error("GraphicalLasso: unpenalized fit needs a positive diagonal");
        }

        // Warm start from the previous penalty while its W, with the new
        // diagonal, is still positive definite.
        bool warm = !out.precision.empty();
        if (warm) {
            W.diagonal() = S.diagonal().array() + lambda;
            warm = Eigen::LLT<Eigen::MatrixXd>(W).info() == Eigen::Success;
        }
        if (!warm) {
            cold_start(S, lambda, W, B);
        }

        bool ok = glasso_fit(*this, S, lambda, scale, W, B, Theta);
        if (!ok && warm) {
            cold_start(S, lambda, W, B);
            ok = glasso_fit(*this, S, lambda, scale, W, B, Theta);
        }
        if (!ok) {
            throw std::runtime_error("GraphicalLasso: estimate is not positive definite at lambda = " +
                                     std::to_string(lambda));
        }

        out.precision.push_back(Theta);
        out.covariance.push_back(W);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Ridge precision
// ---------------------------------------------------------------------------

PrecisionPath RidgePrecision::solve(const Eigen::MatrixXd& S, const std::vector<double>& lambdas) const {
    check_square(S);
    validate_path(lambdas, "RidgePrecision");

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(0.5 * (S + S.transpose()));
    if (es.info() != Eigen::Success) {
        throw std::runtime_error("RidgePrecision: eigendecomposition failed");
    }
    const Eigen::MatrixXd& U = es.eigenvectors();
    const Eigen::VectorXd& d = es.eigenvalues();

    PrecisionPath out;
    out.lambdas = lambdas;
    for (double lambda : lambdas) {
        if (lambda == 0.0) {
            out.precision.push_back(linalg::pseudo_inverse(S));
            out.covariance.push_back(S);
            continue;
        }
        // Stationarity: 2 lambda theta^2 + d theta - 1 = 0 per eigen-direction
        Eigen::VectorXd sigma(d.size());
        for (int i = 0; i < d.size(); ++i) {
            sigma(i) = 0.5 * (d(i) + std::sqrt(d(i) * d(i) + 8.0 * lambda));
        }
        Eigen::VectorXd theta = sigma.cwiseInverse();
        out.precision.push_back(U * theta.asDiagonal() * U.transpose());
        out.covariance.push_back(U * sigma.asDiagonal() * U.transpose());
    }
    return out;
}

// ---------------------------------------------------------------------------

std::shared_ptr<const PrecisionPathSolver> make_precision_solver(PenaltyNorm norm) {
    switch (norm) {
        case PenaltyNorm::L1: return std::make_shared<GraphicalLasso>();
        case PenaltyNorm::L2: return std::make_shared<RidgePrecision>();
        case PenaltyNorm::None: break;
    }
    throw std::invalid_argument("No precision solver for penalty norm " + to_string(norm));
}

Eigen::MatrixXd regularized_covariance(const Eigen::MatrixXd& S, PenaltyNorm norm, double lambda,
                                       const PrecisionPathSolver* solver) {
    if (norm == PenaltyNorm::None || lambda == 0.0) {
        return S;
    }
    if (solver != nullptr) {
        return solver->solve(S, {lambda}).covariance.front();
    }
    return make_precision_solver(norm)->solve(S, {lambda}).covariance.front();
}

} // namespace robscout
