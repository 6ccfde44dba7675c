#include "coefficient_solver.h"
#include "../linalg/matrix_utils.h"
#include "../optimization/objective.h"
#include "../optimization/penalizer.h"
#include <Eigen/Eigenvalues>
#include <stdexcept>

namespace robscout {

namespace {

void check_system(const Eigen::MatrixXd& S, const Eigen::VectorXd& c, const std::vector<double>& lambdas,
                  const char* who) {
    if (S.rows() != S.cols() || S.rows() != c.size() || c.size() == 0) {
        throw std::invalid_argument(std::string(who) + ": S must be p x p and c of length p");
    }
    validate_path(lambdas, who);
}

} // namespace

std::vector<Eigen::VectorXd> CovarianceLasso::solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& c,
                                                     const std::vector<double>& lambdas) const {
    check_system(S, c, lambdas, "CovarianceLasso");

    QuadraticObjective objective(S, c);
    std::vector<Eigen::VectorXd> out;
    out.reserve(lambdas.size());

    Eigen::VectorXd beta = Eigen::VectorXd::Zero(c.size());
    for (double lambda : lambdas) {
        if (lambda == 0.0) {
            beta = linalg::pseudo_inverse(S) * c;
        } else {
            L1Penalty penalty(lambda);
            OptimizerResult res = optimizer.minimize(objective, penalty, beta);
            beta = res.x;
        }
        out.push_back(beta);
    }
    return out;
}

std::vector<Eigen::VectorXd> CovarianceRidge::solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& c,
                                                     const std::vector<double>& lambdas) const {
    check_system(S, c, lambdas, "CovarianceRidge");

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(0.5 * (S + S.transpose()));
    if (es.info() != Eigen::Success) {
        throw std::runtime_error("CovarianceRidge: eigendecomposition failed");
    }
    const Eigen::MatrixXd& U = es.eigenvectors();
    const Eigen::VectorXd& d = es.eigenvalues();
    const Eigen::VectorXd Utc = U.transpose() * c;

    std::vector<Eigen::VectorXd> out;
    out.reserve(lambdas.size());
    for (double lambda : lambdas) {
        if (lambda == 0.0) {
            out.push_back(linalg::pseudo_inverse(S) * c);
            continue;
        }
        Eigen::VectorXd shrink(d.size());
        for (int i = 0; i < d.size(); ++i) {
            const double denom = d(i) + lambda;
            shrink(i) = (denom > 0.0) ? Utc(i) / denom : 0.0;
        }
        out.push_back(U * shrink);
    }
    return out;
}

std::vector<Eigen::VectorXd> CovarianceLeastSquares::solve(const Eigen::MatrixXd& S, const Eigen::VectorXd& c,
                                                           const std::vector<double>& lambdas) const {
    check_system(S, c, lambdas, "CovarianceLeastSquares");
    Eigen::VectorXd beta = linalg::pseudo_inverse(S) * c;
    return std::vector<Eigen::VectorXd>(lambdas.size(), beta);
}

std::shared_ptr<const CoefficientPathSolver> make_coefficient_solver(PenaltyNorm norm) {
    switch (norm) {
        case PenaltyNorm::L1: return std::make_shared<CovarianceLasso>();
        case PenaltyNorm::L2: return std::make_shared<CovarianceRidge>();
        case PenaltyNorm::None: return std::make_shared<CovarianceLeastSquares>();
    }
    throw std::invalid_argument("No coefficient solver for penalty norm " + to_string(norm));
}

} // namespace robscout
