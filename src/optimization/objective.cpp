#include "objective.h"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace robscout {

QuadraticObjective::QuadraticObjective(const Eigen::MatrixXd& S, const Eigen::VectorXd& c)
    : S_(S), c_(c), lipschitz_(-1.0) {
    if (S.rows() != S.cols() || S.rows() != c.size()) {
        throw std::invalid_argument("QuadraticObjective: dimension mismatch between S and c");
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(S, Eigen::EigenvaluesOnly);
    if (es.info() == Eigen::Success && es.eigenvalues().size() > 0) {
        const Eigen::VectorXd& d = es.eigenvalues();
        lipschitz_ = std::max(std::abs(d.minCoeff()), std::abs(d.maxCoeff()));
    }
}

} // namespace robscout
