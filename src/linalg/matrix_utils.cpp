#include "matrix_utils.h"
#include <Eigen/Eigenvalues>
#include <Eigen/SVD>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace robscout {
namespace linalg {

Eigen::MatrixXd sample_covariance(const Eigen::MatrixXd& X) {
    const int n = static_cast<int>(X.rows());
    if (n < 2) {
        throw std::invalid_argument("sample_covariance: at least 2 rows are required");
    }
    Eigen::MatrixXd centered = X.rowwise() - X.colwise().mean();
    return (centered.transpose() * centered) / (n - 1.0);
}

Eigen::MatrixXd sample_correlation(const Eigen::MatrixXd& X) {
    Eigen::MatrixXd S = sample_covariance(X);
    const int p = static_cast<int>(S.rows());
    Eigen::VectorXd sd = S.diagonal().cwiseMax(0.0).cwiseSqrt();

    Eigen::MatrixXd R(p, p);
    for (int j = 0; j < p; ++j) {
        for (int k = 0; k < p; ++k) {
            if (j == k) {
                R(j, k) = 1.0;
            } else if (sd(j) > 0.0 && sd(k) > 0.0) {
                R(j, k) = S(j, k) / (sd(j) * sd(k));
            } else {
                R(j, k) = 0.0;
            }
        }
    }
    return R;
}

Eigen::VectorXd cross_covariance(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
    const int n = static_cast<int>(X.rows());
    if (y.size() != n) {
        throw std::invalid_argument("cross_covariance: X.rows() != y.size()");
    }
    if (n < 2) {
        throw std::invalid_argument("cross_covariance: at least 2 rows are required");
    }
    Eigen::MatrixXd Xc = X.rowwise() - X.colwise().mean();
    Eigen::VectorXd yc = y.array() - y.mean();
    return (Xc.transpose() * yc) / (n - 1.0);
}

Eigen::VectorXd cross_correlation(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
    Eigen::VectorXd c = cross_covariance(X, y);
    const int n = static_cast<int>(X.rows());
    Eigen::VectorXd yc = y.array() - y.mean();
    double sd_y = std::sqrt(yc.squaredNorm() / (n - 1.0));

    Eigen::MatrixXd Xc = X.rowwise() - X.colwise().mean();
    for (int j = 0; j < c.size(); ++j) {
        double sd_x = std::sqrt(Xc.col(j).squaredNorm() / (n - 1.0));
        c(j) = (sd_x > 0.0 && sd_y > 0.0) ? c(j) / (sd_x * sd_y) : 0.0;
    }
    return c;
}

Eigen::MatrixXd nearest_psd(const Eigen::MatrixXd& A, double posd_tol) {
    if (A.rows() != A.cols()) {
        throw std::invalid_argument("nearest_psd: matrix must be square");
    }
    Eigen::MatrixXd sym = 0.5 * (A + A.transpose());
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(sym);
    if (es.info() != Eigen::Success) {
        throw std::runtime_error("nearest_psd: eigendecomposition failed");
    }

    Eigen::VectorXd d = es.eigenvalues();
    double top = d.maxCoeff();
    if (top <= 0.0) {
        // No positive direction at all: fall back to a scaled identity floor.
        return posd_tol * Eigen::MatrixXd::Identity(A.rows(), A.cols());
    }
    double floor = posd_tol * top;
    d = d.cwiseMax(floor);

    const Eigen::MatrixXd& U = es.eigenvectors();
    Eigen::MatrixXd out = U * d.asDiagonal() * U.transpose();
    return 0.5 * (out + out.transpose());
}

double log_determinant(const Eigen::MatrixXd& A, bool& ok) {
    Eigen::LLT<Eigen::MatrixXd> llt(A);
    if (llt.info() != Eigen::Success) {
        ok = false;
        return std::numeric_limits<double>::infinity();
    }
    const Eigen::MatrixXd& L = llt.matrixLLT();
    double logdet = 0.0;
    for (int i = 0; i < L.rows(); ++i) {
        double d = L(i, i);
        if (!(d > 0.0)) {
            ok = false;
            return std::numeric_limits<double>::infinity();
        }
        logdet += std::log(d);
    }
    ok = true;
    return 2.0 * logdet;
}

Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& A, double tol) {
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(A, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& s = svd.singularValues();
    double cutoff = (s.size() > 0) ? tol * s.maxCoeff() : 0.0;

    Eigen::VectorXd s_inv(s.size());
    for (int i = 0; i < s.size(); ++i) {
        s_inv(i) = (s(i) > cutoff) ? 1.0 / s(i) : 0.0;
    }
    return svd.matrixV() * s_inv.asDiagonal() * svd.matrixU().transpose();
}

double max_eigenvalue(const Eigen::MatrixXd& A) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(A, Eigen::EigenvaluesOnly);
    if (es.info() != Eigen::Success) {
        throw std::runtime_error("max_eigenvalue: eigendecomposition failed");
    }
    return es.eigenvalues().maxCoeff();
}

double max_abs_off_diagonal(const Eigen::MatrixXd& A) {
    double m = 0.0;
    for (int j = 0; j < A.cols(); ++j) {
        for (int i = 0; i < A.rows(); ++i) {
            if (i != j) m = std::max(m, std::abs(A(i, j)));
        }
    }
    return m;
}

bool is_off_diag_zero(const Eigen::MatrixXd& A) {
    return max_abs_off_diagonal(A) == 0.0;
}

Eigen::MatrixXd select_rows(const Eigen::MatrixXd& X, const std::vector<int>& idx) {
    Eigen::MatrixXd out(static_cast<int>(idx.size()), X.cols());
    for (size_t i = 0; i < idx.size(); ++i) {
        out.row(static_cast<int>(i)) = X.row(idx[i]);
    }
    return out;
}

Eigen::VectorXd select_rows(const Eigen::VectorXd& y, const std::vector<int>& idx) {
    Eigen::VectorXd out(static_cast<int>(idx.size()));
    for (size_t i = 0; i < idx.size(); ++i) {
        out(static_cast<int>(i)) = y(idx[i]);
    }
    return out;
}

} // namespace linalg
} // namespace robscout
