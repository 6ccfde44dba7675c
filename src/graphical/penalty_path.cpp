#include "penalty_path.h"
#include "../linalg/matrix_utils.h"
#include <cmath>
#include <stdexcept>

namespace robscout {

PenaltyNorm penalty_norm_from_int(int p) {
    switch (p) {
        case 0: return PenaltyNorm::None;
        case 1: return PenaltyNorm::L1;
        case 2: return PenaltyNorm::L2;
        default:
            throw std::invalid_argument("Unsupported penalty norm: " + std::to_string(p) +
                                        " (expected 0, 1 or 2)");
    }
}

std::string to_string(PenaltyNorm norm) {
    switch (norm) {
        case PenaltyNorm::None: return "none";
        case PenaltyNorm::L1: return "L1";
        case PenaltyNorm::L2: return "L2";
    }
    return "unknown";
}

std::vector<double> log_spaced_path(double lambda_max, int nlambda, double lambda_min_ratio) {
    if (nlambda < 1) {
        throw std::invalid_argument("nlambda must be >= 1");
    }
    if (!(lambda_min_ratio > 0.0 && lambda_min_ratio < 1.0)) {
        throw std::invalid_argument("lambda_min_ratio must lie in (0, 1)");
    }
    if (!std::isfinite(lambda_max) || lambda_max < 0.0) {
        throw std::invalid_argument("lambda_max must be finite and non-negative");
    }

    if (lambda_max == 0.0) return {0.0};
    if (nlambda == 1) return {lambda_max};

    const double hi = std::log(lambda_max);
    const double lo = std::log(lambda_min_ratio * lambda_max);
    std::vector<double> path(nlambda);
    for (int i = 0; i < nlambda; ++i) {
        path[i] = std::exp(hi + (lo - hi) * i / (nlambda - 1.0));
    }
    // Pin both ends exactly so path.back() == ratio * path.front()
    path.front() = lambda_max;
    path.back() = lambda_min_ratio * lambda_max;
    return path;
}

double glasso_lambda_max(const Eigen::MatrixXd& S) {
    if (S.rows() != S.cols()) {
        throw std::invalid_argument("glasso_lambda_max: covariance must be square");
    }
    return linalg::max_abs_off_diagonal(S);
}

std::vector<double> build_glasso_path(const Eigen::MatrixXd& S, int nlambda, double lambda_min_ratio) {
    return log_spaced_path(glasso_lambda_max(S), nlambda, lambda_min_ratio);
}

double ridge_precision_lambda_max(const Eigen::MatrixXd& S) {
    if (S.rows() != S.cols()) {
        throw std::invalid_argument("ridge_precision_lambda_max: covariance must be square");
    }
    double top = linalg::max_eigenvalue(0.5 * (S + S.transpose()));
    return (top > 0.0) ? top * top : 0.0;
}

std::vector<double> build_graph_path(const Eigen::MatrixXd& S, PenaltyNorm norm,
                                     int nlambda, double lambda_min_ratio) {
    switch (norm) {
        case PenaltyNorm::None:
            return {0.0};
        case PenaltyNorm::L1:
            return build_glasso_path(S, nlambda, lambda_min_ratio);
        case PenaltyNorm::L2:
            return log_spaced_path(ridge_precision_lambda_max(S), nlambda, lambda_min_ratio);
    }
    throw std::invalid_argument("build_graph_path: unsupported penalty norm");
}

double lasso_lambda_max(const Eigen::VectorXd& cov_xy) {
    if (cov_xy.size() == 0) {
        throw std::invalid_argument("lasso_lambda_max: empty cross-covariance");
    }
    return cov_xy.cwiseAbs().maxCoeff();
}

double ridge_lambda_max(const Eigen::VectorXd& cov_xy) {
    return lasso_lambda_max(cov_xy) / 1e-3;
}

std::vector<double> build_coefficient_path(const Eigen::VectorXd& cov_xy, PenaltyNorm norm,
                                           int nlambda, double lambda_min_ratio) {
    switch (norm) {
        case PenaltyNorm::None:
            return {0.0};
        case PenaltyNorm::L1:
            return log_spaced_path(lasso_lambda_max(cov_xy), nlambda, lambda_min_ratio);
        case PenaltyNorm::L2:
            return log_spaced_path(ridge_lambda_max(cov_xy), nlambda, lambda_min_ratio);
    }
    throw std::invalid_argument("build_coefficient_path: unsupported penalty norm");
}

void validate_path(const std::vector<double>& path, const std::string& what) {
    if (path.empty()) {
        throw std::invalid_argument(what + ": penalty path is empty");
    }
    for (size_t i = 0; i < path.size(); ++i) {
        if (!std::isfinite(path[i]) || path[i] < 0.0) {
            throw std::invalid_argument(what + ": penalties must be finite and non-negative");
        }
        if (i > 0 && !(path[i] < path[i - 1])) {
            throw std::invalid_argument(what + ": penalties must be strictly decreasing");
        }
    }
}

} // namespace robscout
