#include "covariance_estimator.h"
#include "../linalg/matrix_utils.h"
#include "../stats/robust_scale.h"
#include <stdexcept>
#include <utility>

namespace robscout {

namespace {

void check_inputs(const Eigen::MatrixXd& X) {
    if (X.cols() < 1) {
        throw std::invalid_argument("Covariance estimation needs at least one column");
    }
    if (X.rows() < 2) {
        throw std::invalid_argument("Covariance estimation needs at least two rows");
    }
}

void check_inputs(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
    check_inputs(X);
    if (y.size() != X.rows()) {
        throw std::invalid_argument("Dimension mismatch: X.rows() != y.size()");
    }
}

CovarianceEstimate plain_estimate(const Eigen::MatrixXd& X, bool correlation) {
    CovarianceEstimate est;
    est.matrix = correlation ? linalg::sample_correlation(X) : linalg::sample_covariance(X);
    return est;
}

CovarianceEstimate plain_estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, bool correlation) {
    CovarianceEstimate est;
    est.matrix = correlation ? linalg::cross_correlation(X, y) : linalg::cross_covariance(X, y);
    return est;
}

} // namespace

// ---------------------------------------------------------------------------
// default
// ---------------------------------------------------------------------------

CovarianceEstimate DefaultCovariance::estimate(const Eigen::MatrixXd& X, bool correlation) const {
    check_inputs(X);
    return plain_estimate(X, correlation);
}

CovarianceEstimate DefaultCovariance::estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                               bool correlation) const {
    check_inputs(X, y);
    return plain_estimate(X, y, correlation);
}

// ---------------------------------------------------------------------------
// winsor
// ---------------------------------------------------------------------------

CovarianceEstimate WinsorCovariance::estimate(const Eigen::MatrixXd& X, bool correlation) const {
    check_inputs(X);
    const int p = static_cast<int>(X.cols());

    stats::Standardization st = stats::fit_standardization(X, stats::ScaleMethod::MedianMad);
    Eigen::MatrixXd Xs = stats::apply_standardization(X, st);

    Eigen::MatrixXd cormat(p, p);
    for (int j = 0; j < p; ++j) {
        cormat(j, j) = 1.0;
        for (int k = j + 1; k < p; ++k) {
            double r = stats::huber_correlation(Xs.col(j), Xs.col(k));
            cormat(j, k) = r;
            cormat(k, j) = r;
        }
    }

    CovarianceEstimate est;
    if (correlation) {
        est.matrix = cormat;
        return est;
    }
    Eigen::MatrixXd cov = st.scale.asDiagonal() * cormat * st.scale.asDiagonal();
    est.matrix = linalg::nearest_psd(cov);
    return est;
}

CovarianceEstimate WinsorCovariance::estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                              bool correlation) const {
    check_inputs(X, y);
    const int p = static_cast<int>(X.cols());

    stats::Standardization st = stats::fit_standardization(X, stats::ScaleMethod::MedianMad);
    Eigen::MatrixXd Xs = stats::apply_standardization(X, st);
    auto [y_center, y_scale] = stats::vector_center_scale(y, stats::ScaleMethod::MedianMad);
    Eigen::VectorXd ys = (y.array() - y_center) / y_scale;

    Eigen::MatrixXd cormat(p, 1);
    for (int j = 0; j < p; ++j) {
        cormat(j, 0) = stats::huber_correlation(Xs.col(j), ys);
    }

    CovarianceEstimate est;
    if (correlation) {
        est.matrix = cormat;
        return est;
    }
    Eigen::VectorXd cov = cormat.col(0).cwiseProduct(st.scale) * y_scale;
    est.matrix = cov;
    return est;
}

// ---------------------------------------------------------------------------
// wrap
// ---------------------------------------------------------------------------

CovarianceEstimate WrapCovariance::estimate(const Eigen::MatrixXd& X, bool correlation) const {
    check_inputs(X);
    Eigen::MatrixXd Xw = stats::wrap_columns(X, stats::estimate_loc_scale(X));
    return plain_estimate(Xw, correlation);
}

CovarianceEstimate WrapCovariance::estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                            bool correlation) const {
    check_inputs(X, y);
    Eigen::MatrixXd Xw = stats::wrap_columns(X, stats::estimate_loc_scale(X));

    Eigen::MatrixXd Y = y;
    Eigen::VectorXd yw = stats::wrap_columns(Y, stats::estimate_loc_scale(Y)).col(0);
    return plain_estimate(Xw, yw, correlation);
}

// ---------------------------------------------------------------------------
// ddc
// ---------------------------------------------------------------------------

CellwiseCovariance::CellwiseCovariance(std::shared_ptr<const stats::CellwiseImputer> imputer)
    : imputer_(std::move(imputer)) {
    if (!imputer_) {
        imputer_ = std::make_shared<stats::DeviatingCellsImputer>();
    }
}

Eigen::MatrixXd CellwiseCovariance::clean(const Eigen::MatrixXd& X,
                                          std::vector<std::string>& warnings) const {
    if (X.cols() < 2) {
        warnings.push_back("Input data X had fewer than 2 columns. Skipping DDC step.");
        return X;
    }
    if (X.rows() < 3) {
        warnings.push_back("Input data X had fewer than 3 rows. Skipping DDC step.");
        return X;
    }
    Eigen::MatrixXd Ximp = imputer_->impute(X);
    if (Ximp.rows() != X.rows() || Ximp.cols() != X.cols()) {
        throw std::runtime_error("Cellwise imputer changed the shape of the data");
    }
    return Ximp;
}

Eigen::MatrixXd CellwiseCovariance::clean_new(const Eigen::MatrixXd& X_ref, const Eigen::MatrixXd& X_new,
                                              std::vector<std::string>& warnings) const {
    if (X_ref.cols() != X_new.cols()) {
        throw std::invalid_argument("Dimension mismatch: X_ref.cols() != X_new.cols()");
    }
    if (X_new.rows() == 0) {
        return X_new;
    }
    Eigen::MatrixXd stacked(X_ref.rows() + X_new.rows(), X_new.cols());
    stacked.topRows(X_ref.rows()) = X_ref;
    stacked.bottomRows(X_new.rows()) = X_new;
    return clean(stacked, warnings).bottomRows(X_new.rows());
}

CovarianceEstimate CellwiseCovariance::estimate(const Eigen::MatrixXd& X, bool correlation) const {
    check_inputs(X);
    std::vector<std::string> warnings;
    Eigen::MatrixXd Ximp = clean(X, warnings);
    CovarianceEstimate est = plain_estimate(Ximp, correlation);
    est.warnings = std::move(warnings);
    return est;
}

CovarianceEstimate CellwiseCovariance::estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                                bool correlation) const {
    check_inputs(X, y);
    std::vector<std::string> warnings;
    Eigen::MatrixXd Ximp = clean(X, warnings);
    CovarianceEstimate est = plain_estimate(Ximp, y, correlation);
    est.warnings = std::move(warnings);
    return est;
}

// ---------------------------------------------------------------------------
// factory
// ---------------------------------------------------------------------------

bool is_known_covariance_method(const std::string& method) {
    return method == "default" || method == "winsor" || method == "wrap" || method == "ddc";
}

std::unique_ptr<CovarianceEstimator> make_covariance_estimator(const std::string& method) {
    if (method == "default") {
        return std::make_unique<DefaultCovariance>();
    } else if (method == "winsor") {
        return std::make_unique<WinsorCovariance>();
    } else if (method == "wrap") {
        return std::make_unique<WrapCovariance>();
    } else if (method == "ddc") {
        return std::make_unique<CellwiseCovariance>();
    }
    throw std::invalid_argument("Unknown covariance method: " + method);
}

CovarianceEstimate estimate_covariance(const Eigen::MatrixXd& X,
                                       const std::optional<Eigen::VectorXd>& y,
                                       const std::string& method,
                                       bool correlation) {
    auto estimator = make_covariance_estimator(method);
    if (y.has_value()) {
        return estimator->estimate(X, y.value(), correlation);
    }
    return estimator->estimate(X, correlation);
}

} // namespace robscout
