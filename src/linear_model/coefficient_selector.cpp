#include "coefficient_selector.h"
#include "../covariance/covariance_estimator.h"
#include "../validation/folds.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace robscout {

namespace {

struct StandardizedSplit {
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    stats::Standardization x_st;
    double y_center = 0.0;
    double y_scale = 1.0;
    bool cleaned = false;
    std::vector<std::string> warnings;
};

// Cell-repairing strategies clean X before the center and scale are fitted.
// Without standardization the data are still centered so the intercept is well defined.
StandardizedSplit standardize_split(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                    const CovarianceEstimator& est_xx,
                                    const CoefficientSelectOptions& options) {
    if (X.rows() != y.size()) {
        throw std::invalid_argument("Coefficient stage: rows(X) must equal length(y)");
    }
    if (X.rows() < 2 || X.cols() < 1) {
        throw std::invalid_argument("Coefficient stage: X needs at least 2 rows and 1 column");
    }

    StandardizedSplit out;
    out.cleaned = est_xx.repairs_cells();
    const Eigen::MatrixXd X_work = out.cleaned ? est_xx.clean(X, out.warnings) : X;

    out.x_st = stats::fit_standardization(X_work, options.scaling);
    auto yc = stats::vector_center_scale(y, options.scaling);
    out.y_center = yc.first;
    out.y_scale = yc.second;
    if (!options.standardize) {
        out.x_st.scale.setOnes();
        out.y_scale = 1.0;
    }
    out.X = stats::apply_standardization(X_work, out.x_st);
    out.y = (y.array() - out.y_center) / out.y_scale;
    return out;
}

// Estimator for moments of the split: a cleaned matrix only needs ordinary ones.
const CovarianceEstimator& moments_for(const CovarianceEstimator& est, const StandardizedSplit& split,
                                       const CovarianceEstimator& plain) {
    return (split.cleaned && est.repairs_cells()) ? plain : est;
}

void append(std::vector<std::string>& dst, const std::vector<std::string>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

Eigen::VectorXd CoefficientPath::original_coefficients(int i) const {
    return coefficients.at(i).cwiseQuotient(x_scale) * y_scale;
}

double CoefficientPath::intercept(int i) const {
    return y_center - x_center.dot(original_coefficients(i));
}

Eigen::VectorXd CoefficientPath::predict(const Eigen::MatrixXd& X, int i) const {
    if (X.cols() != x_center.size()) {
        throw std::invalid_argument("CoefficientPath::predict: column count mismatch");
    }
    Eigen::VectorXd yhat = X * original_coefficients(i);
    yhat.array() += intercept(i);
    return yhat;
}

Eigen::VectorXd standardized_cross_covariance(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                              const CoefficientSelectOptions& options,
                                              std::vector<std::string>* warnings) {
    auto est_xx = make_covariance_estimator(options.method_xx);
    auto est_xy = make_covariance_estimator(options.method_xy);
    StandardizedSplit split = standardize_split(X, y, *est_xx, options);
    DefaultCovariance plain;
    CovarianceEstimate cxy = moments_for(*est_xy, split, plain).estimate(split.X, split.y);
    if (warnings) {
        append(*warnings, split.warnings);
        append(*warnings, cxy.warnings);
    }
    return cxy.vector();
}

CoefficientPath fit_coefficient_path(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, double lambda1,
                                     const std::optional<std::vector<double>>& path,
                                     const CoefficientSelectOptions& options) {
    if (!(lambda1 >= 0.0) || !std::isfinite(lambda1)) {
        throw std::invalid_argument("Coefficient stage: lambda1 must be finite and >= 0");
    }
    auto est_xx = make_covariance_estimator(options.method_xx);
    auto est_xy = make_covariance_estimator(options.method_xy);
    StandardizedSplit split = standardize_split(X, y, *est_xx, options);
    DefaultCovariance plain;

    CoefficientPath out;
    out.x_center = split.x_st.center;
    out.x_scale = split.x_st.scale;
    out.y_center = split.y_center;
    out.y_scale = split.y_scale;

    CovarianceEstimate sxx = moments_for(*est_xx, split, plain).estimate(split.X);
    CovarianceEstimate sxy = moments_for(*est_xy, split, plain).estimate(split.X, split.y);
    out.warnings = split.warnings;
    append(out.warnings, sxx.warnings);
    append(out.warnings, sxy.warnings);
    out.cov_xy = sxy.vector();

    // Graph stage at the fixed lambda1
    Eigen::MatrixXd S_reg;
    if (options.graph_norm == PenaltyNorm::None || lambda1 == 0.0) {
        S_reg = sxx.matrix;
    } else if (options.precision_solver) {
        S_reg = regularized_covariance(sxx.matrix, options.graph_norm, lambda1, options.precision_solver.get());
    } else {
        S_reg = regularized_covariance(sxx.matrix, options.graph_norm, lambda1);
    }

    if (path) {
        validate_path(*path, "coefficient penalty path");
        out.path = *path;
    } else {
        out.path = build_coefficient_path(out.cov_xy, options.coef_norm, options.nlambda, options.lambda_min_ratio);
    }

    auto solver = options.coefficient_solver ? options.coefficient_solver
                                             : make_coefficient_solver(options.coef_norm);
    out.coefficients = solver->solve(S_reg, out.cov_xy, out.path);
    if (out.coefficients.size() != out.path.size()) {
        throw std::runtime_error("Coefficient stage: solver returned the wrong number of candidates");
    }

    if (options.rescale) {
        int skipped = 0;
        for (auto& beta : out.coefficients) {
            if (beta.isZero(0.0)) continue;
            const double denom = beta.dot(sxx.matrix * beta);
            if (denom > 0.0) {
                beta *= beta.dot(out.cov_xy) / denom;
            } else {
                ++skipped;
            }
        }
        if (skipped > 0) {
            out.warnings.push_back("scout rescaling skipped for " + std::to_string(skipped) +
                                   " candidate(s) with b' S_xx b <= 0");
        }
    }
    return out;
}

CoefficientSelection select_coefficients(const Eigen::MatrixXd& X_train, const Eigen::VectorXd& Y_train,
                                         const Eigen::MatrixXd& X_val, const Eigen::VectorXd& Y_val,
                                         double lambda1,
                                         const std::optional<std::vector<double>>& path,
                                         const CoefficientSelectOptions& options) {
    if (X_val.cols() != X_train.cols() || X_val.rows() != Y_val.size() || X_val.rows() == 0) {
        throw std::invalid_argument("select_coefficients: validation data do not match training data");
    }

    CoefficientPath fitted = fit_coefficient_path(X_train, Y_train, lambda1, path, options);

    CoefficientSelection result;
    result.path = fitted.path;
    result.warnings = fitted.warnings;

    // Held-out rows get the same cell repairs as the training rows
    auto est_xx = make_covariance_estimator(options.method_xx);
    const Eigen::MatrixXd X_eval = est_xx->repairs_cells()
        ? est_xx->clean_new(X_train, X_val, result.warnings)
        : X_val;

    result.errors.resize(fitted.path.size());
    for (size_t i = 0; i < fitted.path.size(); ++i) {
        result.errors[i] = rmspe(Y_val, fitted.predict(X_eval, static_cast<int>(i)));
    }

    result.best_index = first_minimizer(result.errors);
    result.best_penalty = result.path[result.best_index];
    result.coefficients = fitted.original_coefficients(result.best_index);
    result.intercept = fitted.intercept(result.best_index);

    if (options.verbose) {
        std::cout << "[select_coefficients] lambda1 = " << lambda1 << ", lambda2 = " << result.best_penalty
                  << ", RMSPE = " << result.errors[result.best_index] << std::endl;
    }
    return result;
}

} // namespace robscout
