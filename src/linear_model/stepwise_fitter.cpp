#include "stepwise_fitter.h"
#include "../covariance/covariance_estimator.h"
#include "../graphical/precision_selector.h"
#include "../linalg/matrix_utils.h"
#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>


namespace robscout {

std::string to_string(FitStage stage) {
    switch (stage) {
        case FitStage::Init: return "INIT";
        case FitStage::GraphSelected: return "GRAPH_SELECTED";
        case FitStage::CvCoefficientSelected: return "CV_COEFFICIENT_SELECTED";
        case FitStage::FinalFit: return "FINAL_FIT";
        case FitStage::Done: return "DONE";
    }
    return "UNKNOWN";
}

namespace {

void trace(const FitOptions& options, FitStage stage, const std::string& msg = "") {
    if (!options.verbose) return;
    std::cout << "[fit] " << to_string(stage);
    if (!msg.empty()) std::cout << ": " << msg;
    std::cout << std::endl;
}

void check_ratio(double ratio, const char* name) {
    if (!(ratio > 0.0 && ratio < 1.0)) {
        throw std::invalid_argument(std::string(name) + " must lie in (0, 1)");
    }
}

void check_options(const FitOptions& options) {
    if (options.K < 2) {
        throw std::invalid_argument("K must be >= 2");
    }
    if (options.nlambda1 < 1 || options.nlambda2 < 1) {
        throw std::invalid_argument("nlambda1 and nlambda2 must be >= 1");
    }
    check_ratio(options.lambda1_min_ratio, "lambda1_min_ratio");
    check_ratio(options.lambda2_min_ratio, "lambda2_min_ratio");
    if (options.lambda1s) validate_path(*options.lambda1s, "lambda1s");
    if (options.lambda2s) validate_path(*options.lambda2s, "lambda2s");
    for (const std::string* m : {&options.method_graph, &options.method_xx, &options.method_xy}) {
        if (!is_known_covariance_method(*m)) {
            throw std::invalid_argument("Unknown covariance method: " + *m);
        }
    }
    criterion_from_string(options.criterion);
}

CoefficientSelectOptions coefficient_options(const FitOptions& options) {
    CoefficientSelectOptions c;
    c.method_xx = options.method_xx;
    c.method_xy = options.method_xy;
    c.graph_norm = options.graph_norm;
    c.coef_norm = options.coef_norm;
    c.nlambda = options.nlambda2;
    c.lambda_min_ratio = options.lambda2_min_ratio;
    c.rescale = options.rescale;
    c.standardize = options.standardize;
    c.scaling = options.scaling;
    c.precision_solver = options.precision_solver;
    c.coefficient_solver = options.coefficient_solver;
    return c;
}

PrecisionSelectOptions precision_options(const FitOptions& options) {
    PrecisionSelectOptions g;
    g.method = options.method_graph;
    g.criterion = options.criterion;
    g.norm = options.graph_norm;
    g.nlambda = options.nlambda1;
    g.lambda_min_ratio = options.lambda1_min_ratio;
    g.lambdas = options.lambda1s;
    g.standardize = options.standardize;
    g.scaling = options.scaling;
    g.solver = options.precision_solver;
    g.verbose = options.verbose;
    return g;
}

void append(std::vector<std::string>& dst, const std::vector<std::string>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

FittedModel fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, const FitOptions& options) {
    FittedModel model;
    model.graph_norm = options.graph_norm;
    model.coef_norm = options.coef_norm;

    // ---------------------------------------------------------------
    // INIT
    // ---------------------------------------------------------------
    const int n = static_cast<int>(X.rows());
    const int p = static_cast<int>(X.cols());
    if (n < 2 || p < 1) {
        throw std::invalid_argument("fit: X needs at least 2 rows and 1 column");
    }
    if (y.size() != n) {
        throw std::invalid_argument("fit: rows(X) must equal length(y)");
    }
    check_options(options);
    const int K = options.K;
    if (K > n) {
        throw std::invalid_argument("fit: K must not exceed the number of rows");
    }

    if (options.folds) {
        validate_folds(*options.folds, n, K);
        model.folds = *options.folds;
    } else {
        std::mt19937 gen(options.seed);
        model.folds = draw_folds(n, K, gen);
    }
    for (int k = 0; k < K; ++k) {
        if (n - static_cast<int>(model.folds[k].size()) < 2) {
            throw std::invalid_argument("fit: every held-in part needs at least 2 rows");
        }
    }
    trace(options, FitStage::Init, "n = " + std::to_string(n) + ", p = " + std::to_string(p) +
                                   ", K = " + std::to_string(K));

    // ---------------------------------------------------------------
    // GRAPH_SELECTED: lambda1 fixed for everything downstream
    // ---------------------------------------------------------------
    if (options.graph_norm == PenaltyNorm::None) {
        model.lambda1 = 0.0;
        model.lambda1_path = {0.0};
    } else {
        PrecisionSelectOptions gopt = precision_options(options);
        const bool search = !(options.lambda1s && options.lambda1s->size() == 1);
        if (search && options.graph_selection == GraphSelection::CrossValidated) {
            PrecisionCVResult cv = cross_validate_precision(X, model.folds, gopt, options.n_jobs);
            model.lambda1 = cv.best_penalty;
            model.lambda1_path = cv.path;
            model.graph_scores.assign(cv.mean_scores.data(), cv.mean_scores.data() + cv.mean_scores.size());
            model.precision = cv.precision;
            append(model.warnings, cv.warnings);
        } else {
            PrecisionSelection sel = select_precision(X, std::nullopt, gopt);
            model.lambda1 = sel.best_penalty;
            model.lambda1_path = sel.path;
            model.graph_scores = sel.scores;
            model.precision = sel.precision;
            append(model.warnings, sel.warnings);
        }
    }
    trace(options, FitStage::GraphSelected, "lambda1 = " + std::to_string(model.lambda1));

    // ---------------------------------------------------------------
    // CV_COEFFICIENT_SELECTED
    // ---------------------------------------------------------------
    const CoefficientSelectOptions copt = coefficient_options(options);
    if (options.lambda2s) {
        model.lambda2_path = *options.lambda2s;
    } else {
        Eigen::VectorXd cov_xy = standardized_cross_covariance(X, y, copt, &model.warnings);
        model.lambda2_path = build_coefficient_path(cov_xy, options.coef_norm, options.nlambda2,
                                                    options.lambda2_min_ratio);
    }

    const int L = static_cast<int>(model.lambda2_path.size());
    model.cv_errors = Eigen::MatrixXd::Zero(L, K);
    std::vector<std::vector<std::string>> fold_warnings(K);
    std::vector<std::exception_ptr> errors(K);
    const std::optional<std::vector<double>> path2 = model.lambda2_path;

    const int threads = resolve_threads(options.n_jobs);
    (void)threads;
#ifdef _OPENMP
    #pragma omp parallel for num_threads(threads) schedule(dynamic)
#endif
    for (int k = 0; k < K; ++k) {
        try {
            const std::vector<int> in_idx = held_in_indices(model.folds, k, n);
            const std::vector<int>& out_idx = model.folds[k];
            CoefficientSelection sel = select_coefficients(
                linalg::select_rows(X, in_idx), linalg::select_rows(y, in_idx),
                linalg::select_rows(X, out_idx), linalg::select_rows(y, out_idx),
                model.lambda1, path2, copt);
            for (int l = 0; l < L; ++l) {
                model.cv_errors(l, k) = sel.errors[l];
            }
            fold_warnings[k] = sel.warnings;
        } catch (...) {
            errors[k] = std::current_exception();
        }
    }
    rethrow_first(errors);

    for (int k = 0; k < K; ++k) {
        for (const auto& w : fold_warnings[k]) {
            model.warnings.push_back("fold " + std::to_string(k) + ": " + w);
        }
    }

    model.cv_mean_errors = model.cv_errors.rowwise().mean();
    const int best = first_minimizer(model.cv_mean_errors);
    model.lambda2 = model.lambda2_path[best];
    trace(options, FitStage::CvCoefficientSelected,
          "lambda2 = " + std::to_string(model.lambda2) + ", mean RMSPE = " +
          std::to_string(model.cv_mean_errors(best)));

    // ---------------------------------------------------------------
    // FINAL_FIT on every row
    // ---------------------------------------------------------------
    CoefficientPath final_fit = fit_coefficient_path(X, y, model.lambda1,
                                                     std::vector<double>{model.lambda2}, copt);
    model.coefficients = final_fit.coefficients.front();
    model.x_center = final_fit.x_center;
    model.x_scale = final_fit.x_scale;
    model.y_center = final_fit.y_center;
    model.y_scale = final_fit.y_scale;
    model.intercept = final_fit.intercept(0);
    append(model.warnings, final_fit.warnings);
    trace(options, FitStage::FinalFit, "intercept = " + std::to_string(model.intercept));

    if (options.verbose) {
        for (const auto& w : model.warnings) {
            std::cout << "[fit] warning: " << w << std::endl;
        }
    }
    trace(options, FitStage::Done);
    return model;
}

Eigen::VectorXd original_scale_coefficients(const FittedModel& model) {
    return model.coefficients.cwiseQuotient(model.x_scale) * model.y_scale;
}

Eigen::VectorXd predict(const FittedModel& model, const Eigen::MatrixXd& X_new, bool use_intercept) {
    if (X_new.cols() != model.coefficients.size()) {
        throw std::invalid_argument("predict: X_new has " + std::to_string(X_new.cols()) +
                                    " columns, model expects " + std::to_string(model.coefficients.size()));
    }
    Eigen::VectorXd yhat = X_new * original_scale_coefficients(model);
    if (use_intercept) {
        yhat.array() += model.intercept;
    }
    return yhat;
}

} // namespace robscout
