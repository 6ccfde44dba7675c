#include "precision_selector.h"
#include "../covariance/covariance_estimator.h"
#include "../linalg/matrix_utils.h"
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>


namespace robscout {

Criterion criterion_from_string(const std::string& name) {
    if (name == "loglik") return Criterion::LogLik;
    if (name == "bic") return Criterion::Bic;
    if (name == "ebic") return Criterion::Ebic;
    throw std::invalid_argument("unsupported criterion");
}

std::string to_string(Criterion criterion) {
    switch (criterion) {
        case Criterion::LogLik: return "loglik";
        case Criterion::Bic: return "bic";
        case Criterion::Ebic: return "ebic";
    }
    return "unknown";
}

double criterion_score(const Eigen::MatrixXd& Theta, const Eigen::MatrixXd& Sigma, int n,
                       Criterion criterion) {
    const int p = static_cast<int>(Theta.rows());
    if (Theta.cols() != p || Sigma.rows() != p || Sigma.cols() != p) {
        throw std::invalid_argument("criterion_score: Theta and Sigma must be p x p");
    }
    if (n < 1) {
        throw std::invalid_argument("criterion_score: n must be positive");
    }

    bool ok = true;
    const double logdet = linalg::log_determinant(Theta, ok);
    if (!ok || !std::isfinite(logdet)) {
        return std::numeric_limits<double>::infinity();
    }
    const double loglik = -logdet + (Theta * Sigma).trace();
    if (criterion == Criterion::LogLik) {
        return loglik;
    }

    int e_diag = 0;
    int e_off = 0;
    for (int j = 0; j < p; ++j) {
        for (int i = j; i < p; ++i) {
            if (std::abs(Theta(i, j)) > kEdgeTolerance) {
                if (i == j) ++e_diag; else ++e_off;
            }
        }
    }

    const double log_n_over_n = std::log(static_cast<double>(n)) / n;
    if (criterion == Criterion::Bic) {
        return loglik + log_n_over_n * (e_diag + e_off);
    }
    return loglik + log_n_over_n * e_off +
           e_off * 4.0 * kEbicGamma * std::log(static_cast<double>(p)) / n;
}

double criterion_score(const Eigen::MatrixXd& Theta, const Eigen::MatrixXd& Sigma, int n,
                       const std::string& criterion) {
    return criterion_score(Theta, Sigma, n, criterion_from_string(criterion));
}

namespace {

void check_options(const PrecisionSelectOptions& options) {
    if (options.norm == PenaltyNorm::None) {
        throw std::invalid_argument("Graph selection needs penalty norm 1 or 2");
    }
    criterion_from_string(options.criterion);
    if (!is_known_covariance_method(options.method)) {
        throw std::invalid_argument("Unknown covariance method: " + options.method);
    }
    if (options.lambdas) {
        validate_path(*options.lambdas, "graph penalty path");
    } else if (options.nlambda < 1) {
        throw std::invalid_argument("nlambda must be >= 1");
    } else if (!(options.lambda_min_ratio > 0.0 && options.lambda_min_ratio < 1.0)) {
        throw std::invalid_argument("lambda_min_ratio must lie in (0, 1)");
    }
}

std::shared_ptr<const PrecisionPathSolver> solver_for(const PrecisionSelectOptions& options) {
    return options.solver ? options.solver : make_precision_solver(options.norm);
}

// Training data (standardized if requested) and the matching test data.
struct PreparedData {
    Eigen::MatrixXd train;
    std::optional<Eigen::MatrixXd> test;
};

PreparedData prepare(const Eigen::MatrixXd& X, const std::optional<Eigen::MatrixXd>& X_test,
                     const PrecisionSelectOptions& options) {
    PreparedData out;
    if (!options.standardize) {
        out.train = X;
        out.test = X_test;
        return out;
    }
    stats::Standardization st = stats::fit_standardization(X, options.scaling);
    out.train = stats::apply_standardization(X, st);
    if (X_test) {
        out.test = stats::apply_standardization(*X_test, st);
    }
    return out;
}

std::vector<double> scores_for(const PrecisionPath& candidates, const Eigen::MatrixXd& Sigma, int n,
                               Criterion criterion) {
    std::vector<double> scores(candidates.precision.size());
    for (size_t i = 0; i < candidates.precision.size(); ++i) {
        scores[i] = criterion_score(candidates.precision[i], Sigma, n, criterion);
    }
    return scores;
}

bool all_infinite(const std::vector<double>& scores) {
    for (double s : scores) {
        if (std::isfinite(s)) return false;
    }
    return true;
}

} // namespace

PrecisionSelection select_precision(const Eigen::MatrixXd& X,
                                    const std::optional<Eigen::MatrixXd>& X_test,
                                    const PrecisionSelectOptions& options) {
    check_options(options);
    if (X.rows() < 2 || X.cols() < 1) {
        throw std::invalid_argument("select_precision: X needs at least 2 rows and 1 column");
    }
    if (X_test && X_test->cols() != X.cols()) {
        throw std::invalid_argument("select_precision: X_test must have the same columns as X");
    }

    const Criterion criterion = criterion_from_string(options.criterion);
    PreparedData data = prepare(X, X_test, options);
    auto estimator = make_covariance_estimator(options.method);

    PrecisionSelection result;
    CovarianceEstimate cov = estimator->estimate(data.train);
    result.warnings = cov.warnings;
    result.input_covariance = cov.matrix;

    std::vector<double> requested = options.lambdas
        ? *options.lambdas
        : build_graph_path(cov.matrix, options.norm, options.nlambda, options.lambda_min_ratio);

    auto solver = solver_for(options);
    PrecisionPath candidates = solver->solve(cov.matrix, requested);
    result.path = candidates.lambdas;

    Eigen::MatrixXd Sigma_eval = cov.matrix;
    if (data.test) {
        CovarianceEstimate test_cov = estimator->estimate(*data.test);
        result.warnings.insert(result.warnings.end(), test_cov.warnings.begin(), test_cov.warnings.end());
        Sigma_eval = test_cov.matrix;
    }

    result.scores = scores_for(candidates, Sigma_eval, static_cast<int>(X.rows()), criterion);
    if (all_infinite(result.scores)) {
        result.warnings.push_back("no positive-definite precision candidate; largest penalty kept");
    }
    result.best_index = first_minimizer(result.scores);
    result.best_penalty = result.path[result.best_index];
    result.precision = candidates.precision[result.best_index];
    result.covariance = candidates.covariance[result.best_index];

    if (options.verbose) {
        std::cout << "[select_precision] " << to_string(criterion) << " over " << result.path.size()
                  << " penalties, lambda1 = " << result.best_penalty << std::endl;
    }
    return result;
}

PrecisionCVResult cross_validate_precision(const Eigen::MatrixXd& X,
                                           const FoldAssignment& folds,
                                           const PrecisionSelectOptions& options,
                                           int n_jobs) {
    check_options(options);
    const int n = static_cast<int>(X.rows());
    const int K = static_cast<int>(folds.size());
    if (n < 2 || X.cols() < 1) {
        throw std::invalid_argument("cross_validate_precision: X needs at least 2 rows and 1 column");
    }
    validate_folds(folds, n, K);
    if (K < 2) {
        throw std::invalid_argument("cross_validate_precision: need at least 2 folds");
    }
    for (int k = 0; k < K; ++k) {
        if (folds[k].size() < 2 || n - static_cast<int>(folds[k].size()) < 2) {
            throw std::invalid_argument("cross_validate_precision: every fold and its complement need >= 2 rows");
        }
    }

    const Criterion criterion = criterion_from_string(options.criterion);
    PreparedData full = prepare(X, std::nullopt, options);
    auto estimator = make_covariance_estimator(options.method);
    auto solver = solver_for(options);

    PrecisionCVResult result;
    result.folds = folds;

    CovarianceEstimate full_cov = estimator->estimate(full.train);
    result.warnings = full_cov.warnings;
    std::vector<double> requested = options.lambdas
        ? *options.lambdas
        : build_graph_path(full_cov.matrix, options.norm, options.nlambda, options.lambda_min_ratio);
    PrecisionPath full_candidates = solver->solve(full_cov.matrix, requested);
    result.path = full_candidates.lambdas;

    const int L = static_cast<int>(result.path.size());
    result.fold_scores = Eigen::MatrixXd::Constant(L, K, std::numeric_limits<double>::infinity());
    std::vector<std::vector<std::string>> fold_warnings(K);
    std::vector<std::exception_ptr> errors(K);

    const int threads = resolve_threads(n_jobs);
    (void)threads;
#ifdef _OPENMP
    #pragma omp parallel for num_threads(threads) schedule(dynamic)
#endif
    for (int k = 0; k < K; ++k) {
        try {
            const std::vector<int> in_idx = held_in_indices(folds, k, n);
            PreparedData split = prepare(linalg::select_rows(X, in_idx),
                                         linalg::select_rows(X, folds[k]), options);

            CovarianceEstimate train_cov = estimator->estimate(split.train);
            CovarianceEstimate test_cov = estimator->estimate(*split.test);
            PrecisionPath candidates = solver->solve(train_cov.matrix, result.path);
            if (candidates.lambdas.size() != result.path.size()) {
                throw std::runtime_error("cross_validate_precision: solver changed the path length");
            }

            std::vector<double> s = scores_for(candidates, test_cov.matrix,
                                               static_cast<int>(in_idx.size()), criterion);
            for (int l = 0; l < L; ++l) {
                result.fold_scores(l, k) = s[l];
            }
            fold_warnings[k] = train_cov.warnings;
            fold_warnings[k].insert(fold_warnings[k].end(), test_cov.warnings.begin(), test_cov.warnings.end());
        } catch (...) {
            errors[k] = std::current_exception();
        }
    }
    rethrow_first(errors);

    for (int k = 0; k < K; ++k) {
        for (const auto& w : fold_warnings[k]) {
            result.warnings.push_back("fold " + std::to_string(k) + ": " + w);
        }
    }

    result.mean_scores = result.fold_scores.rowwise().mean();
    result.best_index = first_minimizer(result.mean_scores);
    result.best_penalty = result.path[result.best_index];
    result.precision = full_candidates.precision[result.best_index];
    result.covariance = full_candidates.covariance[result.best_index];

    if (options.verbose) {
        std::cout << "[cross_validate_precision] " << K << " folds, " << L
                  << " penalties, lambda1 = " << result.best_penalty << std::endl;
    }
    return result;
}

} // namespace robscout
