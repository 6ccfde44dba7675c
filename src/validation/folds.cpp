#include "folds.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace robscout {

FoldAssignment draw_folds(int n, int K, std::mt19937& gen) {
    if (K < 2) {
        throw std::invalid_argument("Number of folds K must be >= 2");
    }
    if (n < K) {
        throw std::invalid_argument("Number of folds K must not exceed the number of rows");
    }

    std::vector<int> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    std::shuffle(perm.begin(), perm.end(), gen);

    FoldAssignment folds(K);
    for (int i = 0; i < n; ++i) {
        folds[i % K].push_back(perm[i]);
    }
    for (auto& f : folds) {
        std::sort(f.begin(), f.end());
    }
    return folds;
}

void validate_folds(const FoldAssignment& folds, int n, int K) {
    if (static_cast<int>(folds.size()) != K) {
        throw std::invalid_argument("length of folds should be the same as K (got " +
                                    std::to_string(folds.size()) + ", K = " + std::to_string(K) + ")");
    }
    std::vector<int> seen(n, 0);
    for (size_t k = 0; k < folds.size(); ++k) {
        if (folds[k].empty()) {
            throw std::invalid_argument("fold " + std::to_string(k) + " is empty");
        }
        for (int idx : folds[k]) {
            if (idx < 0 || idx >= n) {
                throw std::invalid_argument("each set of indices in folds must be in the range 0..n-1");
            }
            if (seen[idx]++ > 0) {
                throw std::invalid_argument("row " + std::to_string(idx) + " appears in more than one fold");
            }
        }
    }
    for (int i = 0; i < n; ++i) {
        if (seen[i] == 0) {
            throw std::invalid_argument("row " + std::to_string(i) + " is not assigned to any fold");
        }
    }
}

std::vector<int> held_in_indices(const FoldAssignment& folds, int k, int n) {
    std::vector<char> held_out(n, 0);
    for (int idx : folds.at(k)) held_out[idx] = 1;

    std::vector<int> out;
    out.reserve(n - folds[k].size());
    for (int i = 0; i < n; ++i) {
        if (!held_out[i]) out.push_back(i);
    }
    return out;
}

int first_minimizer(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("first_minimizer: empty input");
    }
    int best = 0;
    double best_val = std::numeric_limits<double>::infinity();
    bool any = false;
    for (size_t i = 0; i < values.size(); ++i) {
        double v = std::isnan(values[i]) ? std::numeric_limits<double>::infinity() : values[i];
        if (!any || v < best_val) {
            best = static_cast<int>(i);
            best_val = v;
            any = true;
        }
    }
    return best;
}

int first_minimizer(const Eigen::VectorXd& values) {
    return first_minimizer(std::vector<double>(values.data(), values.data() + values.size()));
}

double rmspe(const Eigen::VectorXd& y, const Eigen::VectorXd& y_hat) {
    if (y.size() != y_hat.size() || y.size() == 0) {
        throw std::invalid_argument("rmspe: length mismatch or empty input");
    }
    return std::sqrt((y - y_hat).squaredNorm() / y.size());
}

int resolve_threads(int n_jobs) {
#ifdef _OPENMP
    if (n_jobs <= 0) return omp_get_max_threads();
    return n_jobs;
#else
    (void)n_jobs;
    return 1;
#endif
}

void rethrow_first(const std::vector<std::exception_ptr>& errors) {
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

} // namespace robscout
