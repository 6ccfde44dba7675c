#ifndef ROBSCOUT_FOLDS_H
#define ROBSCOUT_FOLDS_H

#include <Eigen/Dense>
#include <exception>
#include <random>
#include <vector>

namespace robscout {

/// K disjoint, non-empty sets of 0-based row indices covering 0..n-1.
using FoldAssignment = std::vector<std::vector<int>>;

/**
 * @brief Random partition of 0..n-1 into K folds of near-equal size
 *
 * Fold sizes differ by at most one. The generator is passed explicitly so
 * draws are reproducible and independent of any global state.
 */
FoldAssignment draw_folds(int n, int K, std::mt19937& gen);

/// Throws std::invalid_argument unless folds partition 0..n-1 into exactly K non-empty parts.
void validate_folds(const FoldAssignment& folds, int n, int K);

/// Sorted indices of 0..n-1 not in folds[k] (the held-in rows of fold k).
std::vector<int> held_in_indices(const FoldAssignment& folds, int k, int n);

/// Index of the first minimum (NaN treated as +inf). Throws on empty input.
int first_minimizer(const std::vector<double>& values);
int first_minimizer(const Eigen::VectorXd& values);

/// Root-mean-squared prediction error.
double rmspe(const Eigen::VectorXd& y, const Eigen::VectorXd& y_hat);

/// Thread count for fold loops: n_jobs <= 0 means all available cores.
int resolve_threads(int n_jobs);

/// Rethrows the first captured exception, if any.
void rethrow_first(const std::vector<std::exception_ptr>& errors);

} // namespace robscout

#endif // ROBSCOUT_FOLDS_H
