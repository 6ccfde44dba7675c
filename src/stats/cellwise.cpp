#include "cellwise.h"
#include "robust_scale.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace robscout {
namespace stats {

namespace {

// Robust scale of the unflagged entries of column j of R (1 if degenerate).
double unflagged_mad(const Eigen::MatrixXd& R, const FlagMatrix& flags, int j) {
    std::vector<double> vals;
    vals.reserve(R.rows());
    for (int i = 0; i < R.rows(); ++i) {
        if (!flags(i, j)) vals.push_back(R(i, j));
    }
    if (vals.size() < 2) return 1.0;
    Eigen::VectorXd v = Eigen::Map<Eigen::VectorXd>(vals.data(), static_cast<int>(vals.size()));
    double s = mad(v);
    return (s > 1e-12) ? s : 1.0;
}

} // namespace

DeviatingCellsResult DeviatingCellsImputer::detect(const Eigen::MatrixXd& X) const {
    const int n = static_cast<int>(X.rows());
    const int p = static_cast<int>(X.cols());
    if (n < 3) {
        throw std::invalid_argument("DeviatingCellsImputer: at least 3 rows are required");
    }

    // 1. Robust standardization; non-finite cells are treated as missing.
    Eigen::VectorXd center(p), scale(p);
    FlagMatrix flagged = FlagMatrix::Constant(n, p, false);
    for (int j = 0; j < p; ++j) {
        std::vector<double> vals;
        for (int i = 0; i < n; ++i) {
            if (std::isfinite(X(i, j))) vals.push_back(X(i, j));
            else flagged(i, j) = true;
        }
        if (vals.empty()) {
            throw std::invalid_argument("DeviatingCellsImputer: column without finite values");
        }
        Eigen::VectorXd v = Eigen::Map<Eigen::VectorXd>(vals.data(), static_cast<int>(vals.size()));
        center(j) = median(v);
        double s = mad(v);
        scale(j) = (s > 1e-12) ? s : 1.0;
    }

    Eigen::MatrixXd Z(n, p);
    for (int j = 0; j < p; ++j) {
        for (int i = 0; i < n; ++i) {
            if (flagged(i, j)) {
                Z(i, j) = 0.0;
                continue;
            }
            Z(i, j) = (X(i, j) - center(j)) / scale(j);
            // 2. Univariate outliers
            if (std::abs(Z(i, j)) > cutoff) flagged(i, j) = true;
        }
    }

    // 3. Robust correlations from wrapped, standardized data
    Eigen::MatrixXd Zw(n, p);
    for (int j = 0; j < p; ++j) {
        for (int i = 0; i < n; ++i) {
            Zw(i, j) = flagged(i, j) ? 0.0 : wrap_psi(Z(i, j));
        }
    }
    Eigen::MatrixXd R(p, p);
    for (int j = 0; j < p; ++j) {
        R(j, j) = 1.0;
        for (int h = j + 1; h < p; ++h) {
            double r = pearson(Zw.col(j), Zw.col(h));
            R(j, h) = r;
            R(h, j) = r;
        }
    }

    // 4-5. Predict every cell from its most correlated columns
    Eigen::MatrixXd Zhat = Eigen::MatrixXd::Zero(n, p);
    for (int j = 0; j < p; ++j) {
        std::vector<std::pair<double, int>> neighbours;
        for (int h = 0; h < p; ++h) {
            if (h != j && std::abs(R(j, h)) >= cor_threshold) {
                neighbours.emplace_back(std::abs(R(j, h)), h);
            }
        }
        std::sort(neighbours.begin(), neighbours.end(),
                  [](const std::pair<double, int>& a, const std::pair<double, int>& b) {
                      return a.first > b.first;
                  });
        if (static_cast<int>(neighbours.size()) > max_neighbours) {
            neighbours.resize(max_neighbours);
        }
        if (neighbours.empty()) continue;

        for (int i = 0; i < n; ++i) {
            double num = 0.0, den = 0.0;
            for (const auto& nb : neighbours) {
                int h = nb.second;
                if (flagged(i, h)) continue;
                num += nb.first * R(j, h) * Z(i, h);
                den += nb.first;
            }
            Zhat(i, j) = (den > 0.0) ? num / den : 0.0;
        }

        // 6. Deshrink: least-squares slope of z_j on its prediction
        double zz = 0.0, hh = 0.0;
        for (int i = 0; i < n; ++i) {
            if (flagged(i, j)) continue;
            zz += Z(i, j) * Zhat(i, j);
            hh += Zhat(i, j) * Zhat(i, j);
        }
        if (hh > 0.0 && zz > 0.0) {
            Zhat.col(j) *= zz / hh;
        }
    }

    // 7. Bivariate outliers: standardized residuals
    Eigen::MatrixXd resid = Z - Zhat;
    Eigen::MatrixXd std_resid(n, p);
    for (int j = 0; j < p; ++j) {
        double s = unflagged_mad(resid, flagged, j);
        for (int i = 0; i < n; ++i) {
            std_resid(i, j) = resid(i, j) / s;
        }
    }
    for (int j = 0; j < p; ++j) {
        for (int i = 0; i < n; ++i) {
            if (!flagged(i, j) && std::abs(std_resid(i, j)) > cutoff) {
                flagged(i, j) = true;
            }
        }
    }

    // 8. Impute flagged cells on the original scale
    DeviatingCellsResult result;
    result.imputed = X;
    result.predicted.resize(n, p);
    int count = 0;
    for (int j = 0; j < p; ++j) {
        for (int i = 0; i < n; ++i) {
            double pred = center(j) + scale(j) * Zhat(i, j);
            result.predicted(i, j) = pred;
            if (flagged(i, j)) {
                result.imputed(i, j) = pred;
                ++count;
            }
        }
    }
    result.std_residuals = std_resid;
    result.flagged = flagged;
    result.n_flagged = count;
    return result;
}

} // namespace stats
} // namespace robscout
