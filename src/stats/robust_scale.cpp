#include "robust_scale.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace robscout {
namespace stats {

ScaleMethod scale_method_from_string(const std::string& name) {
    if (name == "mean_sd" || name == "sd") return ScaleMethod::MeanSd;
    if (name == "median_mad" || name == "mad") return ScaleMethod::MedianMad;
    throw std::invalid_argument("Unknown scale method: " + name);
}

double median(const Eigen::VectorXd& x) {
    const int n = static_cast<int>(x.size());
    if (n == 0) {
        throw std::invalid_argument("median: empty input");
    }
    std::vector<double> v(x.data(), x.data() + n);
    auto mid = v.begin() + n / 2;
    std::nth_element(v.begin(), mid, v.end());
    double upper = *mid;
    if (n % 2 == 1) return upper;
    double lower = *std::max_element(v.begin(), mid);
    return 0.5 * (lower + upper);
}

double mad(const Eigen::VectorXd& x) {
    double med = median(x);
    Eigen::VectorXd dev = (x.array() - med).abs();
    return kMadConsistency * median(dev);
}

double sample_sd(const Eigen::VectorXd& x) {
    const int n = static_cast<int>(x.size());
    if (n < 2) return 0.0;
    double m = x.mean();
    return std::sqrt((x.array() - m).square().sum() / (n - 1.0));
}

double huber_location(const Eigen::VectorXd& x, double b) {
    double med = median(x);
    double s = mad(x);
    if (s <= 0.0) return med;

    double num = 0.0;
    int inside = 0;
    for (int i = 0; i < x.size(); ++i) {
        double z = (x(i) - med) / s;
        if (std::abs(z) <= b) {
            num += z;
            ++inside;
        } else {
            num += (z > 0) ? b : -b;
        }
    }
    if (inside == 0) return med;
    // Newton step: sum psi / sum psi'
    return med + s * num / inside;
}

Standardization fit_standardization(const Eigen::MatrixXd& X, ScaleMethod method) {
    const int p = static_cast<int>(X.cols());
    Standardization st;
    st.center.resize(p);
    st.scale.resize(p);

    for (int j = 0; j < p; ++j) {
        Eigen::VectorXd col = X.col(j);
        double c, s;
        if (method == ScaleMethod::MedianMad) {
            c = median(col);
            s = mad(col);
        } else {
            c = col.mean();
            s = sample_sd(col);
        }
        st.center(j) = c;
        st.scale(j) = (s > 1e-12) ? s : 1.0;
    }
    return st;
}

Eigen::MatrixXd apply_standardization(const Eigen::MatrixXd& X, const Standardization& st) {
    if (X.cols() != st.center.size()) {
        throw std::invalid_argument("apply_standardization: column count mismatch");
    }
    Eigen::MatrixXd out(X.rows(), X.cols());
    for (int j = 0; j < X.cols(); ++j) {
        out.col(j) = (X.col(j).array() - st.center(j)) / st.scale(j);
    }
    return out;
}

std::pair<double, double> vector_center_scale(const Eigen::VectorXd& y, ScaleMethod method) {
    double c, s;
    if (method == ScaleMethod::MedianMad) {
        c = median(y);
        s = mad(y);
    } else {
        c = y.mean();
        s = sample_sd(y);
    }
    return {c, (s > 1e-12) ? s : 1.0};
}

Standardization estimate_loc_scale(const Eigen::MatrixXd& X) {
    const int p = static_cast<int>(X.cols());
    Standardization st;
    st.center.resize(p);
    st.scale.resize(p);
    for (int j = 0; j < p; ++j) {
        Eigen::VectorXd col = X.col(j);
        st.center(j) = huber_location(col);
        double s = mad(col);
        st.scale(j) = (s > 1e-12) ? s : 1.0;
    }
    return st;
}

double wrap_psi(double z) {
    constexpr double b = 1.5;
    constexpr double c = 4.0;
    constexpr double q1 = 1.540793;
    constexpr double q2 = 0.8622731;

    double a = std::abs(z);
    if (a <= b) return z;
    if (a > c) return 0.0;
    double sign = (z > 0) ? 1.0 : -1.0;
    return q1 * std::tanh(q2 * (c - a)) * sign;
}

Eigen::MatrixXd wrap_columns(const Eigen::MatrixXd& X, const Standardization& loc_scale) {
    Eigen::MatrixXd Xw(X.rows(), X.cols());
    for (int j = 0; j < X.cols(); ++j) {
        double loc = loc_scale.center(j);
        double s = loc_scale.scale(j);
        for (int i = 0; i < X.rows(); ++i) {
            Xw(i, j) = loc + s * wrap_psi((X(i, j) - loc) / s);
        }
    }
    return Xw;
}

double pearson(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("pearson: length mismatch");
    }
    Eigen::VectorXd xc = x.array() - x.mean();
    Eigen::VectorXd yc = y.array() - y.mean();
    double denom = std::sqrt(xc.squaredNorm() * yc.squaredNorm());
    if (denom <= 0.0) return 0.0;
    return xc.dot(yc) / denom;
}

double huber_correlation(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    const int n = static_cast<int>(x.size());
    if (y.size() != n) {
        throw std::invalid_argument("huber_correlation: length mismatch");
    }

    // Initial estimate from univariate winsorization
    Eigen::VectorXd xw = x.cwiseMax(-2.0).cwiseMin(2.0);
    Eigen::VectorXd yw = y.cwiseMax(-2.0).cwiseMin(2.0);
    double r0 = pearson(xw, yw);
    r0 = std::max(-0.99, std::min(0.99, r0));

    double det = 1.0 - r0 * r0;
    Eigen::VectorXd xs(n), ys(n);
    for (int i = 0; i < n; ++i) {
        double d2 = (x(i) * x(i) - 2.0 * r0 * x(i) * y(i) + y(i) * y(i)) / det;
        double w = (d2 > kBivariateCutoffSq) ? std::sqrt(kBivariateCutoffSq / d2) : 1.0;
        xs(i) = w * x(i);
        ys(i) = w * y(i);
    }
    return pearson(xs, ys);
}

} // namespace stats
} // namespace robscout
