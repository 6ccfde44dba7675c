/**
 * @file penalizer.h
 * @brief robscout - Non-smooth penalties with proximal operators
 */
#ifndef ROBSCOUT_PENALIZER_H
#define ROBSCOUT_PENALIZER_H

#include <Eigen/Dense>

namespace robscout {

/**
 * @brief Abstract base class for regularization penalties
 *
 * prox() enables proximal gradient methods for penalties such as L1 that
 * have no gradient at the origin.
 */
class Penalizer {
public:
    virtual ~Penalizer() = default;

    /// Penalty value (always >= 0)
    virtual double penalty(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief prox_{step*g}(x) = argmin_z { 0.5||z-x||^2 + step*g(z) }
     */
    virtual Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const = 0;
};

/**
 * @brief L1 (Lasso) penalty: lambda * ||x||_1
 *
 * Proximal operator: soft thresholding at lambda * step.
 */
class L1Penalty : public Penalizer {
public:
    double lambda;

    explicit L1Penalty(double lam = 1.0) : lambda(lam) {}

    double penalty(const Eigen::VectorXd& x) const override {
        return lambda * x.lpNorm<1>();
    }

    Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const override {
        const double threshold = lambda * step;
        Eigen::VectorXd out(x.size());
        for (int i = 0; i < x.size(); ++i) {
            out(i) = soft_threshold(x(i), threshold);
        }
        return out;
    }

    static double soft_threshold(double v, double t) {
        if (v > t) return v - t;
        if (v < -t) return v + t;
        return 0.0;
    }
};

} // namespace robscout

#endif // ROBSCOUT_PENALIZER_H
