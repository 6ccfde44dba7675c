/**
 * @file objective.h
 * @brief robscout - Smooth objective interface for first-order solvers
 */
#ifndef ROBSCOUT_OBJECTIVE_H
#define ROBSCOUT_OBJECTIVE_H

#include <Eigen/Dense>
#include <utility>

namespace robscout {

/**
 * @brief Abstract base class for differentiable objective functions
 *
 * Usage:
 *   struct MyObjective : Objective {
 *       double value(const Eigen::VectorXd& x) const override { ... }
 *       Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override { ... }
 *   };
 */
class Objective {
public:
    virtual ~Objective() = default;

    /// Objective value at x (to be minimized)
    virtual double value(const Eigen::VectorXd& x) const = 0;

    /// Gradient at x (same dimension as x)
    virtual Eigen::VectorXd gradient(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Upper bound on the Lipschitz constant of the gradient
     * @return <= 0 if unknown; solvers then start from a unit step
     */
    virtual double lipschitz_bound() const { return -1.0; }

    virtual int dimension() const { return -1; }
};

/**
 * @brief Covariance-form least squares
 *
 *   f(b) = 0.5 * b' S b - c' b
 *
 * For S = X'X/(n-1) and c = X'y/(n-1) this equals the residual sum of
 * squares up to a constant, so only second moments are needed.
 */
class QuadraticObjective : public Objective {
public:
    QuadraticObjective(const Eigen::MatrixXd& S, const Eigen::VectorXd& c);

    double value(const Eigen::VectorXd& b) const override {
        return 0.5 * b.dot(S_ * b) - c_.dot(b);
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& b) const override {
        return S_ * b - c_;
    }

    double lipschitz_bound() const override { return lipschitz_; }

    int dimension() const override { return static_cast<int>(c_.size()); }

private:
    const Eigen::MatrixXd& S_;
    const Eigen::VectorXd& c_;
    double lipschitz_;
};

} // namespace robscout

#endif // ROBSCOUT_OBJECTIVE_H
