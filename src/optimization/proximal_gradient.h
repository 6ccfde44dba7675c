/**
 * @file proximal_gradient.h
 * @brief robscout - Proximal gradient descent (ISTA / FISTA)
 *
 * Minimizes: F(x) = f(x) + g(x)
 * where f is smooth (has Lipschitz gradient) and g has a proximal operator.
 *
 * Step size: starts at 1/L when the objective reports a Lipschitz bound L,
 * otherwise at initial_step, and is halved by backtracking until the
 * composite sufficient-decrease condition holds.
 *
 * Momentum: FISTA (Beck & Teboulle 2009)
 *   t_{k+1} = (1 + sqrt(1 + 4 t_k^2)) / 2
 *   y_k     = x_k + ((t_k - 1) / t_{k+1}) (x_k - x_{k-1})
 * with a function-value restart whenever F increases.
 */
#ifndef ROBSCOUT_PROXIMAL_GRADIENT_H
#define ROBSCOUT_PROXIMAL_GRADIENT_H

#include <Eigen/Dense>
#include "objective.h"
#include "penalizer.h"

namespace robscout {

struct OptimizerResult {
    Eigen::VectorXd x;
    double min_value;
    int iterations;
    bool converged;
};

class ProximalGradient {
public:
    int max_iter = 5000;
    double tol = 1e-8;            // max-norm change between iterates
    double initial_step = 1.0;
    double step_decay = 0.5;      // Backtrack multiplier
    bool use_fista = true;
    bool verbose = false;

    OptimizerResult minimize(const Objective& smooth_objective,
                             const Penalizer& penalizer,
                             const Eigen::VectorXd& x0) const;
};

} // namespace robscout

#endif // ROBSCOUT_PROXIMAL_GRADIENT_H
