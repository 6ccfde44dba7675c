#include "proximal_gradient.h"
#include <cmath>
#include <iostream>

namespace robscout {

OptimizerResult ProximalGradient::minimize(const Objective& smooth_objective,
                                           const Penalizer& penalizer,
                                           const Eigen::VectorXd& x0) const {
    Eigen::VectorXd x = x0;
    Eigen::VectorXd x_prev = x0;
    Eigen::VectorXd y = x0;  // FISTA momentum point

    double step = initial_step;
    double L = smooth_objective.lipschitz_bound();
    if (L > 0.0) step = 1.0 / L;

    double t = 1.0;
    double F_prev = smooth_objective.value(x) + penalizer.penalty(x);

    int iter = 0;
    bool converged = false;

    for (iter = 0; iter < max_iter; ++iter) {
        Eigen::VectorXd grad = smooth_objective.gradient(y);
        double f_y = smooth_objective.value(y);

        bool step_found = false;
        Eigen::VectorXd x_new;
        for (int ls = 0; ls < 50; ++ls) {
            x_new = penalizer.prox(y - step * grad, step);
            Eigen::VectorXd diff = x_new - y;
            double upper = f_y + grad.dot(diff) + (0.5 / step) * diff.squaredNorm();
            if (smooth_objective.value(x_new) <= upper + 1e-12 * (1.0 + std::abs(upper))) {
                step_found = true;
                break;
            }
            step *= step_decay;
        }
        if (!step_found) {
            break;
        }

        double F_new = smooth_objective.value(x_new) + penalizer.penalty(x_new);
        if (use_fista && t > 1.0 && F_new > F_prev) {
            // Restart momentum from the last accepted iterate
            y = x;
            t = 1.0;
            continue;
        }

        x_prev = x;
        x = x_new;
        F_prev = F_new;

        double change = (x - x_prev).cwiseAbs().maxCoeff();
        if (verbose) {
            std::cout << "[ProximalGradient] iter " << iter << " F=" << F_new
                      << " change=" << change << std::endl;
        }
        if (change < tol) {
            converged = true;
            break;
        }

        if (use_fista) {
            double t_new = (1.0 + std::sqrt(1.0 + 4.0 * t * t)) / 2.0;
            y = x + ((t - 1.0) / t_new) * (x - x_prev);
            t = t_new;
        } else {
            y = x;
        }
    }

    return {x, F_prev, iter, converged};
}

} // namespace robscout
