#include "graphical/penalty_path.h"
#include "linalg/matrix_utils.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace robscout;

static bool throws_invalid(void (*fn)()) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void check_decreasing(const std::vector<double>& path) {
    for (size_t i = 1; i < path.size(); ++i) {
        assert(path[i] < path[i - 1]);
    }
}

int main() {
    std::cout << "--- Penalty Path Test ---" << std::endl;

    // Log-spaced path: length, monotonicity, end points
    {
        std::vector<double> path = log_spaced_path(2.0, 10, 0.1);
        assert(path.size() == 10);
        check_decreasing(path);
        assert(path.front() == 2.0);
        assert(std::abs(path.front() * 0.1 - path.back()) < 1e-12);
        // constant ratio between neighbours
        double r0 = path[1] / path[0];
        for (size_t i = 2; i < path.size(); ++i) {
            assert(std::abs(path[i] / path[i - 1] - r0) < 1e-10);
        }
        std::cout << "log_spaced_path: " << path.front() << " ... " << path.back() << std::endl;
    }

    // Degenerate cases
    {
        std::vector<double> zero = log_spaced_path(0.0, 25, 0.1);
        assert(zero.size() == 1 && zero[0] == 0.0);

        std::vector<double> single = log_spaced_path(3.5, 1, 0.1);
        assert(single.size() == 1 && single[0] == 3.5);
    }

    assert(throws_invalid([] { log_spaced_path(1.0, 0, 0.1); }));
    assert(throws_invalid([] { log_spaced_path(1.0, 10, 1.0); }));
    assert(throws_invalid([] { log_spaced_path(1.0, 10, 0.0); }));
    assert(throws_invalid([] { log_spaced_path(-1.0, 10, 0.1); }));

    // Graphical lasso path
    {
        Eigen::MatrixXd S(3, 3);
        S << 1.0, 0.3, -0.5,
             0.3, 2.0, 0.2,
            -0.5, 0.2, 1.5;
        assert(std::abs(glasso_lambda_max(S) - 0.5) < 1e-15);

        std::vector<double> path = build_glasso_path(S, 8, 0.1);
        assert(path.size() == 8);
        check_decreasing(path);
        assert(std::abs(path.front() - 0.5) < 1e-15);
        assert(std::abs(path.back() - 0.05) < 1e-12);

        std::vector<double> g = build_graph_path(S, PenaltyNorm::L1, 8, 0.1);
        assert(g == path);
    }

    // All-zero off-diagonal collapses to {0}
    {
        Eigen::MatrixXd D = Eigen::VectorXd::LinSpaced(4, 1.0, 4.0).asDiagonal();
        assert(linalg::is_off_diag_zero(D));
        std::vector<double> path = build_glasso_path(D, 50, 0.1);
        assert(path.size() == 1 && path[0] == 0.0);
        std::cout << "Diagonal covariance -> path {0}" << std::endl;
    }

    // Ridge-precision path starts at the squared top eigenvalue
    {
        Eigen::MatrixXd S(2, 2);
        S << 2.0, 1.0,
             1.0, 2.0;   // eigenvalues 1 and 3
        assert(std::abs(ridge_precision_lambda_max(S) - 9.0) < 1e-10);
        std::vector<double> path = build_graph_path(S, PenaltyNorm::L2, 5, 0.1);
        assert(path.size() == 5);
        assert(std::abs(path.front() - 9.0) < 1e-10);
        assert(build_graph_path(S, PenaltyNorm::None, 5, 0.1) == std::vector<double>{0.0});
    }

    // Coefficient paths
    {
        Eigen::VectorXd cxy(4);
        cxy << 0.1, -0.8, 0.4, 0.0;
        assert(std::abs(lasso_lambda_max(cxy) - 0.8) < 1e-15);
        assert(std::abs(ridge_lambda_max(cxy) - 800.0) < 1e-9);

        std::vector<double> l1 = build_coefficient_path(cxy, PenaltyNorm::L1, 10, 0.01);
        assert(l1.size() == 10);
        check_decreasing(l1);
        assert(std::abs(l1.back() - 0.008) < 1e-12);

        std::vector<double> l2 = build_coefficient_path(cxy, PenaltyNorm::L2, 10, 0.01);
        assert(l2.size() == 10);
        assert(std::abs(l2.front() - 800.0) < 1e-9);

        assert(build_coefficient_path(cxy, PenaltyNorm::None, 10, 0.01) == std::vector<double>{0.0});
        assert(build_coefficient_path(Eigen::VectorXd::Zero(3), PenaltyNorm::L1, 10, 0.01) ==
               std::vector<double>{0.0});
    }

    // Norm conversion fails fast
    assert(penalty_norm_from_int(0) == PenaltyNorm::None);
    assert(penalty_norm_from_int(2) == PenaltyNorm::L2);
    assert(throws_invalid([] { penalty_norm_from_int(3); }));
    assert(throws_invalid([] { penalty_norm_from_int(-1); }));

    // Caller-supplied paths
    validate_path({1.0, 0.5, 0.0}, "ok");
    assert(throws_invalid([] { validate_path({0.5, 1.0}, "increasing"); }));
    assert(throws_invalid([] { validate_path({1.0, 1.0}, "repeated"); }));
    assert(throws_invalid([] { validate_path({}, "empty"); }));
    assert(throws_invalid([] { validate_path({1.0, -0.1}, "negative"); }));

    std::cout << "Penalty Path Test Passed!" << std::endl;
    return 0;
}
