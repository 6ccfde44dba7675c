/**
 * @file bench_fit.cpp
 * @brief Timing of the scout pipeline stages
 *
 * 1. Covariance strategies (default / winsor / wrap / ddc)
 * 2. Graphical lasso path
 * 3. Full two-stage fit, serial vs parallel fold loop
 */

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>

#include <Eigen/Dense>

#include "covariance/covariance_estimator.h"
#include "graphical/precision_solver.h"
#include "linear_model/stepwise_fitter.h"

using namespace std::chrono;

// Helper: AR(1)-correlated Gaussian design plus a sparse linear response
void make_problem(int n, int p, std::mt19937 &gen, Eigen::MatrixXd &X,
                  Eigen::VectorXd &y) {
  std::normal_distribution<> dist(0.0, 1.0);
  X.resize(n, p);
  y.resize(n);
  for (int i = 0; i < n; ++i) {
    X(i, 0) = dist(gen);
    for (int j = 1; j < p; ++j)
      X(i, j) = 0.5 * X(i, j - 1) + std::sqrt(0.75) * dist(gen);
    y(i) = 2.0 * X(i, 0) - 1.5 * X(i, p / 4) + X(i, p / 2) + dist(gen);
  }
}

template <typename F> double time_ms(F &&f, int repeats) {
  f(); // Warm up
  auto start = high_resolution_clock::now();
  for (int r = 0; r < repeats; ++r)
    f();
  auto end = high_resolution_clock::now();
  return duration_cast<microseconds>(end - start).count() / 1000.0 / repeats;
}

// ===========================================================================
// Benchmark 1: Covariance strategies
// ===========================================================================

void bench_covariance(int n, int p, int repeats) {
  std::mt19937 gen(42);
  Eigen::MatrixXd X;
  Eigen::VectorXd y;
  make_problem(n, p, gen, X, y);

  std::cout << "\n=== Covariance (n=" << n << ", p=" << p << ") ===" << std::endl;
  for (const char *method : {"default", "winsor", "wrap", "ddc"}) {
    auto est = robscout::make_covariance_estimator(method);
    double ms = time_ms([&] { est->estimate(X); }, repeats);
    std::cout << std::setw(8) << method << ": " << std::fixed
              << std::setprecision(2) << ms << " ms/op" << std::endl;
  }
}

// ===========================================================================
// Benchmark 2: Graphical lasso path
// ===========================================================================

void bench_glasso(int n, int p, int nlambda) {
  std::mt19937 gen(42);
  Eigen::MatrixXd X;
  Eigen::VectorXd y;
  make_problem(n, p, gen, X, y);
  Eigen::MatrixXd S = robscout::estimate_covariance(X, std::nullopt, "default", true).matrix;

  robscout::GraphicalLasso gl;
  double ms = time_ms([&] { gl.solve_path(S, nlambda, 0.1); }, 3);
  std::cout << "\n=== Graphical lasso (p=" << p << ", nlambda=" << nlambda
            << ") ===" << std::endl;
  std::cout << "path:    " << std::fixed << std::setprecision(2) << ms
            << " ms/op" << std::endl;
}

// ===========================================================================
// Benchmark 3: Two-stage fit
// ===========================================================================

void bench_fit(int n, int p, int K) {
  std::mt19937 gen(42);
  Eigen::MatrixXd X;
  Eigen::VectorXd y;
  make_problem(n, p, gen, X, y);

  std::cout << "\n=== fit (n=" << n << ", p=" << p << ", K=" << K << ") ==="
            << std::endl;

  robscout::FitOptions opt;
  opt.K = K;
  opt.nlambda1 = 10;
  opt.nlambda2 = 20;

  opt.n_jobs = 1;
  double serial = time_ms([&] { robscout::fit(X, y, opt); }, 1);
  std::cout << "serial:   " << std::fixed << std::setprecision(2) << serial
            << " ms" << std::endl;

  opt.n_jobs = -1;
  double parallel = time_ms([&] { robscout::fit(X, y, opt); }, 1);
  std::cout << "parallel: " << std::fixed << std::setprecision(2) << parallel
            << " ms (x" << serial / parallel << ")" << std::endl;
}

int main() {
  std::cout << "========================================" << std::endl;
  std::cout << "    robscout Benchmark" << std::endl;
  std::cout << "========================================" << std::endl;

  bench_covariance(100, 50, 10);
  bench_covariance(500, 100, 3);

  bench_glasso(200, 50, 20);
  bench_glasso(200, 100, 10);

  bench_fit(100, 50, 5);
  bench_fit(200, 100, 10);

  std::cout << "\n========================================" << std::endl;
  std::cout << "    Benchmark Complete" << std::endl;
  std::cout << "========================================" << std::endl;

  return 0;
}
