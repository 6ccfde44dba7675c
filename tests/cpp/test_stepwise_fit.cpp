#include "linear_model/stepwise_fitter.h"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>

using namespace robscout;

struct Scenario {
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
};

class Ar1Generator {
public:
    Ar1Generator(int p, double rho, double intercept, const Eigen::VectorXd& beta, double snr)
        : beta_(beta), intercept_(intercept) {
        Eigen::MatrixXd Sigma(p, p);
        for (int i = 0; i < p; ++i)
            for (int j = 0; j < p; ++j) Sigma(i, j) = std::pow(rho, std::abs(i - j));
        L_ = Sigma.llt().matrixL();
        sigma_ = std::sqrt(beta.dot(Sigma * beta) / snr);
    }

    Scenario draw(int n, std::mt19937& gen) const {
        std::normal_distribution<double> N(0.0, 1.0);
        const int p = static_cast<int>(L_.rows());
        Eigen::MatrixXd Z(n, p);
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < p; ++j) Z(i, j) = N(gen);
        Scenario s;
        s.X = Z * L_.transpose();
        s.y = s.X * beta_;
        for (int i = 0; i < n; ++i) s.y(i) += intercept_ + sigma_ * N(gen);
        return s;
    }

    double noise_sd() const { return sigma_; }

private:
    Eigen::MatrixXd L_;
    Eigen::VectorXd beta_;
    double intercept_;
    double sigma_;
};

// Test RMSPE relative to the noise level; 1 is the oracle
static double normalized_rmspe(const FittedModel& model, const Scenario& test, double noise_sd) {
    Eigen::VectorXd yhat = predict(model, test.X);
    return std::sqrt((test.y - yhat).squaredNorm() / test.y.size()) / noise_sd;
}

static bool init_rejects(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, const FitOptions& opt) {
    try {
        fit(X, y, opt);
    } catch (const std::invalid_argument& e) {
        std::cout << "  rejected at INIT: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "--- Stepwise Fit Test ---" << std::endl;

    const int n = 50;
    const int p = 40;
    Eigen::VectorXd beta = Eigen::VectorXd::Zero(p);
    beta(0) = 2.0;
    beta(5) = -1.5;
    beta(10) = 1.0;
    beta(20) = 1.5;
    beta(30) = -1.0;
    Ar1Generator model_gen(p, 0.5, 1.0, beta, 1.0);

    std::mt19937 gen(20240531);
    Scenario train = model_gen.draw(n, gen);
    Scenario test = model_gen.draw(1000, gen);

    FitOptions opt;
    opt.K = 5;
    opt.nlambda1 = 10;
    opt.nlambda2 = 10;
    opt.seed = 3;

    // Clean data, non-robust
    FittedModel clean_default = fit(train.X, train.y, opt);
    double nr_clean_default = normalized_rmspe(clean_default, test, model_gen.noise_sd());
    std::cout << "clean/default: lambda1 = " << clean_default.lambda1 << ", lambda2 = " << clean_default.lambda2
              << ", normalized RMSPE = " << nr_clean_default << std::endl;

    assert(clean_default.lambda1_path.size() == 10);
    assert(clean_default.lambda2_path.size() == 10);
    assert(clean_default.cv_errors.rows() == 10 && clean_default.cv_errors.cols() == 5);
    assert(clean_default.coefficients.size() == p);
    assert(clean_default.folds.size() == 5);
    assert(nr_clean_default > 0.9);
    assert(nr_clean_default < 1.5);

    // Selected penalties come from their paths; lambda2 minimizes the mean CV error
    {
        bool found = false;
        for (double l : clean_default.lambda2_path) found = found || (l == clean_default.lambda2);
        assert(found);
        Eigen::Index best;
        clean_default.cv_mean_errors.minCoeff(&best);
        assert(clean_default.lambda2_path[best] == clean_default.lambda2);
    }

    // Clean data, cellwise-robust preprocessing is not materially worse
    FitOptions ddc_opt = opt;
    ddc_opt.method_graph = "ddc";
    ddc_opt.method_xx = "ddc";
    ddc_opt.method_xy = "ddc";
    ddc_opt.scaling = stats::ScaleMethod::MedianMad;
    FittedModel clean_ddc = fit(train.X, train.y, ddc_opt);
    double nr_clean_ddc = normalized_rmspe(clean_ddc, test, model_gen.noise_sd());
    std::cout << "clean/ddc: normalized RMSPE = " << nr_clean_ddc << std::endl;
    assert(nr_clean_ddc < 1.2 * nr_clean_default);

    // Cellwise contamination of the training predictors, over several draws
    for (int rep = 0; rep < 3; ++rep) {
        std::mt19937 rep_gen(7100 + rep);
        Scenario dirty = (rep == 0) ? train : model_gen.draw(n, rep_gen);
        std::bernoulli_distribution hit(0.05);
        int contaminated = 0;
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < p; ++j) {
                if (hit(rep_gen)) {
                    dirty.X(i, j) = 15.0;
                    ++contaminated;
                }
            }
        }
        FittedModel dirty_default = fit(dirty.X, dirty.y, opt);
        FittedModel dirty_ddc = fit(dirty.X, dirty.y, ddc_opt);
        double nr_default = normalized_rmspe(dirty_default, test, model_gen.noise_sd());
        double nr_ddc = normalized_rmspe(dirty_ddc, test, model_gen.noise_sd());
        std::cout << "draw " << rep << ", " << contaminated << " contaminated cells: default = " << nr_default
                  << ", ddc = " << nr_ddc << " (lambda2 = " << dirty_ddc.lambda2 << ")" << std::endl;
        assert(nr_ddc < nr_default);
        // The repaired fit keeps a non-trivial coefficient vector
        assert(dirty_ddc.coefficients.cwiseAbs().maxCoeff() > 0.0);
    }

    // Prediction is a pure function of the model
    {
        Eigen::VectorXd a = predict(clean_default, test.X);
        Eigen::VectorXd b = predict(clean_default, test.X);
        assert(a == b);
        Eigen::VectorXd no_icpt = predict(clean_default, test.X, false);
        assert(((a - no_icpt).array() - clean_default.intercept).abs().maxCoeff() < 1e-10);

        Eigen::VectorXd orig = original_scale_coefficients(clean_default);
        for (int j = 0; j < p; ++j) {
            double expected = clean_default.coefficients(j) * clean_default.y_scale / clean_default.x_scale(j);
            assert(std::abs(orig(j) - expected) < 1e-12);
        }
        double icpt = clean_default.y_center - clean_default.x_center.dot(orig);
        assert(std::abs(icpt - clean_default.intercept) < 1e-10);

        bool threw = false;
        try { predict(clean_default, test.X.leftCols(p - 1)); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
    }

    // Results do not depend on the thread count
    {
        FitOptions par = opt;
        par.n_jobs = 4;
        FittedModel m4 = fit(train.X, train.y, par);
        assert(m4.cv_errors == clean_default.cv_errors);
        assert(m4.lambda2 == clean_default.lambda2);
        assert(m4.coefficients == clean_default.coefficients);
    }

    // Supplied folds, fixed lambda1, other norms, CV graph selection
    {
        Scenario small = model_gen.draw(30, gen);
        FitOptions o;
        o.K = 3;
        o.folds = FoldAssignment{{0, 3, 6, 9, 12, 15, 18, 21, 24, 27},
                                 {1, 4, 7, 10, 13, 16, 19, 22, 25, 28},
                                 {2, 5, 8, 11, 14, 17, 20, 23, 26, 29}};
        o.nlambda2 = 5;
        o.lambda1s = std::vector<double>{0.2};
        FittedModel m = fit(small.X, small.y, o);
        assert(m.folds == *o.folds);
        assert(m.lambda1 == 0.2);
        assert(m.lambda1_path.size() == 1);

        o.lambda1s.reset();
        o.nlambda1 = 4;
        o.graph_selection = GraphSelection::CrossValidated;
        o.criterion = "loglik";
        FittedModel cv = fit(small.X, small.y, o);
        assert(cv.graph_scores.size() == cv.lambda1_path.size());

        o.graph_selection = GraphSelection::Criterion;
        o.graph_norm = PenaltyNorm::L2;
        o.coef_norm = PenaltyNorm::L2;
        o.scaling = stats::ScaleMethod::MedianMad;
        o.method_xx = "wrap";
        FittedModel ridge = fit(small.X, small.y, o);
        assert(ridge.coefficients.allFinite());

        o.graph_norm = PenaltyNorm::None;
        o.coef_norm = PenaltyNorm::L1;
        FittedModel lasso_only = fit(small.X, small.y, o);
        assert(lasso_only.lambda1 == 0.0);
        assert(lasso_only.precision.size() == 0);
    }

    // Far fewer rows than predictors, short graph paths, every covariance strategy
    for (const char* method : {"default", "winsor", "wrap", "ddc"}) {
        for (int seed = 0; seed < 3; ++seed) {
            std::mt19937 small_gen(300 + seed);
            Scenario tiny = model_gen.draw(8, small_gen);
            FitOptions o;
            o.K = 2;
            o.seed = static_cast<std::uint32_t>(seed);
            o.nlambda1 = 3;
            o.nlambda2 = 5;
            o.method_graph = method;
            o.method_xx = method;
            o.method_xy = method;
            FittedModel m = fit(tiny.X, tiny.y, o);
            assert(m.lambda1_path.size() == 3);
            assert(m.coefficients.size() == p);
            assert(m.coefficients.allFinite());
            assert(std::isfinite(m.intercept));
            assert(predict(m, test.X).allFinite());

            o.nlambda1 = 2;
            FittedModel m2 = fit(tiny.X, tiny.y, o);
            assert(m2.lambda1_path.size() == 2);
        }
        std::cout << method << ": n = 8, p = 40 fits OK" << std::endl;
    }

    // INIT rejects invalid input before any fitting
    {
        Scenario small = model_gen.draw(12, gen);
        FitOptions o;
        o.K = 3;

        assert(init_rejects(small.X, small.y.head(11), o));
        assert(init_rejects(small.X.topRows(1), small.y.head(1), o));

        FitOptions bad = o;
        bad.K = 1;
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.K = 13;
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.folds = FoldAssignment{{0, 1, 2, 3}, {4, 5, 6, 7}};
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.folds = FoldAssignment{{0, 1, 2, 3}, {4, 5, 6, 7}, {8, 9, 10, 10}};
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.method_xx = "mcd";
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.criterion = "aic";
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.lambda2s = std::vector<double>{0.1, 0.5};
        assert(init_rejects(small.X, small.y, bad));
        bad = o;
        bad.lambda1_min_ratio = 1.5;
        assert(init_rejects(small.X, small.y, bad));

        // Two rows, two folds: each held-in part would have a single row
        bad = o;
        bad.K = 2;
        assert(init_rejects(small.X.topRows(2), small.y.head(2), bad));
    }

    std::cout << "Stepwise Fit Test Passed!" << std::endl;
    return 0;
}
