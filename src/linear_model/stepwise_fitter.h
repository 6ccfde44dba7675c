/**
 * @file stepwise_fitter.h
 * @brief robscout - Two-stage cross-validated scout regression
 *
 * fit() tunes the graph penalty lambda1 once on the full data (information
 * criterion or cross-validated likelihood), then tunes the coefficient
 * penalty lambda2 by K-fold RMSPE with lambda1 held fixed, and finally
 * refits both stages on every row.
 *
 * Holding lambda1 fixed inside the coefficient CV makes the reported CV
 * error optimistic: lambda1 has already seen every fold.
 *
 * Usage:
 *   robscout::FitOptions opt;
 *   opt.K = 5;
 *   opt.method_xx = "ddc";
 *   robscout::FittedModel model = robscout::fit(X, y, opt);
 *   Eigen::VectorXd yhat = robscout::predict(model, X_new);
 */
#ifndef ROBSCOUT_STEPWISE_FITTER_H
#define ROBSCOUT_STEPWISE_FITTER_H

#include <Eigen/Dense>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "coefficient_selector.h"
#include "coefficient_solver.h"
#include "../graphical/penalty_path.h"
#include "../graphical/precision_solver.h"
#include "../stats/robust_scale.h"
#include "../validation/folds.h"

namespace robscout {

enum class FitStage {
    Init,
    GraphSelected,
    CvCoefficientSelected,
    FinalFit,
    Done
};

std::string to_string(FitStage stage);

/// How lambda1 is chosen.
enum class GraphSelection {
    Criterion,        // information criterion on the full data
    CrossValidated    // held-out criterion averaged over the CV folds
};

struct FitOptions {
    // Cross-validation
    int K = 5;
    std::optional<FoldAssignment> folds;    // drawn from seed when absent
    std::uint32_t seed = 42;
    int n_jobs = 1;                         // <= 0: all cores

    // Penalties
    PenaltyNorm graph_norm = PenaltyNorm::L1;
    PenaltyNorm coef_norm = PenaltyNorm::L1;
    int nlambda1 = 100;
    int nlambda2 = 100;
    double lambda1_min_ratio = 0.1;
    double lambda2_min_ratio = 0.01;
    std::optional<std::vector<double>> lambda1s;   // one value: lambda1 fixed, no search
    std::optional<std::vector<double>> lambda2s;

    // Graph selection
    GraphSelection graph_selection = GraphSelection::Criterion;
    std::string criterion = "ebic";

    // Covariance strategies
    std::string method_graph = "default";   // lambda1 selection
    std::string method_xx = "default";      // predictor covariance in the coefficient stage
    std::string method_xy = "default";      // predictor/response covariance

    bool standardize = true;
    stats::ScaleMethod scaling = stats::ScaleMethod::MeanSd;
    bool rescale = true;

    std::shared_ptr<const PrecisionPathSolver> precision_solver;
    std::shared_ptr<const CoefficientPathSolver> coefficient_solver;

    bool verbose = false;
};

struct FittedModel {
    double lambda1 = 0.0;
    double lambda2 = 0.0;
    Eigen::VectorXd coefficients;   // standardized scale
    double intercept = 0.0;
    Eigen::VectorXd x_center;
    Eigen::VectorXd x_scale;
    double y_center = 0.0;
    double y_scale = 1.0;

    // Diagnostics
    PenaltyNorm graph_norm = PenaltyNorm::L1;
    PenaltyNorm coef_norm = PenaltyNorm::L1;
    std::vector<double> lambda1_path;
    std::vector<double> lambda2_path;
    std::vector<double> graph_scores;     // criterion (or mean CV criterion) per lambda1
    Eigen::MatrixXd cv_errors;            // lambda2_path.size() x K held-out RMSPE
    Eigen::VectorXd cv_mean_errors;
    Eigen::MatrixXd precision;            // graph-stage precision at lambda1 (empty if none)
    FoldAssignment folds;
    std::vector<std::string> warnings;
};

FittedModel fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, const FitOptions& options = FitOptions());

/// coefficients * y_scale / x_scale.
Eigen::VectorXd original_scale_coefficients(const FittedModel& model);

Eigen::VectorXd predict(const FittedModel& model, const Eigen::MatrixXd& X_new, bool use_intercept = true);

} // namespace robscout

#endif // ROBSCOUT_STEPWISE_FITTER_H
