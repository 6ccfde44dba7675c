#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <cstdint>

#include "../covariance/covariance_estimator.h"
#include "../graphical/penalty_path.h"
#include "../graphical/precision_selector.h"
#include "../linear_model/stepwise_fitter.h"
#include "../validation/folds.h"

namespace py = pybind11;
using namespace robscout;

// Python-facing estimator around fit()/predict()
class ScoutRegression {
public:
    FittedModel model;
    bool is_fitted = false;

    ScoutRegression() = default;

    ScoutRegression& fit(
        const Eigen::MatrixXd& X,
        const Eigen::VectorXd& y,
        int K = 5,
        int p1 = 1,
        int p2 = 1,
        int nlambda1 = 100,
        int nlambda2 = 100,
        double lambda1_min_ratio = 0.1,
        double lambda2_min_ratio = 0.01,
        std::optional<std::vector<double>> lambda1s = std::nullopt,
        std::optional<std::vector<double>> lambda2s = std::nullopt,
        const std::string& criterion = "ebic",
        const std::string& graph_selection = "criterion",
        const std::string& method_graph = "default",
        const std::string& method_xx = "default",
        const std::string& method_xy = "default",
        bool standardize = true,
        const std::string& scaling = "mean_sd",
        bool rescale = true,
        std::optional<FoldAssignment> folds = std::nullopt,
        std::uint32_t seed = 42,
        int n_jobs = 1,
        bool verbose = false
    ) {
        FitOptions opt;
        opt.K = K;
        opt.graph_norm = penalty_norm_from_int(p1);
        opt.coef_norm = penalty_norm_from_int(p2);
        opt.nlambda1 = nlambda1;
        opt.nlambda2 = nlambda2;
        opt.lambda1_min_ratio = lambda1_min_ratio;
        opt.lambda2_min_ratio = lambda2_min_ratio;
        opt.lambda1s = std::move(lambda1s);
        opt.lambda2s = std::move(lambda2s);
        opt.criterion = criterion;
        if (graph_selection == "criterion") {
            opt.graph_selection = GraphSelection::Criterion;
        } else if (graph_selection == "cv") {
            opt.graph_selection = GraphSelection::CrossValidated;
        } else {
            throw std::invalid_argument("graph_selection must be 'criterion' or 'cv'");
        }
        opt.method_graph = method_graph;
        opt.method_xx = method_xx;
        opt.method_xy = method_xy;
        opt.standardize = standardize;
        opt.scaling = stats::scale_method_from_string(scaling);
        opt.rescale = rescale;
        opt.folds = std::move(folds);
        opt.seed = seed;
        opt.n_jobs = n_jobs;
        opt.verbose = verbose;

        {
            py::gil_scoped_release release;
            model = robscout::fit(X, y, opt);
        }
        is_fitted = true;
        return *this;
    }

    Eigen::VectorXd predict(const Eigen::MatrixXd& X, bool use_intercept = true) const {
        if (!is_fitted) throw std::runtime_error("Model must be fitted before calling predict");
        return robscout::predict(model, X, use_intercept);
    }

    Eigen::VectorXd get_coef() const {
        return is_fitted ? original_scale_coefficients(model) : Eigen::VectorXd(0);
    }
};

PYBIND11_MODULE(robscout, m) {
    m.doc() = "Robust scout regression: robust covariance, sparse precision, two-stage CV";

    py::class_<ScoutRegression>(m, "ScoutRegression")
        .def(py::init<>())
        .def("fit", &ScoutRegression::fit, py::return_value_policy::reference,
             py::arg("X"), py::arg("y"), py::arg("K") = 5,
             py::arg("p1") = 1, py::arg("p2") = 1,
             py::arg("nlambda1") = 100, py::arg("nlambda2") = 100,
             py::arg("lambda1_min_ratio") = 0.1, py::arg("lambda2_min_ratio") = 0.01,
             py::arg("lambda1s") = py::none(), py::arg("lambda2s") = py::none(),
             py::arg("criterion") = "ebic", py::arg("graph_selection") = "criterion",
             py::arg("method_graph") = "default", py::arg("method_xx") = "default",
             py::arg("method_xy") = "default",
             py::arg("standardize") = true, py::arg("scaling") = "mean_sd",
             py::arg("rescale") = true, py::arg("folds") = py::none(),
             py::arg("seed") = 42, py::arg("n_jobs") = 1, py::arg("verbose") = false)
        .def("predict", &ScoutRegression::predict,
             py::arg("X"), py::arg("use_intercept") = true)
        .def_property_readonly("coef_", &ScoutRegression::get_coef)
        .def_property_readonly("intercept_", [](const ScoutRegression& self) { return self.is_fitted ? self.model.intercept : 0.0; })
        .def_property_readonly("lambda1", [](const ScoutRegression& self) { return self.model.lambda1; })
        .def_property_readonly("lambda2", [](const ScoutRegression& self) { return self.model.lambda2; })
        .def_property_readonly("standardized_coef", [](const ScoutRegression& self) { return self.model.coefficients; })
        .def_property_readonly("x_center", [](const ScoutRegression& self) { return self.model.x_center; })
        .def_property_readonly("x_scale", [](const ScoutRegression& self) { return self.model.x_scale; })
        .def_property_readonly("y_center", [](const ScoutRegression& self) { return self.model.y_center; })
        .def_property_readonly("y_scale", [](const ScoutRegression& self) { return self.model.y_scale; })
        .def_property_readonly("lambda1_path", [](const ScoutRegression& self) { return self.model.lambda1_path; })
        .def_property_readonly("lambda2_path", [](const ScoutRegression& self) { return self.model.lambda2_path; })
        .def_property_readonly("graph_scores", [](const ScoutRegression& self) { return self.model.graph_scores; })
        .def_property_readonly("cv_errors", [](const ScoutRegression& self) { return self.model.cv_errors; })
        .def_property_readonly("cv_mean_errors", [](const ScoutRegression& self) { return self.model.cv_mean_errors; })
        .def_property_readonly("precision", [](const ScoutRegression& self) { return self.model.precision; })
        .def_property_readonly("folds", [](const ScoutRegression& self) { return self.model.folds; })
        .def_property_readonly("warnings", [](const ScoutRegression& self) { return self.model.warnings; })
        ;

    m.def("estimate_covariance",
          [](const Eigen::MatrixXd& X, std::optional<Eigen::VectorXd> y,
             const std::string& method, bool correlation) {
              CovarianceEstimate est = estimate_covariance(X, y, method, correlation);
              return py::make_tuple(est.matrix, est.warnings);
          },
          py::arg("X"), py::arg("y") = py::none(), py::arg("method") = "default",
          py::arg("correlation") = false,
          "Covariance (or p x 1 cross-covariance with y) and any warnings");

    m.def("select_precision",
          [](const Eigen::MatrixXd& X, std::optional<Eigen::MatrixXd> X_test,
             const std::string& method, const std::string& criterion, int norm,
             int nlambda, double lambda_min_ratio, std::optional<std::vector<double>> lambdas,
             bool standardize) {
              PrecisionSelectOptions opt;
              opt.method = method;
              opt.criterion = criterion;
              opt.norm = penalty_norm_from_int(norm);
              opt.nlambda = nlambda;
              opt.lambda_min_ratio = lambda_min_ratio;
              opt.lambdas = std::move(lambdas);
              opt.standardize = standardize;
              PrecisionSelection sel = robscout::select_precision(X, X_test, opt);
              py::dict out;
              out["precision"] = sel.precision;
              out["covariance"] = sel.covariance;
              out["best_penalty"] = sel.best_penalty;
              out["best_index"] = sel.best_index;
              out["path"] = sel.path;
              out["scores"] = sel.scores;
              out["input_covariance"] = sel.input_covariance;
              out["warnings"] = sel.warnings;
              return out;
          },
          py::arg("X"), py::arg("X_test") = py::none(), py::arg("method") = "default",
          py::arg("criterion") = "ebic", py::arg("norm") = 1, py::arg("nlambda") = 100,
          py::arg("lambda_min_ratio") = 0.1, py::arg("lambdas") = py::none(),
          py::arg("standardize") = false);

    m.def("draw_folds",
          [](int n, int K, std::uint32_t seed) {
              std::mt19937 gen(seed);
              return robscout::draw_folds(n, K, gen);
          },
          py::arg("n"), py::arg("K"), py::arg("seed") = 42);

    m.def("criterion_score",
          [](const Eigen::MatrixXd& Theta, const Eigen::MatrixXd& Sigma, int n, const std::string& criterion) {
              return robscout::criterion_score(Theta, Sigma, n, criterion);
          },
          py::arg("Theta"), py::arg("Sigma"), py::arg("n"), py::arg("criterion") = "ebic");
}
