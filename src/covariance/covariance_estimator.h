/**
 * @file covariance_estimator.h
 * @brief robscout - Pluggable (robust) covariance estimators
 *
 * One strategy per class behind a common interface:
 *   - DefaultCovariance   ("default") sample covariance / correlation
 *   - WinsorCovariance    ("winsor")  bivariate winsorization, Lafit et al. 2022
 *   - WrapCovariance      ("wrap")    wrapped data, Raymaekers & Rousseeuw 2021
 *   - CellwiseCovariance  ("ddc")     cellwise-imputed data
 *
 * Every strategy answers two questions: cov(X) (p x p) and cov(X, y)
 * (returned as a p x 1 matrix).
 */
#ifndef ROBSCOUT_COVARIANCE_ESTIMATOR_H
#define ROBSCOUT_COVARIANCE_ESTIMATOR_H

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../stats/cellwise.h"

namespace robscout {

struct CovarianceEstimate {
    Eigen::MatrixXd matrix;               // p x p, or p x 1 for cov(X, y)
    std::vector<std::string> warnings;

    bool is_cross() const { return matrix.cols() == 1 && matrix.rows() >= 1; }
    Eigen::VectorXd vector() const { return matrix.col(0); }
};

class CovarianceEstimator {
public:
    virtual ~CovarianceEstimator() = default;

    virtual CovarianceEstimate estimate(const Eigen::MatrixXd& X, bool correlation = false) const = 0;

    virtual CovarianceEstimate estimate(const Eigen::MatrixXd& X,
                                        const Eigen::VectorXd& y,
                                        bool correlation = false) const = 0;

    virtual std::string name() const = 0;

    /// true if the strategy repairs individual cells rather than reweighting pairs.
    virtual bool repairs_cells() const { return false; }

    /**
     * @brief Data with repaired cells (X itself unless repairs_cells())
     *
     * Once a matrix has been cleaned, ordinary moments of it are the
     * strategy's estimate.
     */
    virtual Eigen::MatrixXd clean(const Eigen::MatrixXd& X, std::vector<std::string>& /*warnings*/) const {
        return X;
    }

    /// Repairs the rows of X_new using X_ref as the reference sample.
    virtual Eigen::MatrixXd clean_new(const Eigen::MatrixXd& /*X_ref*/, const Eigen::MatrixXd& X_new,
                                      std::vector<std::string>& /*warnings*/) const {
        return X_new;
    }
};

class DefaultCovariance : public CovarianceEstimator {
public:
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, bool correlation = false) const override;
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                bool correlation = false) const override;
    std::string name() const override { return "default"; }
};

/**
 * @brief Adjusted multivariate winsorization
 *
 * Columns are standardized by median/MAD, every pair gets a bivariate
 * winsorized correlation, and the correlation matrix is rescaled by the
 * MADs. The X-only covariance is projected to the nearest positive-definite
 * matrix since pairwise estimates need not be jointly PSD.
 */
class WinsorCovariance : public CovarianceEstimator {
public:
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, bool correlation = false) const override;
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                bool correlation = false) const override;
    std::string name() const override { return "winsor"; }
};

class WrapCovariance : public CovarianceEstimator {
public:
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, bool correlation = false) const override;
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                bool correlation = false) const override;
    std::string name() const override { return "wrap"; }
};

/**
 * @brief Covariance of cellwise-imputed data
 *
 * Cellwise detection needs at least two columns and three rows; below that
 * the raw data is used and a warning is attached to the estimate.
 */
class CellwiseCovariance : public CovarianceEstimator {
public:
    explicit CellwiseCovariance(std::shared_ptr<const stats::CellwiseImputer> imputer = nullptr);

    CovarianceEstimate estimate(const Eigen::MatrixXd& X, bool correlation = false) const override;
    CovarianceEstimate estimate(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                bool correlation = false) const override;
    std::string name() const override { return "ddc"; }

    bool repairs_cells() const override { return true; }

    Eigen::MatrixXd clean(const Eigen::MatrixXd& X, std::vector<std::string>& warnings) const override;

    /// Imputes X_new stacked under X_ref, so detection borrows the reference rows.
    Eigen::MatrixXd clean_new(const Eigen::MatrixXd& X_ref, const Eigen::MatrixXd& X_new,
                              std::vector<std::string>& warnings) const override;

private:
    std::shared_ptr<const stats::CellwiseImputer> imputer_;
};

/// Factory: "default", "winsor", "wrap", "ddc". Unknown tags throw std::invalid_argument.
std::unique_ptr<CovarianceEstimator> make_covariance_estimator(const std::string& method);

/// true if make_covariance_estimator accepts the tag.
bool is_known_covariance_method(const std::string& method);

/**
 * @brief Convenience entry point
 * @param X n x p data
 * @param y Optional response; when present a p x 1 cross-covariance is returned
 * @param method Strategy tag
 * @param correlation Return correlations instead of covariances
 */
CovarianceEstimate estimate_covariance(const Eigen::MatrixXd& X,
                                       const std::optional<Eigen::VectorXd>& y,
                                       const std::string& method = "default",
                                       bool correlation = false);

} // namespace robscout

#endif // ROBSCOUT_COVARIANCE_ESTIMATOR_H
