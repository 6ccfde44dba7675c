/**
 * @file cellwise.h
 * @brief robscout - Cellwise outlier detection and imputation
 *
 * A DetectDeviatingCells-style procedure (Rousseeuw & Van den Bossche, 2018):
 * cells are flagged either because they are univariately extreme or because
 * they deviate from the value predicted by correlated columns, and flagged
 * cells are replaced by their predictions.
 */
#ifndef ROBSCOUT_CELLWISE_H
#define ROBSCOUT_CELLWISE_H

#include <Eigen/Dense>

namespace robscout {
namespace stats {

using FlagMatrix = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * @brief Interface for cellwise imputers
 *
 * impute() must return a matrix with the same shape as its input.
 */
class CellwiseImputer {
public:
    virtual ~CellwiseImputer() = default;
    virtual Eigen::MatrixXd impute(const Eigen::MatrixXd& X) const = 0;
};

struct DeviatingCellsResult {
    Eigen::MatrixXd imputed;      // X with flagged cells replaced
    Eigen::MatrixXd predicted;    // per-cell predictions (original scale)
    Eigen::MatrixXd std_residuals;
    FlagMatrix flagged;
    int n_flagged;
};

class DeviatingCellsImputer : public CellwiseImputer {
public:
    double cutoff = 2.5758293035489;  // sqrt(qchisq(0.99, 1))
    double cor_threshold = 0.5;       // minimum |robust correlation| for a neighbour
    int max_neighbours = 100;

    DeviatingCellsResult detect(const Eigen::MatrixXd& X) const;

    Eigen::MatrixXd impute(const Eigen::MatrixXd& X) const override {
        return detect(X).imputed;
    }
};

} // namespace stats
} // namespace robscout

#endif // ROBSCOUT_CELLWISE_H
