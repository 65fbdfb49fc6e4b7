#ifndef ELASTIC_NET_ORACLE_HPP
#define ELASTIC_NET_ORACLE_HPP

#include "regression_oracle.hpp"
#include <vector>

namespace glv_em {

/**
 * @brief Tuning of the cross-validated elastic-net oracle.
 */
struct ElasticNetOptions {
    double alpha = 1.0;         ///< Mixing parameter: 1 = lasso, 0 = ridge.
    double penalty_blend = 1.0; ///< 1 selects lambda.1se, 0 selects lambda.min, in between blends linearly.
    int num_folds = 10;         ///< Cross-validation folds (reduced to the row count for small problems).
    unsigned int seed = 0;      ///< Seed for the fold assignment.

    // Cold start: coarse grid 10^max .. 10^min, then a fine grid around its minimum.
    double cold_grid_max_exponent = -1.0;
    double cold_grid_min_exponent = -9.0;
    int cold_grid_size = 20;
    double refine_factor = 20.0;
    int refine_grid_size = 100;

    // Warm start: grid from the previous penalty down to previous / warm_grid_ratio.
    double warm_grid_ratio = 5.0;
    int warm_grid_size = 50;

    double outlier_iqr_multiple = 5.0; ///< Rows with Y outside median +/- this * IQR are left out of the fit.
    int max_sweeps = 100000;           ///< Coordinate-descent sweeps per penalty value.
    double tolerance = 1e-7;           ///< Convergence threshold relative to the null deviance.

    /**
     * @throws std::invalid_argument on out-of-range settings.
     */
    void validate() const;
};

/**
 * @brief Cross-validated elastic net without intercept.
 *
 * Columns are scaled to unit root-mean-square before fitting and the penalty
 * applies to the scaled coefficients. The first column carries a zero penalty
 * factor, the others a factor of one (rescaled to sum to the column count).
 * Fits run by cyclic coordinate descent with warm starts along a decreasing
 * penalty path.
 */
class ElasticNetOracle : public RegressionOracle {
  public:
    /**
     * @brief Per-penalty cross-validation summary.
     */
    struct CrossValidation {
        std::vector<double> lambdas;         ///< Decreasing penalty grid.
        std::vector<double> mean_error;      ///< Fold-size-weighted mean squared prediction error.
        std::vector<double> standard_error;  ///< Standard error of mean_error.
        double lambda_min = 0.0;             ///< Largest penalty attaining the minimal error.
        double lambda_1se = 0.0;             ///< Largest penalty within one standard error of the minimum.
    };

    explicit ElasticNetOracle(ElasticNetOptions options = ElasticNetOptions());
    ~ElasticNetOracle() override = default;

    RegressionFit fit(const Eigen::VectorXd &response,
                      const Eigen::MatrixXd &design,
                      std::optional<double> previous_penalty) const override;

    std::string name() const override;

    const ElasticNetOptions &options() const { return options_; }

    /**
     * @brief K-fold cross-validation over a decreasing penalty grid.
     * @throws DegenerateRegressionError if fewer than three folds can be formed.
     */
    CrossValidation cross_validate(const Eigen::VectorXd &response,
                                   const Eigen::MatrixXd &design,
                                   const std::vector<double> &lambdas) const;

    /**
     * @brief Elastic-net coefficients at a single penalty, on the original column scale.
     */
    Eigen::VectorXd solve_at(const Eigen::VectorXd &response, const Eigen::MatrixXd &design, double lambda) const;

    /**
     * @brief Grid of `count` log-spaced values from `high` down to `low`.
     */
    static std::vector<double> log_spaced_grid(double high, double low, int count);

  private:
    ElasticNetOptions options_;

    // Coefficients along a decreasing penalty path; one column per lambda.
    Eigen::MatrixXd solve_path(const Eigen::VectorXd &response,
                               const Eigen::MatrixXd &design,
                               const std::vector<double> &lambdas) const;
};

} // namespace glv_em

#endif // ELASTIC_NET_ORACLE_HPP
