#ifndef REGRESSION_ORACLE_HPP
#define REGRESSION_ORACLE_HPP

#include <Eigen/Dense>
#include <optional>
#include <stdexcept>
#include <string>

namespace glv_em {

/**
 * @brief Thrown by a RegressionOracle that cannot fit a sub-problem
 *        (too few rows, rank-deficient design, non-finite data).
 */
class DegenerateRegressionError : public std::runtime_error {
  public:
    explicit DegenerateRegressionError(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * @brief Result of one penalized regression.
 */
struct RegressionFit {
    Eigen::VectorXd coefficients;      ///< One per design column; the first is unpenalized.
    Eigen::VectorXd squared_residuals; ///< (Y - X * coefficients)^2 for every row of the design.
    double penalty = 0.0;              ///< Selected penalty strength (0 for unpenalized fits).
};

/**
 * @brief Abstract per-taxon regression capability consumed by the E-step.
 *
 * The first design column is never penalized; all others are. Implementations
 * must be safe to call concurrently from several threads on distinct problems
 * (fit() is const and must not touch shared mutable state).
 */
class RegressionOracle {
  public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~RegressionOracle() = default;

    /**
     * @brief Fits Y ~ X without intercept.
     *
     * @param response Y, one entry per retained sample.
     * @param design X, rows = retained samples, columns = regressors.
     * @param previous_penalty Penalty chosen for the same taxon in the previous
     *        iteration, used to narrow the search; empty for a cold start.
     * @return RegressionFit Coefficients, squared residuals and the selected penalty.
     * @throws DegenerateRegressionError if the problem cannot be fitted.
     */
    virtual RegressionFit fit(const Eigen::VectorXd &response,
                              const Eigen::MatrixXd &design,
                              std::optional<double> previous_penalty) const = 0;

    /**
     * @brief Returns the name of the oracle implementation.
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Minimum number of rows an oracle accepts for a design with `num_regressors` columns.
 */
inline Eigen::Index
minimum_rows_for(Eigen::Index num_regressors) {
    return num_regressors + 2;
}

} // namespace glv_em

#endif // REGRESSION_ORACLE_HPP
