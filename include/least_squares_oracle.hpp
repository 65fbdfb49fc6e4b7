#ifndef LEAST_SQUARES_ORACLE_HPP
#define LEAST_SQUARES_ORACLE_HPP

#include "regression_oracle.hpp"

namespace glv_em {

/**
 * @brief Unpenalized least-squares oracle (column-pivoting QR).
 *
 * Ignores the previous penalty and reports a penalty of 0. Useful for
 * noiseless data and as a reference for the penalized oracle.
 */
class LeastSquaresOracle : public RegressionOracle {
  public:
    LeastSquaresOracle() = default;
    ~LeastSquaresOracle() override = default;

    RegressionFit fit(const Eigen::VectorXd &response,
                      const Eigen::MatrixXd &design,
                      std::optional<double> previous_penalty) const override;

    std::string name() const override;
};

} // namespace glv_em

#endif // LEAST_SQUARES_ORACLE_HPP
