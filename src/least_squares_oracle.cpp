#include "least_squares_oracle.hpp"

namespace glv_em {

std::string
LeastSquaresOracle::name() const {
    return "LeastSquaresOracle";
}

RegressionFit
LeastSquaresOracle::fit(const Eigen::VectorXd &response,
                        const Eigen::MatrixXd &design,
                        std::optional<double> /* previous_penalty */) const {
    if (response.size() != design.rows()) {
        throw std::invalid_argument("[LeastSquaresOracle] Response length does not match design rows.");
    }
    if (design.rows() < minimum_rows_for(design.cols())) {
        throw DegenerateRegressionError("[LeastSquaresOracle] " + std::to_string(design.rows()) +
                                        " rows are not enough for " + std::to_string(design.cols()) + " regressors.");
    }
    if (!response.allFinite() || !design.allFinite()) {
        throw DegenerateRegressionError("[LeastSquaresOracle] Non-finite values in regression inputs.");
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> dec(design);
    if (dec.rank() < design.cols()) {
        throw DegenerateRegressionError("[LeastSquaresOracle] Design matrix is rank-deficient (rank " +
                                        std::to_string(dec.rank()) + " of " + std::to_string(design.cols()) + ").");
    }

    RegressionFit result;
    result.coefficients = dec.solve(response);
    result.squared_residuals = (response - design * result.coefficients).array().square().matrix();
    result.penalty = 0.0;
    return result;
}

} // namespace glv_em
