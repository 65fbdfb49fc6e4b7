#include "elastic_net_oracle.hpp"
#include "robust_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <random>
#include <utility>

namespace glv_em {

namespace {

// Design with columns scaled to unit mean square.
struct ScaledDesign {
    Eigen::MatrixXd z;
    Eigen::VectorXd scale;          // root-mean-square of each original column, 0 for all-zero columns
    Eigen::VectorXd penalty_factor; // 0 for the first column, 1 otherwise, rescaled to sum to the column count
};

ScaledDesign
scale_design(const Eigen::MatrixXd &design) {
    const Eigen::Index n = design.rows();
    const Eigen::Index k = design.cols();
    ScaledDesign d;
    d.z.resize(n, k);
    d.scale.resize(k);
    for (Eigen::Index j = 0; j < k; ++j) {
        d.scale(j) = std::sqrt(design.col(j).squaredNorm() / static_cast<double>(n));
        if (d.scale(j) > 0.0) {
            d.z.col(j) = design.col(j) / d.scale(j);
        } else {
            d.z.col(j).setZero();
        }
    }

    d.penalty_factor = Eigen::VectorXd::Ones(k);
    d.penalty_factor(0) = 0.0;
    const double pf_sum = d.penalty_factor.sum();
    if (pf_sum > 0.0) { d.penalty_factor *= static_cast<double>(k) / pf_sum; }
    return d;
}

double
soft_threshold(double value, double threshold) {
    if (value > threshold) { return value - threshold; }
    if (value < -threshold) { return value + threshold; }
    return 0.0;
}

// Cyclic coordinate descent at one penalty. gamma (scaled coefficients) and
// residual = y - z * gamma are updated in place so the next penalty starts warm.
void
coordinate_descent(const ScaledDesign &d,
                   double lambda,
                   const ElasticNetOptions &opts,
                   double null_deviance,
                   Eigen::VectorXd &gamma,
                   Eigen::VectorXd &residual) {
    const double n = static_cast<double>(d.z.rows());
    const double threshold = opts.tolerance * std::max(null_deviance, std::numeric_limits<double>::min());

    for (int sweep = 0; sweep < opts.max_sweeps; ++sweep) {
        double max_change = 0.0;
        for (Eigen::Index j = 0; j < d.z.cols(); ++j) {
            if (d.scale(j) == 0.0) { continue; }
            const double old_value = gamma(j);
            const double rho = d.z.col(j).dot(residual) / n + old_value;
            const double l1 = lambda * opts.alpha * d.penalty_factor(j);
            const double l2 = lambda * (1.0 - opts.alpha) * d.penalty_factor(j);
            const double new_value = soft_threshold(rho, l1) / (1.0 + l2);
            const double delta = new_value - old_value;
            if (delta != 0.0) {
                residual -= delta * d.z.col(j);
                gamma(j) = new_value;
                max_change = std::max(max_change, delta * delta);
            }
        }
        if (max_change < threshold) { return; }
    }
    std::cerr << "    [ElasticNetOracle] Warning: coordinate descent did not converge in " << opts.max_sweeps
              << " sweeps (lambda=" << lambda << ")." << std::endl;
}

Eigen::MatrixXd
select_rows(const Eigen::MatrixXd &m, const std::vector<Eigen::Index> &rows) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(rows.size()), m.cols());
    for (size_t r = 0; r < rows.size(); ++r) { out.row(static_cast<Eigen::Index>(r)) = m.row(rows[r]); }
    return out;
}

Eigen::VectorXd
select_rows(const Eigen::VectorXd &v, const std::vector<Eigen::Index> &rows) {
    Eigen::VectorXd out(static_cast<Eigen::Index>(rows.size()));
    for (size_t r = 0; r < rows.size(); ++r) { out(static_cast<Eigen::Index>(r)) = v(rows[r]); }
    return out;
}

} // namespace

void
ElasticNetOptions::validate() const {
    if (!(alpha >= 0.0 && alpha <= 1.0)) { throw std::invalid_argument("Elastic-net alpha must lie in [0, 1]."); }
    if (!(penalty_blend >= 0.0 && penalty_blend <= 1.0)) {
        throw std::invalid_argument("Penalty blend fraction must lie in [0, 1].");
    }
    if (num_folds < 3) { throw std::invalid_argument("Cross-validation needs at least 3 folds."); }
    if (cold_grid_size < 2 || refine_grid_size < 2 || warm_grid_size < 2) {
        throw std::invalid_argument("Penalty grids need at least two values.");
    }
    if (!(cold_grid_max_exponent > cold_grid_min_exponent)) {
        throw std::invalid_argument("Cold grid exponents must be decreasing from max to min.");
    }
    if (!(refine_factor > 1.0) || !(warm_grid_ratio > 1.0)) {
        throw std::invalid_argument("Grid widening factors must exceed 1.");
    }
    if (!(outlier_iqr_multiple > 0.0)) { throw std::invalid_argument("Outlier IQR multiple must be positive."); }
    if (max_sweeps < 1 || !(tolerance > 0.0)) {
        throw std::invalid_argument("Coordinate-descent limits must be positive.");
    }
}

ElasticNetOracle::ElasticNetOracle(ElasticNetOptions options)
  : options_(std::move(options)) {
    options_.validate();
}

std::string
ElasticNetOracle::name() const {
    return "ElasticNetOracle";
}

std::vector<double>
ElasticNetOracle::log_spaced_grid(double high, double low, int count) {
    if (!(high > 0.0 && low > 0.0) || count < 1) {
        throw std::invalid_argument("Penalty grid bounds must be positive.");
    }
    std::vector<double> grid(static_cast<size_t>(count));
    const double log_high = std::log(high);
    const double log_low = std::log(low);
    for (int i = 0; i < count; ++i) {
        const double t = (count == 1) ? 0.0 : static_cast<double>(i) / static_cast<double>(count - 1);
        grid[static_cast<size_t>(i)] = std::exp(log_high + t * (log_low - log_high));
    }
    return grid;
}

Eigen::MatrixXd
ElasticNetOracle::solve_path(const Eigen::VectorXd &response,
                             const Eigen::MatrixXd &design,
                             const std::vector<double> &lambdas) const {
    const ScaledDesign d = scale_design(design);
    const double null_deviance = response.squaredNorm() / static_cast<double>(response.size());

    Eigen::VectorXd gamma = Eigen::VectorXd::Zero(design.cols());
    Eigen::VectorXd residual = response;
    Eigen::MatrixXd path(design.cols(), static_cast<Eigen::Index>(lambdas.size()));

    for (size_t l = 0; l < lambdas.size(); ++l) {
        coordinate_descent(d, lambdas[l], options_, null_deviance, gamma, residual);
        for (Eigen::Index j = 0; j < design.cols(); ++j) {
            path(j, static_cast<Eigen::Index>(l)) = d.scale(j) > 0.0 ? gamma(j) / d.scale(j) : 0.0;
        }
    }
    return path;
}

Eigen::VectorXd
ElasticNetOracle::solve_at(const Eigen::VectorXd &response, const Eigen::MatrixXd &design, double lambda) const {
    return solve_path(response, design, { lambda }).col(0);
}

ElasticNetOracle::CrossValidation
ElasticNetOracle::cross_validate(const Eigen::VectorXd &response,
                                 const Eigen::MatrixXd &design,
                                 const std::vector<double> &lambdas) const {
    const Eigen::Index n = design.rows();
    const int folds = static_cast<int>(std::min<Eigen::Index>(options_.num_folds, n));
    if (folds < 3) {
        throw DegenerateRegressionError("[ElasticNetOracle] Cross-validation needs at least 3 rows, got " +
                                        std::to_string(n) + ".");
    }

    // Balanced fold labels in a seeded random order.
    std::vector<int> fold_of(static_cast<size_t>(n));
    for (Eigen::Index r = 0; r < n; ++r) { fold_of[static_cast<size_t>(r)] = static_cast<int>(r % folds); }
    std::mt19937 rng(options_.seed);
    std::shuffle(fold_of.begin(), fold_of.end(), rng);

    const size_t num_lambdas = lambdas.size();
    Eigen::MatrixXd fold_error(folds, static_cast<Eigen::Index>(num_lambdas));
    Eigen::VectorXd fold_weight(folds);

    for (int f = 0; f < folds; ++f) {
        std::vector<Eigen::Index> train;
        std::vector<Eigen::Index> test;
        for (Eigen::Index r = 0; r < n; ++r) {
            (fold_of[static_cast<size_t>(r)] == f ? test : train).push_back(r);
        }
        const Eigen::MatrixXd x_train = select_rows(design, train);
        const Eigen::VectorXd y_train = select_rows(response, train);
        const Eigen::MatrixXd x_test = select_rows(design, test);
        const Eigen::VectorXd y_test = select_rows(response, test);

        const Eigen::MatrixXd path = solve_path(y_train, x_train, lambdas);
        for (size_t l = 0; l < num_lambdas; ++l) {
            const Eigen::VectorXd pred = x_test * path.col(static_cast<Eigen::Index>(l));
            fold_error(f, static_cast<Eigen::Index>(l)) = (y_test - pred).squaredNorm() / static_cast<double>(test.size());
        }
        fold_weight(f) = static_cast<double>(test.size());
    }

    CrossValidation cv;
    cv.lambdas = lambdas;
    cv.mean_error.resize(num_lambdas);
    cv.standard_error.resize(num_lambdas);
    const double total_weight = fold_weight.sum();
    for (size_t l = 0; l < num_lambdas; ++l) {
        const Eigen::VectorXd errors = fold_error.col(static_cast<Eigen::Index>(l));
        const double mean = errors.dot(fold_weight) / total_weight;
        const double var = (errors.array() - mean).square().matrix().dot(fold_weight) / total_weight;
        cv.mean_error[l] = mean;
        cv.standard_error[l] = std::sqrt(var / static_cast<double>(folds - 1));
    }

    // lambdas are decreasing, so the first index reaching a bound is the largest penalty.
    size_t best = 0;
    for (size_t l = 1; l < num_lambdas; ++l) {
        if (cv.mean_error[l] < cv.mean_error[best]) { best = l; }
    }
    cv.lambda_min = lambdas[best];
    const double bound = cv.mean_error[best] + cv.standard_error[best];
    cv.lambda_1se = cv.lambda_min;
    for (size_t l = 0; l < num_lambdas; ++l) {
        if (cv.mean_error[l] <= bound) {
            cv.lambda_1se = lambdas[l];
            break;
        }
    }
    return cv;
}

RegressionFit
ElasticNetOracle::fit(const Eigen::VectorXd &response,
                      const Eigen::MatrixXd &design,
                      std::optional<double> previous_penalty) const {
    if (response.size() != design.rows()) {
        throw std::invalid_argument("[ElasticNetOracle] Response length does not match design rows.");
    }
    if (design.cols() < 1) { throw std::invalid_argument("[ElasticNetOracle] Design needs at least one column."); }
    if (design.rows() < minimum_rows_for(design.cols())) {
        throw DegenerateRegressionError("[ElasticNetOracle] " + std::to_string(design.rows()) +
                                        " rows are not enough for " + std::to_string(design.cols()) + " regressors.");
    }
    if (!response.allFinite() || !design.allFinite()) {
        throw DegenerateRegressionError("[ElasticNetOracle] Non-finite values in regression inputs.");
    }

    // Keep extreme responses out of the fit so they cannot dominate it.
    const double center = stats::median(response);
    const double spread = options_.outlier_iqr_multiple * stats::iqr(response);
    std::vector<Eigen::Index> kept;
    for (Eigen::Index r = 0; r < response.size(); ++r) {
        if (response(r) <= center + spread && response(r) >= center - spread) { kept.push_back(r); }
    }
    if (static_cast<Eigen::Index>(kept.size()) < minimum_rows_for(design.cols())) {
        throw DegenerateRegressionError("[ElasticNetOracle] Only " + std::to_string(kept.size()) +
                                        " rows remain after outlier removal.");
    }
    const Eigen::MatrixXd x_fit = select_rows(design, kept);
    const Eigen::VectorXd y_fit = select_rows(response, kept);

    std::vector<double> grid;
    if (previous_penalty.has_value() && *previous_penalty > 0.0) {
        grid = log_spaced_grid(*previous_penalty, *previous_penalty / options_.warm_grid_ratio, options_.warm_grid_size);
    } else {
        const std::vector<double> coarse = log_spaced_grid(std::pow(10.0, options_.cold_grid_max_exponent),
                                                           std::pow(10.0, options_.cold_grid_min_exponent),
                                                           options_.cold_grid_size);
        const double coarse_min = cross_validate(y_fit, x_fit, coarse).lambda_min;
        grid = log_spaced_grid(
          coarse_min * options_.refine_factor, coarse_min / options_.refine_factor, options_.refine_grid_size);
    }

    const CrossValidation cv = cross_validate(y_fit, x_fit, grid);
    const double s = (1.0 - options_.penalty_blend) * cv.lambda_min + options_.penalty_blend * cv.lambda_1se;

    // Walk the grid down to s so the final fit starts warm.
    std::vector<double> path_lambdas;
    for (double l : grid) {
        if (l > s) { path_lambdas.push_back(l); }
    }
    path_lambdas.push_back(s);
    const Eigen::MatrixXd path = solve_path(y_fit, x_fit, path_lambdas);

    RegressionFit result;
    result.coefficients = path.col(path.cols() - 1);
    result.squared_residuals = (response - design * result.coefficients).array().square().matrix();
    result.penalty = s;
    return result;
}

} // namespace glv_em
