#include "e_step.hpp"
#include "robust_statistics.hpp"
#include <exception>
#include <limits>
#include <sstream>

namespace glv_em {

namespace internal {

std::vector<Eigen::Index>
retained_samples(const AbundanceMatrix &abundances, const ExclusionMask &mask, Eigen::Index taxon) {
    std::vector<Eigen::Index> samples;
    for (Eigen::Index s = 0; s < abundances.cols(); ++s) {
        if (abundances(taxon, s) != 0.0 && !mask(taxon, s)) { samples.push_back(s); }
    }
    return samples;
}

TaxonFit
fit_taxon(const AbundanceMatrix &abundances,
          const Eigen::VectorXd &biomass,
          const ExclusionMask &mask,
          const RegressionOracle &oracle,
          Eigen::Index taxon,
          std::optional<double> previous_penalty,
          bool center) {
    const Eigen::Index p = abundances.rows();
    const Eigen::Index n = abundances.cols();
    const std::vector<Eigen::Index> samples = retained_samples(abundances, mask, taxon);
    const Eigen::Index rows = static_cast<Eigen::Index>(samples.size());

    // Column 0 is 1/biomass (growth rate), then every other taxon in index order.
    Eigen::VectorXd y(rows);
    Eigen::MatrixXd x(rows, p);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const Eigen::Index s = samples[static_cast<size_t>(r)];
        y(r) = abundances(taxon, s);
        x(r, 0) = 1.0 / biomass(s);
        Eigen::Index col = 1;
        for (Eigen::Index j = 0; j < p; ++j) {
            if (j == taxon) { continue; }
            x(r, col++) = abundances(j, s);
        }
    }
    if (center && rows > 0) {
        y.array() -= y.mean();
        const Eigen::RowVectorXd column_means = x.colwise().mean();
        x.rowwise() -= column_means;
    }

    // The self-interaction is the response itself: x_i = a_i/m + sum_{j != i} B_ij x_j with B_ii = -1.
    const RegressionFit fit = oracle.fit(y, x, previous_penalty);
    if (fit.coefficients.size() != p || fit.squared_residuals.size() != rows) {
        throw std::runtime_error("[EStep] Oracle '" + oracle.name() + "' returned a result of the wrong shape.");
    }

    TaxonFit result;
    result.growth_rate = fit.coefficients(0);
    result.interaction_row.resize(p);
    Eigen::Index col = 1;
    for (Eigen::Index j = 0; j < p; ++j) {
        result.interaction_row(j) = (j == taxon) ? -1.0 : fit.coefficients(col++);
    }
    result.squared_residuals = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::quiet_NaN());
    for (Eigen::Index r = 0; r < rows; ++r) {
        result.squared_residuals(samples[static_cast<size_t>(r)]) = fit.squared_residuals(r);
    }
    result.penalty = fit.penalty;
    result.retained = static_cast<int>(rows);

    result.entropy_row.resize(p);
    for (Eigen::Index j = 0; j < p; ++j) {
        std::vector<double> pattern;
        pattern.reserve(samples.size());
        for (Eigen::Index s : samples) { pattern.push_back(abundances(j, s)); }
        result.entropy_row(j) = stats::binary_entropy(pattern);
    }
    return result;
}

} // namespace internal

EStepResult
run_e_step(const AbundanceMatrix &abundances,
           const Eigen::VectorXd &biomass,
           const ExclusionMask &mask,
           const RegressionOracle &oracle,
           const std::optional<Eigen::VectorXd> &previous_penalties,
           const EStepOptions &options) {
    const Eigen::Index p = abundances.rows();
    const Eigen::Index n = abundances.cols();
    if (biomass.size() != n) { throw std::invalid_argument("[EStep] Biomass length does not match sample count."); }
    if (mask.rows() != p || mask.cols() != n) {
        throw std::invalid_argument("[EStep] Exclusion mask shape does not match abundances.");
    }
    if (previous_penalties.has_value() && previous_penalties->size() != p) {
        throw std::invalid_argument("[EStep] Previous penalties must have one entry per taxon.");
    }

    std::vector<internal::TaxonFit> fits(static_cast<size_t>(p));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(p));
    const int threads = options.num_threads > 0 ? options.num_threads : 1;

    // Exceptions must not leave the parallel region; they are re-raised below.
#pragma omp parallel for num_threads(threads) schedule(dynamic)
    for (Eigen::Index i = 0; i < p; ++i) {
        std::optional<double> warm;
        if (previous_penalties.has_value()) { warm = (*previous_penalties)(i); }
        try {
            fits[static_cast<size_t>(i)] =
              internal::fit_taxon(abundances, biomass, mask, oracle, i, warm, options.center);
        } catch (...) {
            errors[static_cast<size_t>(i)] = std::current_exception();
        }
    }

    std::vector<Eigen::Index> failed;
    std::stringstream details;
    for (Eigen::Index i = 0; i < p; ++i) {
        if (!errors[static_cast<size_t>(i)]) { continue; }
        try {
            std::rethrow_exception(errors[static_cast<size_t>(i)]);
        } catch (const DegenerateRegressionError &e) {
            if (!failed.empty()) { details << "; "; }
            details << "taxon " << (i + 1) << ": " << e.what();
            failed.push_back(i);
        }
    }
    if (!failed.empty()) { throw TaxonFitError(std::move(failed), details.str()); }

    EStepResult result;
    result.parameters.growth_rates.resize(p);
    result.parameters.interactions.resize(p, p);
    result.squared_residuals.resize(p, n);
    result.penalties.resize(p);
    result.coefficient_entropy.resize(p, p);
    result.retained_counts.resize(p);
    for (Eigen::Index i = 0; i < p; ++i) {
        const internal::TaxonFit &fit = fits[static_cast<size_t>(i)];
        result.parameters.growth_rates(i) = fit.growth_rate;
        result.parameters.interactions.row(i) = fit.interaction_row.transpose();
        result.squared_residuals.row(i) = fit.squared_residuals.transpose();
        result.penalties(i) = fit.penalty;
        result.coefficient_entropy.row(i) = fit.entropy_row.transpose();
        result.retained_counts(i) = fit.retained;
    }
    snap_small_interactions(result.parameters.interactions, options.coefficient_snap_threshold);
    return result;
}

} // namespace glv_em
