#include "m_step.hpp"
#include "robust_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace glv_em {

SampleBiomassEstimate
estimate_sample_biomass(const ParameterEstimate &parameters, const Eigen::VectorXd &abundances) {
    const Eigen::Index p = parameters.num_taxa();
    if (abundances.size() != p || parameters.interactions.rows() != p || parameters.interactions.cols() != p) {
        throw std::invalid_argument("[MStep] Parameter and abundance dimensions disagree.");
    }

    const Eigen::VectorXd bx = parameters.interactions * abundances;

    int present = 0;
    std::vector<double> positive;
    double least_negative = -std::numeric_limits<double>::infinity();
    for (Eigen::Index i = 0; i < p; ++i) {
        if (abundances(i) == 0.0) { continue; }
        ++present;
        const double c = -parameters.growth_rates(i) / bx(i);
        if (c > 0.0) {
            positive.push_back(c);
        } else if (c < 0.0 && c > least_negative) {
            least_negative = c;
        }
    }
    if (present == 0) { throw std::invalid_argument("[MStep] Sample has no present taxa."); }

    SampleBiomassEstimate estimate;
    if (positive.empty()) {
        // Zero and undefined candidates cannot yield a positive biomass.
        if (!std::isfinite(least_negative)) {
            throw std::runtime_error("[MStep] No present taxon proposes a non-zero biomass.");
        }
        estimate.biomass = -least_negative;
        estimate.used_fallback = true;
    } else {
        estimate.biomass = stats::median(positive);
    }

    estimate.relative_residuals = ((estimate.biomass * bx + parameters.growth_rates).array() /
                                   parameters.growth_rates.array()).matrix();
    for (Eigen::Index i = 0; i < p; ++i) {
        if (abundances(i) == 0.0) { estimate.relative_residuals(i) = 0.0; }
    }
    return estimate;
}

MStepResult
run_m_step(const AbundanceMatrix &abundances, const ParameterEstimate &parameters, int num_threads) {
    const Eigen::Index p = abundances.rows();
    const Eigen::Index n = abundances.cols();
    if (parameters.num_taxa() != p) {
        throw std::invalid_argument("[MStep] Parameter estimate does not match the number of taxa.");
    }
    for (Eigen::Index s = 0; s < n; ++s) {
        if ((abundances.col(s).array() == 0.0).all()) {
            throw std::invalid_argument("[MStep] Sample " + std::to_string(s + 1) + " has no present taxa.");
        }
    }

    MStepResult result;
    result.biomass.resize(n);
    result.relative_residuals.resize(p, n);
    result.used_fallback = SampleFlags::Constant(n, false);
    const int threads = num_threads > 0 ? num_threads : 1;
    std::vector<std::exception_ptr> errors(static_cast<size_t>(n));

#pragma omp parallel for num_threads(threads) schedule(static)
    for (Eigen::Index s = 0; s < n; ++s) {
        try {
            const SampleBiomassEstimate e = estimate_sample_biomass(parameters, abundances.col(s));
            result.biomass(s) = e.biomass;
            result.relative_residuals.col(s) = e.relative_residuals;
            result.used_fallback(s) = e.used_fallback;
        } catch (...) {
            errors[static_cast<size_t>(s)] = std::current_exception();
        }
    }

    for (const std::exception_ptr &error : errors) {
        if (error) { std::rethrow_exception(error); }
    }
    return result;
}

} // namespace glv_em
