#ifndef M_STEP_HPP
#define M_STEP_HPP

#include "abundance_data.hpp"
#include "parameter_estimate.hpp"
#include <Eigen/Dense>

namespace glv_em {

/**
 * @brief Biomass of a single sample under fixed parameters.
 */
struct SampleBiomassEstimate {
    double biomass = 0.0;
    Eigen::VectorXd relative_residuals; ///< (m (Bx)_i + a_i) / a_i, 0 for taxa absent from the sample.
    bool used_fallback = false;         ///< True when no candidate ratio was strictly positive.
};

/**
 * @brief Closed-form biomass for one sample.
 *
 * Every present taxon i proposes m_i = -a_i / (B x)_i. The biomass is the
 * median of the strictly positive candidates. When there is none, it is the
 * magnitude of the least negative candidate; zero candidates never vote.
 *
 * @param parameters Current (a, B).
 * @param abundances Relative abundances of the sample, length p.
 * @throws std::invalid_argument if no taxon is present or the lengths disagree.
 * @throws std::runtime_error if no candidate is strictly positive or strictly negative.
 */
SampleBiomassEstimate
estimate_sample_biomass(const ParameterEstimate &parameters, const Eigen::VectorXd &abundances);

/**
 * @brief Output of an M-step over all samples.
 */
struct MStepResult {
    Eigen::VectorXd biomass;            ///< One value per sample (not yet rescaled).
    Eigen::MatrixXd relative_residuals; ///< Taxa x samples.
    SampleFlags used_fallback;          ///< Samples that took the all-negative branch.
};

/**
 * @brief Estimates every sample's biomass independently, on up to `num_threads` threads.
 */
MStepResult
run_m_step(const AbundanceMatrix &abundances, const ParameterEstimate &parameters, int num_threads = 1);

} // namespace glv_em

#endif // M_STEP_HPP
