#ifndef PARAMETER_ESTIMATE_HPP
#define PARAMETER_ESTIMATE_HPP

#include <Eigen/Dense>

namespace glv_em {

/// Off-diagonal interactions with magnitude below this are set to zero after each fit.
constexpr double DEFAULT_COEFFICIENT_SNAP_THRESHOLD = 1e-5;

/**
 * @brief Scaled gLV parameters.
 *
 * Both the growth rates and the interactions are divided by each taxon's own
 * self-interaction strength, so the diagonal of `interactions` is exactly -1.
 */
struct ParameterEstimate {
    Eigen::VectorXd growth_rates; ///< a, length p.
    Eigen::MatrixXd interactions; ///< B, p x p; row i holds the effects of every taxon on taxon i.

    Eigen::Index num_taxa() const { return growth_rates.size(); }
};

/**
 * @brief Sets entries of B with |B_ij| < threshold to zero. The -1 diagonal is unaffected.
 */
inline void
snap_small_interactions(Eigen::MatrixXd &interactions, double threshold) {
    interactions = (interactions.array().abs() < threshold).select(0.0, interactions.array()).matrix();
}

} // namespace glv_em

#endif // PARAMETER_ESTIMATE_HPP
