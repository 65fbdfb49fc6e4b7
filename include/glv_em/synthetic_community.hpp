#ifndef SYNTHETIC_COMMUNITY_HPP
#define SYNTHETIC_COMMUNITY_HPP

#include "../abundance_data.hpp"
#include "../parameter_estimate.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace glv_em {
namespace synthetic {

/**
 * @brief Generalized Lotka-Volterra model on absolute abundances:
 *
 *   dX_i/dt = X_i * (r_i + sum_j A_ij X_j)
 *
 * Usable directly as a Boost.Odeint system.
 */
struct GlvModel {
    Eigen::VectorXd growth_rates; ///< r
    Eigen::MatrixXd interactions; ///< A, with negative diagonal

    Eigen::Index num_species() const { return growth_rates.size(); }

    void operator()(const std::vector<double> &x, std::vector<double> &dxdt, double /*t*/) const;

    /**
     * @brief Parameters divided by each species' self-interaction strength -A_ii,
     *        i.e. what an EM fit recovers (up to the biomass scale).
     */
    ParameterEstimate scaled() const;

    /**
     * @throws std::invalid_argument on inconsistent sizes or a non-negative self-interaction.
     */
    void validate() const;
};

/**
 * @brief Five-species community whose every sub-community has a feasible,
 *        stable equilibrium. Mixes positive, negative and absent interactions.
 */
GlvModel
define_five_species_community();

/**
 * @brief Integrates the model from `initial` for `duration` time units
 *        (adaptive Dormand-Prince) and returns the final state.
 */
std::vector<double>
simulate_to_equilibrium(const GlvModel &model,
                        const std::vector<double> &initial,
                        double duration = 500.0,
                        double abs_err = 1e-10,
                        double rel_err = 1e-10);

/**
 * @brief Exact fixed point of the sub-community `species`: X_S = -A_SS^{-1} r_S,
 *        zero elsewhere.
 * @throws std::runtime_error if A_SS is singular.
 */
Eigen::VectorXd
equilibrium_of(const GlvModel &model, const std::vector<Eigen::Index> &species);

struct SamplingOptions {
    int num_samples = 30;
    double presence_probability = 0.8; ///< Chance that a species is seeded into a sample.
    int min_species = 2;
    double noise_sd = 0.0;             ///< Standard deviation of log-normal multiplicative noise.
    double simulation_time = 500.0;
    double extinction_threshold = 1e-6;
    unsigned int seed = 42;
};

/**
 * @brief Equilibrium samples from a known model.
 */
struct SyntheticCommunity {
    Eigen::MatrixXd absolute;      ///< Taxa x samples noise-free equilibrium abundances.
    Eigen::MatrixXd relative;      ///< Taxa x samples observed relative abundances (noise applied).
    Eigen::VectorXd biomass;       ///< Noise-free total abundance per sample.
    std::vector<std::string> taxon_names;

    CountTable to_count_table() const;
};

/**
 * @brief Draws random species subsets, simulates each to equilibrium, polishes
 *        the surviving sub-community to its exact fixed point and applies noise.
 *
 * Subsets whose simulated end state does not match a positive fixed point are
 * redrawn.
 *
 * @throws std::runtime_error if too many draws in a row fail.
 */
SyntheticCommunity
generate_equilibrium_samples(const GlvModel &model, const SamplingOptions &options = SamplingOptions());

} // namespace synthetic
} // namespace glv_em

#endif // SYNTHETIC_COMMUNITY_HPP
