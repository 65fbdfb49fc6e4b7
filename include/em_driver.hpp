#ifndef EM_DRIVER_HPP
#define EM_DRIVER_HPP

#include "abundance_data.hpp"
#include "em_config.hpp"
#include "parameter_estimate.hpp"
#include "regression_oracle.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <string>
#include <vector>

namespace glv_em {

/**
 * @brief Phase of an EM run.
 */
enum class EMState {
    WarmUp,    ///< Sample filtering disabled.
    Filtering, ///< Bad samples are detected and excluded every iteration.
    Converged  ///< Terminal.
};

/**
 * @brief Why a run stopped.
 */
enum class TerminationReason {
    Converged,            ///< The biomass trace stabilized (after enough filtering rounds, if filtering was on).
    MaxIterationsReached, ///< Hard stop; the final estimates may be unconverged.
    Cancelled             ///< request_stop() was honoured at an iteration boundary.
};

std::string
to_string(EMState state);

std::string
to_string(TerminationReason reason);

/**
 * @brief Append-only iteration history.
 *
 * `biomass[0]` is the CSS seed, `biomass[k]` the rescaled biomass after
 * iteration k. `parameters[k-1]` and `penalties[k-1]` are the E-step output of
 * iteration k, so `biomass` holds one more entry than the other two.
 */
struct EMTrace {
    std::vector<Eigen::VectorXd> biomass;
    std::vector<ParameterEstimate> parameters;
    std::vector<Eigen::VectorXd> penalties;

    size_t num_iterations() const { return parameters.size(); }
};

/**
 * @brief Everything an EM run reports.
 */
struct EMResult {
    EMTrace trace;

    AbundanceMatrix abundances;          ///< Preprocessed abundances the run worked on.
    Eigen::MatrixXd e_step_residuals;    ///< Last E-step squared residuals (taxa x samples, NaN where unused).
    Eigen::MatrixXd m_step_residuals;    ///< Last M-step relative residuals (taxa x samples).
    Eigen::MatrixXd coefficient_entropy; ///< Last E-step information-sufficiency diagnostic (taxa x taxa).
    ExclusionMask final_mask;
    std::vector<Eigen::Index> excluded_samples; ///< Samples excluded for any taxon in the final mask.

    int iterations = 0;
    bool converged = false;
    TerminationReason termination = TerminationReason::MaxIterationsReached;
    bool filtering_activated = false; ///< Whether the run ever entered the filtering phase.

    std::vector<std::string> taxon_names;
};

/**
 * @brief Parameters of the last iteration.
 * @throws std::runtime_error if the run recorded no iteration.
 */
ParameterEstimate
final_parameters(const EMResult &result);

/**
 * @brief Biomass after the last iteration (the seed if no iteration ran).
 */
Eigen::VectorXd
final_biomass(const EMResult &result);

/**
 * @brief Median over samples of |(current - previous) / previous|.
 */
double
median_relative_change(const Eigen::VectorXd &previous, const Eigen::VectorXd &current);

/**
 * @brief Scales `biomass` so its median over the retained samples equals `scaling`.
 * @throws std::runtime_error if that median is not a positive finite number.
 */
Eigen::VectorXd
rescale_biomass(const Eigen::VectorXd &biomass, const SampleFlags &retained, double scaling);

/**
 * @class EMDriver
 * @brief Alternates E- and M-steps until the biomass estimate stabilizes.
 *
 * A run starts in the warm-up phase. Filtering starts after the configured
 * warm-up length, or (without one) once the biomass trace is stable after the
 * minimum number of iterations; either way only when the outlier deviation is
 * finite. The run converges when the biomass trace is stable and filtering has
 * run for enough rounds, or at once when filtering is disabled for good.
 *
 * The oracle is borrowed and must outlive the driver.
 */
class EMDriver {
  public:
    /**
     * @throws std::invalid_argument if the configuration is invalid.
     */
    EMDriver(EMConfig config, const RegressionOracle &oracle);

    /**
     * @brief Fits the model to a count table.
     *
     * @throws ZeroTotalSampleError if a sample is empty.
     * @throws TaxonFitError if the oracle cannot fit some taxon.
     * @throws std::invalid_argument on malformed input.
     */
    EMResult run(const CountTable &table);

    /// Current phase; safe to call from another thread.
    EMState state() const { return state_.load(); }

    /**
     * @brief Asks the running (or next) run() to stop at the next iteration boundary.
     *
     * Thread-safe. The committed trace stays intact. The request is cleared
     * when that run returns or throws.
     */
    void request_stop() { stop_requested_.store(true); }

    const EMConfig &config() const { return config_; }

  private:
    EMConfig config_;
    const RegressionOracle &oracle_;
    std::atomic<EMState> state_{ EMState::WarmUp };
    std::atomic<bool> stop_requested_{ false };

    void log(const std::string &message) const;
};

/**
 * @brief Runs the EM procedure with a cross-validated elastic-net oracle built from `config`.
 */
EMResult
fit_glv_em(const CountTable &table, const EMConfig &config = EMConfig());

} // namespace glv_em

#endif // EM_DRIVER_HPP
