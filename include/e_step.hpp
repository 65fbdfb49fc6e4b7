#ifndef E_STEP_HPP
#define E_STEP_HPP

#include "abundance_data.hpp"
#include "parameter_estimate.hpp"
#include "regression_oracle.hpp"
#include <Eigen/Dense>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace glv_em {

/**
 * @brief Raised after an E-step in which the oracle could not fit one or more taxa.
 */
class TaxonFitError : public std::runtime_error {
  public:
    TaxonFitError(std::vector<Eigen::Index> failed_taxa, const std::string &details)
      : std::runtime_error("Regression failed for " + std::to_string(failed_taxa.size()) + " taxon/taxa: " + details)
      , failed_taxa_(std::move(failed_taxa)) {}

    /// Zero-based indices of the taxa whose fit failed, ascending.
    const std::vector<Eigen::Index> &failed_taxa() const { return failed_taxa_; }

  private:
    std::vector<Eigen::Index> failed_taxa_;
};

struct EStepOptions {
    bool center = false;                                            ///< Center Y and each column of X.
    double coefficient_snap_threshold = DEFAULT_COEFFICIENT_SNAP_THRESHOLD;
    int num_threads = 1;                                            ///< Worker threads for the per-taxon fits.
};

/**
 * @brief Everything one E-step produces.
 */
struct EStepResult {
    ParameterEstimate parameters;

    /// Taxa x samples squared residuals; NaN where the sample was not part of that taxon's regression.
    Eigen::MatrixXd squared_residuals;

    /// Penalty selected for each taxon, carried into the next iteration.
    Eigen::VectorXd penalties;

    /**
     * Information-sufficiency diagnostic, taxa x taxa: entry (i, j) is the binary
     * entropy of taxon j's zero/non-zero pattern over the samples retained for taxon i.
     * Low values flag coefficients with too little variation behind them.
     */
    Eigen::MatrixXd coefficient_entropy;

    /// Number of samples entering each taxon's regression.
    Eigen::VectorXi retained_counts;
};

/**
 * @brief Estimates the scaled gLV parameters given the current biomass.
 *
 * For every taxon i, the samples where i is present and not excluded form the
 * regression Y = x_i ~ [1/m, x_j (j != i)]. The first coefficient is the growth
 * rate, the rest fill row i of B, and B_ii is fixed to -1. The per-taxon fits
 * are independent and run on up to `options.num_threads` threads.
 *
 * @param abundances Taxa x samples relative abundances.
 * @param biomass One positive value per sample.
 * @param mask Current exclusion mask (read-only during the step).
 * @param oracle Regression capability, called concurrently.
 * @param previous_penalties Penalties chosen in the previous iteration, one per taxon, or empty.
 * @param options Centering, coefficient snapping and thread count.
 * @throws TaxonFitError if the oracle raised DegenerateRegressionError for any taxon.
 * @throws std::invalid_argument on shape mismatches.
 */
EStepResult
run_e_step(const AbundanceMatrix &abundances,
           const Eigen::VectorXd &biomass,
           const ExclusionMask &mask,
           const RegressionOracle &oracle,
           const std::optional<Eigen::VectorXd> &previous_penalties,
           const EStepOptions &options);

// --- Internal Helper Functions --- //
namespace internal {

/// Result of the regression for a single taxon.
struct TaxonFit {
    double growth_rate = 0.0;
    Eigen::VectorXd interaction_row;   ///< Length p, -1 at the taxon's own position.
    Eigen::VectorXd squared_residuals; ///< Length n, NaN for samples outside the regression.
    double penalty = 0.0;
    Eigen::VectorXd entropy_row;       ///< Length p.
    int retained = 0;
};

/// Indices of the samples entering taxon i's regression.
std::vector<Eigen::Index>
retained_samples(const AbundanceMatrix &abundances, const ExclusionMask &mask, Eigen::Index taxon);

/**
 * @brief Builds and solves the regression sub-problem for one taxon.
 * @throws DegenerateRegressionError propagated from the oracle.
 */
TaxonFit
fit_taxon(const AbundanceMatrix &abundances,
          const Eigen::VectorXd &biomass,
          const ExclusionMask &mask,
          const RegressionOracle &oracle,
          Eigen::Index taxon,
          std::optional<double> previous_penalty,
          bool center);

} // namespace internal

} // namespace glv_em

#endif // E_STEP_HPP
