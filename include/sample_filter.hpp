#ifndef SAMPLE_FILTER_HPP
#define SAMPLE_FILTER_HPP

#include "abundance_data.hpp"
#include <Eigen/Dense>
#include <vector>

namespace glv_em {

/**
 * @brief Per-sample summary of a taxa x samples residual matrix: the median over
 *        taxa, ignoring NaN entries (taxa that did not use the sample).
 *
 * A sample used by no taxon gets NaN.
 */
Eigen::VectorXd
summarize_sample_residuals(const Eigen::MatrixXd &residuals);

/**
 * @brief Flags samples whose robust z-score exceeds `threshold`.
 *
 * score = (value - median) / IQR, both taken over samples with NaN removed.
 * An undefined score (NaN input, zero IQR at the median) counts as +infinity
 * and is therefore flagged for every finite threshold.
 */
SampleFlags
detect_bad_samples(const Eigen::VectorXd &values, double threshold);

/**
 * @brief Accumulating exclusion mask with periodic refresh.
 *
 * Starts from the preprocessing mask. Each update ORs the newly flagged samples
 * into every taxon's row. On iterations that are a multiple of the refresh
 * period the mask first returns to the initial mask, so samples flagged under
 * early, poorly converged parameters can come back.
 */
class SampleFilter {
  public:
    /**
     * @param initial_mask Mask produced by preprocessing.
     * @param threshold Robust z-score above which a sample is removed.
     * @param refresh_period Iterations between resets to the initial mask (>= 1).
     * @throws std::invalid_argument if refresh_period < 1.
     */
    SampleFilter(ExclusionMask initial_mask, double threshold, int refresh_period);

    /**
     * @brief Runs one filtering round.
     *
     * A round that would leave no sample retained is discarded: the mask stays
     * as it was (refresh included) and a warning is logged.
     *
     * @param iteration One-based EM iteration number (drives the refresh schedule).
     * @param e_step_residuals Taxa x samples squared residuals of the last E-step.
     * @return SampleFlags The samples flagged in this round (none if the round was discarded).
     */
    SampleFlags update(int iteration, const Eigen::MatrixXd &e_step_residuals);

    const ExclusionMask &mask() const { return mask_; }
    const ExclusionMask &initial_mask() const { return initial_mask_; }

    /// Samples with no exclusion for any taxon.
    SampleFlags retained_samples() const;

    /// Zero-based indices of samples excluded for at least one taxon, ascending.
    std::vector<Eigen::Index> excluded_samples() const;

    /// Number of update() calls so far.
    int filtering_rounds() const { return rounds_; }

    double threshold() const { return threshold_; }

  private:
    ExclusionMask initial_mask_;
    ExclusionMask mask_;
    double threshold_;
    int refresh_period_;
    int rounds_ = 0;
};

/// Samples with no exclusion in `mask`.
SampleFlags
retained_samples(const ExclusionMask &mask);

/// Indices of samples excluded for at least one taxon in `mask`.
std::vector<Eigen::Index>
excluded_samples(const ExclusionMask &mask);

} // namespace glv_em

#endif // SAMPLE_FILTER_HPP
