#ifndef PREPROCESSING_HPP
#define PREPROCESSING_HPP

#include "abundance_data.hpp"
#include <Eigen/Dense>

namespace glv_em {

/// Relative abundances below this are treated as absent.
constexpr double DEFAULT_DETECTION_LIMIT = 1e-4;

/**
 * @brief Output of the preprocessing stage. Created once and never mutated afterwards.
 */
struct PreprocessedData {
    AbundanceMatrix abundances;   ///< Thresholded relative abundances (taxa x samples).
    ExclusionMask initial_mask;   ///< Initial (taxon, sample) exclusions.
    Eigen::VectorXd taxon_scale;  ///< Per-taxon MAD over non-zero abundances (NaN if the taxon is never observed).
};

/**
 * @brief Relativizes, applies the detection limit and builds the initial exclusion mask.
 *
 * Entries below `detection_limit` are set to exactly zero and the columns are
 * re-closed to sum to one. A (taxon, sample) pair is excluded when its abundance
 * divided by the taxon's MAD is below `deviation`; the default of 0 excludes nothing.
 *
 * @param counts Taxa x samples counts or relative abundances.
 * @param deviation Threshold on abundance / MAD.
 * @param detection_limit Relative-abundance floor.
 * @throws ZeroTotalSampleError if a sample is empty before or after thresholding.
 * @throws std::invalid_argument on malformed input.
 */
PreprocessedData
preprocess(const Eigen::MatrixXd &counts, double deviation = 0.0, double detection_limit = DEFAULT_DETECTION_LIMIT);

} // namespace glv_em

#endif // PREPROCESSING_HPP
