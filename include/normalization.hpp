#ifndef NORMALIZATION_HPP
#define NORMALIZATION_HPP

#include "abundance_data.hpp"
#include <Eigen/Dense>

namespace glv_em {

/**
 * @brief Total-sum scaling: divides every sample (column) by its total.
 *
 * @param counts Taxa x samples non-negative counts or abundances.
 * @return AbundanceMatrix whose columns sum to one.
 * @throws std::invalid_argument if the matrix is empty or holds negative / non-finite entries.
 * @throws ZeroTotalSampleError if any sample has a zero total.
 */
AbundanceMatrix
relativize(const Eigen::MatrixXd &counts);

/**
 * @brief Cumulative-sum-scaling normalization factors, one per sample.
 *
 * For each sample the p-quantile of its non-zero entries is found and the
 * non-zero entries at or below it are summed. The sums are divided by their
 * geometric mean so the factors have unit geometric mean across samples.
 *
 * @param abundances Taxa x samples matrix.
 * @param p Quantile in [0, 1] (default 0.5).
 * @throws ZeroTotalSampleError if a sample has no non-zero entry.
 */
Eigen::VectorXd
css_factors(const AbundanceMatrix &abundances, double p = 0.5);

/**
 * @brief Initial biomass seed: CSS factors rescaled so their median equals `scaling`.
 */
Eigen::VectorXd
initial_biomass(const AbundanceMatrix &abundances, double scaling, double p = 0.5);

} // namespace glv_em

#endif // NORMALIZATION_HPP
