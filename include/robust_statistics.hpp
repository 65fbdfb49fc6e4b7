#ifndef ROBUST_STATISTICS_HPP
#define ROBUST_STATISTICS_HPP

#include <Eigen/Dense>
#include <vector>

namespace glv_em {
namespace stats {

/**
 * @brief Sample quantile using linear interpolation between order statistics
 *        (Hyndman & Fan type 7, the usual default of statistical packages).
 *
 * NaN entries are ignored.
 *
 * @param values Input values (copied, then partially sorted).
 * @param p Probability in [0, 1].
 * @return The quantile, or NaN if no finite-or-infinite (non-NaN) values remain.
 * @throws std::invalid_argument if p is outside [0, 1].
 */
double
quantile(std::vector<double> values, double p);

/// Median ignoring NaN entries. NaN if the input is empty after removal.
double
median(const std::vector<double> &values);

/// Median of an Eigen vector ignoring NaN entries.
double
median(const Eigen::VectorXd &values);

/// Interquartile range (type 7 quartiles) ignoring NaN entries.
double
iqr(const std::vector<double> &values);

/// Interquartile range of an Eigen vector ignoring NaN entries.
double
iqr(const Eigen::VectorXd &values);

/**
 * @brief Median absolute deviation, scaled by 1.4826 for consistency with the
 *        standard deviation under normality.
 */
double
mad(const std::vector<double> &values);

/**
 * @brief Entropy (bits) of a binary zero/non-zero pattern.
 *
 * Returns 0 when the pattern is constant (all zero or all non-zero) or empty.
 */
double
binary_entropy(const std::vector<double> &values);

/// Geometric mean of strictly positive values.
double
geometric_mean(const std::vector<double> &values);

/// Copies an Eigen vector into a std::vector.
std::vector<double>
to_std_vector(const Eigen::VectorXd &values);

} // namespace stats
} // namespace glv_em

#endif // ROBUST_STATISTICS_HPP
