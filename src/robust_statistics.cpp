#include "robust_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace glv_em {
namespace stats {

namespace {

std::vector<double>
drop_nan(const std::vector<double> &values) {
    std::vector<double> kept;
    kept.reserve(values.size());
    for (double v : values) {
        if (!std::isnan(v)) { kept.push_back(v); }
    }
    return kept;
}

} // namespace

double
quantile(std::vector<double> values, double p) {
    if (!(p >= 0.0 && p <= 1.0)) { throw std::invalid_argument("Quantile probability must lie in [0, 1]."); }
    values = drop_nan(values);
    if (values.empty()) { return std::numeric_limits<double>::quiet_NaN(); }

    std::sort(values.begin(), values.end());
    const double h = (static_cast<double>(values.size()) - 1.0) * p;
    const size_t lo = static_cast<size_t>(std::floor(h));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = h - static_cast<double>(lo);
    if (frac == 0.0) { return values[lo]; }
    return values[lo] + frac * (values[hi] - values[lo]);
}

double
median(const std::vector<double> &values) {
    return quantile(values, 0.5);
}

double
median(const Eigen::VectorXd &values) {
    return quantile(to_std_vector(values), 0.5);
}

double
iqr(const std::vector<double> &values) {
    return quantile(values, 0.75) - quantile(values, 0.25);
}

double
iqr(const Eigen::VectorXd &values) {
    return iqr(to_std_vector(values));
}

double
mad(const std::vector<double> &values) {
    const double center = median(values);
    if (std::isnan(center)) { return center; }
    std::vector<double> deviations;
    deviations.reserve(values.size());
    for (double v : values) {
        if (!std::isnan(v)) { deviations.push_back(std::abs(v - center)); }
    }
    return 1.4826 * median(deviations);
}

double
binary_entropy(const std::vector<double> &values) {
    if (values.empty()) { return 0.0; }
    size_t zeros = 0;
    for (double v : values) {
        if (v == 0.0) { ++zeros; }
    }
    const double p = static_cast<double>(zeros) / static_cast<double>(values.size());
    if (p == 0.0 || p == 1.0) { return 0.0; }
    return -(p * std::log2(p) + (1.0 - p) * std::log2(1.0 - p));
}

double
geometric_mean(const std::vector<double> &values) {
    if (values.empty()) { throw std::invalid_argument("Geometric mean of an empty set is undefined."); }
    double log_sum = 0.0;
    for (double v : values) {
        if (!(v > 0.0)) { throw std::invalid_argument("Geometric mean requires strictly positive values."); }
        log_sum += std::log(v);
    }
    return std::exp(log_sum / static_cast<double>(values.size()));
}

std::vector<double>
to_std_vector(const Eigen::VectorXd &values) {
    return std::vector<double>(values.data(), values.data() + values.size());
}

} // namespace stats
} // namespace glv_em
