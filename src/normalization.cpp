#include "normalization.hpp"
#include "robust_statistics.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace glv_em {

AbundanceMatrix
relativize(const Eigen::MatrixXd &counts) {
    if (counts.rows() == 0 || counts.cols() == 0) {
        throw std::invalid_argument("Abundance table must have at least one taxon and one sample.");
    }
    if (!counts.allFinite()) { throw std::invalid_argument("Abundance table contains non-finite entries."); }
    if ((counts.array() < 0.0).any()) { throw std::invalid_argument("Abundance table contains negative entries."); }

    AbundanceMatrix rel(counts.rows(), counts.cols());
    for (Eigen::Index s = 0; s < counts.cols(); ++s) {
        const double total = counts.col(s).sum();
        if (total == 0.0) { throw ZeroTotalSampleError(s); }
        rel.col(s) = counts.col(s) / total;
    }
    return rel;
}

Eigen::VectorXd
css_factors(const AbundanceMatrix &abundances, double p) {
    std::vector<double> sums(static_cast<size_t>(abundances.cols()));
    for (Eigen::Index s = 0; s < abundances.cols(); ++s) {
        std::vector<double> nonzero;
        for (Eigen::Index i = 0; i < abundances.rows(); ++i) {
            if (abundances(i, s) != 0.0) { nonzero.push_back(abundances(i, s)); }
        }
        if (nonzero.empty()) { throw ZeroTotalSampleError(s); }

        const double q = stats::quantile(nonzero, p);
        double f = 0.0;
        for (double v : nonzero) {
            if (v <= q) { f += v; }
        }
        sums[static_cast<size_t>(s)] = f;
    }

    const double gm = stats::geometric_mean(sums);
    Eigen::VectorXd factors(abundances.cols());
    for (Eigen::Index s = 0; s < abundances.cols(); ++s) { factors(s) = sums[static_cast<size_t>(s)] / gm; }
    return factors;
}

Eigen::VectorXd
initial_biomass(const AbundanceMatrix &abundances, double scaling, double p) {
    Eigen::VectorXd factors = css_factors(abundances, p);
    return scaling * factors / stats::median(factors);
}

} // namespace glv_em
