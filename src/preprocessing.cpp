#include "preprocessing.hpp"
#include "normalization.hpp"
#include "robust_statistics.hpp"
#include <stdexcept>
#include <vector>

namespace glv_em {

PreprocessedData
preprocess(const Eigen::MatrixXd &counts, double deviation, double detection_limit) {
    if (!(detection_limit >= 0.0 && detection_limit < 1.0)) {
        throw std::invalid_argument("Detection limit must lie in [0, 1).");
    }

    PreprocessedData data;
    data.abundances = relativize(counts);

    // Snap sub-detection entries to zero, then re-close each sample.
    data.abundances = (data.abundances.array() < detection_limit).select(0.0, data.abundances.array()).matrix();
    for (Eigen::Index s = 0; s < data.abundances.cols(); ++s) {
        const double total = data.abundances.col(s).sum();
        if (total == 0.0) { throw ZeroTotalSampleError(s); }
        data.abundances.col(s) /= total;
    }

    const Eigen::Index p = data.abundances.rows();
    const Eigen::Index n = data.abundances.cols();
    data.taxon_scale.resize(p);
    data.initial_mask = ExclusionMask::Constant(p, n, false);

    for (Eigen::Index i = 0; i < p; ++i) {
        std::vector<double> nonzero;
        for (Eigen::Index s = 0; s < n; ++s) {
            if (data.abundances(i, s) != 0.0) { nonzero.push_back(data.abundances(i, s)); }
        }
        data.taxon_scale(i) = stats::mad(nonzero);
        for (Eigen::Index s = 0; s < n; ++s) {
            // NaN ratios (unobserved taxon, 0/0) compare false and stay included.
            data.initial_mask(i, s) = (data.abundances(i, s) / data.taxon_scale(i)) < deviation;
        }
    }
    return data;
}

} // namespace glv_em
