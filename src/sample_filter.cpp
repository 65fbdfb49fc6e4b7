#include "sample_filter.hpp"
#include "robust_statistics.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace glv_em {

Eigen::VectorXd
summarize_sample_residuals(const Eigen::MatrixXd &residuals) {
    Eigen::VectorXd summary(residuals.cols());
    for (Eigen::Index s = 0; s < residuals.cols(); ++s) {
        summary(s) = stats::median(Eigen::VectorXd(residuals.col(s)));
    }
    return summary;
}

SampleFlags
detect_bad_samples(const Eigen::VectorXd &values, double threshold) {
    const double center = stats::median(values);
    const double spread = stats::iqr(values);
    SampleFlags flags(values.size());
    for (Eigen::Index s = 0; s < values.size(); ++s) {
        double score = (values(s) - center) / spread;
        if (std::isnan(score)) { score = std::numeric_limits<double>::infinity(); }
        flags(s) = score > threshold;
    }
    return flags;
}

SampleFlags
retained_samples(const ExclusionMask &mask) {
    SampleFlags retained(mask.cols());
    for (Eigen::Index s = 0; s < mask.cols(); ++s) { retained(s) = !mask.col(s).any(); }
    return retained;
}

std::vector<Eigen::Index>
excluded_samples(const ExclusionMask &mask) {
    std::vector<Eigen::Index> excluded;
    for (Eigen::Index s = 0; s < mask.cols(); ++s) {
        if (mask.col(s).any()) { excluded.push_back(s); }
    }
    return excluded;
}

// --- SampleFilter --- //

SampleFilter::SampleFilter(ExclusionMask initial_mask, double threshold, int refresh_period)
  : initial_mask_(std::move(initial_mask))
  , threshold_(threshold)
  , refresh_period_(refresh_period) {
    if (refresh_period_ < 1) { throw std::invalid_argument("Mask refresh period must be at least 1."); }
    mask_ = initial_mask_;
}

SampleFlags
SampleFilter::update(int iteration, const Eigen::MatrixXd &e_step_residuals) {
    if (e_step_residuals.rows() != mask_.rows() || e_step_residuals.cols() != mask_.cols()) {
        throw std::invalid_argument("[SampleFilter] Residual matrix shape does not match the mask.");
    }
    ++rounds_;
    ExclusionMask next = (iteration % refresh_period_ == 0) ? initial_mask_ : mask_;

    const SampleFlags bad = detect_bad_samples(summarize_sample_residuals(e_step_residuals), threshold_);
    for (Eigen::Index s = 0; s < next.cols(); ++s) {
        if (bad(s)) { next.col(s).setConstant(true); }
    }
    if (!glv_em::retained_samples(next).any()) {
        std::cerr << "[SampleFilter] Warning: round " << rounds_ << " flagged every sample; keeping the previous mask."
                  << std::endl;
        return SampleFlags::Constant(bad.size(), false);
    }
    mask_ = std::move(next);
    return bad;
}

SampleFlags
SampleFilter::retained_samples() const {
    return glv_em::retained_samples(mask_);
}

std::vector<Eigen::Index>
SampleFilter::excluded_samples() const {
    return glv_em::excluded_samples(mask_);
}

} // namespace glv_em
