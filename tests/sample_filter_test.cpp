#include "sample_filter.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace glv_em;

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

// Two-taxon residual matrix whose per-sample medians are 1..5, with sample `outlier` set to 100.
Eigen::MatrixXd
residuals_with_outlier(Eigen::Index outlier) {
    Eigen::MatrixXd r(2, 5);
    for (Eigen::Index s = 0; s < 5; ++s) {
        const double v = s == outlier ? 100.0 : static_cast<double>(s + 1);
        r(0, s) = v;
        r(1, s) = v;
    }
    return r;
}

} // namespace

TEST(SampleFilterTest, SummaryIsMedianOverTaxaIgnoringNaN) {
    const Eigen::MatrixXd r = test_utils::make_matrix({ { 1.0, kNaN, kNaN }, { 3.0, 4.0, kNaN }, { 8.0, kNaN, kNaN } });
    const Eigen::VectorXd summary = summarize_sample_residuals(r);
    EXPECT_DOUBLE_EQ(summary(0), 3.0);
    EXPECT_DOUBLE_EQ(summary(1), 4.0);
    EXPECT_TRUE(std::isnan(summary(2)));
}

TEST(SampleFilterTest, RobustZScoreFlagsOutliers) {
    Eigen::VectorXd v(5);
    v << 1.0, 2.0, 3.0, 4.0, 100.0; // median 3, IQR 2
    const SampleFlags flags = detect_bad_samples(v, 3.0);
    EXPECT_FALSE(flags(0));
    EXPECT_FALSE(flags(3));
    EXPECT_TRUE(flags(4));
    EXPECT_EQ(flags.count(), 1);
}

TEST(SampleFilterTest, UndefinedScoresAreFlagged) {
    Eigen::VectorXd with_nan(4);
    with_nan << 1.0, 2.0, kNaN, 3.0;
    const SampleFlags flags = detect_bad_samples(with_nan, 3.0);
    EXPECT_TRUE(flags(2));
    EXPECT_FALSE(flags(1));

    // Zero IQR: every score is undefined or infinite.
    Eigen::VectorXd flat(5);
    flat << 1.0, 1.0, 1.0, 1.0, 5.0;
    EXPECT_TRUE(detect_bad_samples(flat, 3.0).all());
}

TEST(SampleFilterTest, InfiniteThresholdFlagsNothing) {
    Eigen::VectorXd v(4);
    v << 1.0, kNaN, 3.0, 1000.0;
    EXPECT_FALSE(detect_bad_samples(v, std::numeric_limits<double>::infinity()).any());
}

TEST(SampleFilterTest, MaskAccumulatesThenResetsAtRefresh) {
    ExclusionMask initial = ExclusionMask::Constant(2, 5, false);
    initial(0, 0) = true;
    SampleFilter filter(initial, 3.0, 3);

    filter.update(7, residuals_with_outlier(4));
    EXPECT_TRUE(filter.mask().col(4).all());
    const ExclusionMask after_first = filter.mask();

    filter.update(8, residuals_with_outlier(3));
    EXPECT_TRUE(filter.mask().col(3).all());
    // Monotone between refresh points.
    for (Eigen::Index i = 0; i < 2; ++i) {
        for (Eigen::Index s = 0; s < 5; ++s) {
            if (after_first(i, s)) { EXPECT_TRUE(filter.mask()(i, s)); }
        }
    }
    EXPECT_TRUE(filter.mask().col(4).all());

    // Iteration 9 is a refresh point: back to the initial mask before flagging.
    filter.update(9, residuals_with_outlier(2));
    EXPECT_TRUE(filter.mask().col(2).all());
    EXPECT_FALSE(filter.mask().col(3).any());
    EXPECT_FALSE(filter.mask().col(4).any());
    EXPECT_TRUE(filter.mask()(0, 0));
    EXPECT_FALSE(filter.mask()(1, 0));

    EXPECT_EQ(filter.filtering_rounds(), 3);
    const std::vector<Eigen::Index> excluded = filter.excluded_samples();
    ASSERT_EQ(excluded.size(), 2u);
    EXPECT_EQ(excluded[0], 0);
    EXPECT_EQ(excluded[1], 2);
    const SampleFlags retained = filter.retained_samples();
    EXPECT_FALSE(retained(0));
    EXPECT_TRUE(retained(1));
    EXPECT_FALSE(retained(2));
    EXPECT_EQ(filter.initial_mask().count(), 1);
}

TEST(SampleFilterTest, RoundFlaggingEverySampleIsDiscarded) {
    SampleFilter filter(ExclusionMask::Constant(2, 5, false), 3.0, 3);
    filter.update(1, residuals_with_outlier(4));
    const ExclusionMask before = filter.mask();
    ASSERT_EQ(filter.excluded_samples().size(), 1u);

    // Zero IQR makes every score undefined or infinite.
    const Eigen::MatrixXd flat = test_utils::make_matrix({ { 1.0, 1.0, 1.0, 1.0, 5.0 }, { 1.0, 1.0, 1.0, 1.0, 5.0 } });
    const SampleFlags flagged = filter.update(2, flat);
    EXPECT_FALSE(flagged.any());
    EXPECT_TRUE((filter.mask() == before).all());
    EXPECT_EQ(filter.retained_samples().count(), 4);
    EXPECT_EQ(filter.filtering_rounds(), 2);

    // Discarding also applies on a refresh round.
    filter.update(3, flat);
    EXPECT_TRUE((filter.mask() == before).all());
}

TEST(SampleFilterTest, InvalidArgumentsAreRejected) {
    const ExclusionMask initial = ExclusionMask::Constant(2, 5, false);
    EXPECT_THROW(SampleFilter(initial, 3.0, 0), std::invalid_argument);
    SampleFilter filter(initial, 3.0, 3);
    EXPECT_THROW(filter.update(1, Eigen::MatrixXd::Zero(3, 5)), std::invalid_argument);
}
