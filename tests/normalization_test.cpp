#include "normalization.hpp"
#include "robust_statistics.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace glv_em;
using glv_em::test_utils::make_matrix;

TEST(NormalizationTest, RelativizeClosesEveryColumn) {
    const Eigen::MatrixXd counts = make_matrix({ { 10, 0, 3 }, { 30, 5, 3 }, { 60, 15, 4 } });
    const AbundanceMatrix rel = relativize(counts);
    for (Eigen::Index s = 0; s < rel.cols(); ++s) { EXPECT_NEAR(rel.col(s).sum(), 1.0, 1e-12); }
    EXPECT_NEAR(rel(0, 0), 0.1, 1e-12);
    EXPECT_NEAR(rel(2, 1), 0.75, 1e-12);
    EXPECT_DOUBLE_EQ(rel(0, 1), 0.0);
}

TEST(NormalizationTest, RelativizeRejectsZeroTotalSample) {
    const Eigen::MatrixXd counts = make_matrix({ { 1, 0, 2 }, { 3, 0, 2 } });
    try {
        relativize(counts);
        FAIL() << "Expected ZeroTotalSampleError";
    } catch (const ZeroTotalSampleError &e) {
        EXPECT_EQ(e.sample_index(), 1);
    }
}

TEST(NormalizationTest, RelativizeRejectsMalformedInput) {
    EXPECT_THROW(relativize(Eigen::MatrixXd(0, 3)), std::invalid_argument);
    EXPECT_THROW(relativize(make_matrix({ { 1, -1 }, { 2, 3 } })), std::invalid_argument);
    EXPECT_THROW(relativize(make_matrix({ { 1, std::numeric_limits<double>::infinity() }, { 2, 3 } })),
                 std::invalid_argument);
}

TEST(NormalizationTest, CssFactorsUseLowerQuantileSums) {
    // Sample 0: non-zero {0.2, 0.3, 0.5}, median 0.3, sum below = 0.5.
    // Sample 1: non-zero {0.1, 0.9}, median 0.5, sum below = 0.1.
    const AbundanceMatrix x = make_matrix({ { 0.2, 0.1 }, { 0.3, 0.0 }, { 0.5, 0.9 } });
    const Eigen::VectorXd f = css_factors(x);
    ASSERT_EQ(f.size(), 2);
    EXPECT_NEAR(f(0) * f(1), 1.0, 1e-12); // unit geometric mean
    EXPECT_NEAR(f(0) / f(1), 5.0, 1e-12);
}

TEST(NormalizationTest, InitialBiomassHasTargetMedian) {
    const AbundanceMatrix x =
      relativize(make_matrix({ { 5, 1, 8, 2 }, { 3, 7, 1, 2 }, { 2, 2, 1, 6 }, { 0, 4, 3, 1 } }));
    const Eigen::VectorXd m = initial_biomass(x, 1000.0);
    EXPECT_NEAR(stats::median(m), 1000.0, 1e-9);
    EXPECT_TRUE((m.array() > 0.0).all());
}
