#include "m_step.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace glv_em;

namespace {

// a_i = `growth`, B = -I: every present taxon proposes growth / x_i.
ParameterEstimate
independent_taxa(const Eigen::VectorXd &growth) {
    ParameterEstimate params;
    params.growth_rates = growth;
    params.interactions = -Eigen::MatrixXd::Identity(growth.size(), growth.size());
    return params;
}

} // namespace

TEST(MStepTest, MedianOfPositiveCandidates) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector3d(1.0, 1.0, 1.0));
    // Candidates 5, 3.33, 2.
    const SampleBiomassEstimate e = estimate_sample_biomass(params, Eigen::Vector3d(0.2, 0.3, 0.5));
    EXPECT_NEAR(e.biomass, 1.0 / 0.3, 1e-12);
    EXPECT_FALSE(e.used_fallback);
    // Relative residual (m (Bx)_i + a_i) / a_i = 1 - m x_i.
    EXPECT_NEAR(e.relative_residuals(0), 1.0 - 0.2 / 0.3, 1e-12);
    EXPECT_NEAR(e.relative_residuals(1), 0.0, 1e-12);
    EXPECT_NEAR(e.relative_residuals(2), 1.0 - 0.5 / 0.3, 1e-12);
}

TEST(MStepTest, NegativeCandidatesAreIgnoredWhenAnyIsPositive) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector3d(1.0, 1.0, -1.0));
    // Candidates 5, 3.33, -2.
    const SampleBiomassEstimate e = estimate_sample_biomass(params, Eigen::Vector3d(0.2, 0.3, 0.5));
    EXPECT_NEAR(e.biomass, (5.0 + 1.0 / 0.3) / 2.0, 1e-12);
    EXPECT_FALSE(e.used_fallback);
}

TEST(MStepTest, AllNegativeCandidatesFallBackToLeastNegative) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector3d(-1.0, -1.0, -1.0));
    // Candidates -5, -3.33, -2.
    const SampleBiomassEstimate e = estimate_sample_biomass(params, Eigen::Vector3d(0.2, 0.3, 0.5));
    EXPECT_NEAR(e.biomass, 2.0, 1e-12);
    EXPECT_TRUE(e.used_fallback);
}

TEST(MStepTest, ZeroCandidateDoesNotVoteInFallback) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector2d(0.0, -1.0));
    // Candidates 0 and -2.
    const SampleBiomassEstimate e = estimate_sample_biomass(params, Eigen::Vector2d(0.5, 0.5));
    EXPECT_NEAR(e.biomass, 2.0, 1e-12);
    EXPECT_GT(e.biomass, 0.0);
    EXPECT_TRUE(e.used_fallback);
}

TEST(MStepTest, OnlyZeroCandidatesAreRejected) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector2d(0.0, 0.0));
    EXPECT_THROW(estimate_sample_biomass(params, Eigen::Vector2d(0.5, 0.5)), std::runtime_error);

    Eigen::MatrixXd abundances(2, 3);
    abundances << 0.5, 0.2, 0.7,
                  0.5, 0.8, 0.3;
    EXPECT_THROW(run_m_step(abundances, params, 2), std::runtime_error);
}

TEST(MStepTest, AbsentTaxaDoNotVoteAndHaveZeroResidual) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector3d(1.0, 1.0, 1.0));
    // Present candidates 2.5 and 1.67.
    const SampleBiomassEstimate e = estimate_sample_biomass(params, Eigen::Vector3d(0.4, 0.0, 0.6));
    EXPECT_NEAR(e.biomass, (2.5 + 1.0 / 0.6) / 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(e.relative_residuals(1), 0.0);
}

TEST(MStepTest, TrueParametersReturnTrueBiomass) {
    const synthetic::SyntheticCommunity community = test_utils::noiseless_community(12);
    const ParameterEstimate truth = synthetic::define_five_species_community().scaled();
    const MStepResult m = run_m_step(community.relative, truth, 2);
    ASSERT_EQ(m.biomass.size(), 12);
    for (Eigen::Index s = 0; s < 12; ++s) {
        EXPECT_NEAR(m.biomass(s) / community.biomass(s), 1.0, 1e-10) << "sample " << s;
        EXPECT_FALSE(m.used_fallback(s));
    }
    EXPECT_LT(m.relative_residuals.cwiseAbs().maxCoeff(), 1e-10);
}

TEST(MStepTest, RunMatchesPerSampleEstimates) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector3d(1.0, -1.0, 2.0));
    Eigen::MatrixXd x(3, 3);
    // clang-format off
    x << 0.2, 0.5, 0.0,
         0.3, 0.5, 0.4,
         0.5, 0.0, 0.6;
    // clang-format on
    const MStepResult m = run_m_step(x, params, 3);
    for (Eigen::Index s = 0; s < 3; ++s) {
        const SampleBiomassEstimate e = estimate_sample_biomass(params, x.col(s));
        EXPECT_DOUBLE_EQ(m.biomass(s), e.biomass);
        EXPECT_EQ(m.used_fallback(s), e.used_fallback);
        for (Eigen::Index i = 0; i < 3; ++i) { EXPECT_DOUBLE_EQ(m.relative_residuals(i, s), e.relative_residuals(i)); }
    }
    // Sample 1: candidates 2 and -2, so the positive one wins.
    EXPECT_NEAR(m.biomass(1), 2.0, 1e-12);
}

TEST(MStepTest, InvalidInputsAreRejected) {
    const ParameterEstimate params = independent_taxa(Eigen::Vector3d(1.0, 1.0, 1.0));
    EXPECT_THROW(estimate_sample_biomass(params, Eigen::Vector3d(0.0, 0.0, 0.0)), std::invalid_argument);
    EXPECT_THROW(estimate_sample_biomass(params, Eigen::Vector2d(0.5, 0.5)), std::invalid_argument);
    Eigen::MatrixXd x = Eigen::MatrixXd::Constant(3, 2, 1.0 / 3.0);
    x.col(1).setZero();
    EXPECT_THROW(run_m_step(x, params, 1), std::invalid_argument);
}
