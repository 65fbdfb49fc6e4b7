#include "em_driver.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace glv_em;

namespace {

int
sign_of(double v) {
    return (v > 0.0) - (v < 0.0);
}

} // namespace

// Five taxa, thirty samples from the known equilibrium distribution with
// multiplicative log-normal noise, fitted by the cross-validated lasso.
TEST(EMScenarioTest, FiveTaxaThirtySamplesRecoversInteractionSigns) {
    const synthetic::GlvModel model = synthetic::define_five_species_community();
    synthetic::SamplingOptions sampling;
    sampling.num_samples = 30;
    sampling.noise_sd = 0.005;
    sampling.seed = 2024;
    const synthetic::SyntheticCommunity community = synthetic::generate_equilibrium_samples(model, sampling);

    EMConfig config = test_utils::quiet_config();
    config.outlier_deviation = std::numeric_limits<double>::infinity();
    config.alpha = 1.0;
    config.max_iterations = 30;

    const EMResult result = fit_glv_em(community.to_count_table(), config);
    ASSERT_TRUE(result.converged) << "stopped after " << result.iterations << " iterations";
    EXPECT_LT(result.iterations, config.max_iterations);
    EXPECT_FALSE(result.filtering_activated);

    const ParameterEstimate truth = model.scaled();
    const ParameterEstimate estimate = final_parameters(result);
    for (Eigen::Index i = 0; i < truth.num_taxa(); ++i) {
        EXPECT_EQ(estimate.interactions(i, i), -1.0);
        for (Eigen::Index j = 0; j < truth.num_taxa(); ++j) {
            if (i == j || std::abs(truth.interactions(i, j)) <= config.coefficient_snap_threshold) { continue; }
            EXPECT_EQ(sign_of(estimate.interactions(i, j)), sign_of(truth.interactions(i, j)))
              << "B(" << i << ", " << j << "): true " << truth.interactions(i, j) << ", estimated "
              << estimate.interactions(i, j);
        }
    }
    // Growth rates are positive in the generating model and recovered up to the biomass scale.
    EXPECT_TRUE((estimate.growth_rates.array() > 0.0).all());
}
