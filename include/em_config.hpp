#ifndef EM_CONFIG_HPP
#define EM_CONFIG_HPP

#include "elastic_net_oracle.hpp"
#include "parameter_estimate.hpp"
#include "preprocessing.hpp"
#include <limits>
#include <optional>

namespace glv_em {

/**
 * @brief Settings of an EM run. Every field has a usable default.
 */
struct EMConfig {
    int num_threads = 4;              ///< Worker threads for the E- and M-steps.
    double biomass_scaling = 10000.0; ///< Target median biomass over retained samples.

    /// Robust z-score threshold of the sample filter. Infinity disables filtering for good.
    double outlier_deviation = std::numeric_limits<double>::infinity();

    int max_iterations = 30;
    std::optional<int> warmup_iterations; ///< Filtering starts after this many iterations if set.
    int mask_refresh_period = 3;          ///< Iterations between resets of the exclusion mask.

    // Regression oracle
    double alpha = 1.0;
    double penalty_blend = 1.0;

    // Preprocessing
    double detection_limit = DEFAULT_DETECTION_LIMIT;
    double preprocess_deviation = 0.0;
    double css_quantile = 0.5;

    double coefficient_snap_threshold = DEFAULT_COEFFICIENT_SNAP_THRESHOLD;

    // Iteration control
    double convergence_tolerance = 1e-3; ///< On the median relative biomass change.
    int min_warmup_iterations = 5;
    int min_filtering_iterations = 5;
    int penalty_warm_start_iteration = 5; ///< First iteration that reuses the previous penalties.

    bool center = false;

    bool verbose = true;
    bool debug = false;

    /**
     * @brief Checks ranges of all settings.
     * @throws std::invalid_argument naming the offending setting.
     */
    void validate() const;
};

/**
 * @brief Elastic-net options matching an EM configuration (alpha and penalty blend).
 */
ElasticNetOptions
elastic_net_options_from(const EMConfig &config);

} // namespace glv_em

#endif // EM_CONFIG_HPP
