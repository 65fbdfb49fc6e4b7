#include "em_config.hpp"
#include <cmath>
#include <stdexcept>

namespace glv_em {

void
EMConfig::validate() const {
    if (num_threads < 1) { throw std::invalid_argument("num_threads must be at least 1."); }
    if (!(biomass_scaling > 0.0) || !std::isfinite(biomass_scaling)) {
        throw std::invalid_argument("biomass_scaling must be positive and finite.");
    }
    if (std::isnan(outlier_deviation)) { throw std::invalid_argument("outlier_deviation must not be NaN."); }
    if (max_iterations < 1) { throw std::invalid_argument("max_iterations must be at least 1."); }
    if (warmup_iterations.has_value() && *warmup_iterations < 0) {
        throw std::invalid_argument("warmup_iterations must be non-negative.");
    }
    if (mask_refresh_period < 1) { throw std::invalid_argument("mask_refresh_period must be at least 1."); }
    if (!(alpha >= 0.0 && alpha <= 1.0)) { throw std::invalid_argument("alpha must lie in [0, 1]."); }
    if (!(penalty_blend >= 0.0 && penalty_blend <= 1.0)) {
        throw std::invalid_argument("penalty_blend must lie in [0, 1].");
    }
    if (!(detection_limit >= 0.0 && detection_limit < 1.0)) {
        throw std::invalid_argument("detection_limit must lie in [0, 1).");
    }
    if (!(preprocess_deviation >= 0.0)) { throw std::invalid_argument("preprocess_deviation must be non-negative."); }
    if (!(css_quantile >= 0.0 && css_quantile <= 1.0)) {
        throw std::invalid_argument("css_quantile must lie in [0, 1].");
    }
    // The diagonal of B is -1 and must survive snapping.
    if (!(coefficient_snap_threshold >= 0.0 && coefficient_snap_threshold < 1.0)) {
        throw std::invalid_argument("coefficient_snap_threshold must lie in [0, 1).");
    }
    if (!(convergence_tolerance > 0.0)) { throw std::invalid_argument("convergence_tolerance must be positive."); }
    if (min_warmup_iterations < 0 || min_filtering_iterations < 0 || penalty_warm_start_iteration < 1) {
        throw std::invalid_argument("Iteration thresholds must be non-negative (warm start at least 1).");
    }
}

ElasticNetOptions
elastic_net_options_from(const EMConfig &config) {
    ElasticNetOptions options;
    options.alpha = config.alpha;
    options.penalty_blend = config.penalty_blend;
    return options;
}

} // namespace glv_em
