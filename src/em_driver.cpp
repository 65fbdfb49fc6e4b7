#include "em_driver.hpp"
#include "e_step.hpp"
#include "elastic_net_oracle.hpp"
#include "m_step.hpp"
#include "normalization.hpp"
#include "preprocessing.hpp"
#include "robust_statistics.hpp"
#include "sample_filter.hpp"
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace glv_em {

namespace {

struct StopRequestReset {
    std::atomic<bool> &flag;
    ~StopRequestReset() { flag.store(false); }
};

} // namespace

std::string
to_string(EMState state) {
    switch (state) {
        case EMState::WarmUp:
            return "WarmUp";
        case EMState::Filtering:
            return "Filtering";
        case EMState::Converged:
            return "Converged";
    }
    return "Unknown";
}

std::string
to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::Converged:
            return "Converged";
        case TerminationReason::MaxIterationsReached:
            return "MaxIterationsReached";
        case TerminationReason::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

ParameterEstimate
final_parameters(const EMResult &result) {
    if (result.trace.parameters.empty()) {
        throw std::runtime_error("EM result holds no parameter estimate (no iteration completed).");
    }
    return result.trace.parameters.back();
}

Eigen::VectorXd
final_biomass(const EMResult &result) {
    if (result.trace.biomass.empty()) { throw std::runtime_error("EM result holds no biomass estimate."); }
    return result.trace.biomass.back();
}

double
median_relative_change(const Eigen::VectorXd &previous, const Eigen::VectorXd &current) {
    if (previous.size() != current.size()) {
        throw std::invalid_argument("Biomass vectors of different length cannot be compared.");
    }
    const Eigen::VectorXd change = ((current - previous).array() / previous.array()).abs().matrix();
    return stats::median(change);
}

Eigen::VectorXd
rescale_biomass(const Eigen::VectorXd &biomass, const SampleFlags &retained, double scaling) {
    if (retained.size() != biomass.size()) {
        throw std::invalid_argument("Retained-sample flags do not match the biomass vector.");
    }
    std::vector<double> kept;
    for (Eigen::Index s = 0; s < biomass.size(); ++s) {
        if (retained(s)) { kept.push_back(biomass(s)); }
    }
    const double center = stats::median(kept);
    if (!std::isfinite(center) || !(center > 0.0)) {
        throw std::runtime_error("[EMDriver] Cannot rescale biomass: median over " + std::to_string(kept.size()) +
                                 " retained samples is " + std::to_string(center) + ".");
    }
    return biomass * (scaling / center);
}

// --- EMDriver --- //

EMDriver::EMDriver(EMConfig config, const RegressionOracle &oracle)
  : config_(std::move(config))
  , oracle_(oracle) {
    config_.validate();
}

void
EMDriver::log(const std::string &message) const {
    if (config_.verbose) { std::cout << "[EMDriver] " << message << std::endl; }
}

EMResult
EMDriver::run(const CountTable &table) {
    state_.store(EMState::WarmUp);
    // A stop request is consumed by this run however it ends.
    StopRequestReset stop_reset{ stop_requested_ };

    if (!table.taxon_names.empty() && table.taxon_names.size() != table.num_taxa()) {
        throw std::invalid_argument("[EMDriver] Number of taxon names does not match the count table.");
    }

    const PreprocessedData data = preprocess(table.counts, config_.preprocess_deviation, config_.detection_limit);
    const Eigen::Index p = data.abundances.rows();
    const Eigen::Index n = data.abundances.cols();
    log("Fitting " + std::to_string(p) + " taxa over " + std::to_string(n) + " samples with " + oracle_.name() +
        " (" + std::to_string(config_.num_threads) + " threads).");

    Eigen::VectorXd biomass = initial_biomass(data.abundances, config_.biomass_scaling, config_.css_quantile);
    SampleFilter filter(data.initial_mask, config_.outlier_deviation, config_.mask_refresh_period);

    EMResult result;
    result.abundances = data.abundances;
    result.taxon_names = table.taxon_names.empty() ? default_taxon_names(table.num_taxa()) : table.taxon_names;
    result.trace.biomass.push_back(biomass);

    EStepOptions e_options;
    e_options.center = config_.center;
    e_options.coefficient_snap_threshold = config_.coefficient_snap_threshold;
    e_options.num_threads = config_.num_threads;

    const bool filtering_possible = std::isfinite(config_.outlier_deviation);
    bool filtering = false;
    std::optional<Eigen::VectorXd> previous_penalties;

    for (int iter = 1; iter <= config_.max_iterations; ++iter) {
        if (stop_requested_.load()) {
            result.termination = TerminationReason::Cancelled;
            log("Stop requested; ending before iteration " + std::to_string(iter) + ".");
            break;
        }
        if (config_.verbose) {
            std::cout << "############# Run for iteration " << iter << ": #############" << std::endl;
        }

        // --- E-step --- //
        log("E-step: estimating scaled parameters...");
        std::optional<Eigen::VectorXd> warm_penalties;
        if (iter >= config_.penalty_warm_start_iteration) { warm_penalties = previous_penalties; }
        EStepResult e = run_e_step(data.abundances, biomass, filter.mask(), oracle_, warm_penalties, e_options);
        if (config_.debug) {
            std::cout << "[EMDriver] Non-zero interactions per taxon:";
            for (Eigen::Index i = 0; i < p; ++i) {
                std::cout << " " << (e.parameters.interactions.row(i).array() != 0.0).count();
            }
            std::cout << std::endl;
        }

        // --- M-step --- //
        log("M-step: estimating biomass...");
        MStepResult m = run_m_step(data.abundances, e.parameters, config_.num_threads);
        const Eigen::Index fallbacks = m.used_fallback.count();
        if (fallbacks > 0 && config_.verbose) {
            std::cerr << "[EMDriver] Warning: " << fallbacks
                      << " sample(s) had no positive biomass candidate; used the least negative one." << std::endl;
        }

        if (filtering) {
            filter.update(iter, e.squared_residuals);
            log("Number of samples removed (detected to be non-static): " +
                std::to_string(filter.excluded_samples().size()));
        }

        Eigen::VectorXd next = rescale_biomass(m.biomass, filter.retained_samples(), config_.biomass_scaling);
        const bool stable = median_relative_change(biomass, next) < config_.convergence_tolerance;

        // Commit the iteration.
        result.trace.biomass.push_back(next);
        result.trace.parameters.push_back(std::move(e.parameters));
        result.trace.penalties.push_back(e.penalties);
        result.e_step_residuals = std::move(e.squared_residuals);
        result.m_step_residuals = std::move(m.relative_residuals);
        result.coefficient_entropy = std::move(e.coefficient_entropy);
        result.iterations = iter;
        previous_penalties = std::move(e.penalties);
        biomass = std::move(next);

        if (!filtering && filtering_possible) {
            if (config_.warmup_iterations.has_value()) {
                if (iter > *config_.warmup_iterations) {
                    log("Start to detect and remove bad samples...");
                    filtering = true;
                }
            } else if (iter > config_.min_warmup_iterations && stable) {
                log("Converged and start to detect and remove bad samples...");
                filtering = true;
            }
            if (filtering) { state_.store(EMState::Filtering); }
        }

        const bool enough_filtering = filtering && filter.filtering_rounds() > config_.min_filtering_iterations;
        if ((enough_filtering || !filtering_possible) && stable) {
            log("Converged!");
            result.converged = true;
            result.termination = TerminationReason::Converged;
            state_.store(EMState::Converged);
            break;
        }
    }

    if (result.termination == TerminationReason::MaxIterationsReached) {
        std::cerr << "[EMDriver] Warning: reached the maximum of " << config_.max_iterations
                  << " iterations without convergence." << std::endl;
    }

    result.final_mask = filter.mask();
    result.excluded_samples = filter.excluded_samples();
    result.filtering_activated = filtering;
    return result;
}

EMResult
fit_glv_em(const CountTable &table, const EMConfig &config) {
    const ElasticNetOracle oracle(elastic_net_options_from(config));
    EMDriver driver(config, oracle);
    return driver.run(table);
}

} // namespace glv_em
