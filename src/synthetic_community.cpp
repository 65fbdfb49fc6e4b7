#include "glv_em/synthetic_community.hpp"
#include <algorithm>
#include <boost/numeric/odeint.hpp>
#include <cmath>
#include <random>
#include <stdexcept>

namespace odeint = boost::numeric::odeint;

namespace glv_em {
namespace synthetic {

void
GlvModel::operator()(const std::vector<double> &x, std::vector<double> &dxdt, double /*t*/) const {
    const Eigen::Index p = num_species();
    dxdt.resize(static_cast<size_t>(p));
    for (Eigen::Index i = 0; i < p; ++i) {
        double rate = growth_rates(i);
        for (Eigen::Index j = 0; j < p; ++j) { rate += interactions(i, j) * x[static_cast<size_t>(j)]; }
        dxdt[static_cast<size_t>(i)] = x[static_cast<size_t>(i)] * rate;
    }
}

ParameterEstimate
GlvModel::scaled() const {
    validate();
    ParameterEstimate estimate;
    const Eigen::VectorXd self = -interactions.diagonal();
    estimate.growth_rates = (growth_rates.array() / self.array()).matrix();
    estimate.interactions = self.cwiseInverse().asDiagonal() * interactions;
    estimate.interactions.diagonal().setConstant(-1.0);
    return estimate;
}

void
GlvModel::validate() const {
    const Eigen::Index p = num_species();
    if (p == 0 || interactions.rows() != p || interactions.cols() != p) {
        throw std::invalid_argument("GlvModel: growth rates and interaction matrix sizes disagree.");
    }
    if ((interactions.diagonal().array() >= 0.0).any()) {
        throw std::invalid_argument("GlvModel: every self-interaction must be negative.");
    }
}

GlvModel
define_five_species_community() {
    // Scaled interactions (diagonal -1); every off-diagonal row sum of |B| is 0.35,
    // which keeps all sub-communities feasible and globally stable.
    Eigen::MatrixXd b(5, 5);
    // clang-format off
    b <<  -1.0,   0.2,   0.0,  -0.15,  0.0,
          -0.2,  -1.0,   0.15,  0.0,   0.0,
           0.0,   0.0,  -1.0,   0.2,  -0.15,
           0.15,  0.0,   0.0,  -1.0,  -0.2,
           0.0,  -0.15,  0.2,   0.0,  -1.0;
    // clang-format on
    Eigen::VectorXd self(5);
    self << 1.0, 0.8, 1.5, 1.2, 0.9;

    GlvModel model;
    model.growth_rates.resize(5);
    model.growth_rates << 1.0, 0.8, 1.2, 0.9, 1.1;
    model.interactions = self.asDiagonal() * b;
    return model;
}

std::vector<double>
simulate_to_equilibrium(const GlvModel &model,
                        const std::vector<double> &initial,
                        double duration,
                        double abs_err,
                        double rel_err) {
    model.validate();
    if (initial.size() != static_cast<size_t>(model.num_species())) {
        throw std::invalid_argument("Initial condition vector size mismatch.");
    }
    using StateType = std::vector<double>;
    using ErrorStepperType = odeint::runge_kutta_dopri5<StateType>;
    auto stepper = odeint::make_controlled(abs_err, rel_err, ErrorStepperType());

    StateType state = initial;
    odeint::integrate_adaptive(stepper, model, state, 0.0, duration, 0.01);
    return state;
}

Eigen::VectorXd
equilibrium_of(const GlvModel &model, const std::vector<Eigen::Index> &species) {
    const Eigen::Index k = static_cast<Eigen::Index>(species.size());
    Eigen::MatrixXd a_sub(k, k);
    Eigen::VectorXd r_sub(k);
    for (Eigen::Index u = 0; u < k; ++u) {
        r_sub(u) = model.growth_rates(species[static_cast<size_t>(u)]);
        for (Eigen::Index v = 0; v < k; ++v) {
            a_sub(u, v) = model.interactions(species[static_cast<size_t>(u)], species[static_cast<size_t>(v)]);
        }
    }
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> dec(a_sub);
    if (dec.rank() < k) { throw std::runtime_error("Sub-community interaction matrix is singular."); }
    const Eigen::VectorXd x_sub = dec.solve(-r_sub);

    Eigen::VectorXd x = Eigen::VectorXd::Zero(model.num_species());
    for (Eigen::Index u = 0; u < k; ++u) { x(species[static_cast<size_t>(u)]) = x_sub(u); }
    return x;
}

CountTable
SyntheticCommunity::to_count_table() const {
    CountTable table;
    table.counts = relative;
    table.taxon_names = taxon_names.empty() ? default_taxon_names(static_cast<size_t>(relative.rows())) : taxon_names;
    return table;
}

SyntheticCommunity
generate_equilibrium_samples(const GlvModel &model, const SamplingOptions &options) {
    model.validate();
    const Eigen::Index p = model.num_species();
    if (options.num_samples < 1 || options.min_species < 1 || options.min_species > p) {
        throw std::invalid_argument("Sampling options are inconsistent with the model size.");
    }
    if (!(options.presence_probability > 0.0 && options.presence_probability <= 1.0)) {
        throw std::invalid_argument("Presence probability must lie in (0, 1].");
    }

    std::mt19937 rng(options.seed);
    std::bernoulli_distribution seeded(options.presence_probability);
    std::uniform_real_distribution<double> initial_abundance(0.1, 1.0);
    std::normal_distribution<double> log_noise(0.0, options.noise_sd > 0.0 ? options.noise_sd : 1.0);

    SyntheticCommunity community;
    community.absolute.resize(p, options.num_samples);
    community.relative.resize(p, options.num_samples);
    community.biomass.resize(options.num_samples);
    community.taxon_names = default_taxon_names(static_cast<size_t>(p));

    const int max_failures = 100;
    int failures = 0;
    int s = 0;
    while (s < options.num_samples) {
        std::vector<double> initial(static_cast<size_t>(p), 0.0);
        int present = 0;
        for (Eigen::Index i = 0; i < p; ++i) {
            if (seeded(rng)) {
                initial[static_cast<size_t>(i)] = initial_abundance(rng);
                ++present;
            }
        }
        if (present < options.min_species) { continue; }

        const std::vector<double> end_state = simulate_to_equilibrium(model, initial, options.simulation_time);
        std::vector<Eigen::Index> survivors;
        for (Eigen::Index i = 0; i < p; ++i) {
            if (end_state[static_cast<size_t>(i)] > options.extinction_threshold) { survivors.push_back(i); }
        }

        // Polish to the exact fixed point; reject draws that have not settled there.
        bool accepted = !survivors.empty();
        Eigen::VectorXd x;
        if (accepted) {
            x = equilibrium_of(model, survivors);
            for (Eigen::Index i : survivors) {
                const double simulated = end_state[static_cast<size_t>(i)];
                if (!(x(i) > 0.0) || std::abs(simulated - x(i)) > 1e-4 * std::max(1.0, x(i))) {
                    accepted = false;
                    break;
                }
            }
        }
        if (!accepted) {
            if (++failures > max_failures) {
                throw std::runtime_error("Too many species subsets failed to reach a positive equilibrium.");
            }
            continue;
        }
        failures = 0;

        community.absolute.col(s) = x;
        community.biomass(s) = x.sum();
        Eigen::VectorXd observed = x;
        if (options.noise_sd > 0.0) {
            for (Eigen::Index i = 0; i < p; ++i) {
                if (observed(i) > 0.0) { observed(i) *= std::exp(log_noise(rng)); }
            }
        }
        community.relative.col(s) = observed / observed.sum();
        ++s;
    }
    return community;
}

} // namespace synthetic
} // namespace glv_em
