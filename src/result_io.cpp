#include "result_io.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace glv_em {

namespace {

nlohmann::json
number_to_json(double value) {
    if (std::isnan(value)) { return nullptr; }
    if (std::isinf(value)) { return value > 0.0 ? "inf" : "-inf"; }
    return value;
}

double
number_from_json(const nlohmann::json &j, const std::string &key) {
    if (j.is_null()) { return std::numeric_limits<double>::quiet_NaN(); }
    if (j.is_number()) { return j.get<double>(); }
    if (j.is_string()) {
        const std::string s = j.get<std::string>();
        if (s == "inf" || s == "Inf" || s == "infinity" || s == "Infinity") {
            return std::numeric_limits<double>::infinity();
        }
        if (s == "-inf" || s == "-Inf" || s == "-infinity" || s == "-Infinity") {
            return -std::numeric_limits<double>::infinity();
        }
    }
    throw std::invalid_argument("Expected a number for '" + key + "', got " + j.dump() + ".");
}

int
integer_from_json(const nlohmann::json &j, const std::string &key) {
    if (!j.is_number_integer()) { throw std::invalid_argument("Expected an integer for '" + key + "'."); }
    return j.get<int>();
}

bool
bool_from_json(const nlohmann::json &j, const std::string &key) {
    if (!j.is_boolean()) { throw std::invalid_argument("Expected true/false for '" + key + "'."); }
    return j.get<bool>();
}

nlohmann::json
vector_to_json(const Eigen::VectorXd &v) {
    nlohmann::json arr = nlohmann::json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) { arr.push_back(number_to_json(v(i))); }
    return arr;
}

// Row-major nested arrays.
nlohmann::json
matrix_to_json(const Eigen::MatrixXd &m) {
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) { rows.push_back(vector_to_json(m.row(r).transpose())); }
    return rows;
}

nlohmann::json
mask_to_json(const ExclusionMask &mask) {
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index r = 0; r < mask.rows(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index c = 0; c < mask.cols(); ++c) { row.push_back(static_cast<bool>(mask(r, c))); }
        rows.push_back(row);
    }
    return rows;
}

} // namespace

// --- Configuration --- //

EMConfig
config_from_json(const nlohmann::json &j) {
    if (!j.is_object()) { throw std::invalid_argument("Configuration must be a JSON object."); }

    EMConfig config;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string &key = it.key();
        const nlohmann::json &value = it.value();
        if (key == "num_threads") {
            config.num_threads = integer_from_json(value, key);
        } else if (key == "biomass_scaling") {
            config.biomass_scaling = number_from_json(value, key);
        } else if (key == "outlier_deviation") {
            config.outlier_deviation = number_from_json(value, key);
        } else if (key == "max_iterations") {
            config.max_iterations = integer_from_json(value, key);
        } else if (key == "warmup_iterations") {
            if (value.is_null()) {
                config.warmup_iterations.reset();
            } else {
                config.warmup_iterations = integer_from_json(value, key);
            }
        } else if (key == "mask_refresh_period") {
            config.mask_refresh_period = integer_from_json(value, key);
        } else if (key == "alpha") {
            config.alpha = number_from_json(value, key);
        } else if (key == "penalty_blend") {
            config.penalty_blend = number_from_json(value, key);
        } else if (key == "detection_limit") {
            config.detection_limit = number_from_json(value, key);
        } else if (key == "coefficient_snap_threshold") {
            config.coefficient_snap_threshold = number_from_json(value, key);
        } else if (key == "preprocess_deviation") {
            config.preprocess_deviation = number_from_json(value, key);
        } else if (key == "convergence_tolerance") {
            config.convergence_tolerance = number_from_json(value, key);
        } else if (key == "min_warmup_iterations") {
            config.min_warmup_iterations = integer_from_json(value, key);
        } else if (key == "min_filtering_iterations") {
            config.min_filtering_iterations = integer_from_json(value, key);
        } else if (key == "penalty_warm_start_iteration") {
            config.penalty_warm_start_iteration = integer_from_json(value, key);
        } else if (key == "center") {
            config.center = bool_from_json(value, key);
        } else if (key == "css_quantile") {
            config.css_quantile = number_from_json(value, key);
        } else if (key == "verbose") {
            config.verbose = bool_from_json(value, key);
        } else if (key == "debug") {
            config.debug = bool_from_json(value, key);
        } else {
            std::cerr << "Warning: Unknown configuration key '" << key << "' ignored." << std::endl;
        }
    }
    config.validate();
    return config;
}

nlohmann::json
config_to_json(const EMConfig &config) {
    nlohmann::json j;
    j["num_threads"] = config.num_threads;
    j["biomass_scaling"] = number_to_json(config.biomass_scaling);
    j["outlier_deviation"] = number_to_json(config.outlier_deviation);
    j["max_iterations"] = config.max_iterations;
    j["warmup_iterations"] = config.warmup_iterations.has_value() ? nlohmann::json(*config.warmup_iterations)
                                                                   : nlohmann::json(nullptr);
    j["mask_refresh_period"] = config.mask_refresh_period;
    j["alpha"] = config.alpha;
    j["penalty_blend"] = config.penalty_blend;
    j["detection_limit"] = config.detection_limit;
    j["coefficient_snap_threshold"] = config.coefficient_snap_threshold;
    j["preprocess_deviation"] = number_to_json(config.preprocess_deviation);
    j["convergence_tolerance"] = config.convergence_tolerance;
    j["min_warmup_iterations"] = config.min_warmup_iterations;
    j["min_filtering_iterations"] = config.min_filtering_iterations;
    j["penalty_warm_start_iteration"] = config.penalty_warm_start_iteration;
    j["center"] = config.center;
    j["css_quantile"] = config.css_quantile;
    j["verbose"] = config.verbose;
    j["debug"] = config.debug;
    return j;
}

// --- Count tables --- //

CountTable
count_table_from_json(const nlohmann::json &j) {
    if (!j.is_object() || !j.contains("counts")) {
        throw std::invalid_argument("Count table must be an object with a 'counts' array.");
    }
    const nlohmann::json &rows = j.at("counts");
    if (!rows.is_array() || rows.empty()) { throw std::invalid_argument("'counts' must be a non-empty array of rows."); }

    const size_t num_taxa = rows.size();
    const size_t num_samples = rows.front().is_array() ? rows.front().size() : 0;
    if (num_samples == 0) { throw std::invalid_argument("Count table rows must be non-empty arrays."); }

    CountTable table;
    table.counts.resize(static_cast<Eigen::Index>(num_taxa), static_cast<Eigen::Index>(num_samples));
    for (size_t i = 0; i < num_taxa; ++i) {
        const nlohmann::json &row = rows[i];
        if (!row.is_array() || row.size() != num_samples) {
            throw std::invalid_argument("Row " + std::to_string(i + 1) + " of the count table has the wrong length.");
        }
        for (size_t s = 0; s < num_samples; ++s) {
            table.counts(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(s)) =
              number_from_json(row[s], "counts");
        }
    }

    if (j.contains("taxa")) {
        const nlohmann::json &names = j.at("taxa");
        if (!names.is_array() || names.size() != num_taxa) {
            throw std::invalid_argument("'taxa' must list one name per row of 'counts'.");
        }
        for (const auto &name : names) {
            if (!name.is_string()) { throw std::invalid_argument("Taxon names must be strings."); }
            table.taxon_names.push_back(name.get<std::string>());
        }
    } else {
        table.taxon_names = default_taxon_names(num_taxa);
    }
    return table;
}

// --- Results --- //

nlohmann::json
result_to_json(const EMResult &result) {
    nlohmann::json j;
    j["taxa"] = result.taxon_names;
    j["converged"] = result.converged;
    j["termination"] = to_string(result.termination);
    j["iterations"] = result.iterations;
    j["filtering_activated"] = result.filtering_activated;

    if (!result.trace.parameters.empty()) {
        const ParameterEstimate last = final_parameters(result);
        j["growth_rates"] = vector_to_json(last.growth_rates);
        j["interactions"] = matrix_to_json(last.interactions);
    }
    j["biomass"] = vector_to_json(final_biomass(result));

    nlohmann::json trace;
    trace["biomass"] = nlohmann::json::array();
    for (const auto &b : result.trace.biomass) { trace["biomass"].push_back(vector_to_json(b)); }
    trace["growth_rates"] = nlohmann::json::array();
    trace["interactions"] = nlohmann::json::array();
    for (const auto &p : result.trace.parameters) {
        trace["growth_rates"].push_back(vector_to_json(p.growth_rates));
        trace["interactions"].push_back(matrix_to_json(p.interactions));
    }
    trace["penalties"] = nlohmann::json::array();
    for (const auto &l : result.trace.penalties) { trace["penalties"].push_back(vector_to_json(l)); }
    j["trace"] = trace;

    j["e_step_residuals"] = matrix_to_json(result.e_step_residuals);
    j["m_step_residuals"] = matrix_to_json(result.m_step_residuals);
    j["coefficient_entropy"] = matrix_to_json(result.coefficient_entropy);
    j["final_mask"] = mask_to_json(result.final_mask);
    j["excluded_samples"] = nlohmann::json::array();
    for (Eigen::Index s : result.excluded_samples) { j["excluded_samples"].push_back(s); }
    return j;
}

// --- Files --- //

nlohmann::json
read_json_file(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open JSON file for parsing: " + path); }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("JSON parsing error in file '" + path + "': " + std::string(e.what()));
    }
}

void
write_json_file(const nlohmann::json &j, const std::string &path, int indent) {
    std::ofstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open file for writing: " + path); }
    file << j.dump(indent) << std::endl;
    if (!file) { throw std::runtime_error("Failed while writing JSON file: " + path); }
}

} // namespace glv_em
