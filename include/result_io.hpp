#ifndef RESULT_IO_HPP
#define RESULT_IO_HPP

#include "abundance_data.hpp"
#include "em_config.hpp"
#include "em_driver.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace glv_em {

// JSON has no infinity or NaN. Infinite values are written as the strings
// "inf" / "-inf" and NaN as null; the readers accept the same forms.

/**
 * @brief Builds a configuration from a JSON object. Missing keys keep their defaults.
 *
 * Unknown keys are reported on std::cerr and ignored.
 *
 * @throws std::invalid_argument on type errors or if the resulting configuration is invalid.
 */
EMConfig
config_from_json(const nlohmann::json &j);

nlohmann::json
config_to_json(const EMConfig &config);

/**
 * @brief Reads a count table of the form
 *        {"taxa": ["name", ...], "counts": [[row of taxon 1], [row of taxon 2], ...]}.
 *
 * "taxa" is optional; default names are generated when it is absent.
 *
 * @throws std::invalid_argument on malformed or ragged input.
 */
CountTable
count_table_from_json(const nlohmann::json &j);

/**
 * @brief Serializes an EM result: final estimates, full trace, residuals,
 *        entropy diagnostic, excluded samples and run status.
 */
nlohmann::json
result_to_json(const EMResult &result);

/// Parses a JSON file. @throws std::runtime_error if the file cannot be opened or parsed.
nlohmann::json
read_json_file(const std::string &path);

/// Writes `j` to `path` with the given indentation. @throws std::runtime_error on I/O failure.
void
write_json_file(const nlohmann::json &j, const std::string &path, int indent = 2);

} // namespace glv_em

#endif // RESULT_IO_HPP
