#ifndef ABUNDANCE_DATA_HPP
#define ABUNDANCE_DATA_HPP

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

namespace glv_em {

/// Taxa x samples matrix of relative abundances (columns sum to one after preprocessing).
using AbundanceMatrix = Eigen::MatrixXd;

/// Taxa x samples flags; true excludes the (taxon, sample) pair from that taxon's regression.
using ExclusionMask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

/// One flag per sample.
using SampleFlags = Eigen::Array<bool, Eigen::Dynamic, 1>;

/**
 * @brief Raw input table: non-negative counts (or relative abundances) with taxon identifiers.
 *
 * counts(i, s) is the measurement of taxon i in sample s.
 */
struct CountTable {
    std::vector<std::string> taxon_names; ///< One name per row of counts.
    Eigen::MatrixXd counts;               ///< Taxa x samples.

    size_t num_taxa() const { return static_cast<size_t>(counts.rows()); }
    size_t num_samples() const { return static_cast<size_t>(counts.cols()); }
};

/**
 * @brief Thrown when a sample has no reads at all; no biomass can be estimated for it.
 */
class ZeroTotalSampleError : public std::runtime_error {
  public:
    explicit ZeroTotalSampleError(Eigen::Index sample_index)
      : std::runtime_error("Sample " + std::to_string(sample_index + 1) + " has zero total abundance...")
      , sample_index_(sample_index) {}

    Eigen::Index sample_index() const { return sample_index_; }

  private:
    Eigen::Index sample_index_;
};

/**
 * @brief Generates default taxon names ("taxon_1", "taxon_2", ...) for an unnamed table.
 */
inline std::vector<std::string>
default_taxon_names(size_t num_taxa) {
    std::vector<std::string> names;
    names.reserve(num_taxa);
    for (size_t i = 0; i < num_taxa; ++i) { names.push_back("taxon_" + std::to_string(i + 1)); }
    return names;
}

} // namespace glv_em

#endif // ABUNDANCE_DATA_HPP
