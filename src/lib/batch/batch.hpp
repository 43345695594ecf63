#ifndef BATCH_BATCH_HPP
#define BATCH_BATCH_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "binning/binning.hpp"
#include "similarity/similarity.hpp"
#include "spectrum/spectrum.hpp"
#include "spectrum_index/spectrum_index.hpp"

// In this namespace we have the all-against-all comparison of spectra
// collections, used to build score tables and per query rankings.
namespace Batch {

// A pair that could not be scored. It is stored in the report instead of
// aborting the whole run.
struct PairwiseComparisonFailure {
    std::string reason;
};

// std::monostate marks a cell that was not computed because the run was
// cancelled before reaching it.
using Outcome =
    std::variant<std::monostate, Similarity::Score, PairwiseComparisonFailure>;

struct Cell {
    std::string query_id;
    std::string candidate_id;
    // Both sides have the same identifier.
    bool self_comparison;
    Outcome outcome;
};

struct Report {
    std::vector<std::string> query_ids;
    std::vector<std::string> candidate_ids;
    // query_ids.size() * candidate_ids.size() cells in row major order, one row
    // per query.
    std::vector<Cell> cells;
    Binning::Config config;
    Similarity::Metric metric;
    // The run was interrupted and some cells were not computed.
    bool cancelled;
};

// Number of threads the hardware can run concurrently, at least 1.
uint64_t hardware_threads();

struct Parameters {
    Binning::Config config = Binning::default_config();
    Similarity::Metric metric = Similarity::COSINE;
    // Upper bound on the number of worker threads. The actual number is also
    // limited by the hardware concurrency.
    uint64_t max_threads = 1;
};

// Compares every spectrum of `queries' against every spectrum of
// `candidates'. If `cancel' is given, it is checked before every pairwise
// comparison and the remaining cells are left uncomputed once it is set.
Report compare_all(const std::vector<Spectrum::Spectrum> &queries,
                   const std::vector<Spectrum::Spectrum> &candidates,
                   const Parameters &parameters,
                   const std::atomic<bool> *cancel = nullptr);

// Same as above with the collection on both sides.
Report compare_within(const std::vector<Spectrum::Spectrum> &spectra,
                      const Parameters &parameters,
                      const std::atomic<bool> *cancel = nullptr);

// Compares already binned vectors. Incompatible pairs are reported as
// failures. The binning configuration of the report is taken from the first
// query, parameters.config is not used.
Report compare_vectors(const std::vector<Binning::BinnedVector> &queries,
                       const std::vector<Binning::BinnedVector> &candidates,
                       const Parameters &parameters,
                       const std::atomic<bool> *cancel = nullptr);

// Compares the queries against every spectrum stored in the index, reusing
// its cached vectors.
Report compare_with_index(const std::vector<Spectrum::Spectrum> &queries,
                          const SpectrumIndex::Index &index,
                          const Parameters &parameters,
                          const std::atomic<bool> *cancel = nullptr);

// Cell for the query i and candidate j. Throws Errors::NotFoundError when out
// of bounds.
const Cell &cell(const Report &report, uint64_t i, uint64_t j);

// Best `k' scores for the query i, sorted as in Similarity::rank. Failed and
// uncomputed cells are skipped.
std::vector<Similarity::Score> top_k(const Report &report, uint64_t i,
                                     int64_t k, bool exclude_self = false);

// top_k for every query.
std::vector<std::vector<Similarity::Score>> rankings(const Report &report,
                                                     int64_t k,
                                                     bool exclude_self = false);

uint64_t num_scored(const Report &report);
uint64_t num_failed(const Report &report);

// Dense query x candidate matrix of match factors (0-1000). Failed and
// uncomputed cells are set to -1 and, if requested, self comparisons to -2.
std::vector<std::vector<double>> score_matrix(const Report &report,
                                              bool mask_self = false);

}  // namespace Batch

#endif /* BATCH_BATCH_HPP */
