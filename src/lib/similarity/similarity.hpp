#ifndef SIMILARITY_SIMILARITY_HPP
#define SIMILARITY_SIMILARITY_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "binning/binning.hpp"

// This namespace contains the scoring functions used to compare binned
// spectra, and the ranking of a query against a set of candidates.
namespace Similarity {

// The available similarity metrics. All of them produce a value in [0, 1],
// where 1 means identical spectra.
//
//   COSINE:         dot(a, b) / (|a| * |b|).
//   DOT_PRODUCT:    dot(a, b) / max(dot(a, a), dot(b, b)). Unlike the cosine
//                   it also penalizes differences in absolute intensity.
//   EUCLIDEAN:      1 / (1 + |a - b|).
//   REVERSE_COSINE: Cosine restricted to the bins where the candidate has
//                   signal, so peaks only present in the query are ignored.
//                   This is the reverse search used for library matching and
//                   it is not symmetric.
//
// The cosine based metrics are defined as 0 when either vector has no signal.
enum Metric : uint8_t {
    COSINE = 0,
    DOT_PRODUCT = 1,
    EUCLIDEAN = 2,
    REVERSE_COSINE = 3
};

// Parse the metric name ("cosine", "dot_product", "euclidean",
// "reverse_cosine"), case insensitive.
Metric parse_metric(std::string name);
std::string to_string(Metric metric);

struct Score {
    // Identifiers of the query (a) and candidate (b) spectra.
    std::string id_a;
    std::string id_b;
    double value;
    // Parameters used to compute this score.
    Metric metric;
    Binning::Config config;
};

// Throws Errors::IncompatibleVectorsError unless both vectors have the same
// number of bins, mass range and bin width.
void check_compatible(const Binning::BinnedVector &a,
                      const Binning::BinnedVector &b);

// Raw metric computation over two vectors of the same length.
double compute(Metric metric, const std::vector<double> &a,
               const std::vector<double> &b);

// Score a against b.
Score score(const Binning::BinnedVector &a, const Binning::BinnedVector &b,
            Metric metric = COSINE);

// Sort the scores in descending order, breaking ties by ascending candidate
// identifier.
void sort_scores(std::vector<Score> &scores);

// Score the query against every candidate and return the scores sorted with
// sort_scores. Candidates without signal are skipped, and a query without
// signal produces an empty ranking.
std::vector<Score> rank(const Binning::BinnedVector &query,
                        const std::vector<Binning::BinnedVector> &candidates,
                        Metric metric = COSINE);
std::vector<Score> rank(
    const Binning::BinnedVector &query,
    const std::vector<std::shared_ptr<const Binning::BinnedVector>>
        &candidates,
    Metric metric = COSINE);

// Scale a similarity value to the 0-1000 range used by library search
// software.
inline double match_factor(double value) { return value * 1000.0; }

}  // namespace Similarity

#endif /* SIMILARITY_SIMILARITY_HPP */
