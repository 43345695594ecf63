#ifndef SPECTRUMINDEX_SPECTRUMINDEX_HPP
#define SPECTRUMINDEX_SPECTRUMINDEX_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "binning/binning.hpp"
#include "similarity/similarity.hpp"
#include "spectrum/spectrum.hpp"

// A library of reference spectra keyed by identifier, searchable by
// similarity. Binned vectors are computed on demand and cached for the last
// binning configuration used.
namespace SpectrumIndex {

// Mutating methods must not be called concurrently with any other method.
// Const methods can be called from multiple threads at the same time.
class Index {
   public:
    // Adds the spectrum to the index. Throws Errors::DuplicateIdentifierError
    // if a spectrum with the same identifier is already stored, unless
    // `replace' is set, in which case the previous entry and its cached vector
    // are discarded.
    void insert(Spectrum::Spectrum spectrum, bool replace = false);

    // Throws Errors::NotFoundError if the identifier is not stored.
    void remove(const std::string &id);

    // Removes every spectrum and cached vector.
    void clear();

    bool contains(const std::string &id) const;
    // Throws Errors::NotFoundError if the identifier is not stored.
    const Spectrum::Spectrum &get(const std::string &id) const;
    uint64_t size() const { return m_spectra.size(); }
    bool empty() const { return m_spectra.empty(); }

    // Stored identifiers/spectra in ascending identifier order.
    std::vector<std::string> ids() const;
    std::vector<Spectrum::Spectrum> spectra() const;

    // Bins the query and every stored spectrum with the given configuration
    // and returns the `top_k' best candidates. Throws
    // Errors::InvalidArgumentError if top_k <= 0.
    std::vector<Similarity::Score> find_best_matches(
        const Spectrum::Spectrum &query, const Binning::Config &config,
        int64_t top_k, Similarity::Metric metric = Similarity::COSINE) const;

    // Binned vectors for every stored spectrum, in identifier order. Vectors
    // are taken from the cache when possible.
    std::vector<std::shared_ptr<const Binning::BinnedVector>> binned(
        const Binning::Config &config) const;
    std::shared_ptr<const Binning::BinnedVector> binned(
        const std::string &id, const Binning::Config &config) const;

    // Number of vectors currently cached.
    uint64_t cached_vectors() const { return m_cache.size(); }
    void invalidate_cache() { m_cache.clear(); }

   private:
    std::map<std::string, Spectrum::Spectrum> m_spectra;
    mutable Binning::Cache m_cache;
};

}  // namespace SpectrumIndex

#endif /* SPECTRUMINDEX_SPECTRUMINDEX_HPP */
