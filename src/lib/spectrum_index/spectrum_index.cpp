#include <sstream>

#include "spectrum_index/spectrum_index.hpp"
#include "utils/errors.hpp"

void SpectrumIndex::Index::insert(Spectrum::Spectrum spectrum, bool replace) {
    std::string id = spectrum.id();
    auto it = m_spectra.find(id);
    if (it != m_spectra.end()) {
        if (!replace) {
            std::ostringstream error_stream;
            error_stream << "error: spectrum " << id
                         << " is already in the index";
            throw Errors::DuplicateIdentifierError(error_stream.str());
        }
        it->second = std::move(spectrum);
        m_cache.invalidate(id);
        return;
    }
    m_spectra.emplace(std::move(id), std::move(spectrum));
}

void SpectrumIndex::Index::remove(const std::string &id) {
    auto it = m_spectra.find(id);
    if (it == m_spectra.end()) {
        std::ostringstream error_stream;
        error_stream << "error: spectrum " << id << " is not in the index";
        throw Errors::NotFoundError(error_stream.str());
    }
    m_spectra.erase(it);
    m_cache.invalidate(id);
}

void SpectrumIndex::Index::clear() {
    m_spectra.clear();
    m_cache.clear();
}

bool SpectrumIndex::Index::contains(const std::string &id) const {
    return m_spectra.count(id) != 0;
}

const Spectrum::Spectrum &SpectrumIndex::Index::get(
    const std::string &id) const {
    auto it = m_spectra.find(id);
    if (it == m_spectra.end()) {
        std::ostringstream error_stream;
        error_stream << "error: spectrum " << id << " is not in the index";
        throw Errors::NotFoundError(error_stream.str());
    }
    return it->second;
}

std::vector<std::string> SpectrumIndex::Index::ids() const {
    std::vector<std::string> ids;
    ids.reserve(m_spectra.size());
    for (const auto &entry : m_spectra) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<Spectrum::Spectrum> SpectrumIndex::Index::spectra() const {
    std::vector<Spectrum::Spectrum> spectra;
    spectra.reserve(m_spectra.size());
    for (const auto &entry : m_spectra) {
        spectra.push_back(entry.second);
    }
    return spectra;
}

std::vector<std::shared_ptr<const Binning::BinnedVector>>
SpectrumIndex::Index::binned(const Binning::Config &config) const {
    Binning::validate(config);
    std::vector<std::shared_ptr<const Binning::BinnedVector>> vectors;
    vectors.reserve(m_spectra.size());
    for (const auto &entry : m_spectra) {
        vectors.push_back(m_cache.get(entry.second, config));
    }
    return vectors;
}

std::shared_ptr<const Binning::BinnedVector> SpectrumIndex::Index::binned(
    const std::string &id, const Binning::Config &config) const {
    return m_cache.get(get(id), config);
}

std::vector<Similarity::Score> SpectrumIndex::Index::find_best_matches(
    const Spectrum::Spectrum &query, const Binning::Config &config,
    int64_t top_k, Similarity::Metric metric) const {
    if (top_k <= 0) {
        std::ostringstream error_stream;
        error_stream << "error: top_k must be positive (top_k: " << top_k
                     << ")";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    // The query is not cached, it may share an identifier with a stored
    // spectrum while having different data.
    auto query_vector = Binning::bin(query, config);
    auto scores = Similarity::rank(query_vector, binned(config), metric);
    if (scores.size() > static_cast<uint64_t>(top_k)) {
        scores.resize(top_k);
    }
    return scores;
}
