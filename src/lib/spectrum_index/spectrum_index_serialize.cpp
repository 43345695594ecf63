#include <set>

#include "spectrum_index/spectrum_index_serialize.hpp"
#include "spectrum/spectrum_serialize.hpp"

bool SpectrumIndex::Serialize::read_index(std::istream &stream,
                                          SpectrumIndex::Index *index) {
    std::vector<Spectrum::Spectrum> spectra;
    if (!Spectrum::Serialize::read_spectra(stream, &spectra)) {
        return false;
    }
    std::set<std::string> ids;
    for (const auto &spectrum : spectra) {
        if (!ids.insert(spectrum.id()).second) {
            std::cerr << "error: repeated spectrum identifier in stream ("
                      << spectrum.id() << ")" << std::endl;
            return false;
        }
    }
    index->clear();
    for (auto &spectrum : spectra) {
        index->insert(std::move(spectrum));
    }
    return true;
}

bool SpectrumIndex::Serialize::write_index(std::ostream &stream,
                                           const SpectrumIndex::Index &index) {
    return Spectrum::Serialize::write_spectra(stream, index.spectra());
}
