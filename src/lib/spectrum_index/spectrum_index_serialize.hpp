#ifndef SPECTRUMINDEX_SPECTRUMINDEXSERIALIZE_HPP
#define SPECTRUMINDEX_SPECTRUMINDEXSERIALIZE_HPP

#include <iostream>

#include "spectrum_index/spectrum_index.hpp"

// This namespace groups the functions used to serialize a spectral library
// into a binary stream. Only the spectra are stored, the binned vectors are
// recomputed on demand after loading.
namespace SpectrumIndex::Serialize {

// Reading replaces the contents of the given index. Fails if the stream
// contains repeated identifiers.
bool read_index(std::istream &stream, SpectrumIndex::Index *index);
bool write_index(std::ostream &stream, const SpectrumIndex::Index &index);

}  // namespace SpectrumIndex::Serialize

#endif /* SPECTRUMINDEX_SPECTRUMINDEXSERIALIZE_HPP */
