#ifndef SPECTRUM_SPECTRUMSERIALIZE_HPP
#define SPECTRUM_SPECTRUMSERIALIZE_HPP

#include <iostream>

#include "spectrum/spectrum.hpp"

// This namespace groups the functions used to serialize Spectrum data
// structures into a binary stream.
namespace Spectrum::Serialize {

// Read/Write the spectrum metadata to/from the given binary stream.
bool read_metadata(std::istream &stream, ::Spectrum::Metadata *metadata);
bool write_metadata(std::ostream &stream, const ::Spectrum::Metadata &metadata);

// Read/Write a single spectrum to/from the given binary stream. Reading fails
// if the stored series is not a valid spectrum.
bool read_spectrum(std::istream &stream, ::Spectrum::Spectrum *spectrum);
bool write_spectrum(std::ostream &stream, const ::Spectrum::Spectrum &spectrum);

// Read/Write all spectra to/from the given binary stream.
bool read_spectra(std::istream &stream,
                  std::vector<::Spectrum::Spectrum> *spectra);
bool write_spectra(std::ostream &stream,
                   const std::vector<::Spectrum::Spectrum> &spectra);

}  // namespace Spectrum::Serialize

#endif /* SPECTRUM_SPECTRUMSERIALIZE_HPP */
