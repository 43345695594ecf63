#ifndef BINNING_BINNINGSERIALIZE_HPP
#define BINNING_BINNINGSERIALIZE_HPP

#include <iostream>

#include "binning/binning.hpp"

// This namespace groups the functions used to serialize Binning data
// structures into a binary stream.
namespace Binning::Serialize {

// Read/Write the binning configuration to/from the given binary stream.
bool read_config(std::istream &stream, Binning::Config *config);
bool write_config(std::ostream &stream, const Binning::Config &config);

// Read/Write a single binned vector to/from the given binary stream.
bool read_binned_vector(std::istream &stream, Binning::BinnedVector *vector);
bool write_binned_vector(std::ostream &stream,
                         const Binning::BinnedVector &vector);

// Read/Write all binned vectors to/from the given binary stream.
bool read_binned_vectors(std::istream &stream,
                         std::vector<Binning::BinnedVector> *vectors);
bool write_binned_vectors(std::ostream &stream,
                          const std::vector<Binning::BinnedVector> &vectors);

}  // namespace Binning::Serialize

#endif /* BINNING_BINNINGSERIALIZE_HPP */
