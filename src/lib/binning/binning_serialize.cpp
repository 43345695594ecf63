#include "binning/binning_serialize.hpp"
#include "utils/serialization.hpp"

bool Binning::Serialize::read_config(std::istream &stream,
                                     Binning::Config *config) {
    Serialization::read_double(stream, &config->mass_min);
    Serialization::read_double(stream, &config->mass_max);
    Serialization::read_double(stream, &config->bin_width);
    uint8_t normalization = 0;
    Serialization::read_uint8(stream, &normalization);
    if (normalization > Binning::Normalization::L2) {
        return false;
    }
    config->normalization = static_cast<Binning::Normalization>(normalization);
    return stream.good();
}

bool Binning::Serialize::write_config(std::ostream &stream,
                                      const Binning::Config &config) {
    Serialization::write_double(stream, config.mass_min);
    Serialization::write_double(stream, config.mass_max);
    Serialization::write_double(stream, config.bin_width);
    Serialization::write_uint8(stream, config.normalization);
    return stream.good();
}

bool Binning::Serialize::read_binned_vector(std::istream &stream,
                                            Binning::BinnedVector *vector) {
    Serialization::read_string(stream, &vector->spectrum_id);
    read_config(stream, &vector->config);
    Serialization::read_vector(stream, &vector->data);
    return stream.good();
}

bool Binning::Serialize::write_binned_vector(
    std::ostream &stream, const Binning::BinnedVector &vector) {
    Serialization::write_string(stream, vector.spectrum_id);
    write_config(stream, vector.config);
    Serialization::write_vector(stream, vector.data);
    return stream.good();
}

bool Binning::Serialize::read_binned_vectors(
    std::istream &stream, std::vector<Binning::BinnedVector> *vectors) {
    return Serialization::read_vector<Binning::BinnedVector>(
        stream, vectors, Binning::Serialize::read_binned_vector);
}

bool Binning::Serialize::write_binned_vectors(
    std::ostream &stream, const std::vector<Binning::BinnedVector> &vectors) {
    return Serialization::write_vector<Binning::BinnedVector>(
        stream, vectors, Binning::Serialize::write_binned_vector);
}
