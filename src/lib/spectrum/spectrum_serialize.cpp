#include <stdexcept>

#include "spectrum/spectrum_serialize.hpp"
#include "utils/serialization.hpp"

bool Spectrum::Serialize::read_metadata(std::istream &stream,
                                        ::Spectrum::Metadata *metadata) {
    Serialization::read_string(stream, &metadata->name);
    Serialization::read_string(stream, &metadata->source);
    bool has_retention_time = false;
    Serialization::read_bool(stream, &has_retention_time);
    metadata->retention_time.reset();
    if (has_retention_time) {
        double retention_time = 0;
        Serialization::read_double(stream, &retention_time);
        metadata->retention_time = retention_time;
    }
    bool has_scan_index = false;
    Serialization::read_bool(stream, &has_scan_index);
    metadata->scan_index.reset();
    if (has_scan_index) {
        uint64_t scan_index = 0;
        Serialization::read_uint64(stream, &scan_index);
        metadata->scan_index = scan_index;
    }
    return stream.good();
}

bool Spectrum::Serialize::write_metadata(std::ostream &stream,
                                         const ::Spectrum::Metadata &metadata) {
    Serialization::write_string(stream, metadata.name);
    Serialization::write_string(stream, metadata.source);
    Serialization::write_bool(stream, metadata.retention_time.has_value());
    if (metadata.retention_time) {
        Serialization::write_double(stream, *metadata.retention_time);
    }
    Serialization::write_bool(stream, metadata.scan_index.has_value());
    if (metadata.scan_index) {
        Serialization::write_uint64(stream, *metadata.scan_index);
    }
    return stream.good();
}

bool Spectrum::Serialize::read_spectrum(std::istream &stream,
                                        ::Spectrum::Spectrum *spectrum) {
    std::string id;
    std::vector<double> mz;
    std::vector<double> intensity;
    ::Spectrum::Metadata metadata = {};
    Serialization::read_string(stream, &id);
    Serialization::read_vector(stream, &mz);
    Serialization::read_vector(stream, &intensity);
    read_metadata(stream, &metadata);
    if (!stream.good()) {
        return false;
    }
    try {
        *spectrum = ::Spectrum::Spectrum(std::move(id), std::move(mz),
                                       std::move(intensity),
                                       std::move(metadata));
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << std::endl;
        return false;
    }
    return true;
}

bool Spectrum::Serialize::write_spectrum(std::ostream &stream,
                                         const ::Spectrum::Spectrum &spectrum) {
    Serialization::write_string(stream, spectrum.id());
    Serialization::write_vector(stream, spectrum.mz());
    Serialization::write_vector(stream, spectrum.intensity());
    write_metadata(stream, spectrum.metadata());
    return stream.good();
}

bool Spectrum::Serialize::read_spectra(
    std::istream &stream, std::vector<::Spectrum::Spectrum> *spectra) {
    return Serialization::read_vector<::Spectrum::Spectrum>(
        stream, spectra, ::Spectrum::Serialize::read_spectrum);
}

bool Spectrum::Serialize::write_spectra(
    std::ostream &stream, const std::vector<::Spectrum::Spectrum> &spectra) {
    return Serialization::write_vector<::Spectrum::Spectrum>(
        stream, spectra, ::Spectrum::Serialize::write_spectrum);
}
