#include <cstring>

#include "utils/serialization.hpp"

// The values are assembled byte by byte, so the stored data is little endian
// regardless of the platform byte order.
template <typename T>
bool read_unsigned(std::istream &stream, T *value) {
    unsigned char bytes[sizeof(T)];
    stream.read(reinterpret_cast<char *>(bytes), sizeof(T));
    if (!stream.good()) {
        return false;
    }
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result |= static_cast<T>(bytes[i]) << (8 * i);
    }
    *value = result;
    return true;
}

template <typename T>
bool write_unsigned(std::ostream &stream, T value) {
    unsigned char bytes[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
    }
    stream.write(reinterpret_cast<const char *>(bytes), sizeof(T));
    return stream.good();
}

bool Serialization::read_uint8(std::istream &stream, uint8_t *value) {
    return read_unsigned<uint8_t>(stream, value);
}

bool Serialization::write_uint8(std::ostream &stream, uint8_t value) {
    return write_unsigned<uint8_t>(stream, value);
}

bool Serialization::read_int8(std::istream &stream, int8_t *value) {
    uint8_t raw = 0;
    if (!read_uint8(stream, &raw)) {
        return false;
    }
    *value = static_cast<int8_t>(raw);
    return true;
}

bool Serialization::write_int8(std::ostream &stream, int8_t value) {
    return write_uint8(stream, static_cast<uint8_t>(value));
}

bool Serialization::read_bool(std::istream &stream, bool *value) {
    uint8_t raw = 0;
    if (!read_uint8(stream, &raw)) {
        return false;
    }
    *value = raw != 0;
    return true;
}

bool Serialization::write_bool(std::ostream &stream, bool value) {
    return write_uint8(stream, value ? 1 : 0);
}

bool Serialization::read_uint16(std::istream &stream, uint16_t *value) {
    return read_unsigned<uint16_t>(stream, value);
}

bool Serialization::write_uint16(std::ostream &stream, uint16_t value) {
    return write_unsigned<uint16_t>(stream, value);
}

bool Serialization::read_uint32(std::istream &stream, uint32_t *value) {
    return read_unsigned<uint32_t>(stream, value);
}

bool Serialization::write_uint32(std::ostream &stream, uint32_t value) {
    return write_unsigned<uint32_t>(stream, value);
}

bool Serialization::read_uint64(std::istream &stream, uint64_t *value) {
    return read_unsigned<uint64_t>(stream, value);
}

bool Serialization::write_uint64(std::ostream &stream, uint64_t value) {
    return write_unsigned<uint64_t>(stream, value);
}

// Floating point numbers are stored as their IEEE 754 bit pattern.
bool Serialization::read_float(std::istream &stream, float *value) {
    uint32_t raw = 0;
    if (!read_uint32(stream, &raw)) {
        return false;
    }
    std::memcpy(value, &raw, sizeof(float));
    return true;
}

bool Serialization::write_float(std::ostream &stream, float value) {
    uint32_t raw = 0;
    std::memcpy(&raw, &value, sizeof(float));
    return write_uint32(stream, raw);
}

bool Serialization::read_double(std::istream &stream, double *value) {
    uint64_t raw = 0;
    if (!read_uint64(stream, &raw)) {
        return false;
    }
    std::memcpy(value, &raw, sizeof(double));
    return true;
}

bool Serialization::write_double(std::ostream &stream, double value) {
    uint64_t raw = 0;
    std::memcpy(&raw, &value, sizeof(double));
    return write_uint64(stream, raw);
}

bool Serialization::read_string(std::istream &stream, std::string *value) {
    uint64_t size = 0;
    if (!read_uint64(stream, &size)) {
        return false;
    }
    value->clear();
    // Read in chunks so a corrupted size does not trigger a huge allocation.
    char buffer[4096];
    while (size > 0) {
        auto chunk = size < sizeof(buffer) ? size : sizeof(buffer);
        stream.read(buffer, chunk);
        if (!stream.good()) {
            return false;
        }
        value->append(buffer, chunk);
        size -= chunk;
    }
    return stream.good();
}

bool Serialization::write_string(std::ostream &stream,
                                 const std::string &value) {
    write_uint64(stream, value.size());
    stream.write(value.data(), value.size());
    return stream.good();
}

bool Serialization::read_vector(std::istream &stream,
                                std::vector<double> *vec) {
    uint64_t num_elements = 0;
    if (!read_uint64(stream, &num_elements)) {
        return false;
    }
    vec->clear();
    for (uint64_t i = 0; i < num_elements; ++i) {
        double value = 0;
        if (!read_double(stream, &value)) {
            return false;
        }
        vec->push_back(value);
    }
    return stream.good();
}

bool Serialization::write_vector(std::ostream &stream,
                                 const std::vector<double> &vec) {
    write_uint64(stream, vec.size());
    for (const auto &value : vec) {
        write_double(stream, value);
    }
    return stream.good();
}
