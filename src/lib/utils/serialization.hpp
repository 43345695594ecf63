#ifndef UTILS_SERIALIZATION_HPP
#define UTILS_SERIALIZATION_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// This namespace contains necessary functions to serialize commonly used types
// into a binary stream using the little endian byte order.
namespace Serialization {

// Write/read a single byte to/from the stream.
bool read_uint8(std::istream &stream, uint8_t *value);
bool write_uint8(std::ostream &stream, uint8_t value);

bool read_int8(std::istream &stream, int8_t *value);
bool write_int8(std::ostream &stream, int8_t value);

// Booleans are stored as a single byte.
bool read_bool(std::istream &stream, bool *value);
bool write_bool(std::ostream &stream, bool value);

// Write/read an uint16 to/from the stream.
bool read_uint16(std::istream &stream, uint16_t *value);
bool write_uint16(std::ostream &stream, uint16_t value);

// Write/read an uint32 to/from the stream.
bool read_uint32(std::istream &stream, uint32_t *value);
bool write_uint32(std::ostream &stream, uint32_t value);

// Write/read an uint64 to/from the stream.
bool read_uint64(std::istream &stream, uint64_t *value);
bool write_uint64(std::ostream &stream, uint64_t value);

bool read_float(std::istream &stream, float *value);
bool write_float(std::ostream &stream, float value);

bool read_double(std::istream &stream, double *value);
bool write_double(std::ostream &stream, double value);

// Strings are stored as the number of bytes (uint64) followed by the raw
// characters, without a null terminator.
bool read_string(std::istream &stream, std::string *value);
bool write_string(std::ostream &stream, const std::string &value);

// Vectors are stored as the number of elements (uint64) followed by each
// element, serialized with the given function.
template <typename T>
bool read_vector(std::istream &stream, std::vector<T> *vec,
                 bool (*read_elem)(std::istream &, T *)) {
    uint64_t num_elements = 0;
    if (!read_uint64(stream, &num_elements)) {
        return false;
    }
    vec->clear();
    for (uint64_t i = 0; i < num_elements; ++i) {
        T elem = {};
        if (!read_elem(stream, &elem)) {
            return false;
        }
        vec->push_back(std::move(elem));
    }
    return stream.good();
}
template <typename T>
bool write_vector(std::ostream &stream, const std::vector<T> &vec,
                  bool (*write_elem)(std::ostream &, const T &)) {
    write_uint64(stream, vec.size());
    for (const auto &elem : vec) {
        if (!write_elem(stream, elem)) {
            return false;
        }
    }
    return stream.good();
}

// Scalar values are passed by value to the write functions, so std::vector of
// scalars needs its own overloads.
bool read_vector(std::istream &stream, std::vector<double> *vec);
bool write_vector(std::ostream &stream, const std::vector<double> &vec);

}  // namespace Serialization

#endif /* UTILS_SERIALIZATION_HPP */
