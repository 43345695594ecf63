#ifndef UTILS_ERRORS_HPP
#define UTILS_ERRORS_HPP

#include <stdexcept>
#include <string>

// Exceptions raised by the spectral comparison engine.
namespace Errors {

// The mass/intensity series given to build a Spectrum is not valid.
struct MalformedSpectrumError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Two binned vectors were produced under different binning configurations.
struct IncompatibleVectorsError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A spectrum with the same identifier is already stored in the index.
struct DuplicateIdentifierError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// The requested identifier is not stored in the index.
struct NotFoundError : public std::out_of_range {
    using std::out_of_range::out_of_range;
};

// Bad configuration or parameter values.
struct InvalidArgumentError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

}  // namespace Errors

#endif /* UTILS_ERRORS_HPP */
