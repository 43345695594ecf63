#ifndef BINNING_BINNING_HPP
#define BINNING_BINNING_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "spectrum/spectrum.hpp"

// The Binning namespace converts sparse spectra into dense fixed resolution
// vectors that can be compared bin by bin.
namespace Binning {

// Scaling applied to a vector after binning.
enum Normalization : uint8_t { NONE = 0, MAX = 1, L2 = 2 };

struct Config {
    // Half open mass range [mass_min, mass_max) covered by the bins.
    double mass_min;
    double mass_max;
    double bin_width;
    Normalization normalization;
};

bool operator==(const Config &a, const Config &b);
bool operator!=(const Config &a, const Config &b);

// Mass range [0, 1000) with unit bins, scaled to the base peak.
Config default_config();

// Upper bound on the number of bins a configuration may request.
constexpr uint64_t MAX_BINS = 100000000;

// Throws Errors::InvalidArgumentError unless all values are finite,
// bin_width > 0, mass_min >= 0, mass_min < mass_max and the range needs at
// most MAX_BINS bins.
void validate(const Config &config);

// Number of bins needed to cover the mass range of the configuration.
uint64_t num_bins(const Config &config);

// Lower mass edge of the bin i.
double mass_at(const Config &config, uint64_t i);

// Bin index for the given mass. The mass must be inside the configured range.
uint64_t bin_index(const Config &config, double mass);

// Parse the normalization name ("none", "max", "l2"), case insensitive.
Normalization parse_normalization(std::string name);
std::string to_string(Normalization normalization);

struct BinnedVector {
    // Identifier of the spectrum this vector was computed from.
    std::string spectrum_id;
    // The configuration used, including the normalization applied.
    Config config;
    // Binned intensities, with num_bins(config) elements.
    std::vector<double> data;
};

// True when every bin is zero, i.e. the source spectrum had no signal in the
// configured mass range.
bool is_zero(const BinnedVector &vector);

// Scale the values in place. Vectors without signal are left untouched.
void normalize(std::vector<double> &data, Normalization normalization);

// Bins the spectrum. Points with a mass outside [mass_min, mass_max) are
// dropped and points that fall into the same bin are summed. The result is
// normalized according to the configuration.
BinnedVector bin(const Spectrum::Spectrum &spectrum, const Config &config);

// Same as above, but all given spectra are accumulated into a single vector
// before normalization.
BinnedVector bin(const std::vector<Spectrum::Spectrum> &spectra,
                 const Config &config, const std::string &id);

// Memoizes binned vectors by spectrum identifier for a single configuration.
// Requesting a vector for a different configuration drops every cached
// vector. The returned pointers stay valid after invalidation. All methods can
// be called concurrently.
class Cache {
   public:
    std::shared_ptr<const BinnedVector> get(
        const Spectrum::Spectrum &spectrum, const Config &config);

    // Remove the cached vector for the given spectrum, if any.
    void invalidate(const std::string &spectrum_id);
    void clear();

    uint64_t size() const;
    std::optional<Config> config() const;

   private:
    mutable std::mutex m_mutex;
    std::optional<Config> m_config;
    std::map<std::string, std::shared_ptr<const BinnedVector>> m_vectors;
};

}  // namespace Binning

#endif /* BINNING_BINNING_HPP */
