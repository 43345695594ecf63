#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

#include "binning/binning.hpp"
#include "utils/errors.hpp"

bool Binning::operator==(const Config &a, const Config &b) {
    return a.mass_min == b.mass_min && a.mass_max == b.mass_max &&
           a.bin_width == b.bin_width && a.normalization == b.normalization;
}

bool Binning::operator!=(const Config &a, const Config &b) { return !(a == b); }

Binning::Config Binning::default_config() {
    return {0.0, 1000.0, 1.0, Normalization::MAX};
}

void Binning::validate(const Config &config) {
    if (!std::isfinite(config.mass_min) || !std::isfinite(config.mass_max) ||
        !std::isfinite(config.bin_width)) {
        throw Errors::InvalidArgumentError(
            "error: the binning mass range and bin width must be finite");
    }
    if (config.bin_width <= 0) {
        std::ostringstream error_stream;
        error_stream << "error: bin_width must be positive (bin_width: "
                     << config.bin_width << ")";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    if (config.mass_min < 0) {
        std::ostringstream error_stream;
        error_stream << "error: mass_min can't be negative (mass_min: "
                     << config.mass_min << ")";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    if (config.mass_min >= config.mass_max) {
        std::ostringstream error_stream;
        error_stream << "error: mass_min >= mass_max (mass_min: "
                     << config.mass_min << ", mass_max: " << config.mass_max
                     << ")";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    double n = (config.mass_max - config.mass_min) / config.bin_width;
    if (!std::isfinite(n) || n > static_cast<double>(MAX_BINS)) {
        std::ostringstream error_stream;
        error_stream << "error: the binning configuration needs too many bins "
                     << "(bins: " << n << ", max: " << MAX_BINS << ")";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    switch (config.normalization) {
        case NONE:
        case MAX:
        case L2:
            break;
        default:
            throw Errors::InvalidArgumentError(
                "error: unknown normalization mode");
    }
}

uint64_t Binning::num_bins(const Config &config) {
    double n = (config.mass_max - config.mass_min) / config.bin_width;
    // Ranges that are an exact multiple of the bin width should not get an
    // extra bin because of rounding errors in the division.
    double rounded = std::round(n);
    if (std::abs(n - rounded) < 1e-9 * std::max(1.0, rounded)) {
        return std::max<uint64_t>(1, static_cast<uint64_t>(rounded));
    }
    return static_cast<uint64_t>(std::ceil(n));
}

double Binning::mass_at(const Config &config, uint64_t i) {
    return config.mass_min + config.bin_width * i;
}

uint64_t Binning::bin_index(const Config &config, double mass) {
    auto i = static_cast<uint64_t>(
        std::floor((mass - config.mass_min) / config.bin_width));
    // Masses just below mass_max can round up to the bin past the end.
    return std::min(i, num_bins(config) - 1);
}

Binning::Normalization Binning::parse_normalization(std::string name) {
    for (auto &ch : name) {
        ch = std::tolower(static_cast<unsigned char>(ch));
    }
    if (name == "none" || name.empty()) {
        return Normalization::NONE;
    }
    if (name == "max") {
        return Normalization::MAX;
    }
    if (name == "l2") {
        return Normalization::L2;
    }
    std::ostringstream error_stream;
    error_stream << "error: the given normalization is not supported (" << name
                 << "). choose between 'none', 'max' and 'l2'";
    throw Errors::InvalidArgumentError(error_stream.str());
}

std::string Binning::to_string(Normalization normalization) {
    switch (normalization) {
        case Normalization::NONE:
            return "NONE";
        case Normalization::MAX:
            return "MAX";
        case Normalization::L2:
            return "L2";
        default:
            return "UNKNOWN";
    };
}

bool Binning::is_zero(const BinnedVector &vector) {
    return std::all_of(vector.data.begin(), vector.data.end(),
                       [](double value) { return value == 0; });
}

void Binning::normalize(std::vector<double> &data,
                        Normalization normalization) {
    double factor = 0;
    switch (normalization) {
        case Normalization::MAX: {
            for (const auto &value : data) {
                factor = std::max(factor, value);
            }
        } break;
        case Normalization::L2: {
            for (const auto &value : data) {
                factor += value * value;
            }
            factor = std::sqrt(factor);
        } break;
        default:
            return;
    }
    if (factor == 0) {
        return;
    }
    for (auto &value : data) {
        value /= factor;
    }
}

// Adds the points of the spectrum inside the mass range to the bins.
static void accumulate(const Spectrum::Spectrum &spectrum,
                       const Binning::Config &config,
                       std::vector<double> &data) {
    const auto &mz = spectrum.mz();
    const auto &intensity = spectrum.intensity();
    // Masses are sorted, so we can skip straight to the start of the range
    // and stop at the end of it.
    auto begin = std::lower_bound(mz.begin(), mz.end(), config.mass_min);
    for (size_t k = begin - mz.begin(); k < mz.size(); ++k) {
        if (mz[k] >= config.mass_max) {
            break;
        }
        data[Binning::bin_index(config, mz[k])] += intensity[k];
    }
}

Binning::BinnedVector Binning::bin(const Spectrum::Spectrum &spectrum,
                                   const Config &config) {
    validate(config);
    BinnedVector vector = {spectrum.id(), config,
                           std::vector<double>(num_bins(config))};
    accumulate(spectrum, config, vector.data);
    normalize(vector.data, config.normalization);
    return vector;
}

Binning::BinnedVector Binning::bin(
    const std::vector<Spectrum::Spectrum> &spectra, const Config &config,
    const std::string &id) {
    validate(config);
    BinnedVector vector = {id, config, std::vector<double>(num_bins(config))};
    for (const auto &spectrum : spectra) {
        accumulate(spectrum, config, vector.data);
    }
    normalize(vector.data, config.normalization);
    return vector;
}

std::shared_ptr<const Binning::BinnedVector> Binning::Cache::get(
    const Spectrum::Spectrum &spectrum, const Config &config) {
    validate(config);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_config || *m_config != config) {
            m_vectors.clear();
            m_config = config;
        }
        auto it = m_vectors.find(spectrum.id());
        if (it != m_vectors.end()) {
            return it->second;
        }
    }

    // Binning is done without holding the lock so that multiple readers can
    // fill the cache in parallel.
    auto vector = std::make_shared<const BinnedVector>(bin(spectrum, config));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_config || *m_config != config) {
        // The configuration changed in the meantime, don't pollute the cache.
        return vector;
    }
    auto inserted = m_vectors.emplace(spectrum.id(), vector);
    return inserted.first->second;
}

void Binning::Cache::invalidate(const std::string &spectrum_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_vectors.erase(spectrum_id);
}

void Binning::Cache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_vectors.clear();
    m_config.reset();
}

uint64_t Binning::Cache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_vectors.size();
}

std::optional<Binning::Config> Binning::Cache::config() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}
