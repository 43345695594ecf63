#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

#include "spectrum/spectrum.hpp"
#include "utils/errors.hpp"

bool Spectrum::operator==(const Metadata &a, const Metadata &b) {
    return a.name == b.name && a.source == b.source &&
           a.retention_time == b.retention_time &&
           a.scan_index == b.scan_index;
}

bool Spectrum::operator!=(const Metadata &a, const Metadata &b) {
    return !(a == b);
}

Spectrum::Spectrum::Spectrum(std::string id, std::vector<double> mz,
                             std::vector<double> intensity, Metadata metadata)
    : m_id(std::move(id)), m_metadata(std::move(metadata)) {
    if (mz.size() != intensity.size()) {
        std::ostringstream error_stream;
        error_stream << "error: spectrum " << m_id << " has " << mz.size()
                     << " masses but " << intensity.size() << " intensities";
        throw Errors::MalformedSpectrumError(error_stream.str());
    }
    for (size_t i = 0; i < mz.size(); ++i) {
        if (!std::isfinite(mz[i])) {
            std::ostringstream error_stream;
            error_stream << "error: spectrum " << m_id
                         << " has a non finite mass at position " << i;
            throw Errors::MalformedSpectrumError(error_stream.str());
        }
        if (!std::isfinite(intensity[i]) || intensity[i] < 0) {
            std::ostringstream error_stream;
            error_stream << "error: spectrum " << m_id
                         << " has an invalid intensity (" << intensity[i]
                         << ") at mass " << mz[i];
            throw Errors::MalformedSpectrumError(error_stream.str());
        }
    }

    // Sort the points by mass, keeping the input order for equal masses so
    // the merged intensity does not depend on the sort implementation.
    std::vector<size_t> order(mz.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&mz](size_t a, size_t b) { return mz[a] < mz[b]; });

    m_mz.reserve(mz.size());
    m_intensity.reserve(mz.size());
    for (const auto &k : order) {
        if (!m_mz.empty() && m_mz.back() == mz[k]) {
            m_intensity.back() += intensity[k];
            continue;
        }
        m_mz.push_back(mz[k]);
        m_intensity.push_back(intensity[k]);
    }

    for (size_t i = 1; i < m_mz.size(); ++i) {
        if (!(m_mz[i - 1] < m_mz[i])) {
            std::ostringstream error_stream;
            error_stream << "error: spectrum " << m_id
                         << " masses are not strictly increasing";
            throw Errors::MalformedSpectrumError(error_stream.str());
        }
    }

    for (const auto &value : m_intensity) {
        m_max_intensity = std::max(m_max_intensity, value);
        m_total_intensity += value;
    }
}

Spectrum::Spectrum Spectrum::Spectrum::from_pairs(
    std::string id, const std::vector<std::pair<double, double>> &points,
    Metadata metadata) {
    std::vector<double> mz(points.size());
    std::vector<double> intensity(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        mz[i] = points[i].first;
        intensity[i] = points[i].second;
    }
    return Spectrum(std::move(id), std::move(mz), std::move(intensity),
                    std::move(metadata));
}

bool Spectrum::operator==(const Spectrum &a, const Spectrum &b) {
    return a.id() == b.id() && a.mz() == b.mz() &&
           a.intensity() == b.intensity() && a.metadata() == b.metadata();
}

bool Spectrum::operator!=(const Spectrum &a, const Spectrum &b) {
    return !(a == b);
}

Spectrum::Spectrum Spectrum::combine(const std::vector<Spectrum> &spectra,
                                     const std::string &id) {
    std::vector<double> mz;
    std::vector<double> intensity;
    for (const auto &spectrum : spectra) {
        mz.insert(mz.end(), spectrum.mz().begin(), spectrum.mz().end());
        intensity.insert(intensity.end(), spectrum.intensity().begin(),
                         spectrum.intensity().end());
    }
    Metadata metadata = {};
    if (!spectra.empty()) {
        metadata = spectra[0].metadata();
    }
    // Repeated masses are merged by the constructor.
    return Spectrum(id, std::move(mz), std::move(intensity),
                    std::move(metadata));
}

Spectrum::Spectrum Spectrum::normalize_intensities(const Spectrum &spectrum,
                                                   double scale) {
    if (spectrum.max_intensity() == 0) {
        return spectrum;
    }
    auto intensity = spectrum.intensity();
    for (auto &value : intensity) {
        value = value / spectrum.max_intensity() * scale;
    }
    return Spectrum(spectrum.id(), spectrum.mz(), std::move(intensity),
                    spectrum.metadata());
}

std::vector<Spectrum::TopMass> Spectrum::top_masses(const Spectrum &spectrum,
                                                    size_t n,
                                                    double min_mass) {
    struct Index {
        size_t index;
        double intensity;
    };
    std::vector<Index> candidates;
    for (size_t i = 0; i < spectrum.num_points(); ++i) {
        if (spectrum.mz()[i] >= min_mass) {
            candidates.push_back({i, spectrum.intensity()[i]});
        }
    }
    // Masses are unique and sorted, so a stable sort breaks intensity ties by
    // ascending mass.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Index &a, const Index &b) {
                         return a.intensity > b.intensity;
                     });
    if (candidates.size() > n) {
        candidates.resize(n);
    }

    // The relative intensity is computed against the base peak of the
    // considered mass range.
    double base_peak = candidates.empty() ? 0.0 : candidates[0].intensity;
    std::vector<TopMass> top;
    for (const auto &candidate : candidates) {
        uint64_t relative = 0;
        if (base_peak > 0) {
            relative = static_cast<uint64_t>(candidate.intensity / base_peak *
                                             100.0 * 9.99);
        }
        top.push_back({spectrum.mz()[candidate.index], relative});
    }
    return top;
}

double Spectrum::max_mass(const Spectrum &spectrum, double cutoff) {
    if (spectrum.max_intensity() == 0) {
        std::ostringstream error_stream;
        error_stream << "error: spectrum " << spectrum.id()
                     << " has no signal";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    double threshold = cutoff * spectrum.max_intensity();
    for (size_t i = spectrum.num_points(); i > 0; --i) {
        if (spectrum.intensity()[i - 1] >= threshold) {
            return spectrum.mz()[i - 1];
        }
    }
    // Unreachable for cutoff <= 1, the base peak always passes.
    std::ostringstream error_stream;
    error_stream << "error: no mass above the cutoff " << cutoff;
    throw Errors::InvalidArgumentError(error_stream.str());
}
