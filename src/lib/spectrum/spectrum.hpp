#ifndef SPECTRUM_SPECTRUM_HPP
#define SPECTRUM_SPECTRUM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// In this namespace we have access to the spectrum data model: a sparse series
// of mass/intensity measurements from one scan and the metadata that travels
// with it.
namespace Spectrum {

struct Metadata {
    // Human readable name, usually the compound or peak name.
    std::string name;
    // Identifier of the file/sample this spectrum was read from.
    std::string source;
    // Retention time in seconds and scan index inside the source, if known.
    std::optional<double> retention_time;
    std::optional<uint64_t> scan_index;
};

bool operator==(const Metadata &a, const Metadata &b);
bool operator!=(const Metadata &a, const Metadata &b);

// Immutable mass spectrum. The series is stored in a struct of arrays format,
// sorted by ascending mass with no repeated masses. Intensities are finite and
// non-negative. A default constructed Spectrum is empty.
class Spectrum {
   public:
    Spectrum() = default;

    // Builds the spectrum from the given parallel vectors. The points are
    // sorted by mass and points with the exact same mass are merged by adding
    // their intensities. Throws Errors::MalformedSpectrumError if the vectors
    // have different sizes, any mass is not finite or any intensity is
    // negative or not finite.
    Spectrum(std::string id, std::vector<double> mz,
             std::vector<double> intensity, Metadata metadata = {});

    // Same as above from a list of (mass, intensity) pairs.
    static Spectrum from_pairs(
        std::string id, const std::vector<std::pair<double, double>> &points,
        Metadata metadata = {});

    const std::string &id() const { return m_id; }
    const std::vector<double> &mz() const { return m_mz; }
    const std::vector<double> &intensity() const { return m_intensity; }
    const Metadata &metadata() const { return m_metadata; }

    uint64_t num_points() const { return m_mz.size(); }
    bool empty() const { return m_mz.empty(); }
    double max_intensity() const { return m_max_intensity; }
    double total_intensity() const { return m_total_intensity; }

   private:
    std::string m_id;
    std::vector<double> m_mz;
    std::vector<double> m_intensity;
    Metadata m_metadata;
    double m_max_intensity = 0.0;
    double m_total_intensity = 0.0;
};

bool operator==(const Spectrum &a, const Spectrum &b);
bool operator!=(const Spectrum &a, const Spectrum &b);

// Sum several spectra into a single one under the given id. The metadata of
// the first spectrum is kept, if any.
Spectrum combine(const std::vector<Spectrum> &spectra, const std::string &id);

// Returns a copy of the spectrum scaled so the most intense point equals
// `scale'. Spectra without signal are returned unchanged.
Spectrum normalize_intensities(const Spectrum &spectrum, double scale = 100.0);

// The most intense masses of a spectrum, with the intensity relative to the
// base peak on a 0-999 scale.
struct TopMass {
    double mz;
    uint64_t relative_intensity;
};
std::vector<TopMass> top_masses(const Spectrum &spectrum, size_t n = 10,
                                double min_mass = 0.0);

// Largest mass whose intensity is at least `cutoff' times the base peak
// intensity. Throws Errors::InvalidArgumentError for spectra without signal.
double max_mass(const Spectrum &spectrum, double cutoff = 0.01);

}  // namespace Spectrum

#endif /* SPECTRUM_SPECTRUM_HPP */
