#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

#include "similarity/similarity.hpp"
#include "utils/errors.hpp"

Similarity::Metric Similarity::parse_metric(std::string name) {
    for (auto &ch : name) {
        ch = std::tolower(static_cast<unsigned char>(ch));
    }
    if (name == "cosine" || name.empty()) {
        return Metric::COSINE;
    }
    if (name == "dot_product" || name == "dot") {
        return Metric::DOT_PRODUCT;
    }
    if (name == "euclidean") {
        return Metric::EUCLIDEAN;
    }
    if (name == "reverse_cosine" || name == "reverse") {
        return Metric::REVERSE_COSINE;
    }
    std::ostringstream error_stream;
    error_stream << "error: the given metric is not supported (" << name
                 << "). choose between 'cosine', 'dot_product', 'euclidean' "
                    "and 'reverse_cosine'";
    throw Errors::InvalidArgumentError(error_stream.str());
}

std::string Similarity::to_string(Metric metric) {
    switch (metric) {
        case Metric::COSINE:
            return "COSINE";
        case Metric::DOT_PRODUCT:
            return "DOT_PRODUCT";
        case Metric::EUCLIDEAN:
            return "EUCLIDEAN";
        case Metric::REVERSE_COSINE:
            return "REVERSE_COSINE";
        default:
            return "UNKNOWN";
    };
}

void Similarity::check_compatible(const Binning::BinnedVector &a,
                                  const Binning::BinnedVector &b) {
    if (a.data.size() != b.data.size() ||
        a.config.mass_min != b.config.mass_min ||
        a.config.mass_max != b.config.mass_max ||
        a.config.bin_width != b.config.bin_width) {
        std::ostringstream error_stream;
        error_stream << "error: can't compare " << a.spectrum_id << " ("
                     << a.data.size() << " bins of " << a.config.bin_width
                     << " in [" << a.config.mass_min << ", "
                     << a.config.mass_max << ")) with " << b.spectrum_id
                     << " (" << b.data.size() << " bins of "
                     << b.config.bin_width << " in [" << b.config.mass_min
                     << ", " << b.config.mass_max << "))";
        throw Errors::IncompatibleVectorsError(error_stream.str());
    }
}

// Largest absolute value in the vector. The metrics divide by it before
// summing squares so that very large or very small intensities don't overflow
// or underflow.
static double max_abs(const std::vector<double> &data) {
    double factor = 0;
    for (const auto &value : data) {
        factor = std::max(factor, std::abs(value));
    }
    return factor;
}

static double cosine(const std::vector<double> &a,
                     const std::vector<double> &b) {
    double scale_a = max_abs(a);
    double scale_b = max_abs(b);
    if (scale_a == 0 || scale_b == 0) {
        return 0;
    }
    double dot = 0;
    double norm_a = 0;
    double norm_b = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i] / scale_a;
        double y = b[i] / scale_b;
        dot += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }
    return dot / std::sqrt(norm_a * norm_b);
}

static double dot_product(const std::vector<double> &a,
                          const std::vector<double> &b) {
    // The ratio depends on the relative size of the two vectors, so both share
    // the same scale.
    double scale = std::max(max_abs(a), max_abs(b));
    if (scale == 0) {
        return 0;
    }
    double dot = 0;
    double self_a = 0;
    double self_b = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i] / scale;
        double y = b[i] / scale;
        dot += x * y;
        self_a += x * x;
        self_b += y * y;
    }
    if (self_a == 0 || self_b == 0) {
        return 0;
    }
    return dot / std::max(self_a, self_b);
}

static double euclidean(const std::vector<double> &a,
                        const std::vector<double> &b) {
    double scale = std::max(max_abs(a), max_abs(b));
    if (scale == 0) {
        return 1.0;
    }
    double distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        double diff = a[i] / scale - b[i] / scale;
        distance += diff * diff;
    }
    return 1.0 / (1.0 + scale * std::sqrt(distance));
}

static double reverse_cosine(const std::vector<double> &a,
                             const std::vector<double> &b) {
    double scale_a = max_abs(a);
    double scale_b = max_abs(b);
    if (scale_a == 0 || scale_b == 0) {
        return 0;
    }
    double dot = 0;
    double norm_a = 0;
    double norm_b = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (b[i] == 0) {
            continue;
        }
        double x = a[i] / scale_a;
        double y = b[i] / scale_b;
        dot += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }
    if (norm_a == 0 || norm_b == 0) {
        return 0;
    }
    return dot / std::sqrt(norm_a * norm_b);
}

double Similarity::compute(Metric metric, const std::vector<double> &a,
                           const std::vector<double> &b) {
    double value = 0;
    switch (metric) {
        case Metric::COSINE:
            value = cosine(a, b);
            break;
        case Metric::DOT_PRODUCT:
            value = dot_product(a, b);
            break;
        case Metric::EUCLIDEAN:
            value = euclidean(a, b);
            break;
        case Metric::REVERSE_COSINE:
            value = reverse_cosine(a, b);
            break;
        default:
            throw Errors::InvalidArgumentError(
                "error: unknown similarity metric");
    }
    // Rounding can push identical vectors slightly above 1.
    return std::min(1.0, std::max(0.0, value));
}

Similarity::Score Similarity::score(const Binning::BinnedVector &a,
                                    const Binning::BinnedVector &b,
                                    Metric metric) {
    check_compatible(a, b);
    return {a.spectrum_id, b.spectrum_id, compute(metric, a.data, b.data),
            metric, a.config};
}

void Similarity::sort_scores(std::vector<Score> &scores) {
    std::sort(scores.begin(), scores.end(),
              [](const Score &x, const Score &y) -> bool {
                  if (x.value != y.value) {
                      return x.value > y.value;
                  }
                  return x.id_b < y.id_b;
              });
}

template <typename Deref>
static std::vector<Similarity::Score> rank_candidates(
    const Binning::BinnedVector &query, size_t n, Deref candidate_at,
    Similarity::Metric metric) {
    std::vector<Similarity::Score> scores;
    if (Binning::is_zero(query)) {
        return scores;
    }
    scores.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const Binning::BinnedVector &candidate = candidate_at(i);
        Similarity::check_compatible(query, candidate);
        if (Binning::is_zero(candidate)) {
            continue;
        }
        scores.push_back(Similarity::score(query, candidate, metric));
    }
    Similarity::sort_scores(scores);
    return scores;
}

std::vector<Similarity::Score> Similarity::rank(
    const Binning::BinnedVector &query,
    const std::vector<Binning::BinnedVector> &candidates, Metric metric) {
    return rank_candidates(
        query, candidates.size(),
        [&candidates](size_t i) -> const Binning::BinnedVector & {
            return candidates[i];
        },
        metric);
}

std::vector<Similarity::Score> Similarity::rank(
    const Binning::BinnedVector &query,
    const std::vector<std::shared_ptr<const Binning::BinnedVector>>
        &candidates,
    Metric metric) {
    return rank_candidates(
        query, candidates.size(),
        [&candidates](size_t i) -> const Binning::BinnedVector & {
            return *candidates[i];
        },
        metric);
}
