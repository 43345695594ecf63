#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

#include "pybind11/pybind11.h"
#include "pybind11/stl.h"

#include "batch/batch.hpp"
#include "batch/batch_serialize.hpp"
#include "binning/binning.hpp"
#include "binning/binning_serialize.hpp"
#include "similarity/similarity.hpp"
#include "similarity/similarity_serialize.hpp"
#include "spectrum/spectrum.hpp"
#include "spectrum/spectrum_serialize.hpp"
#include "spectrum_index/spectrum_index.hpp"
#include "spectrum_index/spectrum_index_serialize.hpp"
#include "utils/compression.hpp"
#include "utils/errors.hpp"

namespace py = pybind11;

namespace PythonAPI {

Spectrum::Spectrum make_spectrum(std::string id, std::vector<double> mz,
                                 std::vector<double> intensity,
                                 std::string name, std::string source,
                                 std::optional<double> retention_time,
                                 std::optional<uint64_t> scan_index) {
    Spectrum::Metadata metadata = {std::move(name), std::move(source),
                                   retention_time, scan_index};
    return Spectrum::Spectrum(std::move(id), std::move(mz),
                              std::move(intensity), std::move(metadata));
}

Binning::Config make_config(double mass_min, double mass_max,
                            double bin_width, std::string normalization) {
    Binning::Config config = {mass_min, mass_max, bin_width,
                              Binning::parse_normalization(normalization)};
    Binning::validate(config);
    return config;
}

Batch::Parameters make_parameters(const Binning::Config &config,
                                  std::string metric, uint64_t max_threads) {
    Batch::Parameters parameters;
    parameters.config = config;
    parameters.metric = Similarity::parse_metric(metric);
    parameters.max_threads = max_threads;
    return parameters;
}

std::vector<Similarity::Score> find_best_matches(
    const SpectrumIndex::Index &index, const Spectrum::Spectrum &query,
    const Binning::Config &config, int64_t top_k, std::string metric) {
    auto parsed_metric = Similarity::parse_metric(metric);
    pybind11::gil_scoped_release release;
    return index.find_best_matches(query, config, top_k, parsed_metric);
}

Batch::Report compare_all(const std::vector<Spectrum::Spectrum> &queries,
                          const std::vector<Spectrum::Spectrum> &candidates,
                          const Binning::Config &config, std::string metric,
                          uint64_t max_threads) {
    auto parameters = make_parameters(config, metric, max_threads);
    pybind11::gil_scoped_release release;
    return Batch::compare_all(queries, candidates, parameters);
}

Batch::Report compare_within(const std::vector<Spectrum::Spectrum> &spectra,
                             const Binning::Config &config,
                             std::string metric, uint64_t max_threads) {
    auto parameters = make_parameters(config, metric, max_threads);
    pybind11::gil_scoped_release release;
    return Batch::compare_within(spectra, parameters);
}

Batch::Report compare_vectors(
    const std::vector<Binning::BinnedVector> &queries,
    const std::vector<Binning::BinnedVector> &candidates, std::string metric,
    uint64_t max_threads) {
    auto parameters =
        make_parameters(Binning::default_config(), metric, max_threads);
    pybind11::gil_scoped_release release;
    return Batch::compare_vectors(queries, candidates, parameters);
}

Batch::Report compare_with_index(
    const std::vector<Spectrum::Spectrum> &queries,
    const SpectrumIndex::Index &index, const Binning::Config &config,
    std::string metric, uint64_t max_threads) {
    auto parameters = make_parameters(config, metric, max_threads);
    pybind11::gil_scoped_release release;
    return Batch::compare_with_index(queries, index, parameters);
}

// Writes the value to a compressed binary file with the given serialization
// function.
template <typename T>
void write_binary(const T &value, const std::string &output_file,
                  bool (*write)(std::ostream &, const T &),
                  const std::string &name) {
    pybind11::gil_scoped_release release;
    // Open file stream.
    Compression::DeflateStream stream;
    stream.open(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }

    bool written = write(stream, value);
    stream.close();
    if (!written || !stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't write the " << name
                     << " into the output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }
}

// Reads a value from a compressed binary file into `value' with the given
// serialization function.
template <typename T>
void read_binary(T *value, const std::string &input_file,
                 bool (*read)(std::istream &, T *), const std::string &name) {
    pybind11::gil_scoped_release release;
    // Open file stream.
    Compression::InflateStream stream;
    stream.open(input_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }

    if (!read(stream, value)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the " << name
                     << " from the input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }
}

void write_spectra(const std::vector<Spectrum::Spectrum> &spectra,
                   std::string &output_file) {
    write_binary(spectra, output_file, Spectrum::Serialize::write_spectra,
                 "spectra");
}

std::vector<Spectrum::Spectrum> read_spectra(std::string &input_file) {
    std::vector<Spectrum::Spectrum> spectra;
    read_binary(&spectra, input_file, Spectrum::Serialize::read_spectra,
                "spectra");
    return spectra;
}

void write_binned_vectors(const std::vector<Binning::BinnedVector> &vectors,
                          std::string &output_file) {
    write_binary(vectors, output_file,
                 Binning::Serialize::write_binned_vectors, "binned vectors");
}

std::vector<Binning::BinnedVector> read_binned_vectors(
    std::string &input_file) {
    std::vector<Binning::BinnedVector> vectors;
    read_binary(&vectors, input_file, Binning::Serialize::read_binned_vectors,
                "binned vectors");
    return vectors;
}

void write_scores(const std::vector<Similarity::Score> &scores,
                  std::string &output_file) {
    write_binary(scores, output_file, Similarity::Serialize::write_scores,
                 "scores");
}

std::vector<Similarity::Score> read_scores(std::string &input_file) {
    std::vector<Similarity::Score> scores;
    read_binary(&scores, input_file, Similarity::Serialize::read_scores,
                "scores");
    return scores;
}

void write_index(const SpectrumIndex::Index &index, std::string &output_file) {
    write_binary(index, output_file, SpectrumIndex::Serialize::write_index,
                 "index");
}

std::unique_ptr<SpectrumIndex::Index> read_index(std::string &input_file) {
    auto index = std::make_unique<SpectrumIndex::Index>();
    read_binary(index.get(), input_file, SpectrumIndex::Serialize::read_index,
                "index");
    return index;
}

void write_report(const Batch::Report &report, std::string &output_file) {
    write_binary(report, output_file, Batch::Serialize::write_report,
                 "report");
}

Batch::Report read_report(std::string &input_file) {
    Batch::Report report = {};
    read_binary(&report, input_file, Batch::Serialize::read_report, "report");
    return report;
}

std::string to_string(const Binning::Config &config) {
    std::ostringstream stream;
    stream << "Config <mass_min: " << config.mass_min
           << ", mass_max: " << config.mass_max
           << ", bin_width: " << config.bin_width
           << ", normalization: " << Binning::to_string(config.normalization)
           << ">";
    return stream.str();
}

}  // namespace PythonAPI

PYBIND11_MODULE(specmatch, m) {
    // Documentation.
    m.doc() = "specmatch: mass spectra binning and similarity search";

    // Exceptions.
    py::register_exception<Errors::MalformedSpectrumError>(
        m, "MalformedSpectrumError", PyExc_ValueError);
    py::register_exception<Errors::IncompatibleVectorsError>(
        m, "IncompatibleVectorsError", PyExc_ValueError);
    py::register_exception<Errors::DuplicateIdentifierError>(
        m, "DuplicateIdentifierError", PyExc_KeyError);
    py::register_exception<Errors::NotFoundError>(m, "NotFoundError",
                                                  PyExc_KeyError);
    py::register_exception<Errors::InvalidArgumentError>(
        m, "InvalidArgumentError", PyExc_ValueError);

    // Enums.
    py::enum_<Binning::Normalization>(m, "Normalization")
        .value("NONE", Binning::Normalization::NONE)
        .value("MAX", Binning::Normalization::MAX)
        .value("L2", Binning::Normalization::L2);

    py::enum_<Similarity::Metric>(m, "Metric")
        .value("COSINE", Similarity::Metric::COSINE)
        .value("DOT_PRODUCT", Similarity::Metric::DOT_PRODUCT)
        .value("EUCLIDEAN", Similarity::Metric::EUCLIDEAN)
        .value("REVERSE_COSINE", Similarity::Metric::REVERSE_COSINE);

    // Structs.
    py::class_<Spectrum::Metadata>(m, "Metadata")
        .def_readonly("name", &Spectrum::Metadata::name)
        .def_readonly("source", &Spectrum::Metadata::source)
        .def_readonly("retention_time", &Spectrum::Metadata::retention_time)
        .def_readonly("scan_index", &Spectrum::Metadata::scan_index);

    py::class_<Spectrum::Spectrum>(m, "Spectrum")
        .def(py::init(&PythonAPI::make_spectrum), py::arg("id"),
             py::arg("mz"), py::arg("intensity"), py::arg("name") = "",
             py::arg("source") = "", py::arg("retention_time") = py::none(),
             py::arg("scan_index") = py::none())
        .def_property_readonly("id", &Spectrum::Spectrum::id)
        .def_property_readonly("mz", &Spectrum::Spectrum::mz)
        .def_property_readonly("intensity", &Spectrum::Spectrum::intensity)
        .def_property_readonly("metadata", &Spectrum::Spectrum::metadata)
        .def_property_readonly("num_points", &Spectrum::Spectrum::num_points)
        .def_property_readonly("max_intensity",
                               &Spectrum::Spectrum::max_intensity)
        .def_property_readonly("total_intensity",
                               &Spectrum::Spectrum::total_intensity)
        .def("__len__", &Spectrum::Spectrum::num_points)
        .def("__repr__", [](const Spectrum::Spectrum &s) {
            return "Spectrum <id: " + s.id() +
                   ", num_points: " + std::to_string(s.num_points()) +
                   ", max_intensity: " + std::to_string(s.max_intensity()) +
                   ">";
        });

    py::class_<Spectrum::TopMass>(m, "TopMass")
        .def_readonly("mz", &Spectrum::TopMass::mz)
        .def_readonly("relative_intensity",
                      &Spectrum::TopMass::relative_intensity)
        .def("__repr__", [](const Spectrum::TopMass &t) {
            return "TopMass <mz: " + std::to_string(t.mz) +
                   ", relative_intensity: " +
                   std::to_string(t.relative_intensity) + ">";
        });

    py::class_<Binning::Config>(m, "Config")
        .def(py::init(&PythonAPI::make_config), py::arg("mass_min") = 0.0,
             py::arg("mass_max") = 1000.0, py::arg("bin_width") = 1.0,
             py::arg("normalization") = "max")
        .def_readonly("mass_min", &Binning::Config::mass_min)
        .def_readonly("mass_max", &Binning::Config::mass_max)
        .def_readonly("bin_width", &Binning::Config::bin_width)
        .def_readonly("normalization", &Binning::Config::normalization)
        .def_property_readonly("num_bins", &Binning::num_bins)
        .def("mass_at", &Binning::mass_at, py::arg("i"))
        .def("__eq__", [](const Binning::Config &a,
                          const Binning::Config &b) { return a == b; })
        .def("__repr__", [](const Binning::Config &c) {
            return PythonAPI::to_string(c);
        });

    py::class_<Binning::BinnedVector>(m, "BinnedVector")
        .def_readonly("spectrum_id", &Binning::BinnedVector::spectrum_id)
        .def_readonly("config", &Binning::BinnedVector::config)
        .def_readonly("data", &Binning::BinnedVector::data)
        .def_property_readonly("is_zero", &Binning::is_zero)
        .def("__repr__", [](const Binning::BinnedVector &v) {
            return "BinnedVector <spectrum_id: " + v.spectrum_id +
                   ", num_bins: " + std::to_string(v.data.size()) + ">";
        });

    py::class_<Similarity::Score>(m, "Score")
        .def_readonly("id_a", &Similarity::Score::id_a)
        .def_readonly("id_b", &Similarity::Score::id_b)
        .def_readonly("value", &Similarity::Score::value)
        .def_readonly("metric", &Similarity::Score::metric)
        .def_readonly("config", &Similarity::Score::config)
        .def_property_readonly("match_factor",
                               [](const Similarity::Score &s) {
                                   return Similarity::match_factor(s.value);
                               })
        .def("__repr__", [](const Similarity::Score &s) {
            return "Score <id_a: " + s.id_a + ", id_b: " + s.id_b +
                   ", value: " + std::to_string(s.value) +
                   ", metric: " + Similarity::to_string(s.metric) + ">";
        });

    py::class_<SpectrumIndex::Index>(m, "Index")
        .def(py::init<>())
        .def("insert", &SpectrumIndex::Index::insert, py::arg("spectrum"),
             py::arg("replace") = false)
        .def("remove", &SpectrumIndex::Index::remove, py::arg("id"))
        .def("clear", &SpectrumIndex::Index::clear)
        .def("get", &SpectrumIndex::Index::get, py::arg("id"))
        .def("__contains__", &SpectrumIndex::Index::contains)
        .def("__len__", &SpectrumIndex::Index::size)
        .def_property_readonly("ids", &SpectrumIndex::Index::ids)
        .def_property_readonly("cached_vectors",
                               &SpectrumIndex::Index::cached_vectors)
        .def("invalidate_cache", &SpectrumIndex::Index::invalidate_cache)
        .def(
            "binned",
            [](const SpectrumIndex::Index &index,
               const Binning::Config &config) {
                std::vector<Binning::BinnedVector> vectors;
                for (const auto &vector : index.binned(config)) {
                    vectors.push_back(*vector);
                }
                return vectors;
            },
            py::arg("config"))
        .def("find_best_matches", &PythonAPI::find_best_matches,
             "Find the spectra in the index most similar to the query",
             py::arg("query"), py::arg("config"), py::arg("top_k") = 10,
             py::arg("metric") = "cosine")
        .def("__repr__", [](const SpectrumIndex::Index &index) {
            return "Index <size: " + std::to_string(index.size()) + ">";
        });

    py::class_<Batch::PairwiseComparisonFailure>(m, "PairwiseComparisonFailure")
        .def_readonly("reason", &Batch::PairwiseComparisonFailure::reason);

    py::class_<Batch::Cell>(m, "Cell")
        .def_readonly("query_id", &Batch::Cell::query_id)
        .def_readonly("candidate_id", &Batch::Cell::candidate_id)
        .def_readonly("self_comparison", &Batch::Cell::self_comparison)
        .def_property_readonly(
            "score",
            [](const Batch::Cell &c) -> std::optional<Similarity::Score> {
                if (auto score = std::get_if<Similarity::Score>(&c.outcome)) {
                    return *score;
                }
                return std::nullopt;
            })
        .def_property_readonly(
            "failure", [](const Batch::Cell &c) -> std::optional<std::string> {
                if (auto failure = std::get_if<Batch::PairwiseComparisonFailure>(
                        &c.outcome)) {
                    return failure->reason;
                }
                return std::nullopt;
            });

    py::class_<Batch::Report>(m, "Report")
        .def_readonly("query_ids", &Batch::Report::query_ids)
        .def_readonly("candidate_ids", &Batch::Report::candidate_ids)
        .def_readonly("cells", &Batch::Report::cells)
        .def_readonly("config", &Batch::Report::config)
        .def_readonly("metric", &Batch::Report::metric)
        .def_readonly("cancelled", &Batch::Report::cancelled)
        .def("cell", &Batch::cell, py::arg("i"), py::arg("j"))
        .def("top_k", &Batch::top_k, py::arg("i"), py::arg("k"),
             py::arg("exclude_self") = false)
        .def("rankings", &Batch::rankings, py::arg("k"),
             py::arg("exclude_self") = false)
        .def_property_readonly("num_scored", &Batch::num_scored)
        .def_property_readonly("num_failed", &Batch::num_failed)
        .def("score_matrix", &Batch::score_matrix,
             py::arg("mask_self") = false)
        .def("__repr__", [](const Batch::Report &r) {
            return "Report <queries: " + std::to_string(r.query_ids.size()) +
                   ", candidates: " + std::to_string(r.candidate_ids.size()) +
                   ", scored: " + std::to_string(Batch::num_scored(r)) +
                   ", failed: " + std::to_string(Batch::num_failed(r)) + ">";
        });

    // Functions.
    m.def("default_config", &Binning::default_config,
          "Default binning configuration")
        .def("combine", &Spectrum::combine,
             "Sum several spectra into a single one", py::arg("spectra"),
             py::arg("id"))
        .def("normalize_intensities", &Spectrum::normalize_intensities,
             "Scale the spectrum so the base peak equals the given scale",
             py::arg("spectrum"), py::arg("scale") = 100.0)
        .def("top_masses", &Spectrum::top_masses,
             "Most intense masses of the spectrum", py::arg("spectrum"),
             py::arg("n") = 10, py::arg("min_mass") = 0.0)
        .def("max_mass", &Spectrum::max_mass,
             "Largest mass with intensity above the cutoff fraction of the "
             "base peak",
             py::arg("spectrum"), py::arg("cutoff") = 0.01)
        .def("bin",
             py::overload_cast<const Spectrum::Spectrum &,
                               const Binning::Config &>(&Binning::bin),
             "Bin the spectrum into a dense vector", py::arg("spectrum"),
             py::arg("config"))
        .def("bin_combined",
             py::overload_cast<const std::vector<Spectrum::Spectrum> &,
                               const Binning::Config &, const std::string &>(
                 &Binning::bin),
             "Bin several spectra into a single dense vector",
             py::arg("spectra"), py::arg("config"), py::arg("id"))
        .def(
            "score",
            [](const Binning::BinnedVector &a, const Binning::BinnedVector &b,
               std::string metric) {
                return Similarity::score(a, b,
                                         Similarity::parse_metric(metric));
            },
            "Similarity between two binned vectors", py::arg("a"),
            py::arg("b"), py::arg("metric") = "cosine")
        .def(
            "rank",
            [](const Binning::BinnedVector &query,
               const std::vector<Binning::BinnedVector> &candidates,
               std::string metric) {
                auto parsed_metric = Similarity::parse_metric(metric);
                pybind11::gil_scoped_release release;
                return Similarity::rank(query, candidates, parsed_metric);
            },
            "Rank the candidates by similarity to the query",
            py::arg("query"), py::arg("candidates"),
            py::arg("metric") = "cosine")
        .def("match_factor", &Similarity::match_factor,
             "Scale a similarity value to 0-1000", py::arg("value"))
        .def("compare_all", &PythonAPI::compare_all,
             "Compare every query against every candidate", py::arg("queries"),
             py::arg("candidates"), py::arg("config"),
             py::arg("metric") = "cosine",
             py::arg("max_threads") = Batch::hardware_threads())
        .def("compare_within", &PythonAPI::compare_within,
             "Compare every spectrum of the collection against each other",
             py::arg("spectra"), py::arg("config"),
             py::arg("metric") = "cosine",
             py::arg("max_threads") = Batch::hardware_threads())
        .def("compare_vectors", &PythonAPI::compare_vectors,
             "Compare every query vector against every candidate vector",
             py::arg("queries"), py::arg("candidates"),
             py::arg("metric") = "cosine",
             py::arg("max_threads") = Batch::hardware_threads())
        .def("compare_with_index", &PythonAPI::compare_with_index,
             "Compare the queries against every spectrum in the index",
             py::arg("queries"), py::arg("index"), py::arg("config"),
             py::arg("metric") = "cosine",
             py::arg("max_threads") = Batch::hardware_threads())
        .def("write_spectra", &PythonAPI::write_spectra,
             "Write the spectra to disk in a binary format",
             py::arg("spectra"), py::arg("file_name"))
        .def("read_spectra", &PythonAPI::read_spectra,
             "Read the spectra from the binary spectra file",
             py::arg("file_name"))
        .def("write_binned_vectors", &PythonAPI::write_binned_vectors,
             "Write the binned vectors to disk in a binary format",
             py::arg("vectors"), py::arg("file_name"))
        .def("read_binned_vectors", &PythonAPI::read_binned_vectors,
             "Read the binned vectors from the binary file",
             py::arg("file_name"))
        .def("write_scores", &PythonAPI::write_scores,
             "Write the scores to disk in a binary format", py::arg("scores"),
             py::arg("file_name"))
        .def("read_scores", &PythonAPI::read_scores,
             "Read the scores from the binary scores file",
             py::arg("file_name"))
        .def("write_index", &PythonAPI::write_index,
             "Write the spectral library to disk in a binary format",
             py::arg("index"), py::arg("file_name"))
        .def("read_index", &PythonAPI::read_index,
             "Read the spectral library from the binary index file",
             py::arg("file_name"))
        .def("write_report", &PythonAPI::write_report,
             "Write the comparison report to disk in a binary format",
             py::arg("report"), py::arg("file_name"))
        .def("read_report", &PythonAPI::read_report,
             "Read the comparison report from the binary report file",
             py::arg("file_name"));
}
