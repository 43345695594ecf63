#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>

#include "batch/batch.hpp"
#include "utils/errors.hpp"

uint64_t Batch::hardware_threads() {
    // hardware_concurrency() returns 0 when the value can't be determined.
    return std::max(1u, std::thread::hardware_concurrency());
}

// Fills the cells of the report comparing queries[i] against candidates[j].
// Rows are distributed among the worker threads, so each thread writes to a
// disjoint set of cells.
static void run_comparisons(
    Batch::Report &report,
    const std::vector<const Binning::BinnedVector *> &queries,
    const std::vector<const Binning::BinnedVector *> &candidates,
    uint64_t max_threads, const std::atomic<bool> *cancel) {
    if (max_threads == 0) {
        throw Errors::InvalidArgumentError(
            "error: max_threads must be at least 1");
    }
    size_t num_rows = queries.size();
    size_t num_cols = candidates.size();
    report.cells.clear();
    report.cells.reserve(num_rows * num_cols);
    for (size_t i = 0; i < num_rows; ++i) {
        for (size_t j = 0; j < num_cols; ++j) {
            const auto &query_id = report.query_ids[i];
            const auto &candidate_id = report.candidate_ids[j];
            report.cells.push_back({query_id, candidate_id,
                                    query_id == candidate_id,
                                    std::monostate{}});
        }
    }
    report.cancelled = false;
    if (num_rows == 0 || num_cols == 0) {
        return;
    }

    // The number of groups/threads is set to the maximum possible concurrency.
    uint64_t num_threads = std::min<uint64_t>(Batch::hardware_threads(),
                                              max_threads);
    num_threads = std::min<uint64_t>(num_threads, num_rows);

    // Split the rows into different groups for concurrency.
    auto groups = std::vector<std::vector<size_t>>(num_threads);
    for (size_t i = 0; i < num_rows; ++i) {
        groups[i % num_threads].push_back(i);
    }

    std::atomic<bool> interrupted(false);
    std::vector<std::thread> threads(num_threads);
    for (size_t t = 0; t < groups.size(); ++t) {
        threads[t] = std::thread([&groups, &report, &queries, &candidates,
                                  &interrupted, cancel, num_cols, t]() {
            for (const auto &i : groups[t]) {
                for (size_t j = 0; j < num_cols; ++j) {
                    if (cancel != nullptr && cancel->load()) {
                        interrupted = true;
                        return;
                    }
                    auto &outcome = report.cells[i * num_cols + j].outcome;
                    try {
                        outcome = Similarity::score(*queries[i],
                                                    *candidates[j],
                                                    report.metric);
                    } catch (const std::exception &e) {
                        outcome = Batch::PairwiseComparisonFailure{e.what()};
                    }
                }
            }
        });
    }

    // Wait for the threads to finish.
    for (auto &thread : threads) {
        thread.join();
    }
    report.cancelled = interrupted;

    uint64_t failed = Batch::num_failed(report);
    if (failed > 0) {
        std::string first_reason;
        for (const auto &cell : report.cells) {
            if (auto failure =
                    std::get_if<Batch::PairwiseComparisonFailure>(
                        &cell.outcome)) {
                first_reason = failure->reason;
                break;
            }
        }
        std::cerr << "warning: " << failed << " out of "
                  << report.cells.size()
                  << " pairwise comparisons failed (" << first_reason << ")"
                  << std::endl;
    }
}

static std::vector<std::string> spectra_ids(
    const std::vector<Spectrum::Spectrum> &spectra) {
    std::vector<std::string> ids;
    ids.reserve(spectra.size());
    for (const auto &spectrum : spectra) {
        ids.push_back(spectrum.id());
    }
    return ids;
}

static std::vector<Binning::BinnedVector> bin_all(
    const std::vector<Spectrum::Spectrum> &spectra,
    const Binning::Config &config) {
    std::vector<Binning::BinnedVector> vectors;
    vectors.reserve(spectra.size());
    for (const auto &spectrum : spectra) {
        vectors.push_back(Binning::bin(spectrum, config));
    }
    return vectors;
}

static std::vector<const Binning::BinnedVector *> pointers(
    const std::vector<Binning::BinnedVector> &vectors) {
    std::vector<const Binning::BinnedVector *> ptrs;
    ptrs.reserve(vectors.size());
    for (const auto &vector : vectors) {
        ptrs.push_back(&vector);
    }
    return ptrs;
}

Batch::Report Batch::compare_all(
    const std::vector<Spectrum::Spectrum> &queries,
    const std::vector<Spectrum::Spectrum> &candidates,
    const Parameters &parameters, const std::atomic<bool> *cancel) {
    Binning::validate(parameters.config);
    Report report = {};
    report.query_ids = spectra_ids(queries);
    report.candidate_ids = spectra_ids(candidates);
    report.config = parameters.config;
    report.metric = parameters.metric;

    auto query_vectors = bin_all(queries, parameters.config);
    auto candidate_vectors = bin_all(candidates, parameters.config);
    run_comparisons(report, pointers(query_vectors),
                    pointers(candidate_vectors), parameters.max_threads,
                    cancel);
    return report;
}

Batch::Report Batch::compare_within(
    const std::vector<Spectrum::Spectrum> &spectra,
    const Parameters &parameters, const std::atomic<bool> *cancel) {
    Binning::validate(parameters.config);
    Report report = {};
    report.query_ids = spectra_ids(spectra);
    report.candidate_ids = report.query_ids;
    report.config = parameters.config;
    report.metric = parameters.metric;

    auto vectors = bin_all(spectra, parameters.config);
    auto ptrs = pointers(vectors);
    run_comparisons(report, ptrs, ptrs, parameters.max_threads, cancel);
    return report;
}

Batch::Report Batch::compare_vectors(
    const std::vector<Binning::BinnedVector> &queries,
    const std::vector<Binning::BinnedVector> &candidates,
    const Parameters &parameters, const std::atomic<bool> *cancel) {
    Report report = {};
    for (const auto &vector : queries) {
        report.query_ids.push_back(vector.spectrum_id);
    }
    for (const auto &vector : candidates) {
        report.candidate_ids.push_back(vector.spectrum_id);
    }
    report.config =
        queries.empty() ? parameters.config : queries[0].config;
    report.metric = parameters.metric;
    run_comparisons(report, pointers(queries), pointers(candidates),
                    parameters.max_threads, cancel);
    return report;
}

Batch::Report Batch::compare_with_index(
    const std::vector<Spectrum::Spectrum> &queries,
    const SpectrumIndex::Index &index, const Parameters &parameters,
    const std::atomic<bool> *cancel) {
    Binning::validate(parameters.config);
    Report report = {};
    report.query_ids = spectra_ids(queries);
    report.candidate_ids = index.ids();
    report.config = parameters.config;
    report.metric = parameters.metric;

    auto query_vectors = bin_all(queries, parameters.config);
    // The shared pointers keep the candidates alive even if the cache is
    // cleared while the comparison runs.
    auto candidate_vectors = index.binned(parameters.config);
    std::vector<const Binning::BinnedVector *> candidate_ptrs;
    candidate_ptrs.reserve(candidate_vectors.size());
    for (const auto &vector : candidate_vectors) {
        candidate_ptrs.push_back(vector.get());
    }
    run_comparisons(report, pointers(query_vectors), candidate_ptrs,
                    parameters.max_threads, cancel);
    return report;
}

const Batch::Cell &Batch::cell(const Report &report, uint64_t i, uint64_t j) {
    if (i >= report.query_ids.size() || j >= report.candidate_ids.size()) {
        std::ostringstream error_stream;
        error_stream << "error: cell (" << i << ", " << j
                     << ") is out of bounds for a report of "
                     << report.query_ids.size() << "x"
                     << report.candidate_ids.size();
        throw Errors::NotFoundError(error_stream.str());
    }
    return report.cells[i * report.candidate_ids.size() + j];
}

std::vector<Similarity::Score> Batch::top_k(const Report &report, uint64_t i,
                                            int64_t k, bool exclude_self) {
    if (k <= 0) {
        std::ostringstream error_stream;
        error_stream << "error: k must be positive (k: " << k << ")";
        throw Errors::InvalidArgumentError(error_stream.str());
    }
    if (i >= report.query_ids.size()) {
        std::ostringstream error_stream;
        error_stream << "error: query " << i << " is out of bounds ("
                     << report.query_ids.size() << " queries)";
        throw Errors::NotFoundError(error_stream.str());
    }
    std::vector<Similarity::Score> scores;
    for (uint64_t j = 0; j < report.candidate_ids.size(); ++j) {
        const auto &current = cell(report, i, j);
        if (exclude_self && current.self_comparison) {
            continue;
        }
        if (auto score = std::get_if<Similarity::Score>(&current.outcome)) {
            scores.push_back(*score);
        }
    }
    Similarity::sort_scores(scores);
    if (scores.size() > static_cast<uint64_t>(k)) {
        scores.resize(k);
    }
    return scores;
}

std::vector<std::vector<Similarity::Score>> Batch::rankings(
    const Report &report, int64_t k, bool exclude_self) {
    std::vector<std::vector<Similarity::Score>> all_rankings;
    all_rankings.reserve(report.query_ids.size());
    for (uint64_t i = 0; i < report.query_ids.size(); ++i) {
        all_rankings.push_back(top_k(report, i, k, exclude_self));
    }
    return all_rankings;
}

uint64_t Batch::num_scored(const Report &report) {
    return std::count_if(report.cells.begin(), report.cells.end(),
                         [](const Cell &cell) {
                             return std::holds_alternative<Similarity::Score>(
                                 cell.outcome);
                         });
}

uint64_t Batch::num_failed(const Report &report) {
    return std::count_if(
        report.cells.begin(), report.cells.end(), [](const Cell &cell) {
            return std::holds_alternative<PairwiseComparisonFailure>(
                cell.outcome);
        });
}

std::vector<std::vector<double>> Batch::score_matrix(const Report &report,
                                                     bool mask_self) {
    auto matrix = std::vector<std::vector<double>>(
        report.query_ids.size(),
        std::vector<double>(report.candidate_ids.size(), -1.0));
    for (uint64_t i = 0; i < report.query_ids.size(); ++i) {
        for (uint64_t j = 0; j < report.candidate_ids.size(); ++j) {
            const auto &current = cell(report, i, j);
            if (mask_self && current.self_comparison) {
                matrix[i][j] = -2.0;
                continue;
            }
            if (auto score =
                    std::get_if<Similarity::Score>(&current.outcome)) {
                matrix[i][j] = Similarity::match_factor(score->value);
            }
        }
    }
    return matrix;
}
