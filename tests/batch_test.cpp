#include <atomic>
#include <chrono>
#include <thread>

#include "doctest.h"

#include "batch/batch.hpp"
#include "test_utils.hpp"
#include "utils/errors.hpp"

TEST_CASE("Batch comparison") {
    Batch::Parameters parameters;
    parameters.config = TestUtils::mock_config(Binning::MAX);
    std::vector<Spectrum::Spectrum> queries = {
        TestUtils::mock_spectrum("A", {{50.0, 10.0}, {51.0, 5.0}}),
        TestUtils::mock_spectrum("C", {{55.0, 10.0}}),
    };
    std::vector<Spectrum::Spectrum> candidates = {
        TestUtils::mock_spectrum("B", {{50.0, 10.0}, {51.0, 5.0}}),
        TestUtils::mock_spectrum("A", {{50.0, 10.0}, {51.0, 5.0}}),
        TestUtils::mock_spectrum("D", {{55.0, 2.0}, {56.0, 2.0}}),
    };

    SUBCASE("Every pair is scored in row major order") {
        auto report = Batch::compare_all(queries, candidates, parameters);
        CHECK(report.query_ids == std::vector<std::string>{"A", "C"});
        CHECK(report.candidate_ids == std::vector<std::string>{"B", "A", "D"});
        CHECK(report.cells.size() == 6);
        CHECK(Batch::num_scored(report) == 6);
        CHECK(Batch::num_failed(report) == 0);
        CHECK_FALSE(report.cancelled);
        CHECK(report.metric == Similarity::COSINE);
        CHECK(report.config == parameters.config);

        const auto &cell = Batch::cell(report, 1, 2);
        CHECK(cell.query_id == "C");
        CHECK(cell.candidate_id == "D");
        auto score = std::get<Similarity::Score>(cell.outcome);
        CHECK(TestUtils::compare_double(score.value, 1.0 / std::sqrt(2.0)));
        CHECK(std::get<Similarity::Score>(Batch::cell(report, 0, 0).outcome)
                  .value == 1.0);
        CHECK(std::get<Similarity::Score>(Batch::cell(report, 1, 0).outcome)
                  .value == 0.0);
        CHECK_THROWS_AS(Batch::cell(report, 2, 0), Errors::NotFoundError);
        CHECK_THROWS_AS(Batch::cell(report, 0, 3), Errors::NotFoundError);
    }

    SUBCASE("Self comparisons are flagged and kept") {
        auto report = Batch::compare_all(queries, candidates, parameters);
        CHECK(Batch::cell(report, 0, 1).self_comparison);
        CHECK_FALSE(Batch::cell(report, 0, 0).self_comparison);
        CHECK_FALSE(Batch::cell(report, 1, 1).self_comparison);
        CHECK(std::holds_alternative<Similarity::Score>(
            Batch::cell(report, 0, 1).outcome));
    }

    SUBCASE("Results do not depend on the number of threads") {
        std::vector<Spectrum::Spectrum> library;
        for (size_t i = 0; i < 30; ++i) {
            library.push_back(TestUtils::mock_envelope(
                "s" + std::to_string(i), 45.0 + (i % 10), 10.0 + i, 4));
        }
        auto single = Batch::compare_within(library, parameters);
        parameters.max_threads = 4;
        auto multi = Batch::compare_within(library, parameters);
        REQUIRE(single.cells.size() == 900);
        REQUIRE(multi.cells.size() == 900);
        for (size_t k = 0; k < single.cells.size(); ++k) {
            CHECK(std::get<Similarity::Score>(single.cells[k].outcome).value ==
                  std::get<Similarity::Score>(multi.cells[k].outcome).value);
        }
        CHECK(Batch::cell(multi, 7, 7).self_comparison);
    }

    SUBCASE("Incompatible vectors are reported per pair") {
        auto config = TestUtils::mock_config();
        auto wide_config = config;
        wide_config.bin_width = 0.5;
        std::vector<Binning::BinnedVector> query_vectors = {
            Binning::bin(queries[0], config),
            Binning::bin(queries[1], wide_config),
        };
        std::vector<Binning::BinnedVector> candidate_vectors = {
            Binning::bin(candidates[0], config),
            Binning::bin(candidates[2], config),
        };
        auto report =
            Batch::compare_vectors(query_vectors, candidate_vectors, parameters);
        CHECK(report.config == config);
        CHECK(Batch::num_scored(report) == 2);
        CHECK(Batch::num_failed(report) == 2);
        auto failure = std::get_if<Batch::PairwiseComparisonFailure>(
            &Batch::cell(report, 1, 0).outcome);
        REQUIRE(failure != nullptr);
        CHECK_FALSE(failure->reason.empty());
        CHECK(std::holds_alternative<Similarity::Score>(
            Batch::cell(report, 0, 1).outcome));
    }

    SUBCASE("Comparing against an index reuses its vectors") {
        SpectrumIndex::Index index;
        for (const auto &candidate : {candidates[0], candidates[2]}) {
            index.insert(candidate);
        }
        auto report = Batch::compare_with_index(queries, index, parameters);
        CHECK(report.candidate_ids == std::vector<std::string>{"B", "D"});
        CHECK(Batch::num_scored(report) == 4);
        CHECK(index.cached_vectors() == 2);
        CHECK(std::get<Similarity::Score>(Batch::cell(report, 0, 0).outcome)
                  .value == 1.0);
    }

    SUBCASE("Cancellation leaves the remaining cells uncomputed") {
        std::atomic<bool> cancel(true);
        auto report =
            Batch::compare_all(queries, candidates, parameters, &cancel);
        CHECK(report.cancelled);
        CHECK(report.cells.size() == 6);
        CHECK(Batch::num_scored(report) == 0);
        for (const auto &cell : report.cells) {
            CHECK(std::holds_alternative<std::monostate>(cell.outcome));
        }
        cancel = false;
        report = Batch::compare_all(queries, candidates, parameters, &cancel);
        CHECK_FALSE(report.cancelled);
        CHECK(Batch::num_scored(report) == 6);
    }

    SUBCASE("Cancelling a running comparison keeps the finished cells") {
        // Large vectors so that the run outlasts the delay before cancelling.
        Binning::Config wide_config = {0.0, 100000.0, 1.0, Binning::NONE};
        std::vector<Binning::BinnedVector> vectors;
        for (size_t i = 0; i < 60; ++i) {
            Binning::BinnedVector vector = {
                std::to_string(i), wide_config,
                std::vector<double>(Binning::num_bins(wide_config))};
            vector.data[i] = 1.0 + i;
            vector.data[1000 + i] = 2.0;
            vectors.push_back(std::move(vector));
        }
        std::atomic<bool> cancel(false);
        std::thread canceller([&cancel]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            cancel = true;
        });
        auto report =
            Batch::compare_vectors(vectors, vectors, parameters, &cancel);
        canceller.join();
        uint64_t num_pending = 0;
        for (const auto &cell : report.cells) {
            if (std::holds_alternative<std::monostate>(cell.outcome)) {
                ++num_pending;
            }
        }
        CHECK(report.cancelled);
        CHECK(report.cells.size() == 3600);
        CHECK(Batch::num_scored(report) > 0);
        CHECK(num_pending > 0);
        CHECK(Batch::num_scored(report) + Batch::num_failed(report) +
                  num_pending ==
              3600);
    }

    SUBCASE("Thread count defaults") {
        CHECK(Batch::hardware_threads() >= 1);
        CHECK(Batch::Parameters().max_threads == 1);
    }

    SUBCASE("Empty collections") {
        auto report = Batch::compare_all({}, candidates, parameters);
        CHECK(report.cells.empty());
        CHECK(report.candidate_ids.size() == 3);
        CHECK(Batch::score_matrix(report).empty());
    }

    SUBCASE("Invalid parameters") {
        parameters.max_threads = 0;
        CHECK_THROWS_AS(Batch::compare_all(queries, candidates, parameters),
                        Errors::InvalidArgumentError);
        parameters.max_threads = 1;
        parameters.config.bin_width = -1.0;
        CHECK_THROWS_AS(Batch::compare_within(queries, parameters),
                        Errors::InvalidArgumentError);
    }
}

TEST_CASE("Batch report views") {
    Batch::Parameters parameters;
    parameters.config = TestUtils::mock_config(Binning::MAX);
    std::vector<Spectrum::Spectrum> spectra = {
        TestUtils::mock_spectrum("A", {{50.0, 10.0}, {51.0, 5.0}}),
        TestUtils::mock_spectrum("B", {{50.0, 10.0}, {51.0, 5.0}}),
        TestUtils::mock_spectrum("C", {{50.0, 10.0}, {55.0, 10.0}}),
    };
    auto report = Batch::compare_within(spectra, parameters);

    SUBCASE("top_k") {
        auto top = Batch::top_k(report, 0, 2);
        REQUIRE(top.size() == 2);
        CHECK(top[0].id_b == "A");
        CHECK(top[1].id_b == "B");

        auto others = Batch::top_k(report, 0, 2, true);
        REQUIRE(others.size() == 2);
        CHECK(others[0].id_b == "B");
        CHECK(others[1].id_b == "C");
        CHECK(others[0].value >= others[1].value);

        CHECK_THROWS_AS(Batch::top_k(report, 0, 0),
                        Errors::InvalidArgumentError);
        CHECK_THROWS_AS(Batch::top_k(report, 3, 1), Errors::NotFoundError);
    }

    SUBCASE("rankings") {
        auto all = Batch::rankings(report, 1, true);
        REQUIRE(all.size() == 3);
        CHECK(all[0][0].id_b == "B");
        CHECK(all[1][0].id_b == "A");
        CHECK(all[2][0].id_b == "A");
    }

    SUBCASE("score_matrix") {
        auto matrix = Batch::score_matrix(report);
        REQUIRE(matrix.size() == 3);
        REQUIRE(matrix[0].size() == 3);
        CHECK(matrix[0][0] == 1000.0);
        CHECK(matrix[0][1] == 1000.0);
        CHECK(TestUtils::compare_double(matrix[2][0],
                                        1000.0 / std::sqrt(2.5)));
        auto masked = Batch::score_matrix(report, true);
        CHECK(masked[0][0] == -2.0);
        CHECK(masked[1][1] == -2.0);
        CHECK(masked[0][1] == 1000.0);

        report.cells[1].outcome = Batch::PairwiseComparisonFailure{"x"};
        report.cells[2].outcome = std::monostate{};
        auto partial = Batch::score_matrix(report);
        CHECK(partial[0][1] == -1.0);
        CHECK(partial[0][2] == -1.0);
        CHECK(Batch::num_failed(report) == 1);
        CHECK(Batch::num_scored(report) == 7);
    }
}
