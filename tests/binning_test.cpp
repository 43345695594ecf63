#include <limits>
#include <thread>

#include "doctest.h"

#include "binning/binning.hpp"
#include "test_utils.hpp"
#include "utils/errors.hpp"

TEST_CASE("Binning configuration") {
    SUBCASE("Defaults") {
        auto config = Binning::default_config();
        CHECK(config.mass_min == 0.0);
        CHECK(config.mass_max == 1000.0);
        CHECK(config.bin_width == 1.0);
        CHECK(config.normalization == Binning::Normalization::MAX);
        CHECK(Binning::num_bins(config) == 1000);
    }

    SUBCASE("Number of bins and bin edges") {
        CHECK(Binning::num_bins(TestUtils::mock_config()) == 15);
        CHECK(Binning::num_bins({0.0, 1.0, 0.1, Binning::NONE}) == 10);
        CHECK(Binning::num_bins({0.0, 1.05, 0.1, Binning::NONE}) == 11);
        CHECK(Binning::mass_at(TestUtils::mock_config(), 0) == 45.0);
        CHECK(Binning::mass_at(TestUtils::mock_config(), 5) == 50.0);
        CHECK(Binning::bin_index(TestUtils::mock_config(), 50.9) == 5);
        CHECK(Binning::bin_index(TestUtils::mock_config(), 59.999) == 14);
    }

    SUBCASE("Validation") {
        double nan = std::numeric_limits<double>::quiet_NaN();
        CHECK_NOTHROW(Binning::validate(TestUtils::mock_config()));
        CHECK_THROWS_AS(Binning::validate({0.0, 100.0, 0.0, Binning::NONE}),
                        Errors::InvalidArgumentError);
        CHECK_THROWS_AS(Binning::validate({0.0, 100.0, -1.0, Binning::NONE}),
                        Errors::InvalidArgumentError);
        CHECK_THROWS_AS(Binning::validate({-1.0, 100.0, 1.0, Binning::NONE}),
                        Errors::InvalidArgumentError);
        CHECK_THROWS_AS(Binning::validate({100.0, 100.0, 1.0, Binning::NONE}),
                        Errors::InvalidArgumentError);
        CHECK_THROWS_AS(Binning::validate({0.0, nan, 1.0, Binning::NONE}),
                        Errors::InvalidArgumentError);
        auto bad_mode = TestUtils::mock_config();
        bad_mode.normalization = static_cast<Binning::Normalization>(7);
        CHECK_THROWS_AS(Binning::validate(bad_mode),
                        Errors::InvalidArgumentError);
    }

    SUBCASE("Configurations needing too many bins") {
        // The bin count overflows to infinity.
        Binning::Config overflow = {0.0, 1e300, 1e-300, Binning::NONE};
        CHECK_THROWS_AS(Binning::validate(overflow),
                        Errors::InvalidArgumentError);
        Binning::Config huge = {0.0, 1e12, 1.0, Binning::NONE};
        CHECK_THROWS_AS(Binning::validate(huge), Errors::InvalidArgumentError);
        auto spectrum = TestUtils::mock_spectrum("s", {{50.0, 1.0}});
        CHECK_THROWS_AS(Binning::bin(spectrum, overflow),
                        Errors::InvalidArgumentError);
        CHECK_THROWS_AS(Binning::bin(spectrum, huge),
                        Errors::InvalidArgumentError);
        Binning::Config largest = {0.0, static_cast<double>(Binning::MAX_BINS),
                                   1.0, Binning::NONE};
        CHECK_NOTHROW(Binning::validate(largest));
    }

    SUBCASE("Normalization names") {
        CHECK(Binning::parse_normalization("max") == Binning::MAX);
        CHECK(Binning::parse_normalization("L2") == Binning::L2);
        CHECK(Binning::parse_normalization("None") == Binning::NONE);
        CHECK(Binning::parse_normalization("") == Binning::NONE);
        CHECK_THROWS_AS(Binning::parse_normalization("sum"),
                        Errors::InvalidArgumentError);
        CHECK(Binning::to_string(Binning::L2) == "L2");
    }
}

TEST_CASE("Binning spectra") {
    auto spectrum = TestUtils::mock_spectrum(
        "s", {{44.9, 100.0}, {50.0, 10.0}, {50.5, 2.0}, {51.0, 5.0},
              {60.0, 100.0}});

    SUBCASE("Intensities are accumulated per bin") {
        auto vector = Binning::bin(spectrum, TestUtils::mock_config());
        CHECK(vector.spectrum_id == "s");
        CHECK(vector.config == TestUtils::mock_config());
        REQUIRE(vector.data.size() == 15);
        CHECK(vector.data[5] == 12.0);
        CHECK(vector.data[6] == 5.0);
        // Out of range masses are dropped.
        double total = 0.0;
        for (const auto &value : vector.data) {
            total += value;
        }
        CHECK(total == 17.0);
    }

    SUBCASE("Binning is deterministic") {
        auto config = TestUtils::mock_config(Binning::L2);
        auto a = Binning::bin(spectrum, config);
        auto b = Binning::bin(spectrum, config);
        CHECK(a.data == b.data);
    }

    SUBCASE("Normalization") {
        auto max = Binning::bin(spectrum, TestUtils::mock_config(Binning::MAX));
        CHECK(max.data[5] == 1.0);
        CHECK(TestUtils::compare_double(max.data[6], 5.0 / 12.0));

        auto l2 = Binning::bin(TestUtils::mock_spectrum(
                                   "s", {{50.0, 3.0}, {51.0, 4.0}}),
                               TestUtils::mock_config(Binning::L2));
        CHECK(TestUtils::compare_double(l2.data[5], 0.6));
        CHECK(TestUtils::compare_double(l2.data[6], 0.8));
    }

    SUBCASE("Spectra without signal in range give a zero vector") {
        auto outside = TestUtils::mock_spectrum("o", {{10.0, 5.0}});
        auto vector =
            Binning::bin(outside, TestUtils::mock_config(Binning::L2));
        CHECK(Binning::is_zero(vector));
        CHECK(vector.data.size() == 15);
        auto empty = Binning::bin(Spectrum::Spectrum("e", {}, {}),
                                  TestUtils::mock_config(Binning::MAX));
        CHECK(Binning::is_zero(empty));
    }

    SUBCASE("Several spectra can be binned together") {
        auto other = TestUtils::mock_spectrum("t", {{50.2, 3.0}});
        auto vector = Binning::bin({spectrum, other},
                                   TestUtils::mock_config(), "combined");
        CHECK(vector.spectrum_id == "combined");
        CHECK(vector.data[5] == 15.0);
    }

    SUBCASE("Invalid configurations are rejected") {
        CHECK_THROWS_AS(
            Binning::bin(spectrum, {50.0, 40.0, 1.0, Binning::NONE}),
            Errors::InvalidArgumentError);
    }
}

TEST_CASE("Binning cache") {
    auto a = TestUtils::mock_spectrum("a", {{50.0, 10.0}});
    auto b = TestUtils::mock_spectrum("b", {{55.0, 10.0}});
    auto config = TestUtils::mock_config();
    Binning::Cache cache;

    SUBCASE("Vectors are reused for the same configuration") {
        auto first = cache.get(a, config);
        auto second = cache.get(a, config);
        CHECK(first == second);
        CHECK(cache.size() == 1);
        cache.get(b, config);
        CHECK(cache.size() == 2);
        CHECK(cache.config().value() == config);
    }

    SUBCASE("A new configuration drops every cached vector") {
        auto first = cache.get(a, config);
        cache.get(b, config);
        auto other_config = config;
        other_config.bin_width = 0.5;
        auto second = cache.get(a, other_config);
        CHECK(cache.size() == 1);
        CHECK(second->data.size() == 30);
        // Old vectors stay valid for their holders.
        CHECK(first->data.size() == 15);
    }

    SUBCASE("Invalidation") {
        auto first = cache.get(a, config);
        cache.get(b, config);
        cache.invalidate("a");
        CHECK(cache.size() == 1);
        CHECK(cache.get(a, config) != first);
        cache.clear();
        CHECK(cache.size() == 0);
        CHECK_FALSE(cache.config().has_value());
    }

    SUBCASE("Invalid configurations leave the cache untouched") {
        auto first = cache.get(a, config);
        CHECK_THROWS_AS(cache.get(a, {50.0, 40.0, 1.0, Binning::NONE}),
                        Errors::InvalidArgumentError);
        CHECK(cache.size() == 1);
        CHECK(cache.config().value() == config);
        CHECK(cache.get(a, config) == first);
    }

    SUBCASE("Concurrent readers") {
        std::vector<Spectrum::Spectrum> spectra;
        for (size_t i = 0; i < 50; ++i) {
            spectra.push_back(TestUtils::mock_spectrum(
                std::to_string(i), {{45.0 + (i % 15), 1.0 + i}}));
        }
        std::vector<std::thread> threads;
        for (size_t t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, &spectra, &config]() {
                for (const auto &spectrum : spectra) {
                    cache.get(spectrum, config);
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        CHECK(cache.size() == 50);
    }
}
