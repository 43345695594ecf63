#include <limits>

#include "doctest.h"

#include "spectrum/spectrum.hpp"
#include "test_utils.hpp"
#include "utils/errors.hpp"

TEST_CASE("Spectrum construction") {
    SUBCASE("Points are sorted by mass") {
        auto spectrum = Spectrum::Spectrum("s", {51.0, 50.0, 60.5},
                                           {5.0, 10.0, 1.0});
        CHECK(spectrum.mz() == std::vector<double>{50.0, 51.0, 60.5});
        CHECK(spectrum.intensity() == std::vector<double>{10.0, 5.0, 1.0});
        CHECK(spectrum.num_points() == 3);
        CHECK(spectrum.max_intensity() == 10.0);
        CHECK(spectrum.total_intensity() == 16.0);
    }

    SUBCASE("Repeated masses are merged") {
        auto spectrum = TestUtils::mock_spectrum(
            "s", {{50.0, 10.0}, {51.0, 5.0}, {50.0, 2.5}, {51.0, 0.0}});
        CHECK(spectrum.mz() == std::vector<double>{50.0, 51.0});
        CHECK(spectrum.intensity() == std::vector<double>{12.5, 5.0});
    }

    SUBCASE("Stored masses are strictly increasing") {
        auto spectrum = TestUtils::mock_spectrum(
            "s", {{90.0, 1.0}, {10.0, 2.0}, {45.5, 0.0}, {10.0, 1.0},
                  {45.4999, 3.0}});
        for (size_t i = 1; i < spectrum.num_points(); ++i) {
            CHECK(spectrum.mz()[i - 1] < spectrum.mz()[i]);
        }
        for (const auto &value : spectrum.intensity()) {
            CHECK(value >= 0.0);
        }
    }

    SUBCASE("Empty spectra are valid") {
        auto spectrum = Spectrum::Spectrum("empty", {}, {});
        CHECK(spectrum.empty());
        CHECK(spectrum.max_intensity() == 0.0);
        Spectrum::Spectrum default_spectrum;
        CHECK(default_spectrum.empty());
        CHECK(default_spectrum.id().empty());
    }

    SUBCASE("Metadata is kept") {
        Spectrum::Metadata metadata = {"benzene", "lib.msp", std::nullopt, 7};
        auto spectrum = Spectrum::Spectrum("s", {78.0}, {999.0}, metadata);
        CHECK(spectrum.metadata() == metadata);
        CHECK(spectrum.metadata().name == "benzene");
        CHECK_FALSE(spectrum.metadata().retention_time.has_value());
    }

    SUBCASE("Invalid input") {
        double nan = std::numeric_limits<double>::quiet_NaN();
        double inf = std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {50.0, 51.0}, {1.0}),
                        Errors::MalformedSpectrumError);
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {50.0}, {-1.0}),
                        Errors::MalformedSpectrumError);
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {nan}, {1.0}),
                        Errors::MalformedSpectrumError);
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {inf}, {1.0}),
                        Errors::MalformedSpectrumError);
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {50.0}, {nan}),
                        Errors::MalformedSpectrumError);
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {50.0}, {inf}),
                        Errors::MalformedSpectrumError);
        // The error types can be caught by their standard base.
        CHECK_THROWS_AS(Spectrum::Spectrum("s", {50.0}, {-1.0}),
                        std::invalid_argument);
    }
}

TEST_CASE("Spectrum utilities") {
    SUBCASE("combine") {
        auto a = TestUtils::mock_spectrum("a", {{50.0, 10.0}, {51.0, 5.0}});
        auto b = TestUtils::mock_spectrum("b", {{51.0, 5.0}, {52.0, 1.0}});
        auto combined = Spectrum::combine({a, b}, "ab");
        CHECK(combined.id() == "ab");
        CHECK(combined.mz() == std::vector<double>{50.0, 51.0, 52.0});
        CHECK(combined.intensity() == std::vector<double>{10.0, 10.0, 1.0});
        CHECK(Spectrum::combine({}, "none").empty());
    }

    SUBCASE("normalize_intensities") {
        auto spectrum =
            TestUtils::mock_spectrum("s", {{50.0, 20.0}, {51.0, 5.0}});
        auto normalized = Spectrum::normalize_intensities(spectrum);
        CHECK(normalized.intensity() == std::vector<double>{100.0, 25.0});
        CHECK(normalized.mz() == spectrum.mz());
        auto unit = Spectrum::normalize_intensities(spectrum, 1.0);
        CHECK(unit.max_intensity() == 1.0);
        auto silent = TestUtils::mock_spectrum("z", {{50.0, 0.0}});
        CHECK(Spectrum::normalize_intensities(silent) == silent);
    }

    SUBCASE("top_masses") {
        auto spectrum = TestUtils::mock_spectrum(
            "s", {{41.0, 50.0}, {43.0, 100.0}, {57.0, 50.0}, {71.0, 10.0},
                  {20.0, 200.0}});
        auto top = Spectrum::top_masses(spectrum, 3, 30.0);
        REQUIRE(top.size() == 3);
        CHECK(top[0].mz == 43.0);
        CHECK(top[0].relative_intensity == 999);
        // Ties are broken by ascending mass.
        CHECK(top[1].mz == 41.0);
        CHECK(top[2].mz == 57.0);
        CHECK(top[1].relative_intensity == 499);
        CHECK(Spectrum::top_masses(spectrum, 10).size() == 5);
        CHECK(Spectrum::top_masses(spectrum, 10)[0].mz == 20.0);
        CHECK(Spectrum::top_masses(spectrum, 2, 1000.0).empty());
    }

    SUBCASE("max_mass") {
        auto spectrum = TestUtils::mock_spectrum(
            "s", {{50.0, 1000.0}, {120.0, 20.0}, {300.0, 5.0}});
        CHECK(Spectrum::max_mass(spectrum) == 120.0);
        CHECK(Spectrum::max_mass(spectrum, 0.001) == 300.0);
        CHECK(Spectrum::max_mass(spectrum, 1.0) == 50.0);
        auto silent = TestUtils::mock_spectrum("z", {{50.0, 0.0}});
        CHECK_THROWS_AS(Spectrum::max_mass(silent),
                        Errors::InvalidArgumentError);
    }
}
