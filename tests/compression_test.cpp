#include <cstdio>
#include <string>

#include "doctest.h"

#include "spectrum/spectrum_serialize.hpp"
#include "test_utils.hpp"
#include "utils/compression.hpp"
#include "utils/serialization.hpp"

TEST_CASE("Compressed file streams") {
    std::string file_name = "specmatch_compression_test.bin";

    SUBCASE("Data larger than the internal buffers round trips") {
        std::vector<double> source_data(20000);
        for (size_t i = 0; i < source_data.size(); ++i) {
            source_data[i] = static_cast<double>(i % 97) * 0.25;
        }
        {
            Compression::DeflateStream stream(file_name, 1024);
            REQUIRE(stream.good());
            CHECK(Serialization::write_vector(stream, source_data));
            CHECK(Serialization::write_string(stream, "end"));
            stream.close();
            CHECK(stream.good());
        }
        {
            Compression::InflateStream stream(file_name, 1024);
            REQUIRE(stream.good());
            std::vector<double> read_data;
            std::string marker;
            CHECK(Serialization::read_vector(stream, &read_data));
            CHECK(Serialization::read_string(stream, &marker));
            CHECK(read_data == source_data);
            CHECK(marker == "end");
            // Nothing left after the last value.
            uint8_t extra = 0;
            CHECK_FALSE(Serialization::read_uint8(stream, &extra));
        }
        std::remove(file_name.c_str());
    }

    SUBCASE("Spectra survive the compressed round trip") {
        auto spectrum = TestUtils::mock_envelope("env", 300.0, 1e6, 5, 0.5);
        {
            Compression::DeflateStream stream(file_name);
            CHECK(Spectrum::Serialize::write_spectra(stream, {spectrum}));
        }
        Compression::InflateStream stream(file_name);
        std::vector<Spectrum::Spectrum> read_spectra;
        CHECK(Spectrum::Serialize::read_spectra(stream, &read_spectra));
        REQUIRE(read_spectra.size() == 1);
        CHECK(read_spectra[0] == spectrum);
        std::remove(file_name.c_str());
    }

    SUBCASE("Missing files put the stream in a failed state") {
        Compression::InflateStream stream("this/file/does/not/exist.bin");
        CHECK_FALSE(stream.good());
    }
}
