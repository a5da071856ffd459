#include <doctest/doctest.h>
#include <bitplay/backends/null/null_backend.hh>
#include <bitplay/sdk/output_backend.hh>
#include <bitplay/error.hh>
#include <chrono>
#include <vector>

using namespace bitplay;

TEST_SUITE("Backends::Null") {
    TEST_CASE("Lifecycle and enumeration") {
        auto backend = create_null_backend();
        REQUIRE(backend);
        CHECK(backend->get_name() == "Null");
        CHECK_FALSE(backend->is_initialized());
        CHECK_THROWS(backend->enumerate_devices());

        backend->init();
        CHECK(backend->is_initialized());
        auto devices = backend->enumerate_devices();
        REQUIRE(devices.size() == 2);
        CHECK(devices[0].id == "hw:null");
        CHECK(devices[0].kind == device_kind::exclusive);
        CHECK(devices[1].id == "plughw:null");
        CHECK(devices[1].kind == device_kind::converting);

        backend->shutdown();
        CHECK_FALSE(backend->is_initialized());
    }

    TEST_CASE("Streams") {
        auto backend = create_null_backend();
        backend->init();
        const audio_spec spec{audio_format::s32le, 2, 96000};

        SUBCASE("Exclusive claim per device") {
            auto s = backend->open_stream("hw:null", spec, 512);
            REQUIRE(s);
            CHECK(s->is_open());
            CHECK(s->get_spec() == spec);
            CHECK_THROWS_AS(backend->open_stream("hw:null", spec, 512), device_busy_error);

            s->close();
            CHECK_FALSE(s->is_open());
            auto again = backend->open_stream("hw:null", spec, 512);
            CHECK(again->is_open());
        }

        SUBCASE("Unknown device and empty spec") {
            CHECK_THROWS_AS(backend->open_stream("hw:5,0", spec, 512), device_error);
            CHECK_THROWS_AS(backend->open_stream("hw:null", audio_spec{audio_format::unknown, 2, 96000}, 512),
                            device_config_error);
        }

        SUBCASE("Writes take playout time") {
            auto s = backend->open_stream("plughw:null", spec, 512);
            std::vector<int32_t> block(2 * 960, 0);
            const auto start = std::chrono::steady_clock::now();
            s->write(block.data(), 960);
            CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(9));

            s->close();
            CHECK_THROWS_AS(s->write(block.data(), 960), device_write_error);
        }
    }
}
