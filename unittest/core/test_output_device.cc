#include <doctest/doctest.h>
#include <bitplay/output_device.hh>
#include <bitplay/error.hh>
#include "../mock_backends.hh"
#include <thread>
#include <type_traits>

using namespace bitplay;
using namespace bitplay::test;

namespace {
    retry_policy fast_policy(unsigned attempts = 6) {
        retry_policy p;
        p.max_attempts = attempts;
        p.escalate_after = 2;
        p.short_delay = std::chrono::milliseconds(1);
        p.long_delay = std::chrono::milliseconds(3);
        return p;
    }

    const audio_spec cd_spec{audio_format::s16le, 2, 44100};
}

TEST_SUITE("Core::OutputDevice") {
    TEST_CASE("Backoff schedule") {
        retry_policy p;
        CHECK(p.max_attempts == 20);
        CHECK(p.delay_after(1) == std::chrono::milliseconds(50));
        CHECK(p.delay_after(5) == std::chrono::milliseconds(50));
        CHECK(p.delay_after(6) == std::chrono::milliseconds(250));
        CHECK(p.delay_after(19) == std::chrono::milliseconds(250));
    }

    TEST_CASE("Only open() creates devices") {
        static_assert(!std::is_default_constructible_v<output_device>);
        static_assert(!std::is_copy_constructible_v<output_device>);
        static_assert(!std::is_constructible_v<output_device, std::unique_ptr<output_stream>, std::string,
                                               const audio_spec&, unsigned>);

        mock_output_backend backend;
        backend.init();
        std::unique_ptr<output_device> dev = output_device::open(backend, "plughw:0,0", cd_spec, 256, fast_policy());
        REQUIRE(dev);
        CHECK(dev->attempts() == 1);
        CHECK(backend.state()->currently_open() == 1);
        dev.reset();
        CHECK(backend.state()->currently_open() == 0);
    }

    TEST_CASE("Opens on the first attempt when free") {
        mock_output_backend backend;
        backend.init();
        auto dev = output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy());
        REQUIRE(dev);
        CHECK(dev->is_open());
        CHECK(dev->attempts() == 1);
        CHECK(dev->device_id() == "hw:0,0");
        CHECK(dev->spec() == cd_spec);

        std::vector<int16_t> frames(2 * 16, 7);
        dev->write(frames.data(), 16);
        CHECK(backend.state()->write_count() == 1);

        dev->close();
        CHECK_FALSE(dev->is_open());
        CHECK(backend.state()->currently_open() == 0);
        CHECK_THROWS_AS(dev->write(frames.data(), 16), device_write_error);
    }

    TEST_CASE("Busy device is retried until released") {
        mock_output_backend backend;
        backend.init();
        backend.state()->busy_failures_remaining = 3;

        auto dev = output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy());
        REQUIRE(dev);
        CHECK(dev->attempts() == 4);
        CHECK(backend.state()->open_attempts.load() == 4);
    }

    TEST_CASE("Gives up after the attempt budget") {
        mock_output_backend backend;
        backend.init();
        backend.state()->always_busy = true;

        CHECK_THROWS_AS(output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy(5)),
                        device_unavailable_error);
        CHECK(backend.state()->open_attempts.load() == 5);
    }

    TEST_CASE("Configuration refusal is not retried") {
        mock_output_backend backend;
        backend.init();
        backend.state()->refused_ids.insert("hw:0,0");

        CHECK_THROWS_AS(output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy()),
                        device_config_error);
        CHECK(backend.state()->open_attempts.load() == 1);
    }

    TEST_CASE("Unknown device is not retried") {
        mock_output_backend backend;
        backend.init();
        CHECK_THROWS_AS(output_device::open(backend, "hw:7,0", cd_spec, 1024, fast_policy()), device_error);
        CHECK(backend.state()->open_attempts.load() == 1);
    }

    TEST_CASE("Second open of the same endpoint waits for the first to close") {
        mock_output_backend backend;
        backend.init();
        auto first = output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy());
        REQUIRE(first);

        std::thread releaser([&first] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            first->close();
        });
        retry_policy patient = fast_policy(200);
        auto second = output_device::open(backend, "plughw:0,0", cd_spec, 1024, patient);
        releaser.join();

        REQUIRE(second);
        CHECK(second->attempts() > 1);
        CHECK(backend.state()->max_open_streams == 1);
    }

    TEST_CASE("Cancellation stops the retry loop") {
        mock_output_backend backend;
        backend.init();
        backend.state()->always_busy = true;

        std::atomic<bool> cancel{false};
        retry_policy slow;
        slow.max_attempts = 20;
        slow.short_delay = std::chrono::milliseconds(200);

        std::thread canceller([&cancel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            cancel = true;
        });
        const auto start = std::chrono::steady_clock::now();
        auto dev = output_device::open(backend, "hw:0,0", cd_spec, 1024, slow, &cancel);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();

        CHECK(dev == nullptr);
        CHECK(elapsed < std::chrono::milliseconds(200));
    }

    TEST_CASE("Backend must be initialized") {
        mock_output_backend backend;
        CHECK_THROWS_AS(output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy()), std::runtime_error);
    }

    TEST_CASE("Destructor releases the device") {
        mock_output_backend backend;
        backend.init();
        {
            auto dev = output_device::open(backend, "hw:0,0", cd_spec, 1024, fast_policy());
            REQUIRE(dev);
            CHECK(backend.state()->currently_open() == 1);
        }
        CHECK(backend.state()->currently_open() == 0);
    }
}
