#include <doctest/doctest.h>
#include <bitplay/format_mapper.hh>
#include <bitplay/bit_perfect.hh>
#include <bitplay/error.hh>
#include <sstream>

using namespace bitplay;

TEST_SUITE("Core::FormatMapper") {
    TEST_CASE("Integer PCM maps to a container without loss") {
        auto m16 = map_encoding(sample_encoding::pcm_16);
        CHECK(m16.device_format == audio_format::s16le);
        CHECK(m16.element_bits == 16);
        CHECK(m16.element_bytes() == 2);

        auto m24 = map_encoding(sample_encoding::pcm_24);
        CHECK(m24.device_format == audio_format::s32le);
        CHECK(m24.element_bits == 32);

        auto m32 = map_encoding(sample_encoding::pcm_32);
        CHECK(m32.device_format == audio_format::s32le);
        CHECK(m32.element_bytes() == 4);
    }

    TEST_CASE("Everything else is refused") {
        const sample_encoding refused[] = {
            sample_encoding::unknown, sample_encoding::pcm_u8, sample_encoding::pcm_s8,
            sample_encoding::float_32, sample_encoding::float_64, sample_encoding::compressed
        };
        for (auto enc : refused) {
            CAPTURE(enc);
            CHECK_THROWS_AS(map_encoding(enc), unsupported_format_error);
        }
    }

    TEST_CASE("Encoding names") {
        std::ostringstream os;
        os << sample_encoding::pcm_24 << " " << sample_encoding::float_32 << " " << audio_format::s32le;
        CHECK(os.str() == "PCM_24 FLOAT s32le");
    }

    TEST_CASE("Device formats are the two integer containers") {
        CHECK(audio_format_byte_size(audio_format::s16le) == 2);
        CHECK(audio_format_byte_size(audio_format::s32le) == 4);
        CHECK(audio_format_byte_size(audio_format::unknown) == 0);
        CHECK(audio_spec_frame_bytes(audio_spec{audio_format::s32le, 2, 96000}) == 8);
        CHECK(audio_spec_frame_bytes(audio_spec{audio_format::unknown, 2, 96000}) == 0);

        // every mappable encoding lands in one of them
        for (auto enc : {sample_encoding::pcm_16, sample_encoding::pcm_24, sample_encoding::pcm_32}) {
            CAPTURE(enc);
            const auto m = map_encoding(enc);
            CHECK((m.device_format == audio_format::s16le || m.device_format == audio_format::s32le));
            CHECK(m.element_bits == audio_format_bit_size(m.device_format));
        }

        std::ostringstream os;
        os << audio_format::unknown << " " << audio_format::s16le;
        CHECK(os.str() == "unknown s16le");
    }
}

TEST_SUITE("Core::BitPerfect") {
    TEST_CASE("Exclusive identifiers") {
        CHECK(is_exclusive_device_id("hw:0,0"));
        CHECK(is_exclusive_device_id("hw:1"));
        CHECK_FALSE(is_exclusive_device_id("plughw:0,0"));
        CHECK_FALSE(is_exclusive_device_id("default"));
        CHECK_FALSE(is_exclusive_device_id("hw"));
        CHECK_FALSE(is_exclusive_device_id(""));
    }

    TEST_CASE("Verdicts") {
        SUBCASE("Exclusive device with wide PCM") {
            for (auto enc : {sample_encoding::pcm_16, sample_encoding::pcm_24, sample_encoding::pcm_32}) {
                auto v = classify_bit_perfect("hw:1,0", enc);
                CHECK(v.bit_perfect);
                CHECK(v.reason.empty());
            }
        }

        SUBCASE("Converting device") {
            auto v = classify_bit_perfect("plughw:1,0", sample_encoding::pcm_24);
            CHECK_FALSE(v.bit_perfect);
            CHECK(v.reason == "output device 'plughw:1,0' is not exclusive hardware access; "
                              "samples may be converted or resampled");
        }

        SUBCASE("Non-integer source") {
            auto v = classify_bit_perfect("hw:1,0", sample_encoding::float_32);
            CHECK_FALSE(v.bit_perfect);
            CHECK(v.reason == "source encoding FLOAT is not integer PCM");
        }

        SUBCASE("Open failure") {
            auto v = device_open_failed_verdict("hw:9,0 still busy");
            CHECK_FALSE(v.bit_perfect);
            CHECK(v.reason == "device open failed: hw:9,0 still busy");
        }
    }
}
