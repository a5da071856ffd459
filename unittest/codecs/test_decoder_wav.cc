#include <doctest/doctest.h>
#include <bitplay/codecs/decoder_drwav.hh>
#include <bitplay/error.hh>
#include "../test_helpers.hh"
#include <vector>

using namespace bitplay;
using namespace bitplay::test;

namespace {
    struct opened_wav {
        std::vector<uint8_t> bytes;
        std::unique_ptr<io_stream> io;
        decoder_drwav dec;

        explicit opened_wav(std::vector<uint8_t> data)
            : bytes(std::move(data)),
              io(io_from_memory(bytes.data(), bytes.size())) {
            dec.open(io.get());
        }
    };

    int64_t ramp16(uint32_t frame, uint16_t channel) {
        return channel == 0 ? static_cast<int64_t>(frame) * 3 : -static_cast<int64_t>(frame) * 5;
    }
}

TEST_SUITE("Codecs::DecoderWAV") {
    TEST_CASE("Accept") {
        auto wav = make_pcm_wav(1, 16, 44100, 16, ramp16);
        auto io = io_from_memory(wav.data(), wav.size());
        CHECK(decoder_drwav::accept(io.get()));
        CHECK(io->tell() == 0);

        std::vector<uint8_t> junk(64, 0x42);
        auto junk_io = io_from_memory(junk.data(), junk.size());
        CHECK_FALSE(decoder_drwav::accept(junk_io.get()));
        CHECK_FALSE(decoder_drwav::accept(nullptr));
    }

    TEST_CASE("Open rejects non-WAV data") {
        std::vector<uint8_t> junk(64, 0x42);
        auto io = io_from_memory(junk.data(), junk.size());
        decoder_drwav dec;
        CHECK_THROWS_AS(dec.open(io.get()), decoder_error);
        CHECK_FALSE(dec.is_open());
    }

    TEST_CASE("16-bit stereo samples come out unchanged") {
        opened_wav w(make_pcm_wav(2, 16, 44100, 1000, ramp16));
        CHECK(w.dec.get_channels() == 2);
        CHECK(w.dec.get_rate() == 44100);
        CHECK(w.dec.get_encoding() == sample_encoding::pcm_16);
        CHECK(w.dec.total_frames() == 1000);

        std::vector<int16_t> buf(2 * 1000);
        CHECK(w.dec.read_s16(buf.data(), 1000) == 1000);
        bool exact = true;
        for (uint32_t f = 0; f < 1000; f++) {
            exact = exact && buf[2 * f] == static_cast<int16_t>(ramp16(f, 0));
            exact = exact && buf[2 * f + 1] == static_cast<int16_t>(ramp16(f, 1));
        }
        CHECK(exact);
        CHECK(w.dec.read_s16(buf.data(), 10) == 0);
    }

    TEST_CASE("24-bit samples are left-justified in 32-bit elements") {
        const int64_t values[] = {0x123456, -0x123456, 0x7FFFFF, -0x800000, 1, -1, 0};
        auto gen = [&](uint32_t f, uint16_t) { return values[f % 7]; };
        opened_wav w(make_pcm_wav(1, 24, 96000, 70, gen));
        CHECK(w.dec.get_encoding() == sample_encoding::pcm_24);
        CHECK(w.dec.get_rate() == 96000);

        std::vector<int32_t> buf(70);
        REQUIRE(w.dec.read_s32(buf.data(), 70) == 70);
        for (uint32_t f = 0; f < 7; f++) {
            CAPTURE(f);
            CHECK(buf[f] == static_cast<int32_t>(static_cast<uint32_t>(values[f]) << 8));
        }
        CHECK(buf[7] == buf[0]);
    }

    TEST_CASE("32-bit samples pass through") {
        auto gen = [](uint32_t f, uint16_t c) {
            return c == 0 ? static_cast<int64_t>(0x7FFF0000) - f : -static_cast<int64_t>(0x7FFF0000) + f;
        };
        opened_wav w(make_pcm_wav(2, 32, 192000, 32, gen));
        CHECK(w.dec.get_encoding() == sample_encoding::pcm_32);

        std::vector<int32_t> buf(64);
        REQUIRE(w.dec.read_s32(buf.data(), 32) == 32);
        CHECK(buf[0] == 0x7FFF0000);
        CHECK(buf[1] == -0x7FFF0000);
        CHECK(buf[62] == 0x7FFF0000 - 31);
    }

    TEST_CASE("Encodings outside wide PCM are reported") {
        SUBCASE("8-bit") {
            opened_wav w(make_pcm_wav(1, 8, 22050, 16, [](uint32_t f, uint16_t) { return static_cast<int64_t>(f); }));
            CHECK(w.dec.get_encoding() == sample_encoding::pcm_u8);
        }
        SUBCASE("IEEE float") {
            opened_wav w(make_float_wav(2, 48000, 128));
            CHECK(w.dec.get_encoding() == sample_encoding::float_32);
            CHECK(w.dec.total_frames() == 128);
        }
    }

    TEST_CASE("Seek lands on the exact frame") {
        opened_wav w(make_pcm_wav(2, 16, 8000, 4000, frame_index_pattern));

        REQUIRE(w.dec.seek_to_frame(1234));
        CHECK(w.dec.tell_frame() == 1234);

        std::vector<int16_t> buf(2 * 4);
        REQUIRE(w.dec.read_s16(buf.data(), 4) == 4);
        CHECK(decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data())) == 1234);
        CHECK(decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data() + 6)) == 1237);
        CHECK(w.dec.tell_frame() == 1238);

        SUBCASE("Backwards") {
            REQUIRE(w.dec.seek_to_frame(3));
            REQUIRE(w.dec.read_s16(buf.data(), 1) == 1);
            CHECK(decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data())) == 3);
        }

        SUBCASE("To the end") {
            REQUIRE(w.dec.seek_to_frame(4000));
            CHECK(w.dec.read_s16(buf.data(), 4) == 0);
        }

        SUBCASE("Beyond the end is refused") {
            CHECK_FALSE(w.dec.seek_to_frame(4001));
        }
    }

    TEST_CASE("Duration follows frame count and rate") {
        opened_wav w(make_pcm_wav(1, 16, 8000, 4000, ramp16));
        CHECK(w.dec.duration() == std::chrono::microseconds(500000));
    }
}
