#include <doctest/doctest.h>
#include <bitplay/codecs/decoder_drflac.hh>
#include <bitplay/error.hh>
#include "../test_helpers.hh"
#include <vector>

using namespace bitplay;
using namespace bitplay::test;

namespace {
    struct opened_flac {
        std::vector<uint8_t> bytes;
        std::unique_ptr<io_stream> io;
        decoder_drflac dec;

        explicit opened_flac(std::vector<uint8_t> data)
            : bytes(std::move(data)),
              io(io_from_memory(bytes.data(), bytes.size())) {
            dec.open(io.get());
        }
    };

    int64_t wave24(uint32_t frame, uint16_t channel) {
        const int64_t v = (static_cast<int64_t>(frame) * 2731) % 0x7FFFFF;
        return channel == 0 ? v : -v;
    }
}

TEST_SUITE("Codecs::DecoderFLAC") {
    TEST_CASE("Accept") {
        auto flac = make_flac(1, 16, 44100, 256, frame_index_pattern);
        auto io = io_from_memory(flac.data(), flac.size());
        CHECK(decoder_drflac::accept(io.get()));
        CHECK(io->tell() == 0);

        auto wav = make_pcm_wav(1, 16, 44100, 16, frame_index_pattern);
        auto wav_io = io_from_memory(wav.data(), wav.size());
        CHECK_FALSE(decoder_drflac::accept(wav_io.get()));
    }

    TEST_CASE("Open rejects non-FLAC data") {
        std::vector<uint8_t> junk(128, 0x11);
        auto io = io_from_memory(junk.data(), junk.size());
        decoder_drflac dec;
        CHECK_THROWS_AS(dec.open(io.get()), decoder_error);
        CHECK_FALSE(dec.is_open());
    }

    TEST_CASE("16-bit stream properties and samples") {
        opened_flac f(make_flac(2, 16, 44100, 1024, frame_index_pattern));
        CHECK(f.dec.get_channels() == 2);
        CHECK(f.dec.get_rate() == 44100);
        CHECK(f.dec.get_encoding() == sample_encoding::pcm_16);
        CHECK(f.dec.total_frames() == 1024);

        std::vector<int16_t> buf(2 * 1024);
        REQUIRE(f.dec.read_s16(buf.data(), 1024) == 1024);
        bool exact = true;
        for (uint32_t i = 0; i < 1024; i++) {
            exact = exact && decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data() + 2 * i)) == i;
        }
        CHECK(exact);
        CHECK(f.dec.read_s16(buf.data(), 1) == 0);
    }

    TEST_CASE("24-bit samples are left-justified in 32-bit elements") {
        opened_flac f(make_flac(2, 24, 96000, 512, wave24));
        CHECK(f.dec.get_encoding() == sample_encoding::pcm_24);
        CHECK(f.dec.get_rate() == 96000);

        std::vector<int32_t> buf(2 * 512);
        REQUIRE(f.dec.read_s32(buf.data(), 512) == 512);
        bool exact = true;
        for (uint32_t i = 0; i < 512; i++) {
            exact = exact && buf[2 * i] == static_cast<int32_t>(static_cast<uint32_t>(wave24(i, 0)) << 8);
            exact = exact && buf[2 * i + 1] == static_cast<int32_t>(static_cast<uint32_t>(wave24(i, 1)) << 8);
        }
        CHECK(exact);
    }

    TEST_CASE("Seek lands on the exact frame") {
        opened_flac f(make_flac(2, 16, 8000, 4096, frame_index_pattern));

        REQUIRE(f.dec.seek_to_frame(1000));
        CHECK(f.dec.tell_frame() == 1000);

        std::vector<int16_t> buf(2 * 8);
        REQUIRE(f.dec.read_s16(buf.data(), 8) == 8);
        CHECK(decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data())) == 1000);
        CHECK(decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data() + 14)) == 1007);

        REQUIRE(f.dec.seek_to_frame(17));
        REQUIRE(f.dec.read_s16(buf.data(), 1) == 1);
        CHECK(decode_frame_index(reinterpret_cast<const uint8_t*>(buf.data())) == 17);

        CHECK_FALSE(f.dec.seek_to_frame(5000));
    }
}
