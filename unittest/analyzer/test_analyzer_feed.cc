#include <doctest/doctest.h>
#include <bitplay/analyzer/analyzer_feed.hh>
#include <bitplay/player.hh>
#include "../mock_backends.hh"
#include "../test_helpers.hh"
#include <algorithm>
#include <cmath>
#include <thread>

using namespace bitplay;
using namespace bitplay::test;

namespace {
    analyzer_config feed_config() {
        analyzer_config cfg;
        cfg.fft_size = 1024;
        cfg.bands = 24;
        cfg.smoothing = 0.0;
        return cfg;
    }

    pcm_block tone_block(size_t frames, audio_format format = audio_format::s16le) {
        pcm_block block;
        block.format = format;
        block.channels = 1;
        block.sample_rate = 48000;
        for (size_t i = 0; i < frames; i++) {
            const auto v = static_cast<int16_t>(12000.0 * std::sin(2.0 * 3.14159265358979 * 1000.0 *
                                                                   static_cast<double>(i) / 48000.0));
            block.data.push_back(static_cast<uint8_t>(static_cast<uint16_t>(v) & 0xFF));
            block.data.push_back(static_cast<uint8_t>(static_cast<uint16_t>(v) >> 8));
        }
        return block;
    }

    // Let the consumer park on its condition variable again
    void settle() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

TEST_SUITE("Analyzer::Feed") {
    TEST_CASE("Blocks reach the analyzer on the feed thread") {
        auto analyzer = std::make_shared<spectrum_analyzer>(feed_config());
        analyzer_feed feed(analyzer);
        CHECK(feed.analyzer() == analyzer);
        settle();

        feed.push(tone_block(1024));
        REQUIRE(wait_until([&] { return feed.delivered() == 1; }));
        CHECK(analyzer->analyses() == 1);
        CHECK(feed.dropped() == 0);
    }

    TEST_CASE("A bad block is logged and skipped") {
        auto analyzer = std::make_shared<spectrum_analyzer>(feed_config());
        analyzer_feed feed(analyzer);
        settle();

        pcm_block bad;
        bad.format = audio_format::unknown;
        bad.channels = 1;
        bad.sample_rate = 48000;
        bad.data.resize(4096);
        feed.push(std::move(bad));
        REQUIRE(wait_until([&] { return feed.delivered() == 1; }));
        settle();

        feed.push(tone_block(1024));
        REQUIRE(wait_until([&] { return feed.delivered() == 2; }));
        CHECK(analyzer->analyses() == 1);
    }

    TEST_CASE("Stopped feed drops everything") {
        auto analyzer = std::make_shared<spectrum_analyzer>(feed_config());
        analyzer_feed feed(analyzer);
        feed.stop();
        feed.stop();

        feed.push(tone_block(1024));
        feed.push(tone_block(1024));
        CHECK(feed.dropped() == 2);
        CHECK(feed.delivered() == 0);
        CHECK(analyzer->analyses() == 0);
    }

    TEST_CASE("Null analyzer is refused") {
        CHECK_THROWS(analyzer_feed(nullptr));
    }

    TEST_CASE("Player output drives the analyzer") {
        auto state = std::make_shared<mock_state>();
        state->write_delay = std::chrono::milliseconds(3);
        auto backend = std::make_shared<mock_output_backend>(state);
        auto wav = make_pcm_wav(2, 16, 48000, 48000, [](uint32_t f, uint16_t) {
            return static_cast<int64_t>(12000.0 * std::sin(2.0 * 3.14159265358979 * 1000.0 * f / 48000.0));
        });
        temp_file file(wav, ".wav");
        auto library = std::make_shared<track_library>(std::vector<std::string>{file.path()});

        player_config cfg;
        cfg.period_frames = 1024;
        player p(backend, library, nullptr, cfg);

        auto analyzer = std::make_shared<spectrum_analyzer>(feed_config());
        auto feed = std::make_shared<analyzer_feed>(analyzer);
        p.set_pcm_sink(feed);
        p.play(0);

        REQUIRE(wait_until([&] { return analyzer->analyses() >= 3; }));
        p.stop();

        const auto frame = analyzer->get_display_frame();
        const auto loudest = std::max_element(frame.smoothed_db.begin(), frame.smoothed_db.end());
        const auto band = static_cast<size_t>(std::distance(frame.smoothed_db.begin(), loudest));
        CHECK(analyzer->band_center_hz(band) > 700.0);
        CHECK(analyzer->band_center_hz(band) < 1400.0);
        CHECK(feed->delivered() + feed->dropped() <= state->write_count() + 1);
    }
}
