#include <bitplay/audio_source.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>

namespace bitplay {

    audio_source::audio_source(std::unique_ptr<io_stream> rwops, const decoders_registry& registry)
        : m_rwops(std::move(rwops)) {
        if (!m_rwops) {
            THROW_RUNTIME("No IO stream provided to audio_source");
        }

        m_decoder = registry.find_decoder(m_rwops.get());
        if (!m_decoder) {
            throw decoder_error("no suitable decoder found for the audio data");
        }

        try {
            m_decoder->open(m_rwops.get());
        } catch (const decoder_error&) {
            throw;
        } catch (const std::exception& e) {
            throw decoder_error(std::string("failed to open audio decoder: ") + e.what());
        }
        LOG_DEBUG("codecs", "Source opened with", m_decoder->get_name());
    }

    std::unique_ptr<audio_source> audio_source::from_file(const std::string& path,
                                                          const decoders_registry& registry) {
        auto rwops = io_from_file(path.c_str());
        if (!rwops) {
            throw io_error("cannot open " + path);
        }
        return std::make_unique<audio_source>(std::move(rwops), registry);
    }

    audio_source::~audio_source() {
        // decoder reads through m_rwops, release it first
        m_decoder.reset();
    }

    channels_t audio_source::get_channels() const {
        return m_decoder->get_channels();
    }

    sample_rate_t audio_source::get_rate() const {
        return m_decoder->get_rate();
    }

    sample_encoding audio_source::get_encoding() const {
        return m_decoder->get_encoding();
    }

    frame_count_t audio_source::total_frames() const {
        return m_decoder->total_frames();
    }

    frame_count_t audio_source::tell_frame() const {
        if (m_at_end) {
            return total_frames();
        }
        return m_decoder->tell_frame();
    }

    double audio_source::duration_seconds() const {
        const auto rate = get_rate();
        if (rate == 0) {
            return 0.0;
        }
        return static_cast<double>(total_frames()) / rate;
    }

    void audio_source::seek_to_frame(frame_count_t frame) {
        const auto total = total_frames();
        // a seek to the end parks past the last frame without touching the codec
        if (total > 0 && frame >= total) {
            m_at_end = true;
            return;
        }
        m_at_end = false;
        if (!m_decoder->seek_to_frame(frame)) {
            throw decoder_error("seek to frame " + std::to_string(frame) + " failed");
        }
    }

    size_t audio_source::read_frames(void* buf, size_t frames, uint8_t element_bits) {
        if (m_at_end) {
            return 0;
        }
        switch (element_bits) {
            case 16:
                return m_decoder->read_s16(static_cast<int16_t*>(buf), frames);
            case 32:
                return m_decoder->read_s32(static_cast<int32_t*>(buf), frames);
            default:
                THROW_RUNTIME("unsupported element width ", static_cast<int>(element_bits));
        }
    }

}
