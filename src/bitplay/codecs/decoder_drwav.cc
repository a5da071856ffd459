#include <bitplay/codecs/decoder_drwav.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <bitplay/sdk/io_stream.hh>

#define DR_WAV_NO_STDIO
#define DR_WAV_IMPLEMENTATION
#define DRWAV_API static
#define DRWAV_PRIVATE static
#include <dr_wav.h>

extern "C" {
static size_t drwav_read_callback(void* const rwops, void* const dst, const size_t len) {
    return static_cast <bitplay::io_stream*>(rwops)->read(dst, len);
}

static drwav_bool32 drwav_seek_callback(void* const rwops_void, const int offset, const drwav_seek_origin origin) {
    auto* const rwops = static_cast <bitplay::io_stream*>(rwops_void);
    const auto rwops_size = rwops->get_size();
    const auto cur_pos = rwops->tell();

    auto seekIsPastEof = [=] {
        const auto abs_offset = static_cast <int64_t>(offset) + (origin == drwav_seek_origin_current ? cur_pos : 0);
        return abs_offset > rwops_size;
    };

    if (rwops_size < 0 || cur_pos < 0) {
        return false;
    }

    bitplay::seek_origin whence;
    switch (origin) {
        case drwav_seek_origin_start:
            whence = bitplay::seek_origin::set;
            break;
        case drwav_seek_origin_current:
            whence = bitplay::seek_origin::cur;
            break;
        default:
            return false;
    }
    return !seekIsPastEof() && rwops->seek(offset, whence) >= 0;
}
} // extern "C"

namespace bitplay {
    namespace {
        sample_encoding encoding_of(const drwav& handle) {
            switch (handle.translatedFormatTag) {
                case DR_WAVE_FORMAT_PCM:
                    switch (handle.bitsPerSample) {
                        case 8: return sample_encoding::pcm_u8;
                        case 16: return sample_encoding::pcm_16;
                        case 24: return sample_encoding::pcm_24;
                        case 32: return sample_encoding::pcm_32;
                        default: return sample_encoding::unknown;
                    }
                case DR_WAVE_FORMAT_IEEE_FLOAT:
                    switch (handle.bitsPerSample) {
                        case 32: return sample_encoding::float_32;
                        case 64: return sample_encoding::float_64;
                        default: return sample_encoding::unknown;
                    }
                case DR_WAVE_FORMAT_ADPCM:
                case DR_WAVE_FORMAT_DVI_ADPCM:
                case DR_WAVE_FORMAT_ALAW:
                case DR_WAVE_FORMAT_MULAW:
                    return sample_encoding::compressed;
                default:
                    return sample_encoding::unknown;
            }
        }
    }

    struct decoder_drwav::impl final {
        drwav m_handle{};
        sample_encoding m_encoding = sample_encoding::unknown;
    };

    decoder_drwav::decoder_drwav()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drwav::~decoder_drwav() {
        if (!is_open()) {
            return;
        }
        drwav_uninit(&m_pimpl->m_handle);
    }

    bool decoder_drwav::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }

        auto original_pos = rwops->tell();
        if (original_pos < 0) {
            return false;
        }

        drwav test_handle;
        bool result = drwav_init(&test_handle, drwav_read_callback, drwav_seek_callback, rwops, nullptr);
        if (result) {
            drwav_uninit(&test_handle);
        }

        rwops->seek(original_pos, seek_origin::set);
        return result;
    }

    const char* decoder_drwav::get_name() const {
        return "WAV (dr_wav)";
    }

    void decoder_drwav::open(io_stream* const rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops) {
            throw decoder_error("WAV decoder opened without a stream");
        }

        if (!drwav_init(&m_pimpl->m_handle, drwav_read_callback, drwav_seek_callback, rwops, nullptr)) {
            throw decoder_error("drwav_init failed");
        }
        m_pimpl->m_encoding = encoding_of(m_pimpl->m_handle);
        set_is_open(true);
        LOG_DEBUG("codecs", "WAV opened: tag", m_pimpl->m_handle.translatedFormatTag,
                  "bits", m_pimpl->m_handle.bitsPerSample,
                  "rate", m_pimpl->m_handle.sampleRate,
                  "channels", m_pimpl->m_handle.channels);
    }

    size_t decoder_drwav::do_read_s16(int16_t* const buf, size_t frames) {
        return static_cast <size_t>(drwav_read_pcm_frames_s16(&m_pimpl->m_handle, frames, buf));
    }

    size_t decoder_drwav::do_read_s32(int32_t* const buf, size_t frames) {
        return static_cast <size_t>(drwav_read_pcm_frames_s32(&m_pimpl->m_handle, frames, buf));
    }

    channels_t decoder_drwav::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_handle.channels);
    }

    sample_rate_t decoder_drwav::get_rate() const {
        return m_pimpl->m_handle.sampleRate;
    }

    sample_encoding decoder_drwav::get_encoding() const {
        return m_pimpl->m_encoding;
    }

    frame_count_t decoder_drwav::total_frames() const {
        return is_open() ? m_pimpl->m_handle.totalPCMFrameCount : 0;
    }

    frame_count_t decoder_drwav::tell_frame() const {
        return is_open() ? m_pimpl->m_handle.readCursorInPCMFrames : 0;
    }

    bool decoder_drwav::seek_to_frame(const frame_count_t frame) {
        if (!is_open() || frame > m_pimpl->m_handle.totalPCMFrameCount) {
            return false;
        }
        return drwav_seek_to_pcm_frame(&m_pimpl->m_handle, frame) == DRWAV_TRUE;
    }
}
