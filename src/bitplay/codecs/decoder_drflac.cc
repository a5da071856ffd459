#include <bitplay/codecs/decoder_drflac.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <bitplay/sdk/io_stream.hh>

#define DR_FLAC_NO_STDIO
#define DR_FLAC_NO_OGG
#define DR_FLAC_IMPLEMENTATION
#define DRFLAC_API static
#define DRFLAC_PRIVATE static
#include <dr_flac.h>

extern "C" {
static size_t drflac_read_callback(void* const rwops, void* const dst, const size_t len) {
    return static_cast <bitplay::io_stream*>(rwops)->read(dst, len);
}

static drflac_bool32 drflac_seek_callback(void* const rwops_void, const int offset, const drflac_seek_origin origin) {
    auto* const rwops = static_cast <bitplay::io_stream*>(rwops_void);
    const auto rwops_size = rwops->get_size();
    const auto cur_pos = rwops->tell();

    auto seekIsPastEof = [=] {
        const auto abs_offset = static_cast <int64_t>(offset) + (origin == drflac_seek_origin_current ? cur_pos : 0);
        return abs_offset > rwops_size;
    };

    if (rwops_size < 0 || cur_pos < 0) {
        return false;
    }

    bitplay::seek_origin whence;
    switch (origin) {
        case drflac_seek_origin_start:
            whence = bitplay::seek_origin::set;
            break;
        case drflac_seek_origin_current:
            whence = bitplay::seek_origin::cur;
            break;
        default:
            return false;
    }
    return !seekIsPastEof() && rwops->seek(offset, whence) >= 0;
}
} // extern "C"

namespace bitplay {
    struct decoder_drflac::impl final {
        drflac* m_handle = nullptr;
        sample_encoding m_encoding = sample_encoding::unknown;
    };

    decoder_drflac::decoder_drflac()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drflac::~decoder_drflac() {
        if (m_pimpl->m_handle) {
            drflac_close(m_pimpl->m_handle);
        }
    }

    bool decoder_drflac::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }

        auto original_pos = rwops->tell();
        if (original_pos < 0) {
            return false;
        }

        drflac* test_handle = drflac_open(drflac_read_callback, drflac_seek_callback, rwops, nullptr);
        bool result = test_handle != nullptr;
        if (test_handle) {
            drflac_close(test_handle);
        }

        rwops->seek(original_pos, seek_origin::set);
        return result;
    }

    const char* decoder_drflac::get_name() const {
        return "FLAC (dr_flac)";
    }

    void decoder_drflac::open(io_stream* const rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops) {
            throw decoder_error("FLAC decoder opened without a stream");
        }

        m_pimpl->m_handle = drflac_open(drflac_read_callback, drflac_seek_callback, rwops, nullptr);
        if (!m_pimpl->m_handle) {
            throw decoder_error("drflac_open failed");
        }
        switch (m_pimpl->m_handle->bitsPerSample) {
            case 8:
                m_pimpl->m_encoding = sample_encoding::pcm_s8;
                break;
            case 16:
                m_pimpl->m_encoding = sample_encoding::pcm_16;
                break;
            case 24:
                m_pimpl->m_encoding = sample_encoding::pcm_24;
                break;
            case 32:
                m_pimpl->m_encoding = sample_encoding::pcm_32;
                break;
            default:
                // 12 and 20 bit streams have no exact hardware container
                m_pimpl->m_encoding = sample_encoding::unknown;
                break;
        }
        set_is_open(true);
        LOG_DEBUG("codecs", "FLAC opened: bits", m_pimpl->m_handle->bitsPerSample,
                  "rate", m_pimpl->m_handle->sampleRate,
                  "channels", m_pimpl->m_handle->channels);
    }

    size_t decoder_drflac::do_read_s16(int16_t* const buf, size_t frames) {
        return static_cast <size_t>(drflac_read_pcm_frames_s16(m_pimpl->m_handle, frames, buf));
    }

    size_t decoder_drflac::do_read_s32(int32_t* const buf, size_t frames) {
        return static_cast <size_t>(drflac_read_pcm_frames_s32(m_pimpl->m_handle, frames, buf));
    }

    channels_t decoder_drflac::get_channels() const {
        return m_pimpl->m_handle ? static_cast <channels_t>(m_pimpl->m_handle->channels) : channels_t{0};
    }

    sample_rate_t decoder_drflac::get_rate() const {
        return m_pimpl->m_handle ? m_pimpl->m_handle->sampleRate : 0;
    }

    sample_encoding decoder_drflac::get_encoding() const {
        return m_pimpl->m_encoding;
    }

    frame_count_t decoder_drflac::total_frames() const {
        return m_pimpl->m_handle ? m_pimpl->m_handle->totalPCMFrameCount : 0;
    }

    frame_count_t decoder_drflac::tell_frame() const {
        return m_pimpl->m_handle ? m_pimpl->m_handle->currentPCMFrame : 0;
    }

    bool decoder_drflac::seek_to_frame(const frame_count_t frame) {
        if (!is_open()) {
            return false;
        }
        const auto total = m_pimpl->m_handle->totalPCMFrameCount;
        if (total != 0 && frame > total) {
            return false;
        }
        return drflac_seek_to_pcm_frame(m_pimpl->m_handle, frame) == DRFLAC_TRUE;
    }
}
