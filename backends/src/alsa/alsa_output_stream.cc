#include "alsa_output_stream.hh"
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <cerrno>

namespace bitplay {

    alsa_output_stream::alsa_output_stream(snd_pcm_t* handle, std::string device_id, const audio_spec& spec)
        : m_handle(handle),
          m_device_id(std::move(device_id)),
          m_spec(spec),
          m_frame_bytes(audio_spec_frame_bytes(spec)) {
    }

    alsa_output_stream::~alsa_output_stream() {
        close();
    }

    void alsa_output_stream::write(const void* data, size_t frames) {
        if (!m_handle) {
            throw device_write_error(m_device_id + " is closed");
        }
        const auto* p = static_cast<const uint8_t*>(data);
        auto left = static_cast<snd_pcm_uframes_t>(frames);
        while (left > 0) {
            const snd_pcm_sframes_t n = snd_pcm_writei(m_handle, p, left);
            if (n == -EAGAIN) {
                snd_pcm_wait(m_handle, 100);
                continue;
            }
            if (n < 0) {
                const int err = snd_pcm_recover(m_handle, static_cast<int>(n), 1);
                if (err < 0) {
                    throw device_write_error(m_device_id + ": " + snd_strerror(err));
                }
                LOG_WARN("alsa", "Recovered from", snd_strerror(static_cast<int>(n)), "on", m_device_id);
                continue;
            }
            p += static_cast<size_t>(n) * m_frame_bytes;
            left -= static_cast<snd_pcm_uframes_t>(n);
        }
    }

    void alsa_output_stream::close() {
        if (!m_handle) {
            return;
        }
        snd_pcm_drop(m_handle);
        snd_pcm_close(m_handle);
        m_handle = nullptr;
        LOG_DEBUG("alsa", "Closed", m_device_id);
    }

    bool alsa_output_stream::is_open() const {
        return m_handle != nullptr;
    }

    audio_spec alsa_output_stream::get_spec() const {
        return m_spec;
    }

} // namespace bitplay
