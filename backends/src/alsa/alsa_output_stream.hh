/**
 * @file alsa_output_stream.hh
 * @brief Blocking ALSA playback stream
 * @ingroup alsa_backend
 */

#ifndef BITPLAY_ALSA_OUTPUT_STREAM_HH
#define BITPLAY_ALSA_OUTPUT_STREAM_HH

#include <bitplay/sdk/output_backend.hh>
#include <alsa/asoundlib.h>
#include <string>

namespace bitplay {

/**
 * @class alsa_output_stream
 * @brief Owns a configured, prepared snd_pcm_t handle
 *
 * write() loops over snd_pcm_writei() until the whole block is queued.
 * Underruns and suspends are recovered with snd_pcm_recover(); any other
 * error is reported as device_write_error.
 */
class alsa_output_stream : public output_stream {
public:
    alsa_output_stream(snd_pcm_t* handle, std::string device_id, const audio_spec& spec);
    ~alsa_output_stream() override;

    alsa_output_stream(const alsa_output_stream&) = delete;
    alsa_output_stream& operator=(const alsa_output_stream&) = delete;

    void write(const void* data, size_t frames) override;
    void close() override;
    bool is_open() const override;
    audio_spec get_spec() const override;

private:
    snd_pcm_t* m_handle;
    std::string m_device_id;
    audio_spec m_spec;
    size_t m_frame_bytes;
};

} // namespace bitplay

#endif // BITPLAY_ALSA_OUTPUT_STREAM_HH
