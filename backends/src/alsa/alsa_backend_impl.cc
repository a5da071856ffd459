#include "alsa_backend_impl.hh"
#include "alsa_output_stream.hh"
#include <bitplay/bit_perfect.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace bitplay {
    namespace {
        std::string card_name(int card) {
            char* name = nullptr;
            if (snd_card_get_name(card, &name) < 0 || !name) {
                return "card " + std::to_string(card);
            }
            std::string result(name);
            std::free(name);
            return result;
        }

        // The device exists and is a playback endpoint, even if somebody holds it
        bool probe_playback(const std::string& id) {
            snd_pcm_t* pcm = nullptr;
            const int err = snd_pcm_open(&pcm, id.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
            if (err == 0) {
                snd_pcm_close(pcm);
                return true;
            }
            return err == -EBUSY;
        }

        // Close the handle and raise a configuration error
        [[noreturn]] void fail_config(snd_pcm_t* pcm, const std::string& id, const std::string& what, int err) {
            snd_pcm_close(pcm);
            throw device_config_error(id + ": " + what + ": " + snd_strerror(err));
        }
    }

    alsa_backend::~alsa_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void alsa_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("ALSA backend already initialized");
        }
        LOG_INFO("alsa", "ALSA library", snd_asoundlib_version());
        m_initialized = true;
    }

    void alsa_backend::shutdown() {
        m_initialized = false;
    }

    std::string alsa_backend::get_name() const {
        return "ALSA";
    }

    bool alsa_backend::is_initialized() const {
        return m_initialized;
    }

    snd_pcm_format_t alsa_backend::to_alsa_format(audio_format fmt) {
        switch (fmt) {
            case audio_format::s16le: return SND_PCM_FORMAT_S16_LE;
            case audio_format::s32le: return SND_PCM_FORMAT_S32_LE;
            case audio_format::unknown: break;
        }
        return SND_PCM_FORMAT_UNKNOWN;
    }

    std::vector <device_info> alsa_backend::enumerate_devices() {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        std::vector <device_info> devices;
        int card = -1;
        while (snd_card_next(&card) == 0 && card >= 0) {
            const std::string name = card_name(card);
            for (int dev = 0; dev < max_probed_devices; dev++) {
                const std::string suffix = std::to_string(card) + "," + std::to_string(dev);
                if (!probe_playback("hw:" + suffix)) {
                    continue;
                }
                devices.push_back({"hw:" + suffix,
                                   name + " (dev " + std::to_string(dev) + ")",
                                   device_kind::exclusive, card, dev});
                devices.push_back({"plughw:" + suffix,
                                   name + " (dev " + std::to_string(dev) + ", converted)",
                                   device_kind::converting, card, dev});
            }
        }

        LOG_INFO("alsa", "Detected", devices.size() / 2, "playback endpoints");
        for (const auto& d : devices) {
            LOG_DEBUG("alsa", d);
        }
        return devices;
    }

    std::unique_ptr <output_stream> alsa_backend::open_stream(const std::string& device_id,
                                                              const audio_spec& spec,
                                                              size_t period_frames) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }
        const snd_pcm_format_t format = to_alsa_format(spec.format);
        if (format == SND_PCM_FORMAT_UNKNOWN) {
            throw device_config_error(device_id + ": no ALSA equivalent for sample format");
        }

        snd_pcm_t* pcm = nullptr;
        int err = snd_pcm_open(&pcm, device_id.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
        if (err == -EBUSY || err == -EAGAIN) {
            throw device_busy_error(device_id + ": " + snd_strerror(err));
        }
        if (err < 0) {
            throw device_error("cannot open " + device_id + ": " + snd_strerror(err));
        }
        // writes block on hardware back-pressure
        if ((err = snd_pcm_nonblock(pcm, 0)) < 0) {
            fail_config(pcm, device_id, "cannot switch to blocking mode", err);
        }

        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);
        if ((err = snd_pcm_hw_params_any(pcm, hw_params)) < 0) {
            fail_config(pcm, device_id, "no configuration space", err);
        }
        if ((err = snd_pcm_hw_params_set_access(pcm, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
            fail_config(pcm, device_id, "interleaved access refused", err);
        }
        if ((err = snd_pcm_hw_params_set_rate_resample(pcm, hw_params, 0)) < 0) {
            fail_config(pcm, device_id, "cannot disable resampling", err);
        }
        if ((err = snd_pcm_hw_params_set_format(pcm, hw_params, format)) < 0) {
            fail_config(pcm, device_id, std::string("format ") + snd_pcm_format_name(format) + " refused", err);
        }
        if ((err = snd_pcm_hw_params_set_channels(pcm, hw_params, spec.channels)) < 0) {
            fail_config(pcm, device_id, std::to_string(spec.channels) + " channels refused", err);
        }
        if ((err = snd_pcm_hw_params_set_rate(pcm, hw_params, spec.freq, 0)) < 0) {
            fail_config(pcm, device_id, std::to_string(spec.freq) + " Hz refused", err);
        }

        auto period = static_cast<snd_pcm_uframes_t>(period_frames);
        if (period > 0 && (err = snd_pcm_hw_params_set_period_size_near(pcm, hw_params, &period, nullptr)) < 0) {
            fail_config(pcm, device_id, "period size refused", err);
        }
        snd_pcm_uframes_t buffer_frames = std::max<snd_pcm_uframes_t>(period * 4, 1);
        if (period > 0 && (err = snd_pcm_hw_params_set_buffer_size_near(pcm, hw_params, &buffer_frames)) < 0) {
            fail_config(pcm, device_id, "buffer size refused", err);
        }
        if ((err = snd_pcm_hw_params(pcm, hw_params)) < 0) {
            fail_config(pcm, device_id, "cannot apply hardware parameters", err);
        }
        snd_pcm_hw_params_get_period_size(hw_params, &period, nullptr);
        snd_pcm_hw_params_get_buffer_size(hw_params, &buffer_frames);

        if ((err = snd_pcm_prepare(pcm)) < 0) {
            fail_config(pcm, device_id, "prepare failed", err);
        }

        LOG_INFO("alsa", "Opened", device_id, snd_pcm_format_name(format),
                 static_cast<int>(spec.channels), "ch", spec.freq, "Hz, period", period,
                 "buffer", buffer_frames, is_exclusive_device_id(device_id) ? "(exclusive)" : "(converting)");
        return std::make_unique <alsa_output_stream>(pcm, device_id, spec);
    }
}
