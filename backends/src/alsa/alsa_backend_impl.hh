/**
 * @file alsa_backend_impl.hh
 * @brief ALSA backend implementation
 * @ingroup alsa_backend
 */

#ifndef BITPLAY_ALSA_BACKEND_IMPL_HH
#define BITPLAY_ALSA_BACKEND_IMPL_HH

#include <bitplay/sdk/output_backend.hh>
#include <alsa/asoundlib.h>
#include <atomic>
#include <string>
#include <vector>

namespace bitplay {

/**
 * @class alsa_backend
 * @brief ALSA implementation of the output backend interface
 * @ingroup alsa_backend
 *
 * Enumeration probes device indices 0..max_probed_devices-1 of every card
 * reported by snd_card_next(). Opening uses SND_PCM_NONBLOCK so that a
 * device claimed by another stream fails immediately with EBUSY; the
 * handle is switched back to blocking mode before any write.
 *
 * @note Internal implementation class. Create instances via
 *       create_alsa_backend().
 */
class alsa_backend : public output_backend {
public:
    static constexpr int max_probed_devices = 8;

    alsa_backend() = default;
    ~alsa_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices() override;

    std::unique_ptr<output_stream> open_stream(const std::string& device_id,
                                               const audio_spec& spec,
                                               size_t period_frames) override;

    static snd_pcm_format_t to_alsa_format(audio_format fmt);

private:
    std::atomic<bool> m_initialized{false};
};

} // namespace bitplay

#endif // BITPLAY_ALSA_BACKEND_IMPL_HH
