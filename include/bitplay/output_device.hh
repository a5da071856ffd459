/**
 * @file output_device.hh
 * @brief RAII playback device with bounded open retry
 * @ingroup playback
 */

#ifndef BITPLAY_OUTPUT_DEVICE_HH
#define BITPLAY_OUTPUT_DEVICE_HH

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/output_backend.hh>

namespace bitplay {

    /**
     * @struct retry_policy
     * @brief Backoff schedule for opening a claimed device
     *
     * Attempt n (1-based) that fails with device_busy_error waits short_delay
     * while n <= escalate_after and long_delay afterwards. After max_attempts
     * failed attempts the open gives up.
     */
    struct retry_policy {
        unsigned max_attempts = 20;
        unsigned escalate_after = 5;
        std::chrono::milliseconds short_delay{50};
        std::chrono::milliseconds long_delay{250};

        [[nodiscard]] std::chrono::milliseconds delay_after(unsigned attempt) const {
            return attempt <= escalate_after ? short_delay : long_delay;
        }
    };

    /**
     * @class output_device
     * @brief An open hardware stream owned for the length of one playback session
     *
     * The stream is closed when the object is destroyed, on every exit path of
     * the streaming loop.
     *
     * @code
     * auto dev = output_device::open(backend, "hw:1,0", spec, 2048, {}, &stop);
     * if (!dev) {
     *     return; // stop requested while waiting for the device
     * }
     * dev->write(block.data(), frames);
     * @endcode
     */
    class BITPLAY_EXPORT output_device {
        private:
            struct open_tag {};

        public:
            /**
             * @brief Open a stream, retrying while the device is busy
             *
             * @param cancel Optional flag polled during backoff waits
             * @return The open device, or nullptr if cancel was raised first
             * @throws device_unavailable_error when all attempts found the device busy
             * @throws device_config_error and other device errors immediately
             */
            static std::unique_ptr<output_device> open(output_backend& backend,
                                                       const std::string& device_id,
                                                       const audio_spec& spec,
                                                       size_t period_frames,
                                                       const retry_policy& policy,
                                                       const std::atomic<bool>* cancel = nullptr);

            /**
             * Only open() can name open_tag.
             */
            output_device(open_tag, std::unique_ptr<output_stream> stream, std::string device_id,
                          const audio_spec& spec, unsigned attempts);

            ~output_device();

            output_device(const output_device&) = delete;
            output_device& operator=(const output_device&) = delete;

            /**
             * @brief Write interleaved frames; blocks on hardware back-pressure
             * @throws device_write_error
             */
            void write(const void* data, size_t frames);

            void close();

            [[nodiscard]] bool is_open() const;

            [[nodiscard]] const std::string& device_id() const;

            [[nodiscard]] const audio_spec& spec() const;

            /**
             * @brief Number of open attempts it took to acquire the device
             */
            [[nodiscard]] unsigned attempts() const;

        private:
            std::unique_ptr<output_stream> m_stream;
            std::string m_device_id;
            audio_spec m_spec;
            unsigned m_attempts;
    };

} // namespace bitplay

#endif // BITPLAY_OUTPUT_DEVICE_HH
