/**
 * @file output_backend.hh
 * @brief Platform playback backend interface
 * @ingroup backends
 */

#ifndef BITPLAY_SDK_OUTPUT_BACKEND_HH
#define BITPLAY_SDK_OUTPUT_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <bitplay/sdk/audio_format.hh>
#include <bitplay/sdk/types.hh>
#include <bitplay/export_bitplay.h>

namespace bitplay {

/**
 * @enum device_kind
 * @brief Whether an output identifier bypasses the system conversion layer
 * @ingroup backends
 */
enum class device_kind {
    exclusive,   ///< Sole, unmediated hardware access (ALSA "hw:")
    converting   ///< Passes through a plugin that may convert or resample
};

/**
 * @struct device_info
 * @brief Output device descriptor
 * @ingroup backends
 *
 * Every probed hardware endpoint is exposed twice, once per kind, so the
 * caller chooses between bit-perfect access and a converting path.
 */
struct device_info {
    std::string id;             ///< Backend identifier ("hw:1,0", "plughw:1,0")
    std::string label;          ///< Human-readable label
    device_kind kind;           ///< exclusive or converting
    int card_index;             ///< Physical card index, -1 if not applicable
    int device_index;           ///< Device index on the card, -1 if not applicable
};

/**
 * @brief Stream output operator for device_info
 */
inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "id=\"" << info.id << "\", "
       << "label=\"" << info.label << "\", "
       << "kind=" << (info.kind == device_kind::exclusive ? "exclusive" : "converting") << ", "
       << "card=" << info.card_index << ", "
       << "device=" << info.device_index
       << "}";
    return os;
}

/**
 * @class output_stream
 * @brief An open, configured playback stream
 * @ingroup backends
 *
 * Data is pushed by the caller; write() blocks until the hardware has
 * accepted the whole block, which is the only flow control on the path.
 */
class BITPLAY_EXPORT output_stream {
public:
    virtual ~output_stream() = default;

    /**
     * Write interleaved frames in the format the stream was opened with.
     * @param data Interleaved samples, frames * channels elements
     * @param frames Number of frames
     * @throws device_write_error if the device fails (xruns are recovered in place)
     */
    virtual void write(const void* data, size_t frames) = 0;

    /**
     * Drop pending frames and release the device. Idempotent.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /**
     * Get the exact configuration the hardware runs with.
     */
    [[nodiscard]] virtual audio_spec get_spec() const = 0;
};

/**
 * @class output_backend
 * @brief Abstract interface for platform playback subsystems
 * @ingroup backends
 *
 * ## Implementing a Backend
 *
 * @code
 * class my_backend : public output_backend {
 * public:
 *     void init() override;
 *     std::vector<device_info> enumerate_devices() override;
 *     std::unique_ptr<output_stream> open_stream(const std::string& id,
 *                                                const audio_spec& spec,
 *                                                size_t period_frames) override;
 *     // ...
 * };
 * @endcode
 *
 * ## Thread Safety
 *
 * - init()/shutdown() must be called from the owning thread
 * - enumerate_devices() and open_stream() are thread-safe after init()
 * - A single output_stream must only be used by one thread at a time
 */
class BITPLAY_EXPORT output_backend {
public:
    virtual ~output_backend() = default;

    /**
     * Initialize the audio subsystem.
     * @throws std::runtime_error if initialization fails
     */
    virtual void init() = 0;

    virtual void shutdown() = 0;

    /**
     * Get the name of this backend ("ALSA", "Null", ...).
     */
    [[nodiscard]] virtual std::string get_name() const = 0;

    [[nodiscard]] virtual bool is_initialized() const = 0;

    /**
     * Enumerate playback devices.
     * @return One exclusive and one converting entry per probed endpoint
     */
    virtual std::vector<device_info> enumerate_devices() = 0;

    /**
     * Open a playback stream with exactly the requested configuration.
     *
     * No format, channel or rate negotiation takes place.
     *
     * @param device_id Identifier from enumerate_devices() or a raw backend name
     * @param spec Format, channel count and rate the hardware must accept
     * @param period_frames Preferred hardware period in frames
     * @throws device_busy_error if the device is claimed by another stream
     * @throws device_config_error if the device refuses the exact spec
     */
    virtual std::unique_ptr<output_stream> open_stream(const std::string& device_id,
                                                       const audio_spec& spec,
                                                       size_t period_frames) = 0;
};

} // namespace bitplay

#endif // BITPLAY_SDK_OUTPUT_BACKEND_HH
