/**
 * @file bit_perfect.hh
 * @brief Bit-perfect pipeline classification
 * @ingroup playback
 */

#ifndef BITPLAY_BIT_PERFECT_HH
#define BITPLAY_BIT_PERFECT_HH

#include <string>
#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/audio_format.hh>

namespace bitplay {

    /**
     * @struct bit_perfect_verdict
     * @brief Result of classifying one stream open
     *
     * reason is empty when bit_perfect is true.
     */
    struct bit_perfect_verdict {
        bool bit_perfect = false;
        std::string reason;
    };

    /**
     * @brief Check whether a device identifier grants exclusive hardware access
     *
     * True for ALSA "hw:" names only. "plughw:", "default", "dmix" and every
     * other plugin name may convert samples.
     */
    BITPLAY_EXPORT bool is_exclusive_device_id(const std::string& device_id);

    /**
     * @brief Classify a (device, source encoding) combination
     *
     * Certifies the pipeline configuration only. Plugins the system attaches
     * behind an exclusive name are not detected.
     */
    BITPLAY_EXPORT bit_perfect_verdict classify_bit_perfect(const std::string& device_id,
                                                            sample_encoding enc);

    /**
     * @brief Verdict for a stream whose device could not be opened
     */
    BITPLAY_EXPORT bit_perfect_verdict device_open_failed_verdict(const std::string& details);

} // namespace bitplay

#endif // BITPLAY_BIT_PERFECT_HH
