/**
 * @file audio_format.hh
 * @brief Device sample formats and source sample encodings
 * @ingroup sdk_audio_format
 */

#ifndef BITPLAY_SDK_AUDIO_FORMAT_HH
#define BITPLAY_SDK_AUDIO_FORMAT_HH

#include <bitplay/sdk/types.hh>
#include <bitplay/export_bitplay.h>
#include <iosfwd>

namespace bitplay {

/**
 * @defgroup sdk_audio_format Audio Formats
 * @ingroup sdk
 * @brief Sample format definitions
 * @{
 */

/**
 * @enum audio_format
 * @brief Hardware sample format enumeration
 *
 * Format the output device is configured with. Only the two signed
 * little-endian integer containers are ever requested; 24-bit sources
 * travel in s32le. Bits 0-7 of the value hold the bit size and bit 15
 * marks a signed format.
 *
 * @code
 * audio_format fmt = audio_format::s16le;  // CD quality format
 * size_t bytes = audio_format_byte_size(fmt);  // Returns 2
 * @endcode
 */
enum class audio_format : uint16_t {
    unknown = 0,          ///< Unknown or uninitialized format
    s16le = 0x8010,      ///< Signed 16-bit little-endian (CD/WAV standard)
    s32le = 0x8020       ///< Signed 32-bit little-endian (also carries 24-bit)
};

inline constexpr uint8_t audio_format_bit_size(audio_format fmt) {
    return static_cast<uint8_t>(static_cast<uint16_t>(fmt) & 0xFF);
}

inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
    return audio_format_bit_size(fmt) / 8;
}

/**
 * @enum sample_encoding
 * @brief Sample encoding of a source file as reported by its decoder
 *
 * Only pcm_16, pcm_24 and pcm_32 can travel to the hardware unchanged;
 * see map_encoding().
 */
enum class sample_encoding : uint8_t {
    unknown = 0,   ///< Decoder could not tell
    pcm_u8,        ///< Unsigned 8-bit integer PCM
    pcm_s8,        ///< Signed 8-bit integer PCM
    pcm_16,        ///< Signed 16-bit integer PCM
    pcm_24,        ///< Signed 24-bit integer PCM
    pcm_32,        ///< Signed 32-bit integer PCM
    float_32,      ///< IEEE 754 single precision
    float_64,      ///< IEEE 754 double precision
    compressed     ///< ADPCM, A-law, u-law and other lossy/companded data
};

/**
 * @brief Check whether an encoding is integer PCM of 16, 24 or 32 bits
 */
inline constexpr bool sample_encoding_is_wide_pcm(sample_encoding enc) {
    return enc == sample_encoding::pcm_16 ||
           enc == sample_encoding::pcm_24 ||
           enc == sample_encoding::pcm_32;
}

/**
 * @struct audio_spec
 * @brief Complete hardware stream specification
 *
 * @code
 * // 24-bit / 96 kHz source in a 32-bit container
 * audio_spec spec{audio_format::s32le, 2, 96000};
 * @endcode
 */
struct audio_spec {
    audio_format format;  ///< Sample format
    channels_t channels;  ///< Number of channels (1=mono, 2=stereo, etc.)
    sample_rate_t freq;   ///< Sample rate in Hz
};

inline bool operator==(const audio_spec& a, const audio_spec& b) {
    return a.format == b.format && a.channels == b.channels && a.freq == b.freq;
}

inline bool operator!=(const audio_spec& a, const audio_spec& b) {
    return !(a == b);
}

/**
 * @brief Size in bytes of one interleaved frame
 */
inline constexpr size_t audio_spec_frame_bytes(const audio_spec& spec) {
    return static_cast<size_t>(audio_format_byte_size(spec.format)) * spec.channels;
}

BITPLAY_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);

BITPLAY_EXPORT std::ostream& operator<<(std::ostream& os, sample_encoding enc);

/**
 * @brief Human readable encoding name ("PCM_16", "FLOAT", ...)
 */
BITPLAY_EXPORT const char* sample_encoding_name(sample_encoding enc);

/** @} */ // end of sdk_audio_format group

} // namespace bitplay

#endif // BITPLAY_SDK_AUDIO_FORMAT_HH
