/**
 * @file format_mapper.hh
 * @brief Source encoding to hardware format mapping
 * @ingroup playback
 */

#ifndef BITPLAY_FORMAT_MAPPER_HH
#define BITPLAY_FORMAT_MAPPER_HH

#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/audio_format.hh>

namespace bitplay {

    /**
     * @struct format_mapping
     * @brief Device sample format and in-memory element width for a source
     */
    struct format_mapping {
        audio_format device_format;  ///< Format the hardware is opened with
        uint8_t element_bits;        ///< 16 or 32, width of one decoded sample in memory

        [[nodiscard]] constexpr size_t element_bytes() const {
            return element_bits / 8u;
        }
    };

    /**
     * @brief Map a source encoding to the hardware format that carries it unchanged
     *
     * | encoding | device format | element |
     * |----------|---------------|---------|
     * | pcm_16   | s16le         | 16 bit  |
     * | pcm_24   | s32le         | 32 bit, left-justified |
     * | pcm_32   | s32le         | 32 bit  |
     *
     * @throws unsupported_format_error for every other encoding
     */
    BITPLAY_EXPORT format_mapping map_encoding(sample_encoding enc);

} // namespace bitplay

#endif // BITPLAY_FORMAT_MAPPER_HH
