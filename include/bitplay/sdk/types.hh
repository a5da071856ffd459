/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef BITPLAY_SDK_TYPES_HH
#define BITPLAY_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace bitplay {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 *
 * bitplay uses specific type aliases for audio-related values to keep
 * signatures self-describing.
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates
 *
 * Number of frames per second (Hz). Hi-res sources commonly use
 * 88200, 96000, 176400 or 192000 Hz; the value is passed to the hardware
 * untouched.
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * Range: 1 to 255 channels (uint8_t max)
 */
using channels_t = uint8_t;

/**
 * @typedef frame_count_t
 * @brief Type for frame offsets and frame counts
 *
 * A frame holds one sample per channel.
 */
using frame_count_t = uint64_t;

/**
 * @typedef track_id_t
 * @brief Identity of a track in the library
 */
using track_id_t = int;

/** @} */ // end of sdk_types group

} // namespace bitplay

#endif // BITPLAY_SDK_TYPES_HH
