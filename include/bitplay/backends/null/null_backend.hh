#ifndef BITPLAY_BACKENDS_NULL_BACKEND_HH
#define BITPLAY_BACKENDS_NULL_BACKEND_HH

#include <memory>
#include <bitplay/export_bitplay.h>

// Public factory header for the Null backend

namespace bitplay {

class output_backend;

/**
 * Create a Null output backend instance.
 *
 * The Null backend provides:
 * - No actual audio output; write() sleeps for the playout time of the block
 * - Two devices, "hw:null" (exclusive) and "plughw:null" (converting)
 * - Exclusive claiming: a device that is open cannot be opened again
 * - Any format, channel count and rate except unknown/zero values
 *
 * @return New Null backend instance
 *
 * Example usage:
 * @code
 * auto backend = bitplay::create_null_backend();
 * backend->init();
 * @endcode
 */
BITPLAY_EXPORT std::unique_ptr<output_backend> create_null_backend();

} // namespace bitplay

#endif // BITPLAY_BACKENDS_NULL_BACKEND_HH
