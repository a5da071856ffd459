/**
 * @file alsa_backend.hh
 * @brief ALSA output backend factory
 * @ingroup backends
 */

#ifndef BITPLAY_BACKENDS_ALSA_BACKEND_HH
#define BITPLAY_BACKENDS_ALSA_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_bitplay_backend_alsa.h"

namespace bitplay {

/**
 * @defgroup alsa_backend ALSA Output Backend
 * @ingroup backends
 * @brief Direct ALSA PCM access for bit-perfect playback
 *
 * Devices are addressed by ALSA PCM names. "hw:C,D" talks to the card
 * without any plugin and is reported as exclusive; "plughw:C,D" goes
 * through the plug layer, which converts sample formats and channel
 * counts, and is reported as converting.
 *
 * Streams are configured with the exact format, channel count and rate
 * requested. ALSA rate resampling is switched off, so a rate the card
 * cannot run natively fails instead of being converted.
 *
 * @{
 */

class output_backend;

/**
 * @brief Create an ALSA backend instance
 * @return New ALSA backend instance; call init() before use
 *
 * @code
 * #include <bitplay_backends/alsa/alsa_backend.hh>
 *
 * auto backend = std::shared_ptr<bitplay::output_backend>(bitplay::create_alsa_backend());
 * backend->init();
 * for (const auto& dev : backend->enumerate_devices()) {
 *     std::cout << dev << "\n";
 * }
 * @endcode
 */
BITPLAY_BACKEND_ALSA_EXPORT std::unique_ptr<output_backend> create_alsa_backend();

/** @} */ // end of alsa_backend group

} // namespace bitplay

#endif // BITPLAY_BACKENDS_ALSA_BACKEND_HH
