/**
 * @file example_common.hh
 * @brief Common utilities for bitplay examples
 *
 * This header provides backend selection based on build configuration.
 */

#ifndef BITPLAY_EXAMPLE_COMMON_HH
#define BITPLAY_EXAMPLE_COMMON_HH

#include <iostream>
#include <memory>
#include <bitplay/sdk/output_backend.hh>

#ifdef BITPLAY_USE_ALSA_BACKEND
#include <bitplay_backends/alsa/alsa_backend.hh>
#else
#include <bitplay/backends/null/null_backend.hh>
#endif

namespace bitplay {
    namespace examples {
        /**
         * @brief Create the default backend based on build configuration
         * @return Shared pointer to the configured backend
         *
         * ALSA is used when it was built; otherwise the null backend lets the
         * examples run on machines without sound hardware.
         */
        inline std::shared_ptr <output_backend> create_default_backend() {
#ifdef BITPLAY_USE_ALSA_BACKEND
            return std::shared_ptr <output_backend>(create_alsa_backend());
#else
            return std::shared_ptr <output_backend>(create_null_backend());
#endif
        }

        /**
         * @brief Get the backend name for display
         * @return Name of the configured backend
         */
        inline const char* get_backend_name() {
#ifdef BITPLAY_USE_ALSA_BACKEND
            return "ALSA";
#else
            return "Null";
#endif
        }
    } // namespace examples
} // namespace bitplay

#endif // BITPLAY_EXAMPLE_COMMON_HH
