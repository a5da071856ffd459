/**
 * @file alsa_backend_factory.cc
 * @brief ALSA backend factory implementation
 * @ingroup alsa_backend
 */

#include <bitplay_backends/alsa/alsa_backend.hh>
#include "alsa_backend_impl.hh"

namespace bitplay {

std::unique_ptr<output_backend> create_alsa_backend() {
    return std::make_unique<alsa_backend>();
}

} // namespace bitplay
