#ifndef BITPLAY_CODECS_REGISTER_CODECS_HH
#define BITPLAY_CODECS_REGISTER_CODECS_HH

#include <bitplay/export_bitplay.h>
#include <memory>

namespace bitplay {
    class decoders_registry;

    /**
     * Register the lossless decoders (WAV, FLAC) with the provided registry.
     *
     * @param registry The registry to register decoders with
     */
    BITPLAY_EXPORT void register_lossless_codecs(decoders_registry& registry);

    /**
     * Create a new registry with the lossless decoders pre-registered.
     *
     * @return A shared pointer to a registry with all codecs registered
     */
    BITPLAY_EXPORT std::shared_ptr<decoders_registry> create_registry_with_lossless_codecs();
}

#endif // BITPLAY_CODECS_REGISTER_CODECS_HH
