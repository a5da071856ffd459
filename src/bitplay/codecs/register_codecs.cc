#include <bitplay/codecs/register_codecs.hh>
#include <bitplay/sdk/decoders_registry.hh>

#include <bitplay/codecs/decoder_drwav.hh>
#include <bitplay/codecs/decoder_drflac.hh>

namespace bitplay {

void register_lossless_codecs(decoders_registry& registry) {
    registry.register_decoder(
        decoder_drwav::accept,
        []() { return std::make_unique<decoder_drwav>(); },
        100
    );

    registry.register_decoder(
        decoder_drflac::accept,
        []() { return std::make_unique<decoder_drflac>(); },
        80
    );
}

std::shared_ptr<decoders_registry> create_registry_with_lossless_codecs() {
    auto registry = std::make_shared<decoders_registry>();
    register_lossless_codecs(*registry);
    return registry;
}

} // namespace bitplay
