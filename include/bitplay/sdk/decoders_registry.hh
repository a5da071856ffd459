/**
 * @file decoders_registry.hh
 * @brief Registry that picks a decoder for a byte stream
 * @ingroup sdk_decoders
 */

#pragma once

#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/io_stream.hh>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bitplay {

    class decoder;

    /**
     * @class decoders_registry
     * @brief Ordered list of (accept, factory) pairs
     *
     * find_decoder() asks every registered accept function, highest priority
     * first, whether it understands the stream. The stream position is
     * restored after each probe, so the returned decoder can be opened on
     * the same stream.
     *
     * @code
     * auto registry = create_registry_with_lossless_codecs();
     * auto io = io_from_file("track.flac");
     * auto dec = registry->find_decoder(io.get());
     * if (dec) {
     *     dec->open(io.get());
     * }
     * @endcode
     *
     * Registration is not thread-safe; lookups on a registry that is no
     * longer modified are.
     */
    class BITPLAY_EXPORT decoders_registry {
    public:
        using accept_func_t = std::function<bool(io_stream*)>;

        using factory_func_t = std::function<std::unique_ptr<decoder>()>;

        void register_decoder(accept_func_t accept,
                            factory_func_t factory,
                            int priority = 0);

        [[nodiscard]] std::unique_ptr<decoder> find_decoder(io_stream* stream) const;

        [[nodiscard]] bool can_decode(io_stream* stream) const;

        [[nodiscard]] size_t size() const;

        void clear();

    private:
        struct decoder_entry {
            accept_func_t accept;
            factory_func_t factory;
            int priority;
        };

        const decoder_entry* find_entry(io_stream* stream) const;

        std::vector<decoder_entry> m_decoders;
    };

} // namespace bitplay
