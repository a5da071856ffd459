/**
 * @file pcm_block.hh
 * @brief Copy of one block of played samples
 * @ingroup analyzer
 */

#ifndef BITPLAY_PCM_BLOCK_HH
#define BITPLAY_PCM_BLOCK_HH

#include <cstdint>
#include <vector>
#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/audio_format.hh>
#include <bitplay/sdk/types.hh>

namespace bitplay {

    /**
     * @struct pcm_block
     * @brief Interleaved samples exactly as written to the device
     */
    struct pcm_block {
        audio_format format = audio_format::s16le;
        channels_t channels = 0;
        sample_rate_t sample_rate = 0;
        std::vector<uint8_t> data;

        [[nodiscard]] size_t frames() const {
            const size_t frame_bytes = static_cast<size_t>(audio_format_byte_size(format)) * channels;
            return frame_bytes == 0 ? 0 : data.size() / frame_bytes;
        }
    };

    /**
     * @class pcm_sink
     * @brief Receiver of block copies from the streaming loop
     *
     * push() is called on the streaming thread and must return promptly.
     * Exceptions it throws are logged and otherwise ignored by the player.
     */
    class BITPLAY_EXPORT pcm_sink {
        public:
            virtual ~pcm_sink() = default;

            virtual void push(pcm_block block) = 0;
    };

} // namespace bitplay

#endif // BITPLAY_PCM_BLOCK_HH
