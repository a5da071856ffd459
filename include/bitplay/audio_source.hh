/**
 * @file audio_source.hh
 * @brief Decoded PCM source bound to its byte stream
 * @ingroup playback
 */

#ifndef BITPLAY_AUDIO_SOURCE_HH
#define BITPLAY_AUDIO_SOURCE_HH

#include <chrono>
#include <memory>
#include <string>
#include <bitplay/sdk/decoder.hh>
#include <bitplay/sdk/decoders_registry.hh>
#include <bitplay/sdk/io_stream.hh>
#include <bitplay/sdk/types.hh>
#include <bitplay/export_bitplay.h>

namespace bitplay {
    /**
     * @class audio_source
     * @brief Owns an io_stream and the decoder reading from it
     * @ingroup playback
     *
     * The source is opened for sequential decoding in the constructor.
     * Frames come out in the container width chosen by the format mapper:
     * 16-bit elements or 32-bit left-justified elements.
     *
     * @code
     * auto src = audio_source::from_file("/music/track.flac", *registry);
     * std::vector<int32_t> block(2048 * src->get_channels());
     * size_t got = src->read_frames(block.data(), 2048, 32);
     * @endcode
     */
    class BITPLAY_EXPORT audio_source {
        public:
            /**
             * @brief Probe rwops with the registry and open the matching decoder
             * @throws decoder_error if no decoder accepts the data or opening fails
             */
            audio_source(std::unique_ptr<io_stream> rwops, const decoders_registry& registry);

            /**
             * @brief Open a file from disk
             * @throws io_error if the file cannot be opened
             * @throws decoder_error if the contents are not understood
             */
            static std::unique_ptr<audio_source> from_file(const std::string& path,
                                                           const decoders_registry& registry);

            audio_source(const audio_source&) = delete;
            audio_source& operator = (const audio_source&) = delete;

            ~audio_source();

            [[nodiscard]] channels_t get_channels() const;

            [[nodiscard]] sample_rate_t get_rate() const;

            [[nodiscard]] sample_encoding get_encoding() const;

            [[nodiscard]] frame_count_t total_frames() const;

            [[nodiscard]] frame_count_t tell_frame() const;

            [[nodiscard]] double duration_seconds() const;

            /**
             * @brief Reposition to an exact frame (clamped to the end of the stream)
             * @throws decoder_error if the codec cannot seek
             */
            void seek_to_frame(frame_count_t frame);

            /**
             * @brief Read interleaved frames
             * @param buf Destination, frames * channels elements of element_bits each
             * @param element_bits 16 or 32
             * @return Frames read, 0 at end of stream
             */
            size_t read_frames(void* buf, size_t frames, uint8_t element_bits);

        private:
            std::unique_ptr<io_stream> m_rwops;
            std::unique_ptr<decoder> m_decoder;
            bool m_at_end = false;
    };
}

#endif // BITPLAY_AUDIO_SOURCE_HH
