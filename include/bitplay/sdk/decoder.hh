// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <bitplay/sdk/io_stream.hh>
#include <bitplay/sdk/audio_format.hh>
#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/types.hh>
#include <chrono>
#include <memory>

namespace bitplay {
    /**
     * @class decoder
     * @brief Integer PCM decoder interface
     * @ingroup sdk_decoders
     *
     * Decoders deliver interleaved frames exactly as stored in the source.
     * A 16-bit source is read with read_s16(); 24- and 32-bit sources are
     * read with read_s32() and come back left-justified in the 32-bit
     * container. No dithering, rescaling or resampling ever happens here.
     *
     * ## Implementing a Decoder
     *
     * @code
     * class my_decoder : public decoder {
     *     void open(io_stream* rwops) override;
     *     sample_encoding get_encoding() const override;
     *     // ...
     * protected:
     *     size_t do_read_s16(int16_t* buf, size_t frames) override;
     *     size_t do_read_s32(int32_t* buf, size_t frames) override;
     * };
     * @endcode
     *
     * The io_stream passed to open() is owned by the caller and must outlive
     * the decoder.
     */
    class BITPLAY_EXPORT decoder {
        public:
            decoder();

            virtual ~decoder();

            decoder(const decoder&) = delete;
            decoder& operator=(const decoder&) = delete;

            [[nodiscard]] bool is_open() const;

            /**
             * @brief Read up to frames interleaved 16-bit frames
             * @return Frames actually read; 0 at end of stream
             * @throws state_error if the decoder is not open
             */
            size_t read_s16(int16_t* buf, size_t frames);

            /**
             * @brief Read up to frames interleaved 32-bit frames
             * @return Frames actually read; 0 at end of stream
             * @throws state_error if the decoder is not open
             */
            size_t read_s32(int32_t* buf, size_t frames);

            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Parse headers and prepare for decoding
             * @throws decoder_error if the data is not understood
             */
            virtual void open(io_stream* rwops) = 0;

            [[nodiscard]] virtual channels_t get_channels() const = 0;

            [[nodiscard]] virtual sample_rate_t get_rate() const = 0;

            [[nodiscard]] virtual sample_encoding get_encoding() const = 0;

            [[nodiscard]] virtual frame_count_t total_frames() const = 0;

            /**
             * @brief Frame the next read starts at
             */
            [[nodiscard]] virtual frame_count_t tell_frame() const = 0;

            /**
             * @brief Reposition to an exact frame
             * @return false if the frame is out of range or the codec failed
             */
            virtual bool seek_to_frame(frame_count_t frame) = 0;

            [[nodiscard]] std::chrono::microseconds duration() const;

        protected:
            void set_is_open(bool f);

            virtual size_t do_read_s16(int16_t* buf, size_t frames) = 0;

            virtual size_t do_read_s32(int32_t* buf, size_t frames) = 0;

        private:
            struct impl;
            const std::unique_ptr <impl> m_pimpl;
    };


} // namespace bitplay

/*
 * Copyright (C) 2025
 *
 * This file is part of bitplay.
 *
 * bitplay is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * bitplay is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with bitplay.  If not, see <http://www.gnu.org/licenses/>.
 */
