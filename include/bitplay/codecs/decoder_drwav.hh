// This is copyrighted software. More information is at the end of this file.

#pragma once

#include <bitplay/sdk/decoder.hh>
#include <bitplay/sdk/types.hh>
#include <bitplay/export_bitplay.h>
namespace bitplay {
    /*!
     * \brief dr_wav decoder.
     *
     * Reports PCM_16/24/32 for integer WAVE_FORMAT_PCM (and extensible)
     * data, FLOAT/DOUBLE for IEEE float and COMPRESSED for ADPCM and the
     * companded formats.
     */
    class BITPLAY_EXPORT decoder_drwav : public decoder {
        public:
            decoder_drwav();
            ~decoder_drwav() override;

            [[nodiscard]] static bool accept(io_stream* rwops);

            [[nodiscard]] const char* get_name() const override;
            void open(io_stream* rwops) override;
            [[nodiscard]] channels_t get_channels() const override;
            [[nodiscard]] sample_rate_t get_rate() const override;
            [[nodiscard]] sample_encoding get_encoding() const override;
            [[nodiscard]] frame_count_t total_frames() const override;
            [[nodiscard]] frame_count_t tell_frame() const override;
            bool seek_to_frame(frame_count_t frame) override;

        protected:
            size_t do_read_s16(int16_t* buf, size_t frames) override;
            size_t do_read_s32(int32_t* buf, size_t frames) override;

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
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
