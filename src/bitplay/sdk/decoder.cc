// This is copyrighted software. More information is at the end of this file.
#include <bitplay/sdk/decoder.hh>
#include <bitplay/error.hh>

#include <memory>

namespace bitplay {
    struct decoder::impl final {
        bool m_is_open = false;
    };

    decoder::decoder()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder::~decoder() = default;

    bool decoder::is_open() const {
        return m_pimpl->m_is_open;
    }

    size_t decoder::read_s16(int16_t* buf, size_t frames) {
        if (!is_open()) {
            throw state_error("read_s16 on a closed decoder");
        }
        if (!buf || frames == 0) {
            return 0;
        }
        return do_read_s16(buf, frames);
    }

    size_t decoder::read_s32(int32_t* buf, size_t frames) {
        if (!is_open()) {
            throw state_error("read_s32 on a closed decoder");
        }
        if (!buf || frames == 0) {
            return 0;
        }
        return do_read_s32(buf, frames);
    }

    std::chrono::microseconds decoder::duration() const {
        if (!is_open() || get_rate() == 0) {
            return {};
        }
        return std::chrono::duration_cast <std::chrono::microseconds>(
            std::chrono::duration <double>(static_cast <double>(total_frames()) / get_rate()));
    }

    void decoder::set_is_open(bool f) {
        m_pimpl->m_is_open = f;
    }
}

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
