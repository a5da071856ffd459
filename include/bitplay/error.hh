// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace bitplay {

/**
 * @brief Base exception class for all bitplay errors
 *
 * All bitplay-specific exceptions derive from this class, making it easy
 * to catch all bitplay errors with a single catch block.
 */
class bitplay_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Unknown track id
 *
 * Thrown synchronously by player::play() when the id is not in the
 * track library. No playback state is touched.
 */
class track_not_found_error : public bitplay_error {
public:
    using bitplay_error::bitplay_error;
};

/**
 * @brief Source encoding outside the bit-perfect PCM set
 *
 * Thrown when a source sample encoding cannot be passed to the hardware
 * unchanged, such as:
 * - Floating point samples
 * - 8-bit or compressed (ADPCM, A-law, u-law) data
 * - Unknown encodings
 */
class unsupported_format_error : public bitplay_error {
public:
    using bitplay_error::bitplay_error;
};

/**
 * @brief Decoder related errors
 *
 * Thrown when decoder operations fail, such as:
 * - Invalid file format
 * - Corrupted data
 * - No decoder accepts the stream
 */
class decoder_error : public bitplay_error {
public:
    using bitplay_error::bitplay_error;
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when a source file cannot be opened or read.
 */
class io_error : public bitplay_error {
public:
    using bitplay_error::bitplay_error;
};

/**
 * @brief Audio output device related errors
 *
 * Base class of everything the output device adapter raises.
 */
class device_error : public bitplay_error {
public:
    using bitplay_error::bitplay_error;
};

/**
 * @brief Device is claimed by somebody else
 *
 * Transient: the open is retried with backoff.
 */
class device_busy_error : public device_error {
public:
    using device_error::device_error;
};

/**
 * @brief Device refuses the exact requested configuration
 *
 * Raised instead of silently substituting a nearby rate, format or
 * channel count. Not retried.
 */
class device_config_error : public device_error {
public:
    using device_error::device_error;
};

/**
 * @brief Device could not be opened after exhausting all retries
 */
class device_unavailable_error : public device_error {
public:
    using device_error::device_error;
};

/**
 * @brief Writing to an open device failed
 *
 * Indicates the device went away mid-stream; never retried.
 */
class device_write_error : public device_error {
public:
    using device_error::device_error;
};

/**
 * @brief State related errors
 *
 * Thrown when operations are attempted on closed or uninitialized objects.
 */
class state_error : public bitplay_error {
public:
    using bitplay_error::bitplay_error;
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
