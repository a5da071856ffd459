/**
 * @file player.hh
 * @brief Playback controller
 * @ingroup playback
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <bitplay/export_bitplay.h>
#include <bitplay/player_config.hh>
#include <bitplay/track_library.hh>
#include <bitplay/settings_store.hh>
#include <bitplay/pcm_block.hh>
#include <bitplay/sdk/output_backend.hh>
#include <bitplay/sdk/decoders_registry.hh>

namespace bitplay {

    enum class playback_state {
        idle,
        playing,
        paused,
        stopped
    };

    /**
     * @brief Kind of failure that ended the last stream
     */
    enum class playback_error {
        none,
        unsupported_format,
        decode_failure,
        device_unavailable,
        device_write_failure
    };

    BITPLAY_EXPORT std::ostream& operator<<(std::ostream& os, playback_state s);
    BITPLAY_EXPORT std::ostream& operator<<(std::ostream& os, playback_error e);

    /**
     * @struct player_status
     * @brief Consistent snapshot of the playback session
     */
    struct player_status {
        playback_state state = playback_state::idle;
        std::optional<track_id_t> current_track_id;
        std::string current_track_name;
        std::string device_id;
        double position = 0.0;
        double duration = 0.0;
        bool bit_perfect = false;
        std::string bit_perfect_reason;
        playback_error last_error = playback_error::none;
        sample_rate_t sample_rate = 0;
        channels_t channels = 0;
        sample_encoding encoding = sample_encoding::unknown;
    };

    /**
     * @class player
     * @brief Thread-safe control surface over one streaming thread per play()
     * @ingroup playback
     *
     * Every call returns without waiting for device I/O. play() starts a new
     * streaming thread with its own stop/pause signals; the previous thread is
     * told to stop and exits on its own. At most one thread holds the device,
     * because the hardware refuses a second exclusive open and the new thread
     * retries until the old one has released it.
     *
     * Failures inside the streaming thread never escape: they end the
     * stream, return the player to idle and are reported by status().
     *
     * @code
     * auto library = std::make_shared<bitplay::track_library>(paths);
     * bitplay::player p(backend, library);
     * p.set_output_device("hw:1,0");
     * p.play(0);
     * auto st = p.status();
     * if (!st.bit_perfect) {
     *     std::cout << st.bit_perfect_reason << "\n";
     * }
     * @endcode
     */
    class BITPLAY_EXPORT player {
        public:
            /**
             * @param backend Output backend, initialized here if needed
             * @param library Tracks play() resolves ids against
             * @param settings Remembered device and folder; in-memory store if null
             * @param config Runtime tuning
             * @param registry Decoders; WAV and FLAC if null
             */
            player(std::shared_ptr<output_backend> backend,
                   std::shared_ptr<track_library> library,
                   std::shared_ptr<settings_store> settings = nullptr,
                   player_config config = {},
                   std::shared_ptr<decoders_registry> registry = nullptr);

            /**
             * Stops the current session and joins every streaming thread.
             */
            ~player();

            player(const player&) = delete;
            player& operator=(const player&) = delete;

            [[nodiscard]] std::vector<track_info> list_tracks() const;

            [[nodiscard]] std::optional<track_info> get_track(track_id_t id) const;

            [[nodiscard]] std::vector<device_info> list_output_devices() const;

            /**
             * @brief Select the device used by the next play(); persisted
             */
            void set_output_device(const std::string& device_id);

            [[nodiscard]] std::string output_device() const;

            void set_source_folder(const std::string& path);

            [[nodiscard]] std::string source_folder() const;

            /**
             * @brief Receive a copy of every block written to the device
             */
            void set_pcm_sink(std::shared_ptr<pcm_sink> sink);

            /**
             * @brief Start playing a track, superseding any current session
             * @throws track_not_found_error for unknown ids; nothing changes then
             */
            void play(track_id_t id);

            /**
             * @return true if the player was playing
             */
            bool pause();

            /**
             * @return true if the player was paused
             */
            bool resume();

            void stop();

            /**
             * @brief Request a reposition of the current track
             *
             * The position reported by get_position() changes immediately;
             * the decoder moves before the next block is read.
             *
             * @return false if no track is current
             */
            bool seek(double seconds);

            [[nodiscard]] double get_position() const;

            [[nodiscard]] double get_duration() const;

            [[nodiscard]] player_status status() const;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };
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
