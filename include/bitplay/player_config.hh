/**
 * @file player_config.hh
 * @brief Runtime configuration of the player
 * @ingroup playback
 */

#ifndef BITPLAY_PLAYER_CONFIG_HH
#define BITPLAY_PLAYER_CONFIG_HH

#include <chrono>
#include <string>
#include <bitplay/output_device.hh>

namespace bitplay {

    struct player_config {
        std::string default_device = "hw:0,0";   ///< Used when no device was remembered
        size_t period_frames = 2048;             ///< Frames per read and per write
        std::chrono::milliseconds pause_poll_interval{50};
        retry_policy retry;
    };

} // namespace bitplay

#endif // BITPLAY_PLAYER_CONFIG_HH
