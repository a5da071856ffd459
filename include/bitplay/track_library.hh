/**
 * @file track_library.hh
 * @brief Collection of playable tracks
 * @ingroup playback
 */

#ifndef BITPLAY_TRACK_LIBRARY_HH
#define BITPLAY_TRACK_LIBRARY_HH

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <bitplay/export_bitplay.h>
#include <bitplay/sdk/types.hh>

namespace bitplay {

    /**
     * @struct track_info
     * @brief Immutable reference to one file of the library
     */
    struct track_info {
        track_id_t id;
        std::string path;
        std::string name;  ///< File name component of path
    };

    /**
     * @class track_library
     * @brief Thread-safe list of tracks, replaced wholesale on every scan
     *
     * Ids are the 0-based positions of the paths passed to replace().
     */
    class BITPLAY_EXPORT track_library {
        public:
            track_library() = default;
            explicit track_library(const std::vector<std::string>& paths);

            /**
             * @brief Drop all tracks and load paths in order
             */
            void replace(const std::vector<std::string>& paths);

            [[nodiscard]] std::vector<track_info> list() const;

            [[nodiscard]] std::optional<track_info> get(track_id_t id) const;

            [[nodiscard]] size_t size() const;

        private:
            mutable std::mutex m_mutex;
            std::vector<track_info> m_tracks;
    };

} // namespace bitplay

#endif // BITPLAY_TRACK_LIBRARY_HH
