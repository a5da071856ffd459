#include <bitplay/track_library.hh>

#include <filesystem>

namespace bitplay {

    track_library::track_library(const std::vector<std::string>& paths) {
        replace(paths);
    }

    void track_library::replace(const std::vector<std::string>& paths) {
        std::vector<track_info> tracks;
        tracks.reserve(paths.size());
        for (const auto& p : paths) {
            tracks.push_back({static_cast<track_id_t>(tracks.size()), p, std::filesystem::path(p).filename().string()});
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tracks.swap(tracks);
    }

    std::vector<track_info> track_library::list() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tracks;
    }

    std::optional<track_info> track_library::get(track_id_t id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (id < 0 || static_cast<size_t>(id) >= m_tracks.size()) {
            return std::nullopt;
        }
        return m_tracks[static_cast<size_t>(id)];
    }

    size_t track_library::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tracks.size();
    }

} // namespace bitplay
