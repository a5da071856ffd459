#include <bitplay/settings_store.hh>

namespace bitplay {

    std::optional<std::string> memory_settings_store::get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_values.find(key);
        if (it == m_values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void memory_settings_store::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values[key] = value;
    }

} // namespace bitplay
