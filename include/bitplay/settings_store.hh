/**
 * @file settings_store.hh
 * @brief Getter/setter hooks for persisted player settings
 * @ingroup playback
 */

#ifndef BITPLAY_SETTINGS_STORE_HH
#define BITPLAY_SETTINGS_STORE_HH

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <bitplay/export_bitplay.h>

namespace bitplay {

    namespace settings_keys {
        constexpr const char* output_device = "output_device";
        constexpr const char* source_folder = "source_folder";
    }

    /**
     * @class settings_store
     * @brief Key/value storage owned by the embedding application
     *
     * The player only reads and writes values; how they reach disk is up to
     * the implementation.
     */
    class BITPLAY_EXPORT settings_store {
        public:
            virtual ~settings_store() = default;

            [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;

            virtual void set(const std::string& key, const std::string& value) = 0;
    };

    /**
     * @class memory_settings_store
     * @brief settings_store that keeps values for the lifetime of the process
     */
    class BITPLAY_EXPORT memory_settings_store : public settings_store {
        public:
            [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;

            void set(const std::string& key, const std::string& value) override;

        private:
            mutable std::mutex m_mutex;
            std::map<std::string, std::string> m_values;
    };

} // namespace bitplay

#endif // BITPLAY_SETTINGS_STORE_HH
