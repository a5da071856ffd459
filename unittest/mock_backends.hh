#ifndef BITPLAY_MOCK_BACKENDS_HH
#define BITPLAY_MOCK_BACKENDS_HH

#include <bitplay/sdk/output_backend.hh>
#include <bitplay/sdk/audio_format.hh>
#include <bitplay/error.hh>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace bitplay::test {

    // One write() as the mock hardware saw it
    struct written_block {
        int stream_serial;
        std::string device_id;
        audio_spec spec;
        size_t frames;
        std::vector<uint8_t> bytes;
    };

    // Shared between the backend and the streams it hands out, so tests can
    // look at it after the player has dropped everything
    struct mock_state {
        std::mutex mutex;
        std::vector<device_info> devices;

        // Configurable behaviors
        int busy_failures_remaining = 0;
        bool always_busy = false;
        std::set<std::string> refused_ids;
        int fail_write_after = -1;   // successful writes per stream before failing, -1 never
        std::chrono::milliseconds write_delay{1};

        // Statistics for testing
        std::atomic<int> open_attempts{0};
        std::atomic<int> init_calls{0};
        int open_streams = 0;
        int max_open_streams = 0;
        int stream_serial = 0;
        std::set<std::string> claimed;
        std::vector<written_block> writes;

        mock_state() {
            devices.push_back({"hw:0,0", "Mock DAC (dev 0)", device_kind::exclusive, 0, 0});
            devices.push_back({"plughw:0,0", "Mock DAC (dev 0, converted)", device_kind::converting, 0, 0});
        }

        std::vector<written_block> snapshot() {
            std::lock_guard<std::mutex> lock(mutex);
            return writes;
        }

        size_t write_count() {
            std::lock_guard<std::mutex> lock(mutex);
            return writes.size();
        }

        int streams_opened() {
            std::lock_guard<std::mutex> lock(mutex);
            return stream_serial;
        }

        int currently_open() {
            std::lock_guard<std::mutex> lock(mutex);
            return open_streams;
        }

        // hw:0,0 and plughw:0,0 address the same endpoint
        static std::string endpoint_of(const std::string& id) {
            const auto colon = id.find(':');
            return colon == std::string::npos ? id : id.substr(colon + 1);
        }
    };

    // Mock stream implementation for testing
    class mock_stream : public output_stream {
        private:
            std::shared_ptr<mock_state> m_state;
            std::string m_device_id;
            audio_spec m_spec;
            int m_serial;
            int m_writes{0};
            bool m_open{true};

        public:
            mock_stream(std::shared_ptr<mock_state> state, std::string device_id,
                        const audio_spec& spec, int serial)
                : m_state(std::move(state)), m_device_id(std::move(device_id)),
                  m_spec(spec), m_serial(serial) {}

            ~mock_stream() override {
                mock_stream::close();
            }

            void write(const void* data, size_t frames) override {
                std::chrono::milliseconds delay;
                {
                    std::lock_guard<std::mutex> lock(m_state->mutex);
                    if (!m_open) {
                        throw device_write_error(m_device_id + ": stream closed");
                    }
                    if (m_state->fail_write_after >= 0 && m_writes >= m_state->fail_write_after) {
                        throw device_write_error(m_device_id + ": device disconnected");
                    }
                    m_writes++;
                    const auto* bytes = static_cast<const uint8_t*>(data);
                    const size_t size = frames * audio_spec_frame_bytes(m_spec);
                    m_state->writes.push_back({m_serial, m_device_id, m_spec, frames,
                                               std::vector<uint8_t>(bytes, bytes + size)});
                    delay = m_state->write_delay;
                }
                if (delay.count() > 0) {
                    std::this_thread::sleep_for(delay);
                }
            }

            void close() override {
                std::lock_guard<std::mutex> lock(m_state->mutex);
                if (!m_open) {
                    return;
                }
                m_open = false;
                m_state->claimed.erase(mock_state::endpoint_of(m_device_id));
                m_state->open_streams--;
            }

            [[nodiscard]] bool is_open() const override {
                std::lock_guard<std::mutex> lock(m_state->mutex);
                return m_open;
            }

            [[nodiscard]] audio_spec get_spec() const override {
                return m_spec;
            }
    };

    // Mock backend; one claim per endpoint like exclusive hardware
    class mock_output_backend : public output_backend {
        private:
            std::shared_ptr<mock_state> m_state;
            bool m_initialized{false};

        public:
            explicit mock_output_backend(std::shared_ptr<mock_state> state = std::make_shared<mock_state>())
                : m_state(std::move(state)) {}

            [[nodiscard]] const std::shared_ptr<mock_state>& state() const { return m_state; }

            void init() override {
                m_state->init_calls++;
                m_initialized = true;
            }

            void shutdown() override {
                m_initialized = false;
            }

            [[nodiscard]] std::string get_name() const override {
                return "Mock";
            }

            [[nodiscard]] bool is_initialized() const override {
                return m_initialized;
            }

            std::vector<device_info> enumerate_devices() override {
                std::lock_guard<std::mutex> lock(m_state->mutex);
                return m_state->devices;
            }

            std::unique_ptr<output_stream> open_stream(const std::string& device_id,
                                                       const audio_spec& spec,
                                                       size_t) override {
                m_state->open_attempts++;
                std::lock_guard<std::mutex> lock(m_state->mutex);
                const bool known = std::any_of(m_state->devices.begin(), m_state->devices.end(),
                                               [&](const device_info& d) { return d.id == device_id; });
                if (!known) {
                    throw device_error("cannot open " + device_id + ": no such device");
                }
                if (m_state->refused_ids.count(device_id)) {
                    throw device_config_error(device_id + ": configuration refused");
                }
                if (m_state->always_busy) {
                    throw device_busy_error(device_id + ": busy");
                }
                if (m_state->busy_failures_remaining > 0) {
                    m_state->busy_failures_remaining--;
                    throw device_busy_error(device_id + ": busy");
                }
                const auto endpoint = mock_state::endpoint_of(device_id);
                if (m_state->claimed.count(endpoint)) {
                    throw device_busy_error(device_id + ": claimed");
                }
                m_state->claimed.insert(endpoint);
                m_state->open_streams++;
                m_state->max_open_streams = std::max(m_state->max_open_streams, m_state->open_streams);
                const int serial = ++m_state->stream_serial;
                return std::make_unique<mock_stream>(m_state, device_id, spec, serial);
            }
    };

} // namespace bitplay::test

#endif // BITPLAY_MOCK_BACKENDS_HH
