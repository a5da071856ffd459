#include <bitplay/backends/null/null_backend.hh>
#include <bitplay/sdk/output_backend.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

namespace bitplay {

namespace {

constexpr const char* null_exclusive_id = "hw:null";
constexpr const char* null_converting_id = "plughw:null";

class null_output_stream : public output_stream {
public:
    null_output_stream(std::shared_ptr<std::mutex> claims_mutex,
                       std::shared_ptr<std::set<std::string>> claims,
                       std::string device_id, const audio_spec& spec)
        : m_claims_mutex(std::move(claims_mutex)),
          m_claims(std::move(claims)),
          m_device_id(std::move(device_id)),
          m_spec(spec) {
    }

    ~null_output_stream() override {
        close();
    }

    void write(const void* data, size_t frames) override {
        if (!m_open) {
            throw device_write_error("null device " + m_device_id + " is closed");
        }
        if (!data || frames == 0) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(
            static_cast<long long>(frames) * 1000000LL / m_spec.freq));
    }

    void close() override {
        if (!m_open) {
            return;
        }
        m_open = false;
        std::lock_guard<std::mutex> lock(*m_claims_mutex);
        m_claims->erase(m_device_id);
    }

    [[nodiscard]] bool is_open() const override { return m_open; }

    [[nodiscard]] audio_spec get_spec() const override { return m_spec; }

private:
    std::shared_ptr<std::mutex> m_claims_mutex;
    std::shared_ptr<std::set<std::string>> m_claims;
    std::string m_device_id;
    audio_spec m_spec;
    bool m_open = true;
};

class null_backend : public output_backend {
public:
    void init() override { m_initialized = true; }

    void shutdown() override { m_initialized = false; }

    [[nodiscard]] std::string get_name() const override { return "Null"; }

    [[nodiscard]] bool is_initialized() const override { return m_initialized; }

    std::vector<device_info> enumerate_devices() override {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }
        return {
            {null_exclusive_id, "Null output (dev 0)", device_kind::exclusive, 0, 0},
            {null_converting_id, "Null output (dev 0, converted)", device_kind::converting, 0, 0}
        };
    }

    std::unique_ptr<output_stream> open_stream(const std::string& device_id,
                                               const audio_spec& spec,
                                               size_t period_frames) override {
        (void)period_frames;
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }
        if (device_id != null_exclusive_id && device_id != null_converting_id) {
            throw device_error("no such null device: " + device_id);
        }
        if (spec.format == audio_format::unknown || spec.channels == 0 || spec.freq == 0) {
            throw device_config_error("null device cannot be configured with an empty spec");
        }
        std::lock_guard<std::mutex> lock(*m_claims_mutex);
        if (!m_claims->insert(device_id).second) {
            throw device_busy_error(device_id + " is busy");
        }
        return std::make_unique<null_output_stream>(m_claims_mutex, m_claims, device_id, spec);
    }

private:
    std::atomic<bool> m_initialized{false};
    std::shared_ptr<std::mutex> m_claims_mutex = std::make_shared<std::mutex>();
    std::shared_ptr<std::set<std::string>> m_claims = std::make_shared<std::set<std::string>>();
};

} // namespace

std::unique_ptr<output_backend> create_null_backend() {
    return std::make_unique<null_backend>();
}

} // namespace bitplay
