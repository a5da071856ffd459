#include <bitplay/output_device.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <thread>

namespace bitplay {

    namespace {
        constexpr std::chrono::milliseconds cancel_poll_slice{10};

        // Sleep for d, returning early (false) if cancel is raised
        bool wait_unless_cancelled(std::chrono::milliseconds d, const std::atomic<bool>* cancel) {
            const auto deadline = std::chrono::steady_clock::now() + d;
            while (true) {
                if (cancel && cancel->load()) {
                    return false;
                }
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    return true;
                }
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                std::this_thread::sleep_for(std::min(left + std::chrono::milliseconds(1), cancel_poll_slice));
            }
        }
    }

    std::unique_ptr<output_device> output_device::open(output_backend& backend,
                                                       const std::string& device_id,
                                                       const audio_spec& spec,
                                                       size_t period_frames,
                                                       const retry_policy& policy,
                                                       const std::atomic<bool>* cancel) {
        if (!backend.is_initialized()) {
            THROW_RUNTIME("output backend is not initialized");
        }
        const unsigned max_attempts = std::max(1u, policy.max_attempts);
        std::string last_failure;

        for (unsigned attempt = 1; attempt <= max_attempts; ++attempt) {
            if (cancel && cancel->load()) {
                LOG_INFO("output_device", "Open of", device_id, "cancelled before attempt", attempt);
                return nullptr;
            }
            try {
                auto stream = backend.open_stream(device_id, spec, period_frames);
                LOG_INFO("output_device", "Opened", device_id, "format", spec.format,
                         "channels", static_cast<int>(spec.channels), "rate", spec.freq,
                         "after", attempt, "attempt(s)");
                return std::make_unique<output_device>(open_tag{}, std::move(stream), device_id, spec, attempt);
            } catch (const device_busy_error& e) {
                last_failure = e.what();
                if (attempt == max_attempts) {
                    break;
                }
                const auto delay = policy.delay_after(attempt);
                LOG_WARN("output_device", device_id, "busy (attempt", attempt, "of", max_attempts,
                         "), retrying in", delay.count(), "ms");
                if (!wait_unless_cancelled(delay, cancel)) {
                    LOG_INFO("output_device", "Open of", device_id, "cancelled during backoff");
                    return nullptr;
                }
            }
        }

        LOG_ERROR("output_device", "Giving up on", device_id, "after", max_attempts, "attempts:", last_failure);
        throw device_unavailable_error(device_id + " still busy after " + std::to_string(max_attempts) +
                                       " attempts: " + last_failure);
    }

    output_device::output_device(open_tag, std::unique_ptr<output_stream> stream, std::string device_id,
                                 const audio_spec& spec, unsigned attempts)
        : m_stream(std::move(stream)),
          m_device_id(std::move(device_id)),
          m_spec(spec),
          m_attempts(attempts) {
    }

    output_device::~output_device() {
        close();
    }

    void output_device::write(const void* data, size_t frames) {
        if (!m_stream || !m_stream->is_open()) {
            throw device_write_error("write to closed device " + m_device_id);
        }
        m_stream->write(data, frames);
    }

    void output_device::close() {
        if (m_stream) {
            m_stream->close();
            m_stream.reset();
            LOG_DEBUG("output_device", "Closed", m_device_id);
        }
    }

    bool output_device::is_open() const {
        return m_stream && m_stream->is_open();
    }

    const std::string& output_device::device_id() const {
        return m_device_id;
    }

    const audio_spec& output_device::spec() const {
        return m_spec;
    }

    unsigned output_device::attempts() const {
        return m_attempts;
    }

} // namespace bitplay
