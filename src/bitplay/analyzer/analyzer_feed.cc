#include <bitplay/analyzer/analyzer_feed.hh>
#include <failsafe/failsafe.hh>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace bitplay {

    struct analyzer_feed::impl {
        std::shared_ptr<spectrum_analyzer> m_analyzer;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::optional<pcm_block> m_slot;
        bool m_stopping = false;

        std::atomic<uint64_t> m_delivered{0};
        std::atomic<uint64_t> m_dropped{0};

        std::thread m_thread;

        void run() {
            while (true) {
                pcm_block block;
                {
                    std::unique_lock<std::mutex> lock(m_mutex);
                    m_cv.wait(lock, [this] { return m_stopping || m_slot.has_value(); });
                    if (m_stopping) {
                        return;
                    }
                    block = std::move(*m_slot);
                    m_slot.reset();
                }
                try {
                    m_analyzer->push_block(block);
                } catch (const std::exception& e) {
                    LOG_WARN("analyzer", "Dropping block:", e.what());
                }
                m_delivered++;
            }
        }
    };

    analyzer_feed::analyzer_feed(std::shared_ptr<spectrum_analyzer> analyzer)
        : m_pimpl(std::make_unique<impl>()) {
        if (!analyzer) {
            THROW_RUNTIME("analyzer_feed needs an analyzer");
        }
        m_pimpl->m_analyzer = std::move(analyzer);
        m_pimpl->m_thread = std::thread([p = m_pimpl.get()] { p->run(); });
    }

    analyzer_feed::~analyzer_feed() {
        stop();
    }

    void analyzer_feed::push(pcm_block block) {
        std::unique_lock<std::mutex> lock(m_pimpl->m_mutex, std::try_to_lock);
        if (!lock.owns_lock() || m_pimpl->m_stopping) {
            m_pimpl->m_dropped++;
            return;
        }
        if (m_pimpl->m_slot) {
            m_pimpl->m_dropped++;
        }
        m_pimpl->m_slot = std::move(block);
        lock.unlock();
        m_pimpl->m_cv.notify_one();
    }

    void analyzer_feed::stop() {
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            m_pimpl->m_stopping = true;
        }
        m_pimpl->m_cv.notify_one();
        if (m_pimpl->m_thread.joinable()) {
            m_pimpl->m_thread.join();
        }
    }

    std::shared_ptr<spectrum_analyzer> analyzer_feed::analyzer() const {
        return m_pimpl->m_analyzer;
    }

    uint64_t analyzer_feed::delivered() const {
        return m_pimpl->m_delivered.load();
    }

    uint64_t analyzer_feed::dropped() const {
        return m_pimpl->m_dropped.load();
    }

} // namespace bitplay
