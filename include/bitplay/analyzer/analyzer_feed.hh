/**
 * @file analyzer_feed.hh
 * @brief Drop-tolerant hand-off of played blocks to a spectrum_analyzer
 * @ingroup analyzer
 */

#ifndef BITPLAY_ANALYZER_ANALYZER_FEED_HH
#define BITPLAY_ANALYZER_ANALYZER_FEED_HH

#include <memory>
#include <bitplay/export_bitplay.h>
#include <bitplay/pcm_block.hh>
#include <bitplay/analyzer/spectrum_analyzer.hh>

namespace bitplay {

    /**
     * @class analyzer_feed
     * @brief Single-slot mailbox plus a consumer thread
     * @ingroup analyzer
     *
     * push() never waits: if the mailbox is being accessed the block is
     * dropped, otherwise it replaces whatever block is still waiting. A slow
     * analyzer therefore costs frames of the display, never playback time.
     *
     * @code
     * auto analyzer = std::make_shared<bitplay::spectrum_analyzer>();
     * auto feed = std::make_shared<bitplay::analyzer_feed>(analyzer);
     * player.set_pcm_sink(feed);
     * @endcode
     */
    class BITPLAY_EXPORT analyzer_feed : public pcm_sink {
        public:
            explicit analyzer_feed(std::shared_ptr<spectrum_analyzer> analyzer);

            /**
             * Stops and joins the consumer thread.
             */
            ~analyzer_feed() override;

            analyzer_feed(const analyzer_feed&) = delete;
            analyzer_feed& operator=(const analyzer_feed&) = delete;

            void push(pcm_block block) override;

            /**
             * @brief Stop the consumer thread; later pushes are dropped
             */
            void stop();

            [[nodiscard]] std::shared_ptr<spectrum_analyzer> analyzer() const;

            /**
             * @brief Blocks handed to the analyzer so far
             */
            [[nodiscard]] uint64_t delivered() const;

            /**
             * @brief Blocks lost to contention, replacement or stop
             */
            [[nodiscard]] uint64_t dropped() const;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace bitplay

#endif // BITPLAY_ANALYZER_ANALYZER_FEED_HH
