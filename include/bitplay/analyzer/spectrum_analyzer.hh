/**
 * @file spectrum_analyzer.hh
 * @brief Log-frequency spectrum for visualization
 * @ingroup analyzer
 */

#ifndef BITPLAY_ANALYZER_SPECTRUM_ANALYZER_HH
#define BITPLAY_ANALYZER_SPECTRUM_ANALYZER_HH

#include <functional>
#include <memory>
#include <vector>
#include <bitplay/export_bitplay.h>
#include <bitplay/pcm_block.hh>

namespace bitplay {

    /**
     * @struct analyzer_config
     * @brief Construction parameters of a spectrum_analyzer
     */
    struct analyzer_config {
        size_t fft_size = 8192;
        size_t bands = 120;
        double min_hz = 20.0;
        double max_hz = 20000.0;
        double smoothing = 0.7;          ///< 0 follows every frame, 1 freezes
        double peak_hold_seconds = 1.2;
        double peak_decay_db = 0.6;      ///< Per analysis, once the hold elapsed
        bool a_weighting = false;

        /// Monotonic time in seconds for peak hold; steady_clock when empty
        std::function<double()> clock;
    };

    /**
     * @struct display_frame
     * @brief One renderable spectrum, bands entries per vector
     */
    struct display_frame {
        std::vector<float> smoothed_db;
        std::vector<float> peak_db;
    };

    /**
     * @class spectrum_analyzer
     * @brief Rolling-buffer FFT mapped onto log-spaced display bands
     * @ingroup analyzer
     *
     * Blocks are reduced to their first channel and appended to a buffer of
     * fft_size samples. Once the buffer has been filled, every push runs a
     * Hann-windowed real FFT and updates the smoothed and peak band values.
     * All band arrays start at, and never fall below, -200 dB.
     *
     * All members are thread-safe.
     */
    class BITPLAY_EXPORT spectrum_analyzer {
        public:
            static constexpr float floor_db = -200.0f;

            explicit spectrum_analyzer(analyzer_config config = {});
            ~spectrum_analyzer();

            spectrum_analyzer(const spectrum_analyzer&) = delete;
            spectrum_analyzer& operator=(const spectrum_analyzer&) = delete;

            /**
             * @brief Fold a block of s16le or s32le samples into the buffer
             * @throws unsupported_format_error for any other sample format
             */
            void push_block(const pcm_block& block);

            /**
             * @brief Fold normalized mono samples into the buffer
             */
            void push_samples(const float* samples, size_t count, sample_rate_t sample_rate);

            [[nodiscard]] display_frame get_display_frame() const;

            /**
             * @brief Band values of the last analysis before smoothing
             */
            [[nodiscard]] std::vector<float> latest_db() const;

            /**
             * @throws std::invalid_argument unless max_hz > max(1, min_hz)
             */
            void set_frequency_range(double min_hz, double max_hz);

            void set_weighting(bool enabled);

            void set_smoothing(double factor);

            void set_peak_hold(double seconds);

            void clear_peaks();

            /**
             * @brief Geometric center of band i in Hz
             */
            [[nodiscard]] double band_center_hz(size_t i) const;

            [[nodiscard]] size_t bands() const;

            [[nodiscard]] size_t fft_size() const;

            /**
             * @brief Number of analyses run so far
             */
            [[nodiscard]] uint64_t analyses() const;

            /**
             * @brief A-weighting gain in dB (IEC 61672 approximation, 0 dB at 1 kHz)
             */
            static double a_weighting_db(double hz);

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace bitplay

#endif // BITPLAY_ANALYZER_SPECTRUM_ANALYZER_HH
