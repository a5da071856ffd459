#include <bitplay/analyzer/spectrum_analyzer.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>
#include "fftw_r2c.hh"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace bitplay {

    namespace {
        constexpr double pi = 3.14159265358979323846;
        constexpr double min_magnitude = 1e-12;
        constexpr double lowest_band_edge = 0.1;
        constexpr sample_rate_t fallback_rate = 44100;

        double steady_seconds() {
            using namespace std::chrono;
            return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
        }

        int16_t load_s16le(const uint8_t* p) {
            return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
        }

        int32_t load_s32le(const uint8_t* p) {
            return static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                        (static_cast<uint32_t>(p[1]) << 8) |
                                        (static_cast<uint32_t>(p[2]) << 16) |
                                        (static_cast<uint32_t>(p[3]) << 24));
        }
    }

    struct spectrum_analyzer::impl {
        analyzer_config m_config;
        mutable std::mutex m_mutex;

        detail::fftw_r2c m_fft;
        std::vector<double> m_window;
        std::vector<double> m_power;   // per bin, scratch
        std::vector<float> m_buffer;
        size_t m_fill = 0;
        sample_rate_t m_sample_rate = fallback_rate;

        std::vector<float> m_smoothed;
        std::vector<float> m_latest;
        std::vector<float> m_peak;
        std::vector<double> m_peak_times;
        uint64_t m_analyses = 0;

        explicit impl(analyzer_config cfg)
            : m_config(std::move(cfg)),
              m_fft(m_config.fft_size),
              m_window(m_config.fft_size),
              m_power(m_fft.bins()),
              m_buffer(m_config.fft_size, 0.0f),
              m_smoothed(m_config.bands, floor_db),
              m_latest(m_config.bands, floor_db),
              m_peak(m_config.bands, floor_db),
              m_peak_times(m_config.bands, 0.0) {
            // symmetric Hann
            const size_t n = m_config.fft_size;
            for (size_t i = 0; i < n; i++) {
                m_window[i] = 0.5 - 0.5 * std::cos(2.0 * pi * static_cast<double>(i) / static_cast<double>(n - 1));
            }
            if (!m_config.clock) {
                m_config.clock = steady_seconds;
            }
        }

        [[nodiscard]] double band_edge(size_t i) const {
            const double lo = std::log10(std::max(lowest_band_edge, m_config.min_hz));
            const double hi = std::log10(m_config.max_hz);
            return std::pow(10.0, lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(m_config.bands));
        }

        void fold(const float* samples, size_t count) {
            const size_t n = m_buffer.size();
            if (count >= n) {
                std::copy(samples + (count - n), samples + count, m_buffer.begin());
                m_fill = n;
            } else {
                std::copy(m_buffer.begin() + static_cast<std::ptrdiff_t>(count), m_buffer.end(), m_buffer.begin());
                std::copy(samples, samples + count, m_buffer.end() - static_cast<std::ptrdiff_t>(count));
                m_fill = std::min(n, m_fill + count);
            }
            if (m_fill >= n) {
                analyze();
            }
        }

        void analyze() {
            const size_t n = m_buffer.size();
            double* in = m_fft.in();
            for (size_t i = 0; i < n; i++) {
                in[i] = static_cast<double>(m_buffer[i]) * m_window[i];
            }
            m_fft.execute();

            const fftw_complex* out = m_fft.out();
            const size_t bins = m_fft.bins();
            const double bin_hz = static_cast<double>(m_sample_rate) / static_cast<double>(n);
            const double norm = static_cast<double>(n) / 2.0;
            for (size_t k = 0; k < bins; k++) {
                const double mag = std::max(std::hypot(out[k][0], out[k][1]) / norm, min_magnitude);
                double db = 20.0 * std::log10(mag);
                if (m_config.a_weighting) {
                    db += a_weighting_db(static_cast<double>(k) * bin_hz);
                }
                m_power[k] = std::pow(10.0, db / 10.0);
            }

            const double k_smooth = m_config.smoothing;
            const double now = m_config.clock();
            for (size_t b = 0; b < m_config.bands; b++) {
                const double low = band_edge(b);
                const double high = band_edge(b + 1);

                double sum = 0.0;
                size_t count = 0;
                auto k = static_cast<size_t>(std::max(0.0, std::ceil(low / bin_hz)));
                while (k > 0 && static_cast<double>(k - 1) * bin_hz >= low) {
                    --k;
                }
                for (; k < bins && static_cast<double>(k) * bin_hz < high; k++) {
                    if (static_cast<double>(k) * bin_hz >= low) {
                        sum += m_power[k];
                        ++count;
                    }
                }
                if (count == 0) {
                    const double center = (low + high) / 2.0;
                    auto nearest = static_cast<size_t>(std::llround(center / bin_hz));
                    sum = m_power[std::min(nearest, bins - 1)];
                    count = 1;
                }
                const double band_db = 10.0 * std::log10(std::max(sum / static_cast<double>(count), min_magnitude));

                m_latest[b] = static_cast<float>(band_db);
                const double s = k_smooth * m_smoothed[b] + (1.0 - k_smooth) * band_db;
                m_smoothed[b] = std::max(static_cast<float>(s), floor_db);

                if (m_smoothed[b] > m_peak[b]) {
                    m_peak[b] = m_smoothed[b];
                    m_peak_times[b] = now;
                } else if (now - m_peak_times[b] > m_config.peak_hold_seconds) {
                    m_peak[b] = std::max(m_smoothed[b], static_cast<float>(m_peak[b] - m_config.peak_decay_db));
                }
            }
            m_analyses++;
        }
    };

    spectrum_analyzer::spectrum_analyzer(analyzer_config config) {
        if (config.bands == 0) {
            THROW_RUNTIME("spectrum analyzer needs at least one band");
        }
        config.min_hz = std::max(1.0, config.min_hz);
        if (config.max_hz <= config.min_hz) {
            throw std::invalid_argument("max_hz must exceed min_hz");
        }
        config.smoothing = std::clamp(config.smoothing, 0.0, 1.0);
        config.peak_hold_seconds = std::max(0.0, config.peak_hold_seconds);
        m_pimpl = std::make_unique<impl>(std::move(config));
        LOG_DEBUG("analyzer", "FFT size", m_pimpl->m_config.fft_size, "bands", m_pimpl->m_config.bands);
    }

    spectrum_analyzer::~spectrum_analyzer() = default;

    void spectrum_analyzer::push_block(const pcm_block& block) {
        if (block.data.empty()) {
            return;
        }
        if (block.format != audio_format::s16le && block.format != audio_format::s32le) {
            throw unsupported_format_error("spectrum analyzer accepts s16le and s32le blocks only");
        }
        const size_t frames = block.frames();
        if (frames == 0) {
            return;
        }
        const size_t stride = static_cast<size_t>(audio_format_byte_size(block.format)) * block.channels;
        std::vector<float> mono(frames);
        switch (block.format) {
            case audio_format::s16le:
                for (size_t i = 0; i < frames; i++) {
                    mono[i] = static_cast<float>(load_s16le(block.data.data() + i * stride)) / 32767.0f;
                }
                break;
            case audio_format::s32le:
                for (size_t i = 0; i < frames; i++) {
                    mono[i] = static_cast<float>(static_cast<double>(load_s32le(block.data.data() + i * stride)) /
                                                 2147483647.0);
                }
                break;
            case audio_format::unknown:
                return;
        }
        push_samples(mono.data(), frames, block.sample_rate);
    }

    void spectrum_analyzer::push_samples(const float* samples, size_t count, sample_rate_t sample_rate) {
        if (!samples || count == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        m_pimpl->m_sample_rate = sample_rate ? sample_rate : fallback_rate;
        m_pimpl->fold(samples, count);
    }

    display_frame spectrum_analyzer::get_display_frame() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return {m_pimpl->m_smoothed, m_pimpl->m_peak};
    }

    std::vector<float> spectrum_analyzer::latest_db() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_latest;
    }

    void spectrum_analyzer::set_frequency_range(double min_hz, double max_hz) {
        min_hz = std::max(1.0, min_hz);
        if (max_hz <= min_hz) {
            throw std::invalid_argument("max_hz must exceed min_hz");
        }
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        m_pimpl->m_config.min_hz = min_hz;
        m_pimpl->m_config.max_hz = max_hz;
    }

    void spectrum_analyzer::set_weighting(bool enabled) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        m_pimpl->m_config.a_weighting = enabled;
    }

    void spectrum_analyzer::set_smoothing(double factor) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        m_pimpl->m_config.smoothing = std::clamp(factor, 0.0, 1.0);
    }

    void spectrum_analyzer::set_peak_hold(double seconds) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        m_pimpl->m_config.peak_hold_seconds = std::max(0.0, seconds);
    }

    void spectrum_analyzer::clear_peaks() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        std::fill(m_pimpl->m_peak.begin(), m_pimpl->m_peak.end(), floor_db);
        std::fill(m_pimpl->m_peak_times.begin(), m_pimpl->m_peak_times.end(), 0.0);
    }

    double spectrum_analyzer::band_center_hz(size_t i) const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        if (i >= m_pimpl->m_config.bands) {
            throw std::out_of_range("band index " + std::to_string(i) + " out of range");
        }
        return std::sqrt(m_pimpl->band_edge(i) * m_pimpl->band_edge(i + 1));
    }

    size_t spectrum_analyzer::bands() const {
        return m_pimpl->m_config.bands;
    }

    size_t spectrum_analyzer::fft_size() const {
        return m_pimpl->m_config.fft_size;
    }

    uint64_t spectrum_analyzer::analyses() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_analyses;
    }

    double spectrum_analyzer::a_weighting_db(double hz) {
        const double f2 = hz * hz;
        const double ra = (12200.0 * 12200.0 * f2 * f2) /
                          ((f2 + 20.6 * 20.6) *
                           std::sqrt((f2 + 107.7 * 107.7) * (f2 + 737.9 * 737.9)) *
                           (f2 + 12200.0 * 12200.0));
        if (!(ra > 0.0)) {
            return static_cast<double>(floor_db);
        }
        return 20.0 * std::log10(ra) + 2.00;
    }

} // namespace bitplay
