#ifndef BITPLAY_ANALYZER_FFTW_R2C_HH
#define BITPLAY_ANALYZER_FFTW_R2C_HH

#include <cstddef>
#include <fftw3.h>

namespace bitplay::detail {

    /**
     * Reusable real-to-complex FFTW plan with its own aligned buffers.
     * out() holds nfft/2 + 1 bins after execute().
     */
    class fftw_r2c {
        public:
            explicit fftw_r2c(size_t nfft);
            ~fftw_r2c();

            fftw_r2c(const fftw_r2c&) = delete;
            fftw_r2c& operator=(const fftw_r2c&) = delete;

            [[nodiscard]] size_t nfft() const { return m_nfft; }
            [[nodiscard]] size_t bins() const { return m_nfft / 2 + 1; }

            double* in() { return m_in; }
            const fftw_complex* out() const { return m_out; }

            void execute();

        private:
            size_t m_nfft = 0;
            double* m_in = nullptr;
            fftw_complex* m_out = nullptr;
            fftw_plan m_plan = nullptr;
    };

} // namespace bitplay::detail

#endif // BITPLAY_ANALYZER_FFTW_R2C_HH
