#include "fftw_r2c.hh"
#include <failsafe/failsafe.hh>

#include <mutex>

namespace bitplay::detail {

    namespace {
        // fftw planner calls are not thread-safe, only fftw_execute is
        std::mutex& planner_mutex() {
            static std::mutex m;
            return m;
        }
    }

    fftw_r2c::fftw_r2c(size_t nfft)
        : m_nfft(nfft) {
        if (nfft < 2) {
            THROW_RUNTIME("FFT size must be at least 2, got ", nfft);
        }
        std::lock_guard<std::mutex> lock(planner_mutex());
        m_in = static_cast<double*>(fftw_malloc(sizeof(double) * m_nfft));
        m_out = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins()));
        if (!m_in || !m_out) {
            fftw_free(m_in);
            fftw_free(m_out);
            THROW_RUNTIME("cannot allocate FFT buffers of size ", nfft);
        }
        m_plan = fftw_plan_dft_r2c_1d(static_cast<int>(m_nfft), m_in, m_out, FFTW_ESTIMATE);
        if (!m_plan) {
            fftw_free(m_in);
            fftw_free(m_out);
            THROW_RUNTIME("fftw_plan_dft_r2c_1d failed for size ", nfft);
        }
    }

    fftw_r2c::~fftw_r2c() {
        std::lock_guard<std::mutex> lock(planner_mutex());
        fftw_destroy_plan(m_plan);
        fftw_free(m_out);
        fftw_free(m_in);
    }

    void fftw_r2c::execute() {
        fftw_execute(m_plan);
    }

} // namespace bitplay::detail
