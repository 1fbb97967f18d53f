// ==============================================================================
// Layer 1: DSP Primitive - FFT-Based Cross-Correlation
// ==============================================================================
// Valid-mode cross-correlation of a signal against a shorter template in
// O(N log N):
//   r[k] = sum_j s[k+j] * h[j],  k = 0..N-M
//
// Algorithm: r = IFFT(FFT(zero_pad(s)) * conj(FFT(zero_pad(h))))
// Zero-padding to at least N+M-1 keeps the valid lags free of circular wrap.
// ==============================================================================

#pragma once

#include <scopelab/dsp/primitives/fft.h>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// @brief Valid-mode cross-correlation using a power-of-two pffft transform.
class FFTCrossCorrelation {
public:
    FFTCrossCorrelation() noexcept = default;

    // Non-copyable, movable
    FFTCrossCorrelation(const FFTCrossCorrelation&) = delete;
    FFTCrossCorrelation& operator=(const FFTCrossCorrelation&) = delete;
    FFTCrossCorrelation(FFTCrossCorrelation&&) noexcept = default;
    FFTCrossCorrelation& operator=(FFTCrossCorrelation&&) noexcept = default;

    /// @brief Prepare for a signal and template length.
    ///
    /// The FFT size is the next power of 2 >= signalLength + templateLength - 1,
    /// and at least 32 (pffft minimum for real transforms).
    /// @note Allocates
    void prepare(size_t signalLength, size_t templateLength) {
        signalLength_ = signalLength;
        templateLength_ = templateLength;
        if (signalLength == 0 || templateLength == 0 || templateLength > signalLength) {
            fftSize_ = 0;
            return;
        }

        fftSize_ = std::max(std::bit_ceil(signalLength + templateLength - 1), kPffftRealQuantum);
        fft_.prepare(fftSize_);

        padded_.assign(fftSize_, 0.0f);
        result_.assign(fftSize_, 0.0f);
        signalSpectrum_.assign(fft_.numBins(), Complex{});
        templateSpectrum_.assign(fft_.numBins(), Complex{});
    }

    /// @brief Check if prepare() succeeded
    [[nodiscard]] bool isPrepared() const noexcept {
        return fftSize_ > 0 && fft_.isPrepared();
    }

    /// @brief Number of valid lags (N - M + 1)
    [[nodiscard]] size_t numLags() const noexcept {
        return isPrepared() ? signalLength_ - templateLength_ + 1 : 0;
    }

    /// @brief Compute r[0..numLags()) into out
    /// @param signal   signalLength samples
    /// @param templ    templateLength samples
    /// @param out      numLags() values
    void compute(const float* signal, const float* templ, double* out) noexcept {
        if (!isPrepared() || signal == nullptr || templ == nullptr || out == nullptr) return;

        std::fill(padded_.begin(), padded_.end(), 0.0f);
        std::copy_n(signal, signalLength_, padded_.begin());
        fft_.forward(padded_.data(), signalSpectrum_.data());

        std::fill(padded_.begin(), padded_.end(), 0.0f);
        std::copy_n(templ, templateLength_, padded_.begin());
        fft_.forward(padded_.data(), templateSpectrum_.data());

        for (size_t k = 0; k < signalSpectrum_.size(); ++k) {
            signalSpectrum_[k] = signalSpectrum_[k] * templateSpectrum_[k].conjugate();
        }
        fft_.inverse(signalSpectrum_.data(), result_.data());

        const size_t lags = numLags();
        for (size_t k = 0; k < lags; ++k) {
            out[k] = static_cast<double>(result_[k]);
        }
    }

private:
    size_t fftSize_ = 0;
    size_t signalLength_ = 0;
    size_t templateLength_ = 0;
    FFT fft_;
    std::vector<float> padded_;
    std::vector<float> result_;
    std::vector<Complex> signalSpectrum_;
    std::vector<Complex> templateSpectrum_;
};

} // namespace Scopelab::DSP
