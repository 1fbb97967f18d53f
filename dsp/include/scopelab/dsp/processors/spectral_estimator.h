// ==============================================================================
// Layer 2: DSP Processor - Spectral Estimator
// ==============================================================================
// Windowed FFT spectral estimates shared by the harmonic analyzer and the
// line detectors:
// - Block spectrum: one windowed FFT of the whole record
// - Welch PSD / cross-spectral density: averaged periodic-Hann periodograms
// - Multitaper PSD: DPSS-tapered periodograms averaged over tapers, then
//   over segments
// - STFT: framed spectra with zero boundary padding
// - Frame spectra: plain framing without padding (cyclic spectrum)
//
// Segmented estimators average per-frame power, never raw FFTs. Every frame
// loop polls the cancellation flag and reports how far it got.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/cancellation.h>
#include <scopelab/dsp/primitives/fft.h>

#include <complex>
#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

// =============================================================================
// Constants
// =============================================================================

/// Shortest segment any segmented estimator will use
inline constexpr size_t kMinSegmentLength = 128;

// =============================================================================
// Result Types
// =============================================================================

/// @brief One-sided spectrum on a uniform frequency grid
struct Spectrum {
    std::vector<double> frequencies;  ///< k * fs / nfft, ascending
    std::vector<double> values;
    double df = 0.0;
};

/// @brief Single-block FFT of a windowed record
struct BlockSpectrum {
    std::vector<Complex> bins;        ///< N/2+1 complex bins, unscaled
    std::vector<double> magnitude;    ///< |bins|
    std::vector<double> frequencies;
    double df = 0.0;
    size_t fftSize = 0;
};

/// @brief Segmentation of a record into overlapping frames
struct SegmentPlan {
    size_t length = 0;    ///< nperseg
    size_t overlap = 0;   ///< noverlap
    size_t hop = 0;       ///< length - overlap
    size_t fftSize = 0;   ///< >= length
    size_t count = 0;     ///< full frames that fit
};

/// @brief Averaged power spectral density
struct PsdEstimate {
    Spectrum psd;
    size_t segmentsUsed = 0;
    bool cancelled = false;
};

/// @brief Auto and cross spectral densities of two channels
struct CrossSpectralEstimate {
    std::vector<double> frequencies;
    std::vector<double> pxx;
    std::vector<double> pyy;
    std::vector<std::complex<double>> pxy;
    double df = 0.0;
    size_t segmentsUsed = 0;
    bool cancelled = false;
};

/// @brief Framed complex spectra, bin-major (row = frequency, column = frame)
struct FramedSpectra {
    size_t numBins = 0;
    size_t numFrames = 0;
    std::vector<std::complex<double>> values;  ///< numBins * numFrames
    std::vector<double> frequencies;
    std::vector<double> times;                 ///< frame centers in seconds
    double df = 0.0;
    bool cancelled = false;

    [[nodiscard]] const std::complex<double>& at(size_t bin, size_t frame) const noexcept {
        return values[bin * numFrames + frame];
    }
};

// =============================================================================
// Segmentation
// =============================================================================

/// @brief Effective segment length: max(kMinSegmentLength, min(requested, available))
/// @throws AnalysisError (InvalidArgument) if requested is 0
/// @throws AnalysisError (InsufficientSamples) if available is below the result
[[nodiscard]] size_t resolveSegmentLength(size_t requested, size_t available);

/// @brief Plan Welch-style segmentation.
/// @param available     Record length N
/// @param segmentLength Requested nperseg (resolved with resolveSegmentLength)
/// @param overlapFraction Overlap in [0,1); noverlap = clamp(floor(f*nperseg), 0, nperseg-1)
/// @param fftSize       Requested nfft; raised to nperseg if smaller
[[nodiscard]] SegmentPlan planSegments(size_t available, size_t segmentLength,
                                       double overlapFraction, size_t fftSize);

// =============================================================================
// Estimators
// =============================================================================

/// @brief Remove the mean, returning a double-precision copy
[[nodiscard]] std::vector<double> removeMean(const float* x, size_t n);

/// @brief Windowed single FFT of x[0..n)
/// @param window n weights (applied sample by sample)
/// @param removeDc subtract the mean before windowing
/// @param fftSize transform length (0 = n); shorter records are zero-padded
[[nodiscard]] BlockSpectrum computeBlockSpectrum(const float* x, size_t n, double sampleRate,
                                                 const std::vector<float>& window,
                                                 bool removeDc, size_t fftSize = 0);

/// @brief Welch PSD (periodic Hann, per-segment mean removal, density scaling)
[[nodiscard]] PsdEstimate welchPsd(const std::vector<double>& x, double sampleRate,
                                   const SegmentPlan& plan, CancelFlag cancel = nullptr);

/// @brief Welch auto- and cross-spectral densities of two equal-length records
[[nodiscard]] CrossSpectralEstimate welchCrossSpectra(const std::vector<double>& x,
                                                      const std::vector<double>& y,
                                                      double sampleRate,
                                                      const SegmentPlan& plan,
                                                      CancelFlag cancel = nullptr);

/// @brief Multitaper PSD with numTapers DPSS tapers, NW = max(2.5, K/2)
[[nodiscard]] PsdEstimate multitaperPsd(const std::vector<double>& x, double sampleRate,
                                        const SegmentPlan& plan, size_t numTapers,
                                        CancelFlag cancel = nullptr);

/// @brief STFT with periodic Hann, zero boundary padding of nperseg/2 at both
///        ends, trailing zero padding to a whole number of hops, and frames
///        scaled by 1/sum(window)
[[nodiscard]] FramedSpectra shortTimeFourier(const std::vector<double>& x, double sampleRate,
                                             size_t segmentLength, size_t hop,
                                             CancelFlag cancel = nullptr);

/// @brief Plain framing (no padding) with a given window, unscaled FFT per frame
[[nodiscard]] FramedSpectra frameSpectra(const std::vector<double>& x, double sampleRate,
                                         const std::vector<float>& window, size_t hop,
                                         CancelFlag cancel = nullptr);

/// @brief Frequency grid k * fs / fftSize for k = 0..fftSize/2
[[nodiscard]] std::vector<double> rfftFrequencies(size_t fftSize, double sampleRate);

} // namespace Scopelab::DSP
