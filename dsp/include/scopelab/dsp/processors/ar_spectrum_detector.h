// ==============================================================================
// Layer 2: DSP Processor - AR (Yule-Walker) Spectrum Detector
// ==============================================================================
// Fits an order-p all-pole model to the demeaned record and evaluates
// P(f) = e / |A(e^jw)|^2 on an nfft-point grid (nfft >= 1024). Resonances of
// the fitted model become peaks, which then pass through the CFAR stages.
//
// Resolution is sharper than FFT methods, but peak count and position depend
// on the model order.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// Smallest evaluation grid for the AR spectrum
inline constexpr size_t kMinArFftSize = 1024;

/// @brief AR power spectrum e / |A|^2 at k * fs / fftSize, k = 0..fftSize/2
/// @param coefficients a[0] = 1, a[1..p]
[[nodiscard]] std::vector<double> evaluateArSpectrum(const std::vector<double>& coefficients,
                                                     double predictionError, size_t fftSize);

/// @brief Detect resonances of a Yule-Walker AR fit.
/// @throws AnalysisError (EmptySignal, InvalidArgument)
/// @throws AnalysisError (InsufficientSamples) if N <= order
[[nodiscard]] DetectorResult detectArSpectrum(const float* x, size_t n, double sampleRate,
                                              const AnalysisParams& params,
                                              CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
