// ==============================================================================
// Layer 2: DSP Processor - Cepstrum Comb Detector
// ==============================================================================
// Real cepstrum c(q) = IFFT(log|X(f)|) of the most recent min(N, nfft)
// samples. A harmonic comb with spacing F shows up as a peak at quefrency
// q = 1/F, so each peak reports a candidate fundamental spacing rather than
// a frequency present in the spectrum.
//
// Curve x axis is 1/q (Hz) over the searched quefrency window.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>

namespace Scopelab::DSP {

/// nfft is clamped into [kMinCepstrumFftSize, kMaxCepstrumFftSize]
inline constexpr size_t kMinCepstrumFftSize = 1024;
inline constexpr size_t kMaxCepstrumFftSize = size_t{1} << 18;

/// @brief Search the quefrency window for comb spacings.
/// @throws AnalysisError (EmptySignal, InvalidArgument)
[[nodiscard]] DetectorResult detectCepstrum(const float* x, size_t n, double sampleRate,
                                            const AnalysisParams& params,
                                            CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
