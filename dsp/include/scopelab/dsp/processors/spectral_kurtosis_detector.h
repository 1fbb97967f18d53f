// ==============================================================================
// Layer 2: DSP Processor - Spectral Kurtosis Detector
// ==============================================================================
// STFT log-magnitude, standardized per frequency bin across time; the excess
// kurtosis mean(z^4) - 3 highlights impulsive or bursty bands rather than
// persistent tones. The threshold is a fixed kurtosis value.
//
// Image: log-magnitude normalized to [0, 1], rows = frequency, columns = time.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>

namespace Scopelab::DSP {

/// @brief Detect bands whose magnitude statistics are heavy-tailed over time.
/// @throws AnalysisError (EmptySignal, InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult detectSpectralKurtosis(const float* x, size_t n, double sampleRate,
                                                    const AnalysisParams& params,
                                                    CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
