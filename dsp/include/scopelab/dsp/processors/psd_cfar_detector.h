// ==============================================================================
// Layer 2: DSP Processor - PSD + CFAR Line Detector
// ==============================================================================
// Welch PSD in dB, robust median baseline, (1-pfa)-quantile threshold on the
// residual, one "line" detection per contiguous run of bins above threshold.
// Deterministic given (segmentLength, overlap, fftSize, pfa, smoothBins).
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>

namespace Scopelab::DSP {

/// @brief Detect narrowband lines in a Welch PSD.
/// @throws AnalysisError (EmptySignal, InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult detectPsdCfar(const float* x, size_t n, double sampleRate,
                                           const AnalysisParams& params,
                                           CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
