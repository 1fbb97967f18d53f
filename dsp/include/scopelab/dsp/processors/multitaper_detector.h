// ==============================================================================
// Layer 2: DSP Processor - Multitaper Line Detector
// ==============================================================================
// DPSS multitaper PSD (K tapers, NW = max(2.5, K/2)) followed by the same
// CFAR stages as the PSD detector. The lower-variance estimate separates
// faint or closely spaced tones better at the same segment length.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>

namespace Scopelab::DSP {

/// @brief Detect narrowband lines in a multitaper PSD.
/// @throws AnalysisError (EmptySignal, InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult detectMultitaper(const float* x, size_t n, double sampleRate,
                                              const AnalysisParams& params,
                                              CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
