// ==============================================================================
// Layer 2: DSP Processor - Magnitude-Squared Coherence Detector
// ==============================================================================
// Two-channel MSC C(f) = |Pxy|^2 / (Pxx * Pyy) from Welch cross/auto spectral
// densities. Frequencies where both channels share a coherent component
// (common-mode pickup, coupled interference) approach 1.
//
// The threshold is a fixed value in [0,1] (params.mscThreshold).
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>

namespace Scopelab::DSP {

/// @brief MSC between two simultaneously captured channels.
/// @param x, nx, sampleRateX  First channel
/// @param y, ny, sampleRateY  Second channel; must match the first in length and rate
/// @throws AnalysisError (EmptySignal) if the first channel is empty
/// @throws AnalysisError (ChannelMismatch) if the second channel is unavailable,
///         or on a length or rate mismatch
/// @throws AnalysisError (InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult detectCoherence(const float* x, size_t nx, double sampleRateX,
                                             const float* y, size_t ny, double sampleRateY,
                                             const AnalysisParams& params,
                                             CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
