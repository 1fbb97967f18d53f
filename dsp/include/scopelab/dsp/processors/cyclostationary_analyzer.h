// ==============================================================================
// Layer 2: DSP Processor - Cyclostationary Spectral Correlation
// ==============================================================================
// Bin-aligned spectral correlation over (cyclic frequency alpha, frequency f):
//
//   X[k,f]       = FFT of symmetric-Hann frame k
//   Px[f]        = mean_k |X[k,f]|^2
//   C[alpha,f]   = mean_k X[k,f+m] conj(X[k,f-m]) / sqrt(Px[f+m] Px[f-m])
//   alpha        = 2 m df,  m = 0..mMax
//
// |C| lies in [0,1]. The image stores 20 log10(|C|) floored at dbFloor, with
// the alpha = 0 row forced to the floor (it is ~0 dB by construction).
//
// Image layout: rows = alpha, columns = f. No detections are produced; the
// map is for visual inspection.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// Smallest frame length requested for cyclic analysis
inline constexpr size_t kMinCycloFrameLength = 256;

/// Smallest frame advance for cyclic analysis
inline constexpr size_t kMinCycloHop = 64;

/// @brief Suggested display range for a dB map.
///
/// lo = median - span/2, hi = max(percentile, median + span/2) over body.
struct DisplayRange {
    double lo = 0.0;
    double hi = 0.0;
};

[[nodiscard]] DisplayRange autoLevelRange(const std::vector<double>& body, double spanDb,
                                          double percentile);

/// @brief Spectral correlation map of a single channel.
/// @throws AnalysisError (EmptySignal, InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult analyzeCyclostationary(const float* x, size_t n, double sampleRate,
                                                    const AnalysisParams& params,
                                                    CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
