// ==============================================================================
// Layer 2: DSP Processor - Spectrogram Persistence Detector
// ==============================================================================
// STFT power in dB, baseline per frequency row = median across time, per-row
// (1-pfa)-quantile threshold. The ranking metric is occupancy, the fraction
// of frames above the row threshold; the topK rows by occupancy are reported
// (rows with zero occupancy never are).
//
// Image layout: rows = frequency bins, columns = frames,
// extent = (t0, t_last, f0, f_last).
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>

namespace Scopelab::DSP {

/// @brief Rank frequencies by how persistently they exceed their own baseline.
/// @throws AnalysisError (EmptySignal, InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult detectSpectrogramPersistence(const float* x, size_t n,
                                                          double sampleRate,
                                                          const AnalysisParams& params,
                                                          CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
