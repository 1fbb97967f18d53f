// ==============================================================================
// Layer 3: System Component - Analysis Engine
// ==============================================================================
// Single entry point that validates parameters, dispatches to the method's
// processor, stamps elapsed time and logs the run.
//
// Calls are independent: no state is carried between them, so identical
// inputs give identical results. Run it from a worker thread and pass a
// cancellation flag to keep an interactive caller responsive.
//
// Usage:
//   AnalysisParams params;
//   applyPreset(params, AnalysisMethod::PsdCfar, "Fast scan");
//   auto result = analyze(samples.data(), samples.size(), fs, AnalysisMethod::PsdCfar, params);
//   const auto& detections = std::get<DetectorResult>(result).detections;
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>
#include <variant>
#include <vector>

namespace Scopelab::DSP {

/// Result of one analyze() call
using AnalysisResult = std::variant<HarmonicResult, DetectorResult>;

/// @brief Run one single-channel method.
///
/// Coherence needs two channels; use analyzeTwoChannel().
/// @throws AnalysisError (EmptySignal) for an empty record, for every method
/// @throws AnalysisError (InvalidArgument) from validation
/// @throws AnalysisError (ChannelMismatch) for Coherence
/// @throws AnalysisError (InsufficientSamples, TemplateNotFound, EmptyTemplate)
[[nodiscard]] AnalysisResult analyze(const float* x, size_t n, double sampleRate,
                                     AnalysisMethod method, const AnalysisParams& params,
                                     CancelFlag cancel = nullptr);

/// @brief Vector overload
[[nodiscard]] AnalysisResult analyze(const std::vector<float>& x, double sampleRate,
                                     AnalysisMethod method, const AnalysisParams& params,
                                     CancelFlag cancel = nullptr);

/// @brief Two-channel magnitude-squared coherence.
/// @throws AnalysisError (EmptySignal) for an empty first channel
/// @throws AnalysisError (ChannelMismatch) when the second channel is missing or
///         differs in length or sample rate
/// @throws AnalysisError (InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult analyzeTwoChannel(const float* x, size_t nx, double sampleRateX,
                                               const float* y, size_t ny, double sampleRateY,
                                               const AnalysisParams& params,
                                               CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
