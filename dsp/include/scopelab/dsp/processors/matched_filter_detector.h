// ==============================================================================
// Layer 2: DSP Processor - Matched Filter Detector
// ==============================================================================
// Normalized cross-correlation of the record against a template. Both are
// demeaned and scaled to unit norm, so the correlation lies in [-1, 1] and
// its maximum measures how well the template shape occurs in the record.
//
// The curve is correlation versus lag in seconds ("valid" lags only,
// N - M + 1 values). Exactly one detection, at the correlation maximum.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// @brief Correlate against an in-memory template.
/// @throws AnalysisError (EmptySignal, InvalidArgument)
/// @throws AnalysisError (EmptyTemplate) if templ is empty
/// @throws AnalysisError (InsufficientSamples) if the template is longer than the record
[[nodiscard]] DetectorResult detectMatchedFilter(const float* x, size_t n, double sampleRate,
                                                 const std::vector<float>& templ,
                                                 const AnalysisParams& params,
                                                 CancelFlag cancel = nullptr);

/// @brief Correlate against the template file named by params.templatePath.
/// @throws AnalysisError (TemplateNotFound, EmptyTemplate) from the loader
[[nodiscard]] DetectorResult detectMatchedFilter(const float* x, size_t n, double sampleRate,
                                                 const AnalysisParams& params,
                                                 CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
