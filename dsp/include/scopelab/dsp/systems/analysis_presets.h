// ==============================================================================
// Layer 3: System Component - Analysis Presets and Validation
// ==============================================================================
// Named per-method parameter presets for quick operator setup, method name
// parsing, and the parameter validation applied before every analysis run.
//
// A preset only overwrites the fields it names; everything else in the
// AnalysisParams passed to applyPreset() is left as it was.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>

#include <string>
#include <string_view>
#include <vector>

namespace Scopelab::DSP {

/// Name of the preset every method has
inline constexpr const char* kDefaultPresetName = "Default";

// =============================================================================
// Method Names
// =============================================================================

/// @brief Parse a method name.
///
/// Accepts the display names from methodName() ("PSD+CFAR", "MSC", ...) and
/// short command-line aliases ("psd", "msc", "ar", "matched", ...), case
/// insensitively.
/// @throws AnalysisError (InvalidArgument) for an unknown name
[[nodiscard]] AnalysisMethod parseAnalysisMethod(std::string_view name);

// =============================================================================
// Presets
// =============================================================================

/// @brief Preset names available for a method, "Default" first
[[nodiscard]] std::vector<std::string> presetNames(AnalysisMethod method);

/// @brief Overwrite the fields named by a preset.
/// @throws AnalysisError (InvalidArgument) if the method has no such preset
void applyPreset(AnalysisParams& params, AnalysisMethod method, std::string_view name);

/// @brief Apply one "key=value" override on top of a preset.
///
/// Keys use the short parameter names (nfft, seglen, overlap, hop, pfa,
/// smooth_bins, topk, msc_thr, k_tapers, sk_thr, qmin_ms, qmax_ms, cep_topk,
/// ar_order, alpha_max, db_floor, auto_level, level_span, level_pct,
/// bico_nfft, window, n_harmonics, include_dc, thdn, template). Range checks
/// are left to validate(); this only rejects values that cannot be stored.
/// @throws AnalysisError (InvalidArgument) for a malformed assignment, an
///         unknown key, a non-numeric or non-finite value, or a count that is
///         negative, fractional or out of range
void applyOverride(AnalysisParams& params, std::string_view assignment);

// =============================================================================
// Validation
// =============================================================================

/// @brief Reject parameter sets the given method cannot run with.
///
/// Checks the sample rate and the fields the method reads. Never corrects a
/// value silently.
/// @throws AnalysisError (InvalidArgument) naming the offending field
void validate(const AnalysisParams& params, AnalysisMethod method, double sampleRate);

} // namespace Scopelab::DSP
