// ==============================================================================
// Layer 2: DSP Processor - Harmonic Analyzer
// ==============================================================================
// Fundamental estimation, harmonic table and distortion figures from a single
// windowed FFT of the whole record:
// 1. DC removal unless includeDc
// 2. Window + FFT (symmetric window, CG-corrected magnitudes)
// 3. Fundamental = largest bin excluding DC, parabolically refined;
//    RMS = (mag/N)/sqrt(2)/CG
// 4. Harmonics k = 2..numHarmonics at round(k*f1/df) while k*f1 < fs/2; the
//    frequency is taken as exactly k*f1, only magnitude and phase are measured
// 5. THD = sqrt(sum h_k^2) / V1
// 6. THD+N, SINAD from the time-domain RMS; SNR from the spectrum with the
//    fundamental and harmonic bins (+-1) removed. The SNR is a coarse noise-
//    floor estimate, not an in-band noise measurement.
// 7. Crest and form factor
//
// Degenerate input (empty, constant, no peak) never throws: affected fields
// are zero and the reason is listed in warnings.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>

#include <cstddef>

namespace Scopelab::DSP {

/// Cycles of the fundamental below which the estimate is flagged unreliable
inline constexpr double kMinCoherenceCycles = 3.0;

/// fs/f1 ratio below which waveform-shape figures are flagged
inline constexpr double kMinSamplesPerCycle = 20.0;

/// Half-width in bins of the regions removed around each tone for the SNR
inline constexpr size_t kSnrExclusionBins = 1;

/// @brief Analyze fundamental and harmonics of x[0..n).
///
/// Reads window, numHarmonics, includeDc and computeThdN from params.
/// @throws AnalysisError (InvalidArgument) for non-positive or non-finite
///         sampleRate or numHarmonics < 1
[[nodiscard]] HarmonicResult analyzeHarmonics(const float* x, size_t n, double sampleRate,
                                              const AnalysisParams& params);

} // namespace Scopelab::DSP
