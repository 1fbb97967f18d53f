// ==============================================================================
// Layer 2: DSP Processor - Line Detection Helpers
// ==============================================================================
// Shared stages of every line detector:
// 1. Robust baseline: median filter of the log-domain estimate
// 2. CFAR offset: (1-pfa)-quantile of residual = estimate - baseline
// 3. Grouping: contiguous runs of above-threshold bins (a gap of more than
//    one bin starts a new run), one detection per run at the bin of maximum
//    residual, refined parabolically
//
// The quantile threshold controls the false-alarm rate well for
// Gaussian-like noise floors; it is not re-derived per detector.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <cstddef>
#include <string>
#include <vector>

namespace Scopelab::DSP {

// =============================================================================
// Constants
// =============================================================================

/// pfa values are clamped to this range before taking the quantile
inline constexpr double kMinPfa = 1e-6;
inline constexpr double kMaxPfa = 0.2;

/// CFAR offset used when the residual quantile is unavailable
inline constexpr double kFallbackCfarOffsetDb = 6.0;

/// Smallest median-filter kernel for robust baselines
inline constexpr int kMinSmoothBins = 3;

/// Warning attached when the input carries no AC energy
inline constexpr const char* kNoAcContentWarning = "signal has no AC content";

// =============================================================================
// Types
// =============================================================================

/// @brief Inclusive run of bin indices [first, last]
struct BinRun {
    size_t first = 0;
    size_t last = 0;
};

/// @brief Intermediate products of a CFAR pass
struct CfarOutcome {
    std::vector<double> baseline;
    std::vector<double> residual;
    double offset = 0.0;
    std::vector<Detection> detections;
    bool cancelled = false; ///< Stopped before grouping; detections empty
};

// =============================================================================
// Stages
// =============================================================================

/// @brief Median-filter baseline with kernel max(3, smoothBins | 1)
[[nodiscard]] std::vector<double> robustBaseline(const std::vector<double>& levelDb, int smoothBins);

/// @brief (1-pfa)-quantile of the residual; pfa clamped to [kMinPfa, kMaxPfa]
/// @return kFallbackCfarOffsetDb if the residual is empty or the quantile is not finite
[[nodiscard]] double cfarOffset(const std::vector<double>& residual, double pfa);

/// @brief Split ascending indices into runs; a gap of more than 1 starts a new run
[[nodiscard]] std::vector<BinRun> groupRuns(const std::vector<size_t>& indices);

/// @brief Bandwidth of a run: frequency span, or one bin for a single-bin run
[[nodiscard]] double runBandwidth(const BinRun& run, const std::vector<double>& frequencies,
                                  double df) noexcept;

/// @brief Full CFAR pass over a dB curve: baseline, threshold, grouping, refinement
/// @param type Detection type tag ("line", "ar")
/// @param cancel Polled after the threshold stage; a hit skips grouping
[[nodiscard]] CfarOutcome detectLinesCfar(const std::vector<double>& frequencies,
                                          const std::vector<double>& levelDb,
                                          double df, int smoothBins, double pfa,
                                          const std::string& type,
                                          CancelFlag cancel = nullptr);

/// @brief Runs where values >= threshold, one detection per run at its maximum
[[nodiscard]] std::vector<Detection> detectRunsAtOrAbove(const std::vector<double>& frequencies,
                                                         const std::vector<double>& values,
                                                         double threshold, double df,
                                                         const std::string& type,
                                                         MetricKind metric);

/// @brief True if x has non-negligible energy after mean removal
[[nodiscard]] bool hasAcContent(const float* x, size_t n) noexcept;

/// @brief Convert a power sequence to dB with the power floor
[[nodiscard]] std::vector<double> toDecibels(const std::vector<double>& power);

// =============================================================================
// Result Plumbing
// =============================================================================

/// @brief Throw EmptySignal for an empty record, InvalidArgument for a bad rate
void requireSignal(const float* x, size_t n, double sampleRate);

/// @brief Empty result tagged with method, record length and rate
[[nodiscard]] DetectorResult makeDetectorResult(AnalysisMethod method, size_t n, double sampleRate);

/// @brief Flag a result as cancelled: no detections, warning appended
void markCancelled(DetectorResult& result);

} // namespace Scopelab::DSP
