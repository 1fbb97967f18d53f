// ==============================================================================
// Layer 2: DSP Processor - Bicoherence
// ==============================================================================
// Squared bicoherence over the principal triangle f1 >= 0, f2 >= 0,
// f1 + f2 <= fs/2 (bin indices i + j < M):
//
//   S1[i,j] = sum_k X_k[i] X_k[j] conj(X_k[i+j])
//   S2[i,j] = sum_k |X_k[i] X_k[j]|^2
//   S3[l]   = sum_k |X_k[l]|^2
//   b2[i,j] = |S1|^2 / (S2[i,j] S3[i+j]), clipped to [0,1]
//
// Values near 1 indicate quadratic phase coupling: a component at f1+f2
// whose phase is locked to the sum of the phases at f1 and f2.
//
// The accumulator is a plain value: accumulateBicoherence() takes one and
// returns the updated one, so blocks can be folded in across captures.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>

#include <complex>
#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// Largest FFT size accepted; the sums grow as (fftSize/2 + 1)^2
inline constexpr size_t kMaxBicoherenceFftSize = 4096;

/// Peaks below this bicoherence are never reported
inline constexpr double kMinBicoherencePeak = 0.2;

/// Peaks below this fraction of the map maximum are never reported
inline constexpr double kRelativeBicoherencePeak = 0.5;

/// @brief Running third-order sums
struct BicoherenceAccumulator {
    size_t fftSize = 0;
    size_t hop = 0;
    size_t numBins = 0;          ///< M = fftSize/2 + 1
    double sampleRate = 0.0;
    std::vector<std::complex<double>> tripleSum;  ///< S1, M*M row-major (i, j)
    std::vector<double> pairPowerSum;             ///< S2, M*M row-major
    std::vector<double> powerSum;                 ///< S3, M
    size_t frameCount = 0;
};

/// @brief Empty accumulator for frames of fftSize samples overlapping by noverlap.
/// @throws AnalysisError (InvalidArgument) for fftSize outside
///         [2, kMaxBicoherenceFftSize], noverlap >= fftSize, or a non-positive
///         sample rate
[[nodiscard]] BicoherenceAccumulator makeBicoherenceAccumulator(size_t fftSize, size_t noverlap,
                                                                double sampleRate);

/// @brief Fold one block into the sums (demeaned, unit-RMS periodic Hann frames).
///
/// Blocks shorter than fftSize contribute nothing. If cancel is raised the
/// frames processed so far are kept.
[[nodiscard]] BicoherenceAccumulator accumulateBicoherence(BicoherenceAccumulator acc,
                                                           const float* x, size_t n,
                                                           CancelFlag cancel = nullptr);

/// @brief Squared bicoherence image: rows = f1 bin, columns = f2 bin.
///
/// Cells outside the triangle, and every cell before any frame was
/// accumulated, are zero.
[[nodiscard]] Image2D finalizeBicoherence(const BicoherenceAccumulator& acc);

/// @brief Local maxima of a bicoherence image.
///
/// DC and edge rows/columns are ignored. A cell qualifies if it is at least
/// max(kMinBicoherencePeak, kRelativeBicoherencePeak * max) and not smaller
/// than any of its 8 neighbours. Only i <= j is reported (the map is
/// symmetric). The strongest topK are returned.
[[nodiscard]] std::vector<Detection> pickBicoherencePeaks(const Image2D& image, double df,
                                                          size_t topK);

/// @brief Single-capture bicoherence analysis.
/// @throws AnalysisError (EmptySignal, InvalidArgument, InsufficientSamples)
[[nodiscard]] DetectorResult detectBicoherence(const float* x, size_t n, double sampleRate,
                                               const AnalysisParams& params,
                                               CancelFlag cancel = nullptr);

} // namespace Scopelab::DSP
