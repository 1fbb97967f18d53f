// ==============================================================================
// Layer 1: DSP Primitive - Parabolic Peak Refiner
// ==============================================================================
// Sub-bin interpolation of a spectral peak from three neighboring bins.
//
// A parabola through (i-1, y0), (i, y1), (i+1, y2) peaks at i + delta with
//   delta = 0.5 * (y0 - y2) / (y0 - 2*y1 + y2)
// and height y1 - 0.25 * (y0 - y2) * delta.
// delta is clamped to [-0.5, 0.5]; collinear points give delta = 0.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/numeric_guards.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Scopelab::DSP {

/// @brief Refined peak location (bins relative to the center) and height
struct PeakEstimate {
    double offset = 0.0;  ///< delta in [-0.5, 0.5]
    double value = 0.0;   ///< interpolated peak height
};

/// @brief Parabolic peak offset from the center bin
/// @return delta in [-0.5, 0.5]; 0 for a flat or non-finite triple
[[nodiscard]] inline double parabolicOffset(double yPrev, double yCenter, double yNext) noexcept {
    const double denom = yPrev - 2.0 * yCenter + yNext;
    if (!(std::abs(denom) >= kFlatDenominator)) return 0.0;

    const double delta = 0.5 * (yPrev - yNext) / denom;
    if (!std::isfinite(delta)) return 0.0;
    return std::clamp(delta, -0.5, 0.5);
}

/// @brief Height of the parabola at the given offset
[[nodiscard]] inline double parabolicValue(double yPrev, double yCenter, double yNext,
                                           double delta) noexcept {
    return yCenter - 0.25 * (yPrev - yNext) * delta;
}

/// @brief Refine the peak at index i of y[0..n)
///
/// Bins 0 and n-1 have only one neighbor, so the raw value is returned with
/// a zero offset.
template <typename T>
[[nodiscard]] inline PeakEstimate refinePeak(const T* y, size_t n, size_t i) noexcept {
    if (y == nullptr || i >= n) return {};

    const double center = static_cast<double>(y[i]);
    if (i == 0 || i + 1 >= n) return {0.0, center};

    const double prev = static_cast<double>(y[i - 1]);
    const double next = static_cast<double>(y[i + 1]);
    const double delta = parabolicOffset(prev, center, next);
    return {delta, parabolicValue(prev, center, next, delta)};
}

} // namespace Scopelab::DSP
