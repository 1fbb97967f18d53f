// ==============================================================================
// Layer 0: Core Utility - Numeric Guards
// ==============================================================================
// Named epsilon floors and guarded log/division helpers.
//
// Every analysis kernel routes degenerate arithmetic (log of zero, division by
// a vanishing denominator) through these helpers so that degenerate input
// yields finite, structurally valid numbers instead of NaN or Inf. None of
// these functions throw.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>

namespace Scopelab {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor added to power values before taking a logarithm.
/// 10*log10(1e-30) = -300 dB, far below any physical measurement.
inline constexpr double kPowerFloor = 1e-30;

/// Floor added to magnitudes before taking a logarithm or dividing.
inline constexpr double kMagnitudeFloor = 1e-30;

/// Floor added to standard deviations and norms before normalizing.
inline constexpr double kStdFloor = 1e-12;

/// Floor used by the cyclic-spectrum and bicoherence dB conversions.
inline constexpr double kCoherenceFloor = 1e-12;

/// Denominator magnitude below which a quadratic fit is considered flat.
inline constexpr double kFlatDenominator = 1e-18;

// ==============================================================================
// Guarded Operations
// ==============================================================================

/// @brief Base-10 logarithm with the argument floored at @p floor.
[[nodiscard]] inline double safeLog10(double x, double floor = kPowerFloor) noexcept {
    if (!(x > floor)) x = floor;  // also catches NaN
    return std::log10(x);
}

/// @brief Natural logarithm with the argument floored at @p floor.
[[nodiscard]] inline double safeLog(double x, double floor = kMagnitudeFloor) noexcept {
    if (!(x > floor)) x = floor;
    return std::log(x);
}

/// @brief Division with the denominator magnitude floored at @p floor.
///
/// The sign of the denominator is kept; a zero denominator is treated as
/// +floor.
[[nodiscard]] inline double safeDiv(double num, double den, double floor = kMagnitudeFloor) noexcept {
    if (std::abs(den) < floor) {
        den = (den < 0.0) ? -floor : floor;
    }
    return num / den;
}

/// @brief Convert a power ratio to decibels: 10*log10(max(p, floor)).
[[nodiscard]] inline double powerToDb(double power, double floor = kPowerFloor) noexcept {
    return 10.0 * safeLog10(power, floor);
}

/// @brief Convert an amplitude ratio to decibels: 20*log10(max(a, floor)).
[[nodiscard]] inline double amplitudeToDb(double amplitude, double floor = kMagnitudeFloor) noexcept {
    return 20.0 * safeLog10(amplitude, floor);
}

/// @brief Clamp to the closed unit interval, mapping NaN to zero.
[[nodiscard]] inline double clampUnit(double x) noexcept {
    if (!(x > 0.0)) return 0.0;
    return std::min(x, 1.0);
}

} // namespace DSP
} // namespace Scopelab
