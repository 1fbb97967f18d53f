// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for the analysis kernels.
// Spectral estimation runs its accumulations in double, so only
// double-precision constants are provided.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units.
// ==============================================================================

#pragma once

namespace Scopelab {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant (double precision)
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr double kTwoPi = 2.0 * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr double kHalfPi = kPi / 2.0;

/// Radians to degrees conversion factor
inline constexpr double kRadToDeg = 180.0 / kPi;

/// Square root of two, converts a sinusoid's peak amplitude to RMS
inline constexpr double kSqrt2 = 1.41421356237309504880;

} // namespace DSP
} // namespace Scopelab
