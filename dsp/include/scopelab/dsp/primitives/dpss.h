// ==============================================================================
// Layer 1: DSP Primitive - Discrete Prolate Spheroidal Sequences
// ==============================================================================
// Slepian tapers for multitaper spectral estimation.
//
// The tapers are eigenvectors of the symmetric tridiagonal matrix
//   T[i][i]   = ((M-1-2i)/2)^2 * cos(2*pi*W)
//   T[i][i+1] = (i+1)(M-1-i)/2
// with W = NW/M, ordered by decreasing eigenvalue (decreasing spectral
// concentration). Eigenvalues come from Sturm-sequence bisection and vectors
// from inverse iteration, all in double precision.
// ==============================================================================

#pragma once

#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// @brief Compute numTapers DPSS tapers of the given length.
///
/// @param length        Samples per taper (>= 1)
/// @param halfBandwidth Time-halfbandwidth product NW
/// @param numTapers     Number of tapers (>= 1, <= length)
/// @param symmetric     false: periodic variant (computed at length+1 and
///                      truncated), the form used for spectral estimation
/// @return numTapers vectors of unit L2 norm (before truncation).
///         Even-order tapers have a positive sum; odd-order tapers start
///         with a positive lobe.
[[nodiscard]] std::vector<std::vector<double>> computeDpss(size_t length,
                                                           double halfBandwidth,
                                                           size_t numTapers,
                                                           bool symmetric = false);

} // namespace Scopelab::DSP
