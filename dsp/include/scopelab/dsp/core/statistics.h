// ==============================================================================
// Layer 0: Core Utility - Statistics
// ==============================================================================
// Order statistics and moments used by the detector baselines and thresholds.
//
// - computeQuantile uses linear interpolation between order statistics
//   (h = (n-1)q), the same definition used for every CFAR threshold.
// - medianFilter zero-pads both edges, so the first and last kernel/2 outputs
//   are pulled toward zero.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/numeric_guards.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Scopelab {
namespace DSP {

namespace Statistics {

// -----------------------------------------------------------------------------
// Basic Statistics
// -----------------------------------------------------------------------------

/// @brief Arithmetic mean, accumulated in double
/// @return Mean value, or 0 if n == 0
template <typename T>
[[nodiscard]] inline double computeMean(const T* data, size_t n) noexcept {
    if (data == nullptr || n == 0) return 0.0;

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(data[i]);
    }
    return sum / static_cast<double>(n);
}

/// @brief Population standard deviation (n denominator)
template <typename T>
[[nodiscard]] inline double computeStdDev(const T* data, size_t n, double mean) noexcept {
    if (data == nullptr || n == 0) return 0.0;

    double sumSquaredDiff = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double diff = static_cast<double>(data[i]) - mean;
        sumSquaredDiff += diff * diff;
    }
    return std::sqrt(sumSquaredDiff / static_cast<double>(n));
}

// -----------------------------------------------------------------------------
// Robust Statistics
// -----------------------------------------------------------------------------

/// @brief Median (takes a copy; input order is preserved)
/// @return Median value, or 0 for an empty sequence
[[nodiscard]] inline double computeMedian(std::vector<double> values) {
    const size_t n = values.size();
    if (n == 0) return 0.0;

    const auto mid = values.begin() + static_cast<std::ptrdiff_t>(n / 2);
    std::nth_element(values.begin(), mid, values.end());
    const double upper = *mid;
    if (n % 2 == 1) return upper;

    const double lower = *std::max_element(values.begin(), mid);
    return 0.5 * (lower + upper);
}

/// @brief q-quantile with linear interpolation between order statistics
/// @param values Sample (copied and sorted)
/// @param q Quantile in [0, 1], clamped
/// @return Quantile value, or 0 for an empty sequence
[[nodiscard]] inline double computeQuantile(std::vector<double> values, double q) {
    const size_t n = values.size();
    if (n == 0) return 0.0;

    q = std::clamp(q, 0.0, 1.0);
    std::sort(values.begin(), values.end());

    const double h = static_cast<double>(n - 1) * q;
    const auto lo = static_cast<size_t>(std::floor(h));
    const size_t hi = std::min(lo + 1, n - 1);
    const double frac = h - static_cast<double>(lo);
    return values[lo] + frac * (values[hi] - values[lo]);
}

/// @brief Excess kurtosis of standardized values: mean(z^4) - 3
///
/// z = (x - mean) / (std + stdFloor), population std. A constant sequence
/// gives z = 0 and therefore -3.
template <typename T>
[[nodiscard]] inline double computeExcessKurtosis(const T* data, size_t n,
                                                  double stdFloor = kStdFloor) noexcept {
    if (data == nullptr || n == 0) return 0.0;

    const double mean = computeMean(data, n);
    const double scale = computeStdDev(data, n, mean) + stdFloor;

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double z = (static_cast<double>(data[i]) - mean) / scale;
        const double z2 = z * z;
        sum += z2 * z2;
    }
    return sum / static_cast<double>(n) - 3.0;
}

// -----------------------------------------------------------------------------
// Filtering
// -----------------------------------------------------------------------------

/// @brief Largest odd kernel length <= requested that fits in n samples
[[nodiscard]] inline size_t fitOddKernel(size_t requested, size_t n) noexcept {
    size_t k = requested | 1u;
    if (n == 0) return 1;
    if (k > n) k = (n % 2 == 1) ? n : n - 1;
    return std::max<size_t>(k, 1);
}

/// @brief Running median with odd kernel and zero-padded edges
/// @param input Sequence to smooth
/// @param kernel Requested kernel length (forced odd, reduced to fit)
[[nodiscard]] inline std::vector<double> medianFilter(const std::vector<double>& input, size_t kernel) {
    const size_t n = input.size();
    std::vector<double> output(n, 0.0);
    if (n == 0) return output;

    const size_t k = fitOddKernel(kernel, n);
    const size_t half = k / 2;
    std::vector<double> scratch(k, 0.0);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < k; ++j) {
            const std::ptrdiff_t src = static_cast<std::ptrdiff_t>(i + j) - static_cast<std::ptrdiff_t>(half);
            scratch[j] = (src >= 0 && src < static_cast<std::ptrdiff_t>(n))
                       ? input[static_cast<size_t>(src)]
                       : 0.0;
        }
        const auto mid = scratch.begin() + static_cast<std::ptrdiff_t>(half);
        std::nth_element(scratch.begin(), mid, scratch.end());
        output[i] = *mid;
    }
    return output;
}

} // namespace Statistics

} // namespace DSP
} // namespace Scopelab
