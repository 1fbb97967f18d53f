// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis windows with coherent-gain and equivalent-noise-bandwidth metadata.
//
// Two families are provided:
// - Symmetric (DFT-odd) windows for single-block amplitude measurement
//   (rectangular, Hann, 5-term flat-top). Weights divide by N-1.
// - Periodic (DFT-even) Hann for segmented estimators (Welch, STFT,
//   coherence, bicoherence). Weights divide by N.
//
// The coherent gain (mean of the weights) must be divided out of any magnitude
// read from a windowed FFT to recover physical amplitude.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Scopelab {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Tapered windows shorter than this degrade to rectangular weights
inline constexpr size_t kMinTaperLength = 8;

/// 5-term flat-top coefficients (a0..a4), alternating signs
inline constexpr double kFlatTopA0 = 1.0;
inline constexpr double kFlatTopA1 = 1.933;
inline constexpr double kFlatTopA2 = 1.286;
inline constexpr double kFlatTopA3 = 0.388;
inline constexpr double kFlatTopA4 = 0.032;

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported analysis windows
enum class WindowType : uint8_t {
    Rectangular = 0,  ///< "rect"    - CG 1, ENBW 1 bin
    Hann = 1,         ///< "hann"    - CG ~0.5, ENBW ~1.5 bins
    FlatTop = 2       ///< "flattop" - amplitude-accurate, ENBW ~3.77 bins
};

/// @brief Window weights plus the scalars derived from them
struct WindowInfo {
    WindowType type = WindowType::Rectangular;
    std::vector<float> weights;
    double coherentGain = 1.0;  ///< mean(weights)
    double enbwBins = 1.0;      ///< N * sum(w^2) / sum(w)^2
};

// =============================================================================
// Tag Conversion
// =============================================================================

/// @brief Canonical tag string for a window type
[[nodiscard]] constexpr const char* windowTag(WindowType type) noexcept {
    switch (type) {
        case WindowType::Rectangular: return "rect";
        case WindowType::Hann:        return "hann";
        case WindowType::FlatTop:     return "flattop";
    }
    return "rect";
}

/// @brief Parse a window tag ("rect", "hann", "flattop").
/// @throws AnalysisError (InvalidArgument) for an unrecognized tag
[[nodiscard]] inline WindowType parseWindowType(std::string_view tag) {
    if (tag == "rect" || tag == "rectangular") return WindowType::Rectangular;
    if (tag == "hann" || tag == "hanning") return WindowType::Hann;
    if (tag == "flattop" || tag == "flat-top") return WindowType::FlatTop;
    throwInvalidArgument("unknown window tag '" + std::string(tag) + "'");
}

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

/// @brief Fill buffer with ones
inline void generateRectangular(float* output, size_t size) noexcept {
    if (output == nullptr) return;
    for (size_t n = 0; n < size; ++n) output[n] = 1.0f;
}

/// @brief Fill buffer with symmetric Hann window
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/(N-1)), zero at both ends
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size < kMinTaperLength) {
        generateRectangular(output, size);
        return;
    }

    const double denom = static_cast<double>(size - 1);
    for (size_t n = 0; n < size; ++n) {
        const double phase = kTwoPi * static_cast<double>(n) / denom;
        output[n] = static_cast<float>(0.5 - 0.5 * std::cos(phase));
    }
}

/// @brief Fill buffer with periodic (DFT-even) Hann window
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N). Used by segmented estimators.
inline void generateHannPeriodic(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) {
        output[0] = 1.0f;
        return;
    }

    const double N = static_cast<double>(size);
    for (size_t n = 0; n < size; ++n) {
        const double phase = kTwoPi * static_cast<double>(n) / N;
        output[n] = static_cast<float>(0.5 - 0.5 * std::cos(phase));
    }
}

/// @brief Fill buffer with symmetric 5-term flat-top window
/// @note w[n] = a0 - a1 cos(x) + a2 cos(2x) - a3 cos(3x) + a4 cos(4x),
///       x = 2*pi*n/(N-1). Peak value is sum(a) ~ 4.64, CG ~ 1.
inline void generateFlatTop(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size < kMinTaperLength) {
        generateRectangular(output, size);
        return;
    }

    const double denom = static_cast<double>(size - 1);
    for (size_t n = 0; n < size; ++n) {
        const double x = kTwoPi * static_cast<double>(n) / denom;
        const double w = kFlatTopA0
                       - kFlatTopA1 * std::cos(x)
                       + kFlatTopA2 * std::cos(2.0 * x)
                       - kFlatTopA3 * std::cos(3.0 * x)
                       + kFlatTopA4 * std::cos(4.0 * x);
        output[n] = static_cast<float>(w);
    }
}

/// @brief Mean of the weights
[[nodiscard]] inline double coherentGain(const std::vector<float>& weights) noexcept {
    if (weights.empty()) return 0.0;
    double sum = 0.0;
    for (float w : weights) sum += static_cast<double>(w);
    return sum / static_cast<double>(weights.size());
}

/// @brief Equivalent noise bandwidth in bins: N * sum(w^2) / sum(w)^2
[[nodiscard]] inline double enbwBins(const std::vector<float>& weights) noexcept {
    double sum = 0.0;
    double sumSq = 0.0;
    for (float w : weights) {
        sum += static_cast<double>(w);
        sumSq += static_cast<double>(w) * static_cast<double>(w);
    }
    if (sum * sum <= 0.0) return 0.0;
    return static_cast<double>(weights.size()) * sumSq / (sum * sum);
}

/// @brief Generate symmetric window coefficients (allocates vector)
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size, 0.0f);

    switch (type) {
        case WindowType::Rectangular:
            generateRectangular(window.data(), size);
            break;
        case WindowType::Hann:
            generateHann(window.data(), size);
            break;
        case WindowType::FlatTop:
            generateFlatTop(window.data(), size);
            break;
    }

    return window;
}

/// @brief Periodic Hann scaled to unit RMS (bicoherence framing)
[[nodiscard]] inline std::vector<float> generateHannUnitRms(size_t size) {
    std::vector<float> window(size, 0.0f);
    generateHannPeriodic(window.data(), size);

    double sumSq = 0.0;
    for (float w : window) sumSq += static_cast<double>(w) * static_cast<double>(w);
    const double rms = size > 0 ? std::sqrt(sumSq / static_cast<double>(size)) : 0.0;
    if (rms > 0.0) {
        for (float& w : window) w = static_cast<float>(static_cast<double>(w) / rms);
    }
    return window;
}

} // namespace Window

// =============================================================================
// Window Factory
// =============================================================================

/// @brief Build a symmetric analysis window with its CG and ENBW.
/// @throws AnalysisError (InvalidArgument) when size is zero
[[nodiscard]] inline WindowInfo makeWindow(WindowType type, size_t size) {
    if (size == 0) {
        throwInvalidArgument("window length must be positive");
    }

    WindowInfo info;
    info.type = type;
    info.weights = Window::generate(type, size);
    info.coherentGain = (type == WindowType::Rectangular) ? 1.0 : Window::coherentGain(info.weights);
    info.enbwBins = (type == WindowType::Rectangular) ? 1.0 : Window::enbwBins(info.weights);
    return info;
}

/// @brief Tag-based overload
[[nodiscard]] inline WindowInfo makeWindow(std::string_view tag, size_t size) {
    return makeWindow(parseWindowType(tag), size);
}

} // namespace DSP
} // namespace Scopelab
