// ==============================================================================
// Layer 0: Core Utility - Analysis Result Model
// ==============================================================================
// Shared output contract of the analysis engine, consumed by rendering and
// export collaborators. Results are built once per call and returned by
// value; nothing in them aliases caller-owned buffers.
//
// Two result shapes exist:
// - HarmonicResult: fundamental, THD family, ordered harmonic table
// - DetectorResult: 1-D curve or 2-D image, detection list, echoed params
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Scopelab {
namespace DSP {

// =============================================================================
// Method Enumeration
// =============================================================================

/// @brief Analysis methods available through analyze()
enum class AnalysisMethod : uint8_t {
    Harmonics = 0,
    PsdCfar,
    Spectrogram,
    Multitaper,
    SpectralKurtosis,
    Coherence,
    Cepstrum,
    ArSpectrum,
    MatchedFilter,
    Cyclostationary,
    Bicoherence
};

/// Number of AnalysisMethod values
inline constexpr int kAnalysisMethodCount = 11;

/// @brief Display name of a method ("PSD+CFAR", "MSC", ...)
[[nodiscard]] constexpr const char* methodName(AnalysisMethod method) noexcept {
    switch (method) {
        case AnalysisMethod::Harmonics:        return "Harmonics";
        case AnalysisMethod::PsdCfar:          return "PSD+CFAR";
        case AnalysisMethod::Spectrogram:      return "Spectrogram";
        case AnalysisMethod::Multitaper:       return "Multitaper";
        case AnalysisMethod::SpectralKurtosis: return "Spectral Kurtosis";
        case AnalysisMethod::Coherence:        return "MSC";
        case AnalysisMethod::Cepstrum:         return "Cepstrum";
        case AnalysisMethod::ArSpectrum:       return "AR (Yule-Walker)";
        case AnalysisMethod::MatchedFilter:    return "Matched filter";
        case AnalysisMethod::Cyclostationary:  return "Cyclostationary";
        case AnalysisMethod::Bicoherence:      return "Bicoherence";
    }
    return "Unknown";
}

// =============================================================================
// Detections
// =============================================================================

/// @brief Meaning of Detection::metric
enum class MetricKind : uint8_t {
    SnrDb = 0,           ///< dB above the robust baseline
    Msc,                 ///< magnitude-squared coherence, 0..1
    SpectralKurtosis,    ///< excess kurtosis across time
    OccupancyPercent,    ///< % of frames above the per-row threshold
    Correlation,         ///< normalized cross-correlation peak
    CepstralAmplitude,   ///< real-cepstrum value at the peak quefrency
    Bicoherence          ///< squared bicoherence, 0..1
};

/// @brief Column label of a metric ("SNR_dB", "MSC", ...)
[[nodiscard]] constexpr const char* metricLabel(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::SnrDb:             return "SNR_dB";
        case MetricKind::Msc:               return "MSC";
        case MetricKind::SpectralKurtosis:  return "SK";
        case MetricKind::OccupancyPercent:  return "Occup_%";
        case MetricKind::Correlation:       return "corr";
        case MetricKind::CepstralAmplitude: return "cep";
        case MetricKind::Bicoherence:       return "b2";
    }
    return "metric";
}

/// @brief A claimed narrowband feature near f0Hz
///
/// Derived, not authoritative: two detectors may disagree about the same
/// signal.
struct Detection {
    std::string type;                    ///< "line", "sk", "coh", "comb", "ar", "corr", "b2-peak"
    double f0Hz = 0.0;
    MetricKind metricKind = MetricKind::SnrDb;
    double metric = 0.0;
    double bandwidthHz = 0.0;
    std::optional<double> secondaryHz;   ///< second frequency of a coupled pair (bicoherence)
    std::string notes;
};

// =============================================================================
// Curves and Images
// =============================================================================

/// @brief 1-D spectrum-like result (frequency/lag/quefrency axis vs value)
struct Curve {
    std::vector<double> x;
    std::vector<double> y;
    std::string xLabel;
    std::string yLabel;
};

/// @brief Axis extent of an image: (xmin, xmax, ymin, ymax)
struct ImageExtent {
    double xMin = 0.0;
    double xMax = 0.0;
    double yMin = 0.0;
    double yMax = 0.0;
};

/// @brief Row-major 2-D image; row index runs along the y axis
struct Image2D {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> values;  ///< rows * cols, row-major
    ImageExtent extent;
    std::string xLabel;
    std::string yLabel;
    std::optional<double> displayMin;  ///< suggested color-scale bounds
    std::optional<double> displayMax;

    [[nodiscard]] double at(size_t row, size_t col) const noexcept {
        return values[row * cols + col];
    }

    [[nodiscard]] double& at(size_t row, size_t col) noexcept {
        return values[row * cols + col];
    }
};

// =============================================================================
// Parameter Echo
// =============================================================================

/// @brief Parameters that produced a result, for reproducibility and export
struct ParameterEcho {
    std::map<std::string, double> numeric;
    std::map<std::string, std::string> text;

    void set(const std::string& key, double value) { numeric[key] = value; }
    void set(const std::string& key, const std::string& value) { text[key] = value; }
};

// =============================================================================
// Detector Result
// =============================================================================

/// @brief Output of every line/anomaly detector
struct DetectorResult {
    AnalysisMethod method = AnalysisMethod::PsdCfar;
    std::string methodName;
    std::optional<Curve> curve;           ///< set for 1-D methods
    std::optional<Image2D> image;         ///< set for 2-D methods
    std::vector<Detection> detections;
    std::optional<double> dfHz;           ///< frequency resolution, if applicable
    ParameterEcho params;
    std::vector<std::string> warnings;
    bool cancelled = false;
    double elapsedSeconds = 0.0;
    size_t numSamples = 0;
    double sampleRate = 0.0;
};

// =============================================================================
// Harmonic Result
// =============================================================================

/// @brief One row of the harmonic table (k = 1 is the fundamental)
struct HarmonicRow {
    int order = 1;                 ///< k >= 1, strictly increasing across rows
    double frequencyHz = 0.0;      ///< k * f1, always below Nyquist
    double magnitudeRms = 0.0;
    double percentOfFundamental = 0.0;
    double phaseDeg = 0.0;
};

/// @brief Output of the harmonic/THD analyzer
///
/// Fields that cannot be computed for degenerate input are zero (or empty
/// optionals) and an explanatory string is appended to warnings.
struct HarmonicResult {
    double fundamentalHz = 0.0;
    double fundamentalRms = 0.0;
    double fundamentalPhaseDeg = 0.0;
    double thd = 0.0;                   ///< fraction; multiply by 100 for %
    double thdDb = 0.0;                 ///< 20*log10(thd), floored
    std::optional<double> thdN;         ///< fraction
    std::optional<double> sinadDb;
    std::optional<double> snrDb;        ///< coarse noise-floor estimate
    double totalRms = 0.0;
    double crestFactor = 0.0;
    double formFactor = 0.0;
    double coherenceCycles = 0.0;       ///< capture duration * f1
    std::vector<HarmonicRow> rows;
    std::vector<std::string> warnings;

    double sampleRate = 0.0;
    size_t numSamples = 0;
    std::string window;
    bool includeDc = false;
    int numHarmonics = 0;
    double elapsedSeconds = 0.0;
};

} // namespace DSP
} // namespace Scopelab
