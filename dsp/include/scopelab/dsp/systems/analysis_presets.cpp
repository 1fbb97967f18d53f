// ==============================================================================
// Layer 3: System Component - Analysis Presets and Validation (implementation)
// ==============================================================================

#include <scopelab/dsp/systems/analysis_presets.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/processors/bicoherence.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace Scopelab::DSP {

namespace {

// =============================================================================
// Preset Table
// =============================================================================

struct PresetEntry {
    AnalysisMethod method;
    const char* name;
    void (*apply)(AnalysisParams&);
};

// clang-format off
constexpr std::array<PresetEntry, 27> kPresets = {{
    // PSD+CFAR
    {AnalysisMethod::PsdCfar, "Default", [](AnalysisParams& p) {
        p.fftSize = 4096; p.segmentLength = 4096; p.overlap = 0.5; p.pfa = 1e-3; p.smoothBins = 31; }},
    {AnalysisMethod::PsdCfar, "Fast scan", [](AnalysisParams& p) {
        p.fftSize = 2048; p.segmentLength = 2048; p.overlap = 0.25; p.pfa = 1e-3; p.smoothBins = 31; }},
    {AnalysisMethod::PsdCfar, "High resolution", [](AnalysisParams& p) {
        p.fftSize = 16384; p.segmentLength = 16384; p.overlap = 0.75; p.pfa = 1e-3; p.smoothBins = 41; }},
    {AnalysisMethod::PsdCfar, "Low false alarm", [](AnalysisParams& p) {
        p.pfa = 1e-4; p.smoothBins = 41; }},

    // Spectrogram
    {AnalysisMethod::Spectrogram, "Default", [](AnalysisParams& p) {
        p.fftSize = 4096; p.hop = 2048; p.pfa = 1e-3; p.smoothBins = 31; p.topK = 8; }},
    {AnalysisMethod::Spectrogram, "Fast scan", [](AnalysisParams& p) {
        p.fftSize = 2048; p.hop = 1024; p.pfa = 1e-3; p.smoothBins = 21; p.topK = 6; }},
    {AnalysisMethod::Spectrogram, "High resolution", [](AnalysisParams& p) {
        p.fftSize = 8192; p.hop = 2048; p.pfa = 1e-3; p.smoothBins = 41; p.topK = 10; }},

    // MSC
    {AnalysisMethod::Coherence, "Default", [](AnalysisParams& p) {
        p.fftSize = 4096; p.segmentLength = 512; p.overlap = 0.5; p.mscThreshold = 0.5; }},
    {AnalysisMethod::Coherence, "Deep", [](AnalysisParams& p) {
        p.fftSize = 8192; p.segmentLength = 1024; p.overlap = 0.75; p.mscThreshold = 0.6; }},
    {AnalysisMethod::Coherence, "Fast scan", [](AnalysisParams& p) {
        p.fftSize = 2048; p.segmentLength = 256; p.overlap = 0.25; p.mscThreshold = 0.5; }},

    // Multitaper
    {AnalysisMethod::Multitaper, "Default", [](AnalysisParams& p) {
        p.numTapers = 6; p.fftSize = 4096; p.segmentLength = 4096; p.overlap = 0.5; p.pfa = 1e-3; p.smoothBins = 31; }},
    {AnalysisMethod::Multitaper, "High resolution", [](AnalysisParams& p) {
        p.numTapers = 8; p.fftSize = 8192; p.segmentLength = 8192; p.overlap = 0.75; p.pfa = 1e-3; p.smoothBins = 41; }},
    {AnalysisMethod::Multitaper, "Fast scan", [](AnalysisParams& p) {
        p.numTapers = 4; p.fftSize = 2048; p.segmentLength = 2048; p.overlap = 0.25; p.pfa = 1e-3; p.smoothBins = 31; }},

    // Spectral Kurtosis
    {AnalysisMethod::SpectralKurtosis, "Default", [](AnalysisParams& p) {
        p.fftSize = 4096; p.hop = 2048; p.skThreshold = 2.5; }},
    {AnalysisMethod::SpectralKurtosis, "Transient hunt", [](AnalysisParams& p) {
        p.fftSize = 4096; p.hop = 1024; p.skThreshold = 2.0; }},
    {AnalysisMethod::SpectralKurtosis, "Strict", [](AnalysisParams& p) {
        p.fftSize = 4096; p.hop = 2048; p.skThreshold = 3.5; }},

    // Cepstrum
    {AnalysisMethod::Cepstrum, "Default", [](AnalysisParams& p) {
        p.fftSize = 4096; p.quefrencyMinMs = 0.02; p.quefrencyMaxMs = 5.0; p.cepstrumPeaks = 3; }},
    {AnalysisMethod::Cepstrum, "Low rate", [](AnalysisParams& p) {
        p.fftSize = 4096; p.quefrencyMinMs = 1.0; p.quefrencyMaxMs = 50.0; p.cepstrumPeaks = 3; }},
    {AnalysisMethod::Cepstrum, "Wide search", [](AnalysisParams& p) {
        p.fftSize = 8192; p.quefrencyMinMs = 0.02; p.quefrencyMaxMs = 50.0; p.cepstrumPeaks = 5; }},

    // AR (Yule-Walker)
    {AnalysisMethod::ArSpectrum, "Default", [](AnalysisParams& p) {
        p.arOrder = 32; p.fftSize = 4096; }},
    {AnalysisMethod::ArSpectrum, "Sharp peaks", [](AnalysisParams& p) {
        p.arOrder = 64; p.fftSize = 8192; }},
    {AnalysisMethod::ArSpectrum, "Fast scan", [](AnalysisParams& p) {
        p.arOrder = 24; p.fftSize = 2048; }},

    // Cyclostationary
    {AnalysisMethod::Cyclostationary, "Default", [](AnalysisParams& p) {
        p.fftSize = 4096; p.hop = 2048; p.alphaMaxHz = 5000.0; }},
    {AnalysisMethod::Cyclostationary, "Deep", [](AnalysisParams& p) {
        p.fftSize = 8192; p.hop = 2048; p.alphaMaxHz = 10000.0; }},
    {AnalysisMethod::Cyclostationary, "Fast", [](AnalysisParams& p) {
        p.fftSize = 2048; p.hop = 1024; p.alphaMaxHz = 3000.0; }},

    // Bicoherence
    {AnalysisMethod::Bicoherence, "Default", [](AnalysisParams& p) {
        p.bicoherenceFftSize = 512; p.overlap = 0.75; }},
    {AnalysisMethod::Bicoherence, "Fast", [](AnalysisParams& p) {
        p.bicoherenceFftSize = 256; p.overlap = 0.5; }},
}};
// clang-format on

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void require(bool condition, const char* message) {
    if (!condition) throwInvalidArgument(message);
}

bool usesSegments(AnalysisMethod method) noexcept {
    return method == AnalysisMethod::PsdCfar || method == AnalysisMethod::Multitaper ||
           method == AnalysisMethod::Coherence || method == AnalysisMethod::Bicoherence;
}

bool usesFrames(AnalysisMethod method) noexcept {
    return method == AnalysisMethod::Spectrogram || method == AnalysisMethod::SpectralKurtosis ||
           method == AnalysisMethod::Cyclostationary;
}

bool usesCfar(AnalysisMethod method) noexcept {
    return method == AnalysisMethod::PsdCfar || method == AnalysisMethod::Multitaper ||
           method == AnalysisMethod::ArSpectrum || method == AnalysisMethod::Spectrogram;
}

double toNumber(const std::string& key, const std::string& value) {
    char* end = nullptr;
    const double number = std::strtod(value.c_str(), &end);
    if (value.empty() || end == value.c_str() || *end != '\0') {
        throwInvalidArgument("value for '" + key + "' is not a number: " + value);
    }
    if (!std::isfinite(number)) {
        throwInvalidArgument("value for '" + key + "' must be finite");
    }
    return number;
}

template <typename T>
T toWhole(const std::string& key, const std::string& value) {
    const double number = toNumber(key, value);
    if (number != std::floor(number)) {
        throwInvalidArgument("value for '" + key + "' must be a whole number");
    }
    if (number < static_cast<double>(std::numeric_limits<T>::lowest()) ||
        number >= static_cast<double>(std::numeric_limits<T>::max())) {
        throwInvalidArgument("value for '" + key + "' is out of range");
    }
    return static_cast<T>(number);
}

size_t toCount(const std::string& key, const std::string& value) {
    return toWhole<size_t>(key, value);
}

int toInt(const std::string& key, const std::string& value) {
    return toWhole<int>(key, value);
}

bool toFlag(const std::string& key, const std::string& value) {
    return toNumber(key, value) != 0.0;
}

} // anonymous namespace

// =============================================================================
// Method Names
// =============================================================================

AnalysisMethod parseAnalysisMethod(std::string_view name) {
    const std::string key = toLower(name);

    for (int i = 0; i < kAnalysisMethodCount; ++i) {
        const auto method = static_cast<AnalysisMethod>(i);
        if (key == toLower(methodName(method))) return method;
    }

    if (key == "harmonic" || key == "thd") return AnalysisMethod::Harmonics;
    if (key == "psd" || key == "psd-cfar" || key == "cfar") return AnalysisMethod::PsdCfar;
    if (key == "stft" || key == "persistence") return AnalysisMethod::Spectrogram;
    if (key == "mt" || key == "dpss") return AnalysisMethod::Multitaper;
    if (key == "sk" || key == "kurtosis") return AnalysisMethod::SpectralKurtosis;
    if (key == "coherence" || key == "coh") return AnalysisMethod::Coherence;
    if (key == "cep") return AnalysisMethod::Cepstrum;
    if (key == "ar" || key == "ar spectrum" || key == "yule-walker") return AnalysisMethod::ArSpectrum;
    if (key == "matched" || key == "matched-filter" || key == "mf") return AnalysisMethod::MatchedFilter;
    if (key == "cyclo" || key == "scd") return AnalysisMethod::Cyclostationary;
    if (key == "bico" || key == "bispectrum") return AnalysisMethod::Bicoherence;

    throwInvalidArgument("unknown analysis method '" + std::string(name) + "'");
}

// =============================================================================
// Presets
// =============================================================================

std::vector<std::string> presetNames(AnalysisMethod method) {
    std::vector<std::string> names{kDefaultPresetName};
    for (const PresetEntry& entry : kPresets) {
        if (entry.method == method && std::string_view(entry.name) != kDefaultPresetName) {
            names.emplace_back(entry.name);
        }
    }
    return names;
}

void applyPreset(AnalysisParams& params, AnalysisMethod method, std::string_view name) {
    for (const PresetEntry& entry : kPresets) {
        if (entry.method == method && name == entry.name) {
            entry.apply(params);
            return;
        }
    }

    // Methods without a tuned table still accept "Default" (no change)
    if (name == kDefaultPresetName) return;

    throwInvalidArgument("no preset '" + std::string(name) + "' for " + methodName(method));
}

void applyOverride(AnalysisParams& params, std::string_view assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        throwInvalidArgument("override must look like key=value: " + std::string(assignment));
    }
    const std::string key(assignment.substr(0, eq));
    const std::string value(assignment.substr(eq + 1));

    if (key == "nfft") params.fftSize = toCount(key, value);
    else if (key == "seglen") params.segmentLength = toCount(key, value);
    else if (key == "overlap") params.overlap = toNumber(key, value);
    else if (key == "hop") params.hop = toCount(key, value);
    else if (key == "pfa") params.pfa = toNumber(key, value);
    else if (key == "smooth_bins") params.smoothBins = toInt(key, value);
    else if (key == "topk") params.topK = toCount(key, value);
    else if (key == "msc_thr") params.mscThreshold = toNumber(key, value);
    else if (key == "k_tapers") params.numTapers = toCount(key, value);
    else if (key == "sk_thr") params.skThreshold = toNumber(key, value);
    else if (key == "qmin_ms") params.quefrencyMinMs = toNumber(key, value);
    else if (key == "qmax_ms") params.quefrencyMaxMs = toNumber(key, value);
    else if (key == "cep_topk") params.cepstrumPeaks = toCount(key, value);
    else if (key == "ar_order") params.arOrder = toCount(key, value);
    else if (key == "alpha_max") params.alphaMaxHz = toNumber(key, value);
    else if (key == "db_floor") params.dbFloor = toNumber(key, value);
    else if (key == "auto_level") params.autoLevel = toFlag(key, value);
    else if (key == "level_span") params.levelSpanDb = toNumber(key, value);
    else if (key == "level_pct") params.levelPercentile = toNumber(key, value);
    else if (key == "bico_nfft") params.bicoherenceFftSize = toCount(key, value);
    else if (key == "window") params.window = parseWindowType(value);
    else if (key == "n_harmonics") params.numHarmonics = toInt(key, value);
    else if (key == "include_dc") params.includeDc = toFlag(key, value);
    else if (key == "thdn") params.computeThdN = toFlag(key, value);
    else if (key == "template") params.templatePath = value;
    else throwInvalidArgument("unknown parameter '" + key + "'");
}

// =============================================================================
// Validation
// =============================================================================

void validate(const AnalysisParams& params, AnalysisMethod method, double sampleRate) {
    require(std::isfinite(sampleRate) && sampleRate > 0.0, "sample rate must be positive and finite");

    if (method == AnalysisMethod::Harmonics) {
        require(params.numHarmonics >= 1, "n_harmonics must be at least 1");
        return;
    }

    require(params.fftSize > 0, "nfft must be positive");

    if (usesSegments(method)) {
        require(params.segmentLength > 0, "seglen must be positive");
        require(params.overlap >= 0.0 && params.overlap < 1.0, "overlap must be in [0, 1)");
    }
    if (usesFrames(method)) {
        require(params.hop > 0, "hop must be positive");
    }
    if (usesCfar(method)) {
        require(params.pfa > 0.0 && params.pfa <= 0.2, "pfa must be in (0, 0.2]");
        if (method != AnalysisMethod::Spectrogram) {
            require(params.smoothBins >= 3 && params.smoothBins % 2 == 1,
                    "smooth_bins must be odd and at least 3");
        }
    }

    switch (method) {
        case AnalysisMethod::Spectrogram:
            require(params.topK >= 1, "top_k must be at least 1");
            break;
        case AnalysisMethod::Multitaper:
            require(params.numTapers >= 1, "k_tapers must be at least 1");
            break;
        case AnalysisMethod::SpectralKurtosis:
            require(std::isfinite(params.skThreshold), "sk_threshold must be finite");
            break;
        case AnalysisMethod::Coherence:
            require(params.mscThreshold >= 0.0 && params.mscThreshold <= 1.0,
                    "msc_threshold must be in [0, 1]");
            break;
        case AnalysisMethod::Cepstrum:
            require(params.quefrencyMinMs > 0.0 && params.quefrencyMaxMs > 0.0,
                    "quefrency bounds must be positive");
            require(params.quefrencyMinMs < params.quefrencyMaxMs, "qmin_ms must be below qmax_ms");
            require(params.cepstrumPeaks >= 1, "top_k must be at least 1");
            break;
        case AnalysisMethod::ArSpectrum:
            require(params.arOrder >= 1, "ar_order must be at least 1");
            break;
        case AnalysisMethod::Cyclostationary:
            require(std::isfinite(params.alphaMaxHz) && params.alphaMaxHz > 0.0,
                    "alpha_max_hz must be positive");
            require(params.levelSpanDb > 0.0, "level span must be positive");
            require(params.levelPercentile > 0.0 && params.levelPercentile <= 100.0,
                    "level percentile must be in (0, 100]");
            break;
        case AnalysisMethod::Bicoherence:
            require(params.bicoherenceFftSize > 0, "bicoherence nfft must be positive");
            require(params.bicoherenceFftSize <= kMaxBicoherenceFftSize,
                    "bicoherence nfft must not exceed 4096");
            require(params.topK >= 1, "top_k must be at least 1");
            break;
        case AnalysisMethod::Harmonics:
        case AnalysisMethod::PsdCfar:
        case AnalysisMethod::MatchedFilter:
            break;
    }
}

} // namespace Scopelab::DSP
