// ==============================================================================
// Layer 0: Core Utility - Analysis Parameters
// ==============================================================================
// The fixed parameter vocabulary shared by every analysis method.
// Each method reads only the fields it needs; defaults match the "Default"
// preset of each method. Validation and named presets live in
// systems/analysis_presets.h.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/window_functions.h>

#include <cstddef>
#include <string>

namespace Scopelab::DSP {

/// @brief Parameters for analyze(); ranges noted per field
struct AnalysisParams {
    // Segmentation
    size_t fftSize = 4096;              // nfft, >= segment length (raised if smaller)
    size_t segmentLength = 4096;        // seglen / nperseg, >= 1
    double overlap = 0.5;               // [0, 1)
    size_t hop = 2048;                  // STFT / frame advance, >= 1

    // CFAR
    double pfa = 1e-3;                  // (0, 0.2]
    int smoothBins = 31;                // odd, >= 3
    size_t topK = 8;                    // >= 1

    // Method-specific thresholds
    double mscThreshold = 0.5;          // [0, 1]
    size_t numTapers = 6;               // k_tapers, >= 1
    double skThreshold = 2.5;           // excess kurtosis
    double quefrencyMinMs = 0.02;       // > 0
    double quefrencyMaxMs = 5.0;        // > quefrencyMinMs
    size_t cepstrumPeaks = 3;           // >= 1
    size_t arOrder = 32;                // >= 1

    // Cyclostationary / bicoherence
    double alphaMaxHz = 5000.0;         // > 0
    double dbFloor = -40.0;             // dB
    bool autoLevel = true;
    double levelSpanDb = 12.0;          // > 0
    double levelPercentile = 98.0;      // (0, 100]
    size_t bicoherenceFftSize = 512;    // >= 1

    // Harmonics
    WindowType window = WindowType::Hann;
    int numHarmonics = 25;              // >= 1
    bool includeDc = false;
    bool computeThdN = true;

    // Matched filter
    std::string templatePath;
};

} // namespace Scopelab::DSP
