// ==============================================================================
// Layer 2: DSP Processor Tests - Spectral Kurtosis Detector
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/processors/spectral_kurtosis_detector.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_kurtosis_detector.h>

#include "test_signals.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

namespace {

/// Hann-shaped tone bursts of burstLength samples every period samples
std::vector<float> makeSmoothBursts(size_t size, double frequency, double fs, size_t period,
                                    size_t burstLength) {
    std::vector<float> x(size, 0.0f);
    for (size_t start = period / 2; start + burstLength <= size; start += period) {
        for (size_t i = 0; i < burstLength; ++i) {
            const double env = 0.5 - 0.5 * std::cos(TestHelpers::kTwoPi * static_cast<double>(i)
                                                    / static_cast<double>(burstLength));
            const double t = static_cast<double>(start + i) / fs;
            x[start + i] = static_cast<float>(env * std::sin(TestHelpers::kTwoPi * frequency * t));
        }
    }
    return x;
}

AnalysisParams skParams() {
    AnalysisParams params;
    params.fftSize = 1024;
    params.hop = 256;
    params.skThreshold = 6.0;
    return params;
}

} // anonymous namespace

TEST_CASE("detectSpectralKurtosis - bursty tone stands out", "[sk]") {
    constexpr double fs = 48000.0;
    auto x = makeSmoothBursts(96000, 3000.0, fs, 32000, 1024);
    TestHelpers::addWhiteNoise(x, 0.01, 12);

    const DetectorResult r = detectSpectralKurtosis(x.data(), x.size(), fs, skParams());
    REQUIRE(r.method == AnalysisMethod::SpectralKurtosis);
    REQUIRE_FALSE(r.detections.empty());

    const double df = *r.dfHz;
    const bool covered = std::any_of(r.detections.begin(), r.detections.end(),
                                     [&](const Detection& d) {
                                         return std::abs(d.f0Hz - 3000.0) <= d.bandwidthHz + 2.0 * df;
                                     });
    REQUIRE(covered);
    for (const Detection& d : r.detections) {
        REQUIRE(d.type == "sk");
        REQUIRE(d.metricKind == MetricKind::SpectralKurtosis);
        REQUIRE(d.metric >= 6.0);
    }
}

TEST_CASE("detectSpectralKurtosis - normalized image", "[sk]") {
    const auto x = TestHelpers::makeWhiteNoise(16384, 1.0, 14);
    const DetectorResult r = detectSpectralKurtosis(x.data(), x.size(), 8000.0, skParams());

    REQUIRE(r.image.has_value());
    REQUIRE(r.image->displayMin == 0.0);
    REQUIRE(r.image->displayMax == 1.0);
    const auto [lo, hi] = std::minmax_element(r.image->values.begin(), r.image->values.end());
    REQUIRE(*lo >= 0.0);
    REQUIRE(*hi <= 1.0);
    REQUIRE(*hi > 0.99);
    REQUIRE(r.params.numeric.at("sk_thr") == 6.0);
}

TEST_CASE("detectSpectralKurtosis - constant input", "[sk][edge]") {
    const auto x = TestHelpers::makeConstant(4096, -1.0f);
    const DetectorResult r = detectSpectralKurtosis(x.data(), x.size(), 1000.0, skParams());
    REQUIRE(r.detections.empty());
    REQUIRE(std::find(r.warnings.begin(), r.warnings.end(), kNoAcContentWarning) != r.warnings.end());
}

TEST_CASE("detectSpectralKurtosis - cancellation", "[sk][cancel]") {
    const auto x = TestHelpers::makeWhiteNoise(8192);
    std::atomic<bool> cancel{true};
    const DetectorResult r = detectSpectralKurtosis(x.data(), x.size(), 1000.0, skParams(), &cancel);
    REQUIRE(r.cancelled);
    REQUIRE(r.detections.empty());
}
