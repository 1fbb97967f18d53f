// ==============================================================================
// Layer 2: DSP Processor Tests - AR (Yule-Walker) Spectrum Detector
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/processors/ar_spectrum_detector.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/processors/ar_spectrum_detector.h>

#include "test_signals.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

TEST_CASE("evaluateArSpectrum - closed-form models", "[ar]") {
    SECTION("white model is flat") {
        const auto p = evaluateArSpectrum({1.0}, 2.0, 16);
        REQUIRE(p.size() == 9);
        for (double v : p) REQUIRE(v == Approx(2.0));
    }

    SECTION("first-order low-pass") {
        // A(z) = 1 - 0.5 z^-1: |A|^2 = 0.25 at DC, 2.25 at Nyquist
        const auto p = evaluateArSpectrum({1.0, -0.5}, 1.0, 16);
        REQUIRE(p.front() == Approx(4.0));
        REQUIRE(p.back() == Approx(1.0 / 2.25));
    }
}

TEST_CASE("detectArSpectrum - sharp peak at a tone", "[ar]") {
    constexpr double fs = 1000.0;
    auto x = TestHelpers::makeSine(20000, 123.0, fs, 1.0);
    TestHelpers::addWhiteNoise(x, 0.1, 61);

    const DetectorResult r = detectArSpectrum(x.data(), x.size(), fs, AnalysisParams{});
    REQUIRE(r.method == AnalysisMethod::ArSpectrum);
    REQUIRE(r.curve.has_value());
    REQUIRE(r.curve->yLabel == "AR PSD (dB)");
    REQUIRE(r.curve->x.size() == 4096 / 2 + 1);
    REQUIRE_FALSE(r.detections.empty());

    const auto best = std::max_element(r.detections.begin(), r.detections.end(),
                                       [](const Detection& a, const Detection& b) {
                                           return a.metric < b.metric;
                                       });
    REQUIRE(best->type == "ar");
    REQUIRE(best->f0Hz == Approx(123.0).margin(2.0));
}

TEST_CASE("detectArSpectrum - FFT size floor and echo", "[ar]") {
    const auto x = TestHelpers::makeWhiteNoise(4096);
    AnalysisParams params;
    params.fftSize = 256;
    params.arOrder = 8;

    const DetectorResult r = detectArSpectrum(x.data(), x.size(), 1000.0, params);
    REQUIRE(r.params.numeric.at("nfft") == static_cast<double>(kMinArFftSize));
    REQUIRE(r.params.numeric.at("order") == 8.0);
    REQUIRE(*r.dfHz == Approx(1000.0 / kMinArFftSize));
}

TEST_CASE("detectArSpectrum - order checks", "[ar][error]") {
    const auto x = TestHelpers::makeWhiteNoise(32);
    AnalysisParams params;

    SECTION("zero order") {
        params.arOrder = 0;
        try {
            (void)detectArSpectrum(x.data(), x.size(), 1000.0, params);
            FAIL("expected AnalysisError");
        } catch (const AnalysisError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidArgument);
        }
    }

    SECTION("order not below the record length") {
        params.arOrder = 32;
        try {
            (void)detectArSpectrum(x.data(), x.size(), 1000.0, params);
            FAIL("expected AnalysisError");
        } catch (const AnalysisError& e) {
            REQUIRE(e.kind() == ErrorKind::InsufficientSamples);
        }
    }
}

TEST_CASE("detectArSpectrum - cancellation", "[ar][cancel]") {
    const auto x = TestHelpers::makeWhiteNoise(4096);
    std::atomic<bool> cancel{true};
    const DetectorResult r = detectArSpectrum(x.data(), x.size(), 1000.0, AnalysisParams{}, &cancel);
    REQUIRE(r.cancelled);
    REQUIRE(r.detections.empty());
}
