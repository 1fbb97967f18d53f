// ==============================================================================
// Layer 2: DSP Processor Tests - Multitaper Line Detector
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/processors/multitaper_detector.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/processors/multitaper_detector.h>

#include "test_signals.h"

#include <algorithm>
#include <atomic>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

TEST_CASE("detectMultitaper - tone in noise is detected", "[multitaper][cfar]") {
    constexpr double fs = 20000.0;
    auto x = TestHelpers::makeWhiteNoise(32768, 0.1, 4);
    TestHelpers::addSine(x, 2500.0, fs, 1.0);

    const DetectorResult r = detectMultitaper(x.data(), x.size(), fs, AnalysisParams{});
    REQUIRE(r.method == AnalysisMethod::Multitaper);
    REQUIRE(r.curve.has_value());
    REQUIRE_FALSE(r.detections.empty());

    const auto best = std::max_element(r.detections.begin(), r.detections.end(),
                                       [](const Detection& a, const Detection& b) {
                                           return a.metric < b.metric;
                                       });
    REQUIRE(best->type == "line");
    REQUIRE(best->f0Hz == Approx(2500.0).margin(3.0 * *r.dfHz));
    REQUIRE(best->metric > 20.0);
}

TEST_CASE("detectMultitaper - time-bandwidth product follows the taper count", "[multitaper]") {
    const auto x = TestHelpers::makeWhiteNoise(8192);
    AnalysisParams params;

    params.numTapers = 4;
    REQUIRE(detectMultitaper(x.data(), x.size(), 1000.0, params).params.numeric.at("NW") == 2.5);

    params.numTapers = 8;
    const DetectorResult r = detectMultitaper(x.data(), x.size(), 1000.0, params);
    REQUIRE(r.params.numeric.at("NW") == 4.0);
    REQUIRE(r.params.numeric.at("K") == 8.0);
}

TEST_CASE("detectMultitaper - zero tapers rejected", "[multitaper][error]") {
    const auto x = TestHelpers::makeWhiteNoise(4096);
    AnalysisParams params;
    params.numTapers = 0;
    try {
        (void)detectMultitaper(x.data(), x.size(), 1000.0, params);
        FAIL("expected AnalysisError");
    } catch (const AnalysisError& e) {
        REQUIRE(e.kind() == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("detectMultitaper - cancellation", "[multitaper][cancel]") {
    const auto x = TestHelpers::makeWhiteNoise(8192);
    std::atomic<bool> cancel{true};
    const DetectorResult r = detectMultitaper(x.data(), x.size(), 1000.0, AnalysisParams{}, &cancel);
    REQUIRE(r.cancelled);
    REQUIRE(r.detections.empty());
}
