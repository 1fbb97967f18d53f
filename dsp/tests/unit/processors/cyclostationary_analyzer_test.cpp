// ==============================================================================
// Layer 2: DSP Processor Tests - Cyclostationary Spectral Correlation
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/processors/cyclostationary_analyzer.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/processors/cyclostationary_analyzer.h>
#include <scopelab/dsp/processors/line_detection.h>

#include "test_signals.h"

#include <algorithm>
#include <atomic>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

namespace {

AnalysisParams cycloParams() {
    AnalysisParams params;
    params.fftSize = 256;
    params.hop = 64;
    params.alphaMaxHz = 5000.0;
    params.dbFloor = -40.0;
    return params;
}

} // anonymous namespace

TEST_CASE("autoLevelRange - median-centred span", "[cyclo][level]") {
    std::vector<double> body(101);
    for (size_t i = 0; i < body.size(); ++i) body[i] = -40.0 + 0.1 * static_cast<double>(i);

    SECTION("percentile inside the span") {
        const DisplayRange r = autoLevelRange(body, 12.0, 50.0);
        REQUIRE(r.lo == Approx(-35.0 - 6.0));
        REQUIRE(r.hi == Approx(-35.0 + 6.0));
    }

    SECTION("percentile above the span widens the top") {
        const DisplayRange r = autoLevelRange(body, 2.0, 98.0);
        REQUIRE(r.lo == Approx(-36.0));
        REQUIRE(r.hi == Approx(-30.2));
    }

    SECTION("empty body") {
        const DisplayRange r = autoLevelRange({}, 12.0, 98.0);
        REQUIRE(r.lo == 0.0);
        REQUIRE(r.hi == 0.0);
    }
}

TEST_CASE("analyzeCyclostationary - image geometry", "[cyclo]") {
    constexpr double fs = 8192.0;
    const auto x = TestHelpers::makeWhiteNoise(8192, 1.0, 81);

    const DetectorResult r = analyzeCyclostationary(x.data(), x.size(), fs, cycloParams());
    REQUIRE(r.method == AnalysisMethod::Cyclostationary);
    REQUIRE(r.detections.empty());
    REQUIRE(r.image.has_value());

    const Image2D& img = *r.image;
    const double df = fs / 256.0;
    REQUIRE(*r.dfHz == Approx(df));
    // alpha_max/(2 df) = 78 rows, capped at (129 - 1)/2
    REQUIRE(img.rows == 65);
    REQUIRE(img.cols == 129);
    REQUIRE(img.extent.yMax == Approx(2.0 * 64.0 * df));
    REQUIRE(img.extent.xMax == Approx(128.0 * df));
    REQUIRE(img.yLabel == "Cyclic freq alpha (Hz)");

    for (size_t k = 0; k < img.cols; ++k) REQUIRE(img.at(0, k) == -40.0);
    for (double v : img.values) {
        REQUIRE(v >= -40.0);
        REQUIRE(v <= 1e-6);
    }
    REQUIRE(r.params.numeric.at("K") == Approx((8192.0 - 256.0) / 64.0 + 1.0));
}

TEST_CASE("analyzeCyclostationary - huge alpha_max caps at the bin count", "[cyclo][edge]") {
    constexpr double fs = 8192.0;
    const auto x = TestHelpers::makeWhiteNoise(8192, 1.0, 82);

    AnalysisParams params = cycloParams();
    params.alphaMaxHz = 1e300;

    const DetectorResult r = analyzeCyclostationary(x.data(), x.size(), fs, params);
    REQUIRE(r.image.has_value());
    REQUIRE(r.image->rows == 65);
    REQUIRE(r.image->cols == 129);
    REQUIRE(r.image->extent.yMax == Approx(2.0 * 64.0 * fs / 256.0));
}

TEST_CASE("analyzeCyclostationary - two locked tones correlate", "[cyclo]") {
    constexpr double fs = 8192.0;
    const double df = fs / 256.0;
    // Bins 20 and 40: alpha = 20 bins (m = 10), centre bin 30
    auto x = TestHelpers::makeSine(16384, 20.0 * df, fs, 1.0);
    TestHelpers::addSine(x, 40.0 * df, fs, 1.0, 0.4);
    TestHelpers::addWhiteNoise(x, 0.01, 82);

    const DetectorResult r = analyzeCyclostationary(x.data(), x.size(), fs, cycloParams());
    const Image2D& img = *r.image;
    REQUIRE(img.at(10, 30) > -3.0);
    REQUIRE(img.at(25, 60) < -10.0);
}

TEST_CASE("analyzeCyclostationary - display range", "[cyclo][level]") {
    const auto x = TestHelpers::makeWhiteNoise(8192, 1.0, 83);
    AnalysisParams params = cycloParams();

    params.autoLevel = false;
    const DetectorResult fixed = analyzeCyclostationary(x.data(), x.size(), 8192.0, params);
    REQUIRE(*fixed.image->displayMin == -40.0);
    REQUIRE(*fixed.image->displayMax == 0.0);

    params.autoLevel = true;
    params.levelSpanDb = 12.0;
    const DetectorResult autoLevel = analyzeCyclostationary(x.data(), x.size(), 8192.0, params);
    REQUIRE(*autoLevel.image->displayMax - *autoLevel.image->displayMin >= 12.0 - 1e-9);
}

TEST_CASE("analyzeCyclostationary - short record", "[cyclo][error]") {
    const auto x = TestHelpers::makeWhiteNoise(100);
    try {
        (void)analyzeCyclostationary(x.data(), x.size(), 1000.0, cycloParams());
        FAIL("expected AnalysisError");
    } catch (const AnalysisError& e) {
        REQUIRE(e.kind() == ErrorKind::InsufficientSamples);
    }
}

TEST_CASE("analyzeCyclostationary - constant input", "[cyclo][edge]") {
    const auto x = TestHelpers::makeConstant(4096);
    const DetectorResult r = analyzeCyclostationary(x.data(), x.size(), 8192.0, cycloParams());
    REQUIRE(std::find(r.warnings.begin(), r.warnings.end(), kNoAcContentWarning) != r.warnings.end());
    for (double v : r.image->values) REQUIRE(v == -40.0);
}

TEST_CASE("analyzeCyclostationary - cancellation", "[cyclo][cancel]") {
    const auto x = TestHelpers::makeWhiteNoise(8192);
    std::atomic<bool> cancel{true};
    const DetectorResult r = analyzeCyclostationary(x.data(), x.size(), 8192.0, cycloParams(), &cancel);
    REQUIRE(r.cancelled);
    REQUIRE(r.image.has_value());
    REQUIRE(r.warnings.back() == "analysis cancelled");
}
