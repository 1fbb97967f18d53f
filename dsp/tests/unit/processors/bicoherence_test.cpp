// ==============================================================================
// Layer 2: DSP Processor Tests - Bicoherence
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/processors/bicoherence.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/processors/bicoherence.h>

#include "test_signals.h"

#include <algorithm>
#include <atomic>
#include <utility>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

namespace {

constexpr double kFs = 1280.0;  // 10 Hz bins at 128 points

/// Tones at 100, 200 and 300 Hz (bins 10, 20, 30) in white noise
std::vector<float> makeCoupledTriplet(size_t size) {
    auto x = TestHelpers::makeWhiteNoise(size, 0.05, 91);
    TestHelpers::addSine(x, 100.0, kFs, 1.0, 0.2);
    TestHelpers::addSine(x, 200.0, kFs, 1.0, 1.1);
    TestHelpers::addSine(x, 300.0, kFs, 1.0, 1.3);
    return x;
}

AnalysisParams bicoParams() {
    AnalysisParams params;
    params.bicoherenceFftSize = 128;
    params.overlap = 0.5;
    params.topK = 8;
    return params;
}

Image2D blankImage(size_t size) {
    Image2D img;
    img.rows = size;
    img.cols = size;
    img.values.assign(size * size, 0.0);
    return img;
}

} // anonymous namespace

TEST_CASE("makeBicoherenceAccumulator - argument checks", "[bicoherence][error]") {
    const auto expectInvalid = [](size_t nfft, size_t noverlap, double fs) {
        try {
            (void)makeBicoherenceAccumulator(nfft, noverlap, fs);
            FAIL("expected AnalysisError");
        } catch (const AnalysisError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidArgument);
        }
    };
    expectInvalid(1, 0, 1000.0);
    expectInvalid(128, 128, 1000.0);
    expectInvalid(128, 64, 0.0);
    expectInvalid(kMaxBicoherenceFftSize + 1, 0, 1000.0);
    expectInvalid(size_t{1} << 40, 0, 1000.0);

    const BicoherenceAccumulator acc = makeBicoherenceAccumulator(128, 32, 1000.0);
    REQUIRE(acc.hop == 96);
    REQUIRE(acc.numBins == 65);
    REQUIRE(acc.tripleSum.size() == 65 * 65);
    REQUIRE(acc.frameCount == 0);
}

TEST_CASE("accumulateBicoherence - blocks fold together", "[bicoherence]") {
    const auto x = makeCoupledTriplet(4096);

    BicoherenceAccumulator acc = makeBicoherenceAccumulator(128, 64, kFs);
    acc = accumulateBicoherence(std::move(acc), x.data(), 2048);
    REQUIRE(acc.frameCount == 31);
    acc = accumulateBicoherence(std::move(acc), x.data() + 2048, 2048);
    REQUIRE(acc.frameCount == 62);

    // A block shorter than one frame adds nothing
    acc = accumulateBicoherence(std::move(acc), x.data(), 100);
    REQUIRE(acc.frameCount == 62);
}

TEST_CASE("finalizeBicoherence - empty accumulator gives a zero map", "[bicoherence][edge]") {
    const Image2D img = finalizeBicoherence(makeBicoherenceAccumulator(64, 32, 1000.0));
    REQUIRE(img.rows == 33);
    REQUIRE(img.cols == 33);
    REQUIRE(std::all_of(img.values.begin(), img.values.end(), [](double v) { return v == 0.0; }));
    REQUIRE(img.xLabel == "f2 (Hz)");
    REQUIRE(img.yLabel == "f1 (Hz)");
}

TEST_CASE("finalizeBicoherence - phase-coupled triplet", "[bicoherence]") {
    const auto x = makeCoupledTriplet(12800);

    BicoherenceAccumulator acc = makeBicoherenceAccumulator(128, 64, kFs);
    acc = accumulateBicoherence(std::move(acc), x.data(), x.size());
    const Image2D img = finalizeBicoherence(acc);

    REQUIRE(img.at(10, 20) > 0.9);
    REQUIRE(img.at(10, 20) == Approx(img.at(20, 10)).margin(1e-9));
    REQUIRE(img.at(40, 5) < 0.2);
    // Outside the principal triangle
    REQUIRE(img.at(40, 40) == 0.0);
    for (double v : img.values) {
        REQUIRE(v >= 0.0);
        REQUIRE(v <= 1.0);
    }
}

TEST_CASE("pickBicoherencePeaks - isolated peak", "[bicoherence][peaks]") {
    Image2D img = blankImage(6);
    img.at(1, 2) = 0.9;
    img.at(2, 1) = 0.9;  // mirror, not reported twice

    const auto peaks = pickBicoherencePeaks(img, 10.0, 5);
    REQUIRE(peaks.size() == 1);
    REQUIRE(peaks[0].type == "b2-peak");
    REQUIRE(peaks[0].f0Hz == Approx(10.0));
    REQUIRE(peaks[0].secondaryHz.has_value());
    REQUIRE(*peaks[0].secondaryHz == Approx(20.0));
    REQUIRE(peaks[0].metricKind == MetricKind::Bicoherence);
    REQUIRE(peaks[0].metric == Approx(0.9));
    REQUIRE(peaks[0].notes == "f3=30 Hz");
}

TEST_CASE("pickBicoherencePeaks - thresholds and limits", "[bicoherence][peaks]") {
    SECTION("below the absolute floor") {
        Image2D img = blankImage(6);
        img.at(2, 3) = 0.15;
        REQUIRE(pickBicoherencePeaks(img, 1.0, 5).empty());
    }

    SECTION("below half of the map maximum") {
        Image2D img = blankImage(8);
        img.at(1, 1) = 0.9;
        img.at(4, 5) = 0.4;
        const auto peaks = pickBicoherencePeaks(img, 1.0, 5);
        REQUIRE(peaks.size() == 1);
        REQUIRE(peaks[0].f0Hz == Approx(1.0));
    }

    SECTION("edge cells are ignored") {
        Image2D img = blankImage(6);
        img.at(0, 3) = 1.0;
        img.at(2, 5) = 1.0;
        REQUIRE(pickBicoherencePeaks(img, 1.0, 5).empty());
    }

    SECTION("strongest topK kept") {
        Image2D img = blankImage(10);
        img.at(1, 1) = 0.6;
        img.at(3, 4) = 0.9;
        img.at(6, 7) = 0.8;
        const auto peaks = pickBicoherencePeaks(img, 1.0, 2);
        REQUIRE(peaks.size() == 2);
        REQUIRE(peaks[0].metric == Approx(0.9));
        REQUIRE(peaks[1].metric == Approx(0.8));
    }
}

TEST_CASE("detectBicoherence - end to end", "[bicoherence]") {
    const auto x = makeCoupledTriplet(12800);
    const DetectorResult r = detectBicoherence(x.data(), x.size(), kFs, bicoParams());

    REQUIRE(r.method == AnalysisMethod::Bicoherence);
    REQUIRE(r.image.has_value());
    REQUIRE(*r.dfHz == Approx(10.0));
    REQUIRE(r.params.numeric.at("nfft") == 128.0);
    REQUIRE(r.params.numeric.at("noverlap") == 64.0);
    REQUIRE(r.params.numeric.at("K") == 199.0);

    REQUIRE_FALSE(r.detections.empty());
    REQUIRE(r.detections.size() <= 8);
    for (const Detection& d : r.detections) {
        REQUIRE(d.metric >= kMinBicoherencePeak);
        REQUIRE(d.secondaryHz.has_value());
        REQUIRE(d.f0Hz <= *d.secondaryHz);
    }
}

TEST_CASE("detectBicoherence - cancellation", "[bicoherence][cancel]") {
    const auto x = makeCoupledTriplet(4096);
    std::atomic<bool> cancel{true};
    const DetectorResult r = detectBicoherence(x.data(), x.size(), kFs, bicoParams(), &cancel);
    REQUIRE(r.cancelled);
    REQUIRE(r.detections.empty());
}
