// ==============================================================================
// Layer 2: DSP Processor Tests - Spectral Estimator
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/processors/spectral_estimator.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/window_functions.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include "test_signals.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <complex>
#include <iterator>
#include <numeric>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

namespace {

std::vector<double> toDouble(const std::vector<float>& x) {
    return std::vector<double>(x.begin(), x.end());
}

double meanOfInteriorBins(const std::vector<double>& values) {
    double sum = 0.0;
    for (size_t k = 1; k + 1 < values.size(); ++k) sum += values[k];
    return sum / static_cast<double>(values.size() - 2);
}

} // anonymous namespace

// ==============================================================================
// Segmentation
// ==============================================================================

TEST_CASE("resolveSegmentLength - clamps to the record and the minimum", "[spectral][segment]") {
    REQUIRE(resolveSegmentLength(4096, 1000) == 1000);
    REQUIRE(resolveSegmentLength(512, 1000) == 512);
    REQUIRE(resolveSegmentLength(64, 1000) == kMinSegmentLength);
}

TEST_CASE("resolveSegmentLength - rejects impossible requests", "[spectral][segment][error]") {
    SECTION("zero length") {
        try {
            (void)resolveSegmentLength(0, 1000);
            FAIL("expected AnalysisError");
        } catch (const AnalysisError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidArgument);
        }
    }

    SECTION("record shorter than the minimum segment") {
        try {
            (void)resolveSegmentLength(4096, 100);
            FAIL("expected AnalysisError");
        } catch (const AnalysisError& e) {
            REQUIRE(e.kind() == ErrorKind::InsufficientSamples);
        }
    }
}

TEST_CASE("planSegments - overlap, hop and FFT size", "[spectral][segment]") {
    SECTION("half overlap") {
        const SegmentPlan plan = planSegments(10000, 1000, 0.5, 512);
        REQUIRE(plan.length == 1000);
        REQUIRE(plan.overlap == 500);
        REQUIRE(plan.hop == 500);
        REQUIRE(plan.fftSize == 1000);  // raised to the segment length
        REQUIRE(plan.count == 19);
    }

    SECTION("overlap never reaches the segment length") {
        const SegmentPlan plan = planSegments(4096, 1024, 0.9999, 2048);
        REQUIRE(plan.overlap == 1023);
        REQUIRE(plan.hop == 1);
        REQUIRE(plan.fftSize == 2048);
    }

    SECTION("no overlap, single segment") {
        const SegmentPlan plan = planSegments(1024, 4096, 0.0, 4096);
        REQUIRE(plan.length == 1024);
        REQUIRE(plan.hop == 1024);
        REQUIRE(plan.count == 1);
    }
}

TEST_CASE("rfftFrequencies - uniform grid up to Nyquist", "[spectral]") {
    const auto f = rfftFrequencies(8, 8000.0);
    REQUIRE(f.size() == 5);
    REQUIRE(f.front() == 0.0);
    REQUIRE(f[1] == Approx(1000.0));
    REQUIRE(f.back() == Approx(4000.0));
}

// ==============================================================================
// Single Block
// ==============================================================================

TEST_CASE("computeBlockSpectrum - on-bin tone magnitude", "[spectral][block]") {
    constexpr size_t N = 1024;
    constexpr double fs = 1024.0;
    const auto x = TestHelpers::makeSine(N, 64.0, fs, 2.0);
    const std::vector<float> rect(N, 1.0f);

    const BlockSpectrum s = computeBlockSpectrum(x.data(), N, fs, rect, true);
    REQUIRE(s.fftSize == N);
    REQUIRE(s.bins.size() == N / 2 + 1);
    REQUIRE(s.df == Approx(1.0));
    // Rectangular window: |X[k]| = A*N/2
    REQUIRE(s.magnitude[64] == Approx(2.0 * N / 2.0).epsilon(1e-3));
    REQUIRE(s.magnitude[10] < 1e-2);
}

TEST_CASE("computeBlockSpectrum - DC removal", "[spectral][block]") {
    auto x = TestHelpers::makeSine(512, 32.0, 512.0, 1.0);
    for (auto& v : x) v += 3.0f;
    const std::vector<float> rect(512, 1.0f);

    const BlockSpectrum kept = computeBlockSpectrum(x.data(), x.size(), 512.0, rect, false);
    const BlockSpectrum removed = computeBlockSpectrum(x.data(), x.size(), 512.0, rect, true);
    REQUIRE(kept.magnitude[0] == Approx(3.0 * 512.0).epsilon(1e-3));
    REQUIRE(removed.magnitude[0] < 1e-2);
}

// ==============================================================================
// Welch
// ==============================================================================

TEST_CASE("welchPsd - white noise density level", "[spectral][welch]") {
    constexpr double fs = 1000.0;
    constexpr double sigma = 1.0;
    const auto x = toDouble(TestHelpers::makeWhiteNoise(65536, sigma, 11));

    const SegmentPlan plan = planSegments(x.size(), 1024, 0.5, 1024);
    const PsdEstimate est = welchPsd(x, fs, plan);

    REQUIRE_FALSE(est.cancelled);
    REQUIRE(est.segmentsUsed == plan.count);
    REQUIRE(est.psd.values.size() == 513);
    REQUIRE(est.psd.df == Approx(fs / 1024.0));
    // One-sided density of unit-variance white noise: 2*sigma^2/fs
    REQUIRE(meanOfInteriorBins(est.psd.values) == Approx(2.0 * sigma * sigma / fs).epsilon(0.1));
}

TEST_CASE("welchPsd - integrated density equals tone power", "[spectral][welch]") {
    constexpr double fs = 8192.0;
    const auto x = toDouble(TestHelpers::makeSine(32768, 512.0, fs, 1.0));

    const SegmentPlan plan = planSegments(x.size(), 2048, 0.5, 2048);
    const PsdEstimate est = welchPsd(x, fs, plan);

    const double power = std::accumulate(est.psd.values.begin(), est.psd.values.end(), 0.0)
                         * est.psd.df;
    REQUIRE(power == Approx(0.5).epsilon(0.02));
}

TEST_CASE("welchPsd - cancelled before the first segment", "[spectral][welch][cancel]") {
    const auto x = toDouble(TestHelpers::makeWhiteNoise(8192));
    const SegmentPlan plan = planSegments(x.size(), 1024, 0.5, 1024);
    std::atomic<bool> cancel{true};

    const PsdEstimate est = welchPsd(x, 1000.0, plan, &cancel);
    REQUIRE(est.cancelled);
    REQUIRE(est.segmentsUsed == 0);
    REQUIRE(est.psd.values.empty());
}

TEST_CASE("welchCrossSpectra - identical channels are fully coherent", "[spectral][welch]") {
    auto xf = TestHelpers::makeWhiteNoise(16384, 1.0, 5);
    const auto x = toDouble(xf);

    const SegmentPlan plan = planSegments(x.size(), 512, 0.5, 512);
    const CrossSpectralEstimate est = welchCrossSpectra(x, x, 1000.0, plan);

    REQUIRE(est.frequencies.size() == 257);
    for (size_t k = 1; k + 1 < est.frequencies.size(); ++k) {
        REQUIRE(est.pxx[k] == Approx(est.pyy[k]));
        REQUIRE(std::abs(est.pxy[k]) == Approx(est.pxx[k]).epsilon(1e-9));
        REQUIRE(std::abs(est.pxy[k].imag()) < 1e-9 * est.pxx[k] + 1e-300);
    }
}

// ==============================================================================
// Multitaper
// ==============================================================================

TEST_CASE("multitaperPsd - white noise density level", "[spectral][multitaper]") {
    constexpr double fs = 2000.0;
    const auto x = toDouble(TestHelpers::makeWhiteNoise(32768, 1.0, 21));

    const SegmentPlan plan = planSegments(x.size(), 2048, 0.5, 2048);
    const PsdEstimate est = multitaperPsd(x, fs, plan, 6);

    REQUIRE(est.segmentsUsed == plan.count);
    REQUIRE(meanOfInteriorBins(est.psd.values) == Approx(2.0 / fs).epsilon(0.15));
}

TEST_CASE("multitaperPsd - tone peak sits at its bin", "[spectral][multitaper]") {
    constexpr double fs = 4096.0;
    auto xf = TestHelpers::makeSine(16384, 300.0, fs, 1.0);
    TestHelpers::addWhiteNoise(xf, 0.01);
    const auto x = toDouble(xf);

    const SegmentPlan plan = planSegments(x.size(), 4096, 0.5, 4096);
    const PsdEstimate est = multitaperPsd(x, fs, plan, 4);

    const auto peak = std::max_element(est.psd.values.begin(), est.psd.values.end());
    const auto bin = static_cast<size_t>(std::distance(est.psd.values.begin(), peak));
    REQUIRE(est.psd.frequencies[bin] == Approx(300.0).margin(3.0));
}

// ==============================================================================
// Framed Spectra
// ==============================================================================

TEST_CASE("shortTimeFourier - frame layout and scaling", "[spectral][stft]") {
    constexpr double fs = 1024.0;
    // Tone on bin 32 of a 256-point frame
    const auto x = toDouble(TestHelpers::makeSine(1000, 128.0, fs, 1.0));

    const FramedSpectra s = shortTimeFourier(x, fs, 256, 64);
    // 1000 + 2*128 padded to a whole number of hops: (1280 - 256)/64 + 1
    REQUIRE(s.numFrames == 17);
    REQUIRE(s.numBins == 129);
    REQUIRE(s.times.size() == 17);
    REQUIRE(s.times[0] == 0.0);
    REQUIRE(s.times[1] == Approx(64.0 / fs));
    REQUIRE(s.df == Approx(4.0));

    // Interior frame: |X| = A/2 after 1/sum(window) scaling
    REQUIRE(std::abs(s.at(32, 8)) == Approx(0.5).epsilon(0.01));
}

TEST_CASE("frameSpectra - unpadded frames with window centers", "[spectral][stft]") {
    const auto x = toDouble(TestHelpers::makeWhiteNoise(1000));
    const std::vector<float> window = Window::generate(WindowType::Hann, 256);

    const FramedSpectra s = frameSpectra(x, 1000.0, window, 128);
    REQUIRE(s.numFrames == 6);
    REQUIRE(s.numBins == 129);
    REQUIRE(s.times[0] == Approx(0.128));
    REQUIRE(s.times[5] == Approx((5.0 * 128.0 + 128.0) / 1000.0));
}

TEST_CASE("frameSpectra - record shorter than a frame", "[spectral][stft][edge]") {
    const std::vector<double> x(100, 1.0);
    const std::vector<float> window(256, 1.0f);
    const FramedSpectra s = frameSpectra(x, 1000.0, window, 64);
    REQUIRE(s.numFrames == 0);
    REQUIRE(s.values.empty());
}
