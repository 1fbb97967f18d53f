// ==============================================================================
// Layer 1: DSP Primitive Tests - FFT Cross-Correlation
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/primitives/fft_correlation.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/primitives/fft_correlation.h>

#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

TEST_CASE("FFTCrossCorrelation - matches direct valid-mode correlation", "[correlation][matched]") {
    const std::vector<float> signal = {0.0f, 1.0f, 2.0f, -1.0f, 0.5f, 3.0f, -2.0f, 1.0f, 0.0f, 0.25f};
    const std::vector<float> templ = {1.0f, -0.5f, 2.0f};

    FFTCrossCorrelation corr;
    corr.prepare(signal.size(), templ.size());
    REQUIRE(corr.isPrepared());
    REQUIRE(corr.numLags() == signal.size() - templ.size() + 1);

    std::vector<double> out(corr.numLags());
    corr.compute(signal.data(), templ.data(), out.data());

    for (size_t lag = 0; lag < out.size(); ++lag) {
        double expected = 0.0;
        for (size_t m = 0; m < templ.size(); ++m) {
            expected += static_cast<double>(signal[lag + m]) * static_cast<double>(templ[m]);
        }
        REQUIRE(out[lag] == Approx(expected).margin(1e-4));
    }
}

TEST_CASE("FFTCrossCorrelation - rejects a template longer than the signal", "[correlation][edge]") {
    FFTCrossCorrelation corr;
    corr.prepare(4, 8);
    REQUIRE_FALSE(corr.isPrepared());
    REQUIRE(corr.numLags() == 0);
}
