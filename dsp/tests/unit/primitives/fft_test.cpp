// ==============================================================================
// Layer 1: DSP Primitive Tests - Fast Fourier Transform
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/primitives/fft.h
//
// Covers the direct pffft path (multiples of 32 with 2/3/5 factors) and the
// Bluestein path (every other length).
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/core/math_constants.h>
#include <scopelab/dsp/primitives/fft.h>

#include <array>
#include <cmath>
#include <complex>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

// ==============================================================================
// Helper Functions
// ==============================================================================

namespace {

/// Direct O(N^2) real DFT, bins 0..N/2
std::vector<std::complex<double>> naiveDft(const std::vector<float>& x) {
    const size_t n = x.size();
    std::vector<std::complex<double>> out(n / 2 + 1);
    for (size_t k = 0; k < out.size(); ++k) {
        std::complex<double> acc{0.0, 0.0};
        for (size_t i = 0; i < n; ++i) {
            const double angle = -kTwoPi * static_cast<double>(k * i % n) / static_cast<double>(n);
            acc += static_cast<double>(x[i]) * std::complex<double>(std::cos(angle), std::sin(angle));
        }
        out[k] = acc;
    }
    return out;
}

std::vector<float> makeTestSignal(size_t n) {
    std::vector<float> x(n);
    for (size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        x[i] = static_cast<float>(0.7 * std::sin(0.31 * t) + 0.2 * std::cos(1.7 * t + 0.4) +
                                  0.05 * static_cast<double>(i % 7));
    }
    return x;
}

double maxBinError(const std::vector<Complex>& a, const std::vector<std::complex<double>>& b) {
    double worst = 0.0;
    for (size_t k = 0; k < b.size(); ++k) {
        const std::complex<double> got(a[k].real, a[k].imag);
        worst = std::max(worst, std::abs(got - b[k]));
    }
    return worst;
}

} // anonymous namespace

// ==============================================================================
// Complex Struct
// ==============================================================================

TEST_CASE("Complex struct arithmetic operators", "[fft][complex]") {
    Complex a{3.0f, 4.0f};
    Complex b{1.0f, 2.0f};

    SECTION("multiplication") {
        // (3+4i)(1+2i) = -5 + 10i
        Complex c = a * b;
        REQUIRE(c.real == Approx(-5.0f));
        REQUIRE(c.imag == Approx(10.0f));
    }

    SECTION("conjugate, magnitude, power") {
        REQUIRE(a.conjugate().imag == Approx(-4.0f));
        REQUIRE(a.magnitude() == Approx(5.0));
        REQUIRE(a.power() == Approx(25.0));
    }

    SECTION("phase of 0+1i is pi/2") {
        Complex c{0.0f, 1.0f};
        REQUIRE(c.phase() == Approx(kHalfPi));
    }
}

// ==============================================================================
// prepare()
// ==============================================================================

TEST_CASE("FFT prepare accepts any positive length", "[fft][prepare]") {
    FFT fft;

    SECTION("direct sizes") {
        for (size_t n : {32u, 96u, 480u, 1024u, 4096u}) {
            fft.prepare(n);
            REQUIRE(fft.isPrepared());
            REQUIRE(fft.size() == n);
            REQUIRE(fft.numBins() == n / 2 + 1);
            REQUIRE_FALSE(fft.usesBluestein());
        }
    }

    SECTION("non-friendly sizes use Bluestein") {
        for (size_t n : {1u, 7u, 100u, 1000u, 4801u}) {
            fft.prepare(n);
            REQUIRE(fft.isPrepared());
            REQUIRE(fft.size() == n);
            REQUIRE(fft.usesBluestein());
        }
    }

    SECTION("zero leaves the object unprepared") {
        fft.prepare(0);
        REQUIRE_FALSE(fft.isPrepared());
    }
}

TEST_CASE("isDirectRealSize - pffft real transform constraint", "[fft][prepare]") {
    REQUIRE(isDirectRealSize(32));
    REQUIRE(isDirectRealSize(4096));
    REQUIRE(isDirectRealSize(480));      // 2^5 * 3 * 5
    REQUIRE_FALSE(isDirectRealSize(16)); // below the quantum
    REQUIRE_FALSE(isDirectRealSize(224)); // factor 7
    REQUIRE_FALSE(isDirectRealSize(1000));
}

// ==============================================================================
// Accuracy
// ==============================================================================

TEST_CASE("FFT forward matches a direct DFT", "[fft][forward]") {
    const std::array<size_t, 8> sizes = {32, 64, 96, 7, 100, 250, 333, 1000};

    for (size_t n : sizes) {
        INFO("N=" << n);
        const std::vector<float> x = makeTestSignal(n);
        const auto reference = naiveDft(x);

        FFT fft;
        fft.prepare(n);
        std::vector<Complex> spectrum(fft.numBins());
        fft.forward(x.data(), spectrum.data());

        // Errors scale with N for single-precision accumulation
        REQUIRE(maxBinError(spectrum, reference) < 1e-4 * static_cast<double>(n));
    }
}

TEST_CASE("FFT round trip restores the input", "[fft][inverse]") {
    for (size_t n : {64u, 480u, 37u, 500u, 1023u}) {
        INFO("N=" << n);
        const std::vector<float> x = makeTestSignal(n);

        FFT fft;
        fft.prepare(n);
        std::vector<Complex> spectrum(fft.numBins());
        std::vector<float> back(n, 0.0f);
        fft.forward(x.data(), spectrum.data());
        fft.inverse(spectrum.data(), back.data());

        for (size_t i = 0; i < n; ++i) {
            REQUIRE(back[i] == Approx(x[i]).margin(1e-4));
        }
    }
}

TEST_CASE("FFT pure tone lands in its bin", "[fft][forward]") {
    constexpr size_t kN = 1000;  // Bluestein
    constexpr size_t kBin = 37;
    std::vector<float> x(kN);
    for (size_t i = 0; i < kN; ++i) {
        x[i] = static_cast<float>(std::cos(kTwoPi * kBin * static_cast<double>(i) / kN));
    }

    FFT fft;
    fft.prepare(kN);
    std::vector<Complex> spectrum(fft.numBins());
    fft.forward(x.data(), spectrum.data());

    REQUIRE(spectrum[kBin].magnitude() == Approx(kN / 2.0).epsilon(1e-4));
    REQUIRE(spectrum[kBin + 5].magnitude() < 0.05);
    REQUIRE(spectrum[0].magnitude() < 0.05);
}

TEST_CASE("FFT is movable", "[fft][lifecycle]") {
    FFT a;
    a.prepare(128);
    FFT b = std::move(a);
    REQUIRE(b.isPrepared());
    REQUIRE(b.size() == 128);
}
