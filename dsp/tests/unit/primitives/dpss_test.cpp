// ==============================================================================
// Layer 1: DSP Primitive Tests - DPSS Tapers
// ==============================================================================
// Tests for: dsp/include/scopelab/dsp/primitives/dpss.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <scopelab/dsp/primitives/dpss.h>

#include <cmath>
#include <numeric>
#include <vector>

using namespace Scopelab::DSP;
using Catch::Approx;

namespace {

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
}

} // anonymous namespace

TEST_CASE("computeDpss - symmetric tapers are orthonormal", "[dpss][multitaper]") {
    const auto tapers = computeDpss(256, 3.0, 5, true);
    REQUIRE(tapers.size() == 5);

    for (size_t i = 0; i < tapers.size(); ++i) {
        REQUIRE(tapers[i].size() == 256);
        for (size_t j = 0; j < tapers.size(); ++j) {
            const double expected = (i == j) ? 1.0 : 0.0;
            REQUIRE(dot(tapers[i], tapers[j]) == Approx(expected).margin(1e-6));
        }
    }
}

TEST_CASE("computeDpss - sign convention and symmetry", "[dpss][multitaper]") {
    const auto tapers = computeDpss(128, 2.5, 4, true);

    SECTION("even tapers are symmetric with positive sum") {
        for (size_t k : {0u, 2u}) {
            const auto& w = tapers[k];
            REQUIRE(std::accumulate(w.begin(), w.end(), 0.0) > 0.0);
            for (size_t i = 0; i < w.size(); ++i) {
                REQUIRE(w[i] == Approx(w[w.size() - 1 - i]).margin(1e-6));
            }
        }
    }

    SECTION("odd tapers are antisymmetric") {
        for (size_t k : {1u, 3u}) {
            const auto& w = tapers[k];
            for (size_t i = 0; i < w.size(); ++i) {
                REQUIRE(w[i] == Approx(-w[w.size() - 1 - i]).margin(1e-6));
            }
        }
    }

    SECTION("first taper peaks in the middle") {
        const auto& w = tapers[0];
        REQUIRE(w[64] > w[0]);
        REQUIRE(w[64] > w[10]);
    }
}

TEST_CASE("computeDpss - periodic variant keeps the requested length", "[dpss][multitaper]") {
    const auto tapers = computeDpss(200, 3.0, 6);
    REQUIRE(tapers.size() == 6);
    for (const auto& w : tapers) {
        REQUIRE(w.size() == 200);
        // Truncating one sample from a unit-norm taper keeps the norm near 1
        REQUIRE(dot(w, w) == Approx(1.0).margin(0.05));
    }
}
