// ==============================================================================
// Layer 1: DSP Primitive - Levinson-Durbin Autoregressive Fit
// ==============================================================================
// Yule-Walker AR model estimation:
// 1. Biased autocorrelation r[0..order] (divided by N)
// 2. Levinson-Durbin recursion solving the Toeplitz normal equations
//
// The model is A(z) = 1 + a1 z^-1 + ... + ap z^-p with innovation variance
// e, so the AR power spectrum is e / |A(e^jw)|^2.
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/numeric_guards.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Scopelab::DSP {

/// Smallest zero-lag autocorrelation accepted before the recursion starts
inline constexpr double kMinAutocorrelation = 1e-12;

/// @brief All-pole model from the Levinson-Durbin recursion
struct AutoregressiveModel {
    std::vector<double> coefficients;  ///< a[0] = 1, a[1..p]
    double predictionError = 0.0;      ///< innovation variance e
    std::vector<double> reflection;    ///< reflection coefficients k[1..p]
};

/// @brief Biased autocorrelation r[lag] = sum(x[i] x[i+lag]) / N for lag 0..maxLag
[[nodiscard]] inline std::vector<double> computeAutocorrelation(const double* x, size_t n,
                                                                size_t maxLag) {
    std::vector<double> r(maxLag + 1, 0.0);
    if (x == nullptr || n == 0) return r;

    for (size_t lag = 0; lag <= maxLag && lag < n; ++lag) {
        double sum = 0.0;
        for (size_t i = 0; i + lag < n; ++i) {
            sum += x[i] * x[i + lag];
        }
        r[lag] = sum / static_cast<double>(n);
    }
    return r;
}

/// @brief Levinson-Durbin recursion on r[0..order]
///
/// A non-positive r[0] is replaced by kMinAutocorrelation. The prediction
/// error is kept above r[0] * 1e-12, so a degenerate or marginally stable
/// fit still yields a finite spectrum.
[[nodiscard]] inline AutoregressiveModel levinsonDurbin(std::vector<double> r, size_t order) {
    AutoregressiveModel model;
    model.coefficients.assign(order + 1, 0.0);
    model.coefficients[0] = 1.0;
    model.reflection.assign(order, 0.0);

    if (r.size() < order + 1) r.resize(order + 1, 0.0);
    if (!(r[0] > 0.0)) r[0] = kMinAutocorrelation;

    std::vector<double>& a = model.coefficients;
    std::vector<double> temp(order + 1, 0.0);
    double error = r[0];
    const double errorFloor = r[0] * 1e-12;

    for (size_t i = 1; i <= order; ++i) {
        double acc = 0.0;
        for (size_t j = 0; j < i; ++j) {
            acc -= a[j] * r[i - j];
        }
        const double lambda = acc / std::max(error, errorFloor);
        model.reflection[i - 1] = lambda;

        for (size_t j = 0; j <= i; ++j) {
            temp[j] = a[j] + lambda * a[i - j];
        }
        std::copy(temp.begin(), temp.begin() + static_cast<std::ptrdiff_t>(i + 1), a.begin());

        error *= (1.0 - lambda * lambda);
        if (!(error > errorFloor)) error = errorFloor;
    }

    model.predictionError = error;
    return model;
}

} // namespace Scopelab::DSP
