// ==============================================================================
// Layer 2: DSP Processor - Harmonic Analyzer (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/harmonic_analyzer.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/math_constants.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/primitives/peak_refiner.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace Scopelab::DSP {

namespace {

/// Windowed-FFT magnitude to sinusoid RMS
double magnitudeToRms(double magnitude, size_t n, double coherentGain) noexcept {
    const double peak = magnitude / static_cast<double>(n);
    return safeDiv(peak / kSqrt2, coherentGain);
}

void addDegenerateWarnings(HarmonicResult& result) {
    if (result.fundamentalHz <= 0.0) {
        result.warnings.emplace_back("No fundamental detected (f1<=0)");
    }
    if (result.coherenceCycles < kMinCoherenceCycles) {
        result.warnings.emplace_back("Low cycle count in buffer (<3 cycles)");
    }
}

} // anonymous namespace

HarmonicResult analyzeHarmonics(const float* x, size_t n, double sampleRate,
                                const AnalysisParams& params) {
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        throwInvalidArgument("sample rate must be positive and finite");
    }
    if (params.numHarmonics < 1) {
        throwInvalidArgument("numHarmonics must be >= 1");
    }

    HarmonicResult result;
    result.sampleRate = sampleRate;
    result.numSamples = n;
    result.window = windowTag(params.window);
    result.includeDc = params.includeDc;
    result.numHarmonics = params.numHarmonics;

    if (x == nullptr || n == 0) {
        result.warnings.emplace_back("Empty signal");
        addDegenerateWarnings(result);
        return result;
    }

    // -------------------------------------------------------------------------
    // Time-domain figures
    // -------------------------------------------------------------------------
    const std::vector<double> centered = params.includeDc
        ? std::vector<double>(x, x + n)
        : removeMean(x, n);

    double sumSq = 0.0;
    double sumAbs = 0.0;
    double peakAbs = 0.0;
    for (double v : centered) {
        sumSq += v * v;
        sumAbs += std::abs(v);
        peakAbs = std::max(peakAbs, std::abs(v));
    }
    const double totalRms = std::sqrt(sumSq / static_cast<double>(n));
    const double meanAbs = sumAbs / static_cast<double>(n);
    result.totalRms = totalRms;
    result.crestFactor = peakAbs / std::max(totalRms, kMagnitudeFloor);
    result.formFactor = totalRms / std::max(meanAbs, kMagnitudeFloor);

    // -------------------------------------------------------------------------
    // Spectrum
    // -------------------------------------------------------------------------
    const WindowInfo window = makeWindow(params.window, n);
    const BlockSpectrum spectrum = computeBlockSpectrum(x, n, sampleRate, window.weights,
                                                        !params.includeDc);
    const std::vector<double>& mag = spectrum.magnitude;
    const size_t numBins = mag.size();
    const double df = spectrum.df;
    const double nyquist = 0.5 * sampleRate;

    // Fundamental: largest bin, DC excluded
    size_t k0 = 0;
    double best = 0.0;
    for (size_t k = 1; k < numBins; ++k) {
        if (mag[k] > best) {
            best = mag[k];
            k0 = k;
        }
    }

    double f1 = 0.0;
    double v1 = 0.0;
    if (k0 > 0) {
        const PeakEstimate refined = refinePeak(mag.data(), numBins, k0);
        f1 = (static_cast<double>(k0) + refined.offset) * df;
        v1 = magnitudeToRms(refined.value, n, window.coherentGain);
        result.fundamentalPhaseDeg = spectrum.bins[k0].phase() * kRadToDeg;
    }
    result.fundamentalHz = f1;
    result.fundamentalRms = v1;
    result.coherenceCycles = (static_cast<double>(n) / sampleRate) * f1;

    // -------------------------------------------------------------------------
    // Harmonic table
    // -------------------------------------------------------------------------
    std::vector<size_t> toneBins;
    if (k0 > 0) toneBins.push_back(k0);

    if (f1 > 0.0 && f1 < nyquist) {
        result.rows.push_back({1, f1, v1, 100.0, result.fundamentalPhaseDeg});
    }

    double harmonicPower = 0.0;
    if (f1 > 0.0) {
        for (int k = 2; k <= params.numHarmonics; ++k) {
            const double fk = static_cast<double>(k) * f1;
            if (fk >= nyquist) break;

            const double binPosition = std::round(fk / df);
            double rms = 0.0;
            double phaseDeg = 0.0;
            if (binPosition > 0.0 && binPosition < static_cast<double>(numBins)) {
                const auto bin = static_cast<size_t>(binPosition);
                const PeakEstimate refined = refinePeak(mag.data(), numBins, bin);
                rms = magnitudeToRms(refined.value, n, window.coherentGain);
                phaseDeg = spectrum.bins[bin].phase() * kRadToDeg;
                toneBins.push_back(bin);
            }

            harmonicPower += rms * rms;
            const double percent = v1 > 0.0 ? 100.0 * rms / v1 : 0.0;
            result.rows.push_back({k, fk, rms, percent, phaseDeg});
        }
    }

    result.thd = v1 > 0.0 ? std::sqrt(harmonicPower) / v1 : 0.0;
    result.thdDb = amplitudeToDb(result.thd);

    // -------------------------------------------------------------------------
    // THD+N, SINAD, SNR
    // -------------------------------------------------------------------------
    if (params.computeThdN && v1 > 0.0) {
        const double residual = std::sqrt(std::max(0.0, totalRms * totalRms - v1 * v1));
        result.thdN = residual / v1;
        result.sinadDb = amplitudeToDb(v1 / std::max(residual, kMagnitudeFloor));

        std::vector<double> noise(numBins, 0.0);
        for (size_t k = 0; k < numBins; ++k) noise[k] = mag[k] * mag[k];
        if (!params.includeDc) noise[0] = 0.0;
        for (size_t bin : toneBins) {
            const size_t lo = bin > kSnrExclusionBins ? bin - kSnrExclusionBins : 0;
            const size_t hi = std::min(numBins - 1, bin + kSnrExclusionBins);
            for (size_t k = lo; k <= hi; ++k) noise[k] = 0.0;
        }

        double noisePower = 0.0;
        for (double p : noise) noisePower += p;

        // One-sided Parseval, corrected for the window's power gain
        double windowPower = 0.0;
        for (float w : window.weights) windowPower += static_cast<double>(w) * static_cast<double>(w);
        windowPower /= static_cast<double>(n);
        const double noiseRms = safeDiv(std::sqrt(2.0 * noisePower) / static_cast<double>(n),
                                        std::sqrt(windowPower));

        result.snrDb = amplitudeToDb(std::max(v1, kMagnitudeFloor) / std::max(noiseRms, kMagnitudeFloor));
    }

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------
    addDegenerateWarnings(result);
    if (f1 > 0.0 && sampleRate / f1 < kMinSamplesPerCycle) {
        result.warnings.emplace_back("fs/f0 ratio below 20 - increase sample rate");
    }

    return result;
}

} // namespace Scopelab::DSP
