// ==============================================================================
// Layer 2: DSP Processor - Bicoherence (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/bicoherence.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/core/window_functions.h>
#include <scopelab/dsp/primitives/fft.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace Scopelab::DSP {

BicoherenceAccumulator makeBicoherenceAccumulator(size_t fftSize, size_t noverlap,
                                                  double sampleRate) {
    if (fftSize < 2) {
        throwInvalidArgument("bicoherence FFT size must be at least 2");
    }
    if (fftSize > kMaxBicoherenceFftSize) {
        throwInvalidArgument("bicoherence FFT size must not exceed " +
                             std::to_string(kMaxBicoherenceFftSize));
    }
    if (noverlap >= fftSize) {
        throwInvalidArgument("bicoherence overlap must be smaller than the FFT size");
    }
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        throwInvalidArgument("sample rate must be positive and finite");
    }

    BicoherenceAccumulator acc;
    acc.fftSize = fftSize;
    acc.hop = fftSize - noverlap;
    acc.numBins = fftSize / 2 + 1;
    acc.sampleRate = sampleRate;
    acc.tripleSum.assign(acc.numBins * acc.numBins, {0.0, 0.0});
    acc.pairPowerSum.assign(acc.numBins * acc.numBins, 0.0);
    acc.powerSum.assign(acc.numBins, 0.0);
    return acc;
}

BicoherenceAccumulator accumulateBicoherence(BicoherenceAccumulator acc, const float* x, size_t n,
                                             CancelFlag cancel) {
    if (x == nullptr || acc.fftSize == 0 || n < acc.fftSize) return acc;

    const size_t length = acc.fftSize;
    const size_t bins = acc.numBins;
    const std::vector<float> window = Window::generateHannUnitRms(length);
    const double mean = Statistics::computeMean(x, n);

    FFT fft;
    fft.prepare(length);
    std::vector<float> frame(length, 0.0f);
    std::vector<Complex> raw(fft.numBins());
    std::vector<std::complex<double>> spectrum(bins);

    const size_t numFrames = (n - length) / acc.hop + 1;
    for (size_t f = 0; f < numFrames; ++f) {
        if (isCancelled(cancel)) break;

        const float* src = x + f * acc.hop;
        for (size_t i = 0; i < length; ++i) {
            frame[i] = static_cast<float>((static_cast<double>(src[i]) - mean) * window[i]);
        }
        fft.forward(frame.data(), raw.data());
        for (size_t k = 0; k < bins; ++k) {
            spectrum[k] = {static_cast<double>(raw[k].real), static_cast<double>(raw[k].imag)};
            acc.powerSum[k] += std::norm(spectrum[k]);
        }

        for (size_t i = 0; i < bins; ++i) {
            for (size_t j = 0; i + j < bins; ++j) {
                const std::complex<double> pair = spectrum[i] * spectrum[j];
                acc.tripleSum[i * bins + j] += pair * std::conj(spectrum[i + j]);
                acc.pairPowerSum[i * bins + j] += std::norm(pair);
            }
        }
        ++acc.frameCount;
    }
    return acc;
}

Image2D finalizeBicoherence(const BicoherenceAccumulator& acc) {
    const size_t bins = acc.numBins;
    const double df = acc.fftSize > 0 ? acc.sampleRate / static_cast<double>(acc.fftSize) : 0.0;
    const double fMax = bins > 0 ? static_cast<double>(bins - 1) * df : 0.0;

    Image2D image;
    image.rows = bins;
    image.cols = bins;
    image.values.assign(bins * bins, 0.0);
    image.extent = {0.0, fMax, 0.0, fMax};
    image.xLabel = "f2 (Hz)";
    image.yLabel = "f1 (Hz)";
    image.displayMin = 0.0;
    image.displayMax = 1.0;
    if (acc.frameCount == 0) return image;

    for (size_t i = 0; i < bins; ++i) {
        for (size_t j = 0; i + j < bins; ++j) {
            const double denom = acc.pairPowerSum[i * bins + j] * acc.powerSum[i + j];
            if (denom > 0.0) {
                image.at(i, j) = clampUnit(std::norm(acc.tripleSum[i * bins + j]) / denom);
            }
        }
    }
    return image;
}

std::vector<Detection> pickBicoherencePeaks(const Image2D& image, double df, size_t topK) {
    std::vector<Detection> detections;
    if (image.rows < 3 || image.cols < 3 || topK == 0) return detections;

    // Interior cells only: DC and edge rows/columns never qualify
    double peak = 0.0;
    for (size_t i = 1; i + 1 < image.rows; ++i) {
        for (size_t j = 1; j + 1 < image.cols; ++j) peak = std::max(peak, image.at(i, j));
    }
    const double threshold = std::max(kMinBicoherencePeak, kRelativeBicoherencePeak * peak);

    struct Candidate {
        size_t i;
        size_t j;
        double value;
    };
    std::vector<Candidate> candidates;

    for (size_t i = 1; i + 1 < image.rows; ++i) {
        for (size_t j = i; j + 1 < image.cols; ++j) {
            const double v = image.at(i, j);
            if (v < threshold) continue;

            bool isMax = true;
            for (size_t a = i - 1; a <= i + 1 && isMax; ++a) {
                for (size_t b = j - 1; b <= j + 1; ++b) {
                    if (image.at(a, b) > v) {
                        isMax = false;
                        break;
                    }
                }
            }
            if (isMax) candidates.push_back({i, j, v});
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.value > b.value; });
    if (candidates.size() > topK) candidates.resize(topK);

    for (const Candidate& c : candidates) {
        const double f1 = static_cast<double>(c.i) * df;
        const double f2 = static_cast<double>(c.j) * df;
        char note[64];
        std::snprintf(note, sizeof(note), "f3=%.6g Hz", f1 + f2);

        Detection d;
        d.type = "b2-peak";
        d.f0Hz = f1;
        d.secondaryHz = f2;
        d.metricKind = MetricKind::Bicoherence;
        d.metric = c.value;
        d.bandwidthHz = df;
        d.notes = note;
        detections.push_back(std::move(d));
    }
    return detections;
}

DetectorResult detectBicoherence(const float* x, size_t n, double sampleRate,
                                 const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    DetectorResult result = makeDetectorResult(AnalysisMethod::Bicoherence, n, sampleRate);

    const size_t length = resolveSegmentLength(params.bicoherenceFftSize, n);
    const double overlap = std::clamp(params.overlap, 0.0, 1.0);
    const size_t noverlap = std::min(static_cast<size_t>(std::floor(overlap * static_cast<double>(length))),
                                     length - 1);
    result.params.set("nfft", static_cast<double>(length));
    result.params.set("noverlap", static_cast<double>(noverlap));
    result.params.set("topk", static_cast<double>(params.topK));

    BicoherenceAccumulator acc = makeBicoherenceAccumulator(length, noverlap, sampleRate);
    acc = accumulateBicoherence(std::move(acc), x, n, cancel);
    result.params.set("K", static_cast<double>(acc.frameCount));

    const double df = sampleRate / static_cast<double>(length);
    result.image = finalizeBicoherence(acc);
    result.dfHz = df;

    if (isCancelled(cancel)) {
        markCancelled(result);
        return result;
    }
    if (!hasAcContent(x, n)) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    result.detections = pickBicoherencePeaks(*result.image, df, params.topK);
    return result;
}

} // namespace Scopelab::DSP
