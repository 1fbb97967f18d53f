// ==============================================================================
// Layer 2: DSP Processor - Cepstrum Comb Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/cepstrum_detector.h>

#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/core/window_functions.h>
#include <scopelab/dsp/primitives/fft.h>
#include <scopelab/dsp/processors/line_detection.h>

#include <algorithm>
#include <numeric>
#include <vector>

namespace Scopelab::DSP {

namespace {

/// Indices of the largest values in seg, local maxima first
std::vector<size_t> pickCepstralPeaks(const std::vector<double>& seg, size_t count) {
    std::vector<size_t> maxima;
    for (size_t i = 1; i + 1 < seg.size(); ++i) {
        if (seg[i] > seg[i - 1] && seg[i] >= seg[i + 1]) maxima.push_back(i);
    }
    if (maxima.empty()) {
        maxima.resize(seg.size());
        std::iota(maxima.begin(), maxima.end(), size_t{0});
    }

    std::stable_sort(maxima.begin(), maxima.end(),
                     [&](size_t a, size_t b) { return seg[a] > seg[b]; });
    if (maxima.size() > count) maxima.resize(count);
    return maxima;
}

} // anonymous namespace

DetectorResult detectCepstrum(const float* x, size_t n, double sampleRate,
                              const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    DetectorResult result = makeDetectorResult(AnalysisMethod::Cepstrum, n, sampleRate);

    const size_t nfft = std::clamp(params.fftSize, kMinCepstrumFftSize, kMaxCepstrumFftSize);
    const size_t length = std::min(n, nfft);
    result.params.set("nfft", static_cast<double>(nfft));
    result.params.set("qmin_ms", params.quefrencyMinMs);
    result.params.set("qmax_ms", params.quefrencyMaxMs);
    result.params.set("topk", static_cast<double>(params.cepstrumPeaks));

    // Most recent samples, demeaned and tapered
    const float* tail = x + (n - length);
    const double mean = Statistics::computeMean(tail, length);
    const std::vector<float> window = Window::generate(WindowType::Hann, length);
    std::vector<float> frame(nfft, 0.0f);
    for (size_t i = 0; i < length; ++i) {
        frame[i] = static_cast<float>((static_cast<double>(tail[i]) - mean) * window[i]);
    }

    FFT fft;
    fft.prepare(nfft);
    std::vector<Complex> spectrum(fft.numBins());
    fft.forward(frame.data(), spectrum.data());
    for (Complex& bin : spectrum) {
        bin = {static_cast<float>(safeLog(bin.magnitude())), 0.0f};
    }
    std::vector<float> cepstrum(nfft, 0.0f);
    fft.inverse(spectrum.data(), cepstrum.data());

    if (isCancelled(cancel)) {
        markCancelled(result);
        return result;
    }

    const double qMin = std::max(1.0 / sampleRate, params.quefrencyMinMs * 1e-3);
    const double qMax = std::min(static_cast<double>(nfft - 1) / sampleRate,
                                 params.quefrencyMaxMs * 1e-3);

    std::vector<size_t> searchBins;
    for (size_t k = 1; k < nfft; ++k) {
        const double q = static_cast<double>(k) / sampleRate;
        if (q >= qMin && q <= qMax) searchBins.push_back(k);
    }
    if (searchBins.empty()) {
        result.warnings.emplace_back("quefrency window is empty");
        return result;
    }

    Curve curve;
    curve.xLabel = "1/quefrency (Hz)";
    curve.yLabel = "Cepstrum";
    std::vector<double> seg;
    seg.reserve(searchBins.size());
    for (size_t k : searchBins) {
        curve.x.push_back(sampleRate / static_cast<double>(k));
        seg.push_back(static_cast<double>(cepstrum[k]));
    }
    curve.y = seg;
    result.curve = std::move(curve);

    if (!hasAcContent(x, n)) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    const size_t count = std::max<size_t>(params.cepstrumPeaks, 1);
    for (size_t i : pickCepstralPeaks(seg, count)) {
        Detection d;
        d.type = "comb";
        d.f0Hz = sampleRate / static_cast<double>(searchBins[i]);
        d.metricKind = MetricKind::CepstralAmplitude;
        d.metric = seg[i];
        d.bandwidthHz = 0.0;
        d.notes = "fundamental spacing";
        result.detections.push_back(std::move(d));
    }
    return result;
}

} // namespace Scopelab::DSP
