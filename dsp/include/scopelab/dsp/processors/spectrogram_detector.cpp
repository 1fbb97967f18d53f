// ==============================================================================
// Layer 2: DSP Processor - Spectrogram Persistence Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/spectrogram_detector.h>

#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <numeric>

namespace Scopelab::DSP {

DetectorResult detectSpectrogramPersistence(const float* x, size_t n, double sampleRate,
                                            const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    DetectorResult result = makeDetectorResult(AnalysisMethod::Spectrogram, n, sampleRate);

    const size_t segment = resolveSegmentLength(params.fftSize, n);
    const size_t hop = std::clamp<size_t>(params.hop, 1, segment);
    result.params.set("nfft", static_cast<double>(segment));
    result.params.set("hop", static_cast<double>(hop));
    result.params.set("pfa", params.pfa);
    result.params.set("topk", static_cast<double>(params.topK));

    const std::vector<double> centered = removeMean(x, n);
    const FramedSpectra stft = shortTimeFourier(centered, sampleRate, segment, hop, cancel);
    const size_t bins = stft.numBins;
    const size_t frames = stft.numFrames;

    Image2D image;
    image.rows = bins;
    image.cols = frames;
    image.values.resize(bins * frames);
    for (size_t i = 0; i < image.values.size(); ++i) {
        image.values[i] = powerToDb(std::norm(stft.values[i]));
    }
    image.extent = {frames > 0 ? stft.times.front() : 0.0,
                    frames > 0 ? stft.times.back() : 0.0,
                    stft.frequencies.empty() ? 0.0 : stft.frequencies.front(),
                    stft.frequencies.empty() ? 0.0 : stft.frequencies.back()};
    image.xLabel = "Time (s)";
    image.yLabel = "Frequency (Hz)";
    result.dfHz = stft.df;

    if (stft.cancelled) {
        result.image = std::move(image);
        markCancelled(result);
        return result;
    }
    if (!hasAcContent(x, n) || frames == 0) {
        result.image = std::move(image);
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    // Occupancy per frequency row
    const double quantile = 1.0 - std::clamp(params.pfa, kMinPfa, kMaxPfa);
    std::vector<double> occupancy(bins, 0.0);
    std::vector<double> row(frames);
    for (size_t k = 0; k < bins; ++k) {
        for (size_t t = 0; t < frames; ++t) row[t] = image.at(k, t);
        const double baseline = Statistics::computeMedian(row);
        for (double& v : row) v -= baseline;
        const double offset = Statistics::computeQuantile(row, quantile);

        size_t above = 0;
        for (double v : row) {
            if (v > offset) ++above;
        }
        occupancy[k] = static_cast<double>(above) / static_cast<double>(frames);
    }

    std::vector<size_t> order(bins);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return occupancy[a] > occupancy[b]; });

    const size_t count = std::min(std::max<size_t>(params.topK, 1), bins);
    for (size_t i = 0; i < count; ++i) {
        const size_t k = order[i];
        if (occupancy[k] <= 0.0) break;

        Detection d;
        d.type = "line";
        d.f0Hz = stft.frequencies[k];
        d.metricKind = MetricKind::OccupancyPercent;
        d.metric = 100.0 * occupancy[k];
        d.bandwidthHz = bins > 1 ? stft.df : 0.0;
        result.detections.push_back(std::move(d));
    }

    result.image = std::move(image);
    return result;
}

} // namespace Scopelab::DSP
