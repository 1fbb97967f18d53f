// ==============================================================================
// Layer 2: DSP Processor - Spectral Kurtosis Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/spectral_kurtosis_detector.h>

#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <complex>
#include <limits>
#include <utility>

namespace Scopelab::DSP {

DetectorResult detectSpectralKurtosis(const float* x, size_t n, double sampleRate,
                                      const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    DetectorResult result = makeDetectorResult(AnalysisMethod::SpectralKurtosis, n, sampleRate);

    const size_t segment = resolveSegmentLength(params.fftSize, n);
    const size_t hop = std::clamp<size_t>(params.hop, 1, segment);
    result.params.set("nfft", static_cast<double>(segment));
    result.params.set("hop", static_cast<double>(hop));
    result.params.set("sk_thr", params.skThreshold);

    const std::vector<double> centered = removeMean(x, n);
    const FramedSpectra stft = shortTimeFourier(centered, sampleRate, segment, hop, cancel);
    const size_t bins = stft.numBins;
    const size_t frames = stft.numFrames;

    // Log-magnitude, bin-major
    std::vector<double> logMag(bins * frames);
    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    for (size_t i = 0; i < logMag.size(); ++i) {
        logMag[i] = safeLog(std::abs(stft.values[i]));
        lo = std::min(lo, logMag[i]);
        hi = std::max(hi, logMag[i]);
    }

    Image2D image;
    image.rows = bins;
    image.cols = frames;
    image.values.resize(logMag.size());
    const double range = (hi - lo) + kStdFloor;
    for (size_t i = 0; i < logMag.size(); ++i) image.values[i] = (logMag[i] - lo) / range;
    image.extent = {frames > 0 ? stft.times.front() : 0.0,
                    frames > 0 ? stft.times.back() : 0.0,
                    stft.frequencies.empty() ? 0.0 : stft.frequencies.front(),
                    stft.frequencies.empty() ? 0.0 : stft.frequencies.back()};
    image.xLabel = "Time (s)";
    image.yLabel = "Frequency (Hz)";
    image.displayMin = 0.0;
    image.displayMax = 1.0;
    result.image = std::move(image);
    result.dfHz = stft.df;

    if (stft.cancelled) {
        markCancelled(result);
        return result;
    }
    if (!hasAcContent(x, n) || frames == 0) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    std::vector<double> kurtosis(bins, 0.0);
    for (size_t k = 0; k < bins; ++k) {
        kurtosis[k] = Statistics::computeExcessKurtosis(logMag.data() + k * frames, frames);
    }

    result.detections = detectRunsAtOrAbove(stft.frequencies, kurtosis, params.skThreshold,
                                            stft.df, "sk", MetricKind::SpectralKurtosis);
    return result;
}

} // namespace Scopelab::DSP
