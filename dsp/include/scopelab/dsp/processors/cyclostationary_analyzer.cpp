// ==============================================================================
// Layer 2: DSP Processor - Cyclostationary Spectral Correlation (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/cyclostationary_analyzer.h>

#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/core/window_functions.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <utility>

namespace Scopelab::DSP {

DisplayRange autoLevelRange(const std::vector<double>& body, double spanDb, double percentile) {
    DisplayRange range;
    if (body.empty()) return range;

    const double median = Statistics::computeMedian(body);
    const double high = Statistics::computeQuantile(body, percentile / 100.0);
    range.lo = median - 0.5 * spanDb;
    range.hi = std::max(high, median + 0.5 * spanDb);
    return range;
}

DetectorResult analyzeCyclostationary(const float* x, size_t n, double sampleRate,
                                      const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    DetectorResult result = makeDetectorResult(AnalysisMethod::Cyclostationary, n, sampleRate);

    const size_t length = resolveSegmentLength(std::max(kMinCycloFrameLength, params.fftSize), n);
    const size_t hop = std::clamp(params.hop, std::min(kMinCycloHop, length), length);
    const double dbFloor = params.dbFloor;

    const std::vector<double> centered = removeMean(x, n);
    const std::vector<float> window = Window::generate(WindowType::Hann, length);
    const FramedSpectra frames = frameSpectra(centered, sampleRate, window, hop, cancel);

    const size_t bins = frames.numBins;
    const size_t numFrames = frames.numFrames;
    const double df = frames.df;
    result.dfHz = df;

    // Clamp in double before the cast; alpha_max may exceed any bin count
    size_t mMax = 0;
    if (df > 0.0 && bins > 0) {
        const double limit = static_cast<double>((bins - 1) / 2);
        mMax = static_cast<size_t>(std::min(std::floor(params.alphaMaxHz / (2.0 * df)), limit));
    }

    result.params.set("nfft", static_cast<double>(length));
    result.params.set("hop", static_cast<double>(hop));
    result.params.set("alpha_max", params.alphaMaxHz);
    result.params.set("db_floor", dbFloor);
    result.params.set("K", static_cast<double>(numFrames));
    result.params.set("auto_level", params.autoLevel ? 1.0 : 0.0);

    Image2D image;
    image.rows = mMax + 1;
    image.cols = bins;
    image.values.assign(image.rows * image.cols, dbFloor);
    image.extent = {0.0, bins > 0 ? static_cast<double>(bins - 1) * df : 0.0,
                    0.0, 2.0 * static_cast<double>(mMax) * df};
    image.xLabel = "Frequency (Hz)";
    image.yLabel = "Cyclic freq alpha (Hz)";
    image.displayMin = dbFloor;
    image.displayMax = 0.0;

    if (frames.cancelled || numFrames == 0) {
        result.image = std::move(image);
        if (frames.cancelled) markCancelled(result);
        return result;
    }

    std::vector<double> power(bins, 0.0);
    for (size_t k = 0; k < bins; ++k) {
        double sum = 0.0;
        for (size_t f = 0; f < numFrames; ++f) sum += std::norm(frames.at(k, f));
        power[k] = sum / static_cast<double>(numFrames) + kPowerFloor;
    }

    // Row 0 (alpha = 0) stays at the floor
    for (size_t m = 1; m <= mMax; ++m) {
        if (isCancelled(cancel)) {
            result.image = std::move(image);
            markCancelled(result);
            return result;
        }
        for (size_t k = m; k + m < bins; ++k) {
            std::complex<double> acc{0.0, 0.0};
            for (size_t f = 0; f < numFrames; ++f) {
                acc += frames.at(k + m, f) * std::conj(frames.at(k - m, f));
            }
            acc /= static_cast<double>(numFrames);

            const double denom = std::sqrt(power[k + m] * power[k - m]) + kPowerFloor;
            const double magnitude = std::abs(acc) / denom;
            image.at(m, k) = std::max(20.0 * std::log10(magnitude + kStdFloor), dbFloor);
        }
    }

    if (params.autoLevel) {
        std::vector<double> body;
        if (image.rows > 1) {
            body.assign(image.values.begin() + static_cast<std::ptrdiff_t>(image.cols),
                        image.values.end());
        } else {
            body = image.values;
        }
        const DisplayRange range = autoLevelRange(body, params.levelSpanDb, params.levelPercentile);
        image.displayMin = range.lo;
        image.displayMax = range.hi;
    }

    result.image = std::move(image);
    if (!hasAcContent(x, n)) {
        result.warnings.emplace_back(kNoAcContentWarning);
    }
    return result;
}

} // namespace Scopelab::DSP
