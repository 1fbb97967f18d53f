// ==============================================================================
// Layer 2: DSP Processor - PSD + CFAR Line Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/psd_cfar_detector.h>

#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <utility>

namespace Scopelab::DSP {

DetectorResult detectPsdCfar(const float* x, size_t n, double sampleRate,
                             const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    DetectorResult result = makeDetectorResult(AnalysisMethod::PsdCfar, n, sampleRate);

    const SegmentPlan plan = planSegments(n, params.segmentLength, params.overlap, params.fftSize);
    result.params.set("nfft", static_cast<double>(plan.fftSize));
    result.params.set("seglen", static_cast<double>(plan.length));
    result.params.set("overlap", params.overlap);
    result.params.set("pfa", params.pfa);
    result.params.set("smooth_bins", static_cast<double>(params.smoothBins));

    const std::vector<double> centered = removeMean(x, n);
    PsdEstimate estimate = welchPsd(centered, sampleRate, plan, cancel);

    std::vector<double> levelDb;
    if (estimate.segmentsUsed > 0) {
        levelDb = toDecibels(estimate.psd.values);
        result.curve = Curve{estimate.psd.frequencies, levelDb, "Frequency (Hz)", "PSD (dB/Hz)"};
        result.dfHz = estimate.psd.df;
    }

    if (estimate.cancelled) {
        markCancelled(result);
        return result;
    }
    if (!hasAcContent(x, n)) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    CfarOutcome cfar = detectLinesCfar(estimate.psd.frequencies, levelDb, estimate.psd.df,
                                       params.smoothBins, params.pfa, "line", cancel);
    if (cfar.cancelled) {
        markCancelled(result);
        return result;
    }
    result.detections = std::move(cfar.detections);
    return result;
}

} // namespace Scopelab::DSP
