// ==============================================================================
// Layer 2: DSP Processor - Multitaper Line Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/multitaper_detector.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <utility>

namespace Scopelab::DSP {

DetectorResult detectMultitaper(const float* x, size_t n, double sampleRate,
                                const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    if (params.numTapers == 0) {
        throwInvalidArgument("numTapers must be >= 1");
    }
    DetectorResult result = makeDetectorResult(AnalysisMethod::Multitaper, n, sampleRate);

    const SegmentPlan plan = planSegments(n, params.segmentLength, params.overlap, params.fftSize);
    const double halfBandwidth = std::max(2.5, static_cast<double>(params.numTapers) / 2.0);
    result.params.set("K", static_cast<double>(params.numTapers));
    result.params.set("NW", halfBandwidth);
    result.params.set("nfft", static_cast<double>(plan.fftSize));
    result.params.set("seglen", static_cast<double>(plan.length));
    result.params.set("overlap", params.overlap);
    result.params.set("pfa", params.pfa);
    result.params.set("smooth_bins", static_cast<double>(params.smoothBins));

    const std::vector<double> centered = removeMean(x, n);
    PsdEstimate estimate = multitaperPsd(centered, sampleRate, plan, params.numTapers, cancel);

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
