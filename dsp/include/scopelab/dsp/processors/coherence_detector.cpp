// ==============================================================================
// Layer 2: DSP Processor - Magnitude-Squared Coherence Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/coherence_detector.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <complex>
#include <string>
#include <vector>

namespace Scopelab::DSP {

DetectorResult detectCoherence(const float* x, size_t nx, double sampleRateX,
                               const float* y, size_t ny, double sampleRateY,
                               const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, nx, sampleRateX);
    if (y == nullptr || ny == 0) {
        throw AnalysisError(ErrorKind::ChannelMismatch, "second channel unavailable");
    }
    if (nx != ny) {
        throw AnalysisError(ErrorKind::ChannelMismatch,
                            "channel lengths differ (" + std::to_string(nx) + " vs " +
                                std::to_string(ny) + ")");
    }
    if (sampleRateX != sampleRateY) {
        throw AnalysisError(ErrorKind::ChannelMismatch, "channel sample rates differ");
    }

    DetectorResult result = makeDetectorResult(AnalysisMethod::Coherence, nx, sampleRateX);
    const SegmentPlan plan = planSegments(nx, params.segmentLength, params.overlap, params.fftSize);
    result.params.set("nfft", static_cast<double>(plan.fftSize));
    result.params.set("seglen", static_cast<double>(plan.length));
    result.params.set("overlap", params.overlap);
    result.params.set("thr", params.mscThreshold);

    const std::vector<double> a(x, x + nx);
    const std::vector<double> b(y, y + ny);
    const CrossSpectralEstimate cross = welchCrossSpectra(a, b, sampleRateX, plan, cancel);

    std::vector<double> msc(cross.frequencies.size(), 0.0);
    for (size_t k = 0; k < msc.size(); ++k) {
        const double denom = cross.pxx[k] * cross.pyy[k];
        if (denom > kCoherenceFloor * kCoherenceFloor) {
            msc[k] = clampUnit(std::norm(cross.pxy[k]) / denom);
        }
    }

    if (cross.segmentsUsed > 0) {
        result.curve = Curve{cross.frequencies, msc, "Frequency (Hz)", "MSC"};
        result.dfHz = cross.df;
    }

    if (cross.cancelled) {
        markCancelled(result);
        return result;
    }
    if (!hasAcContent(x, nx) || !hasAcContent(y, ny)) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    result.detections = detectRunsAtOrAbove(cross.frequencies, msc, params.mscThreshold,
                                            cross.df, "coh", MetricKind::Msc);
    return result;
}

} // namespace Scopelab::DSP
