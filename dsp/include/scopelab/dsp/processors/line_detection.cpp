// ==============================================================================
// Layer 2: DSP Processor - Line Detection Helpers (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/line_detection.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/primitives/peak_refiner.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Scopelab::DSP {

std::vector<double> robustBaseline(const std::vector<double>& levelDb, int smoothBins) {
    const int kernel = std::max(kMinSmoothBins, smoothBins | 1);
    return Statistics::medianFilter(levelDb, static_cast<size_t>(kernel));
}

double cfarOffset(const std::vector<double>& residual, double pfa) {
    if (residual.empty()) return kFallbackCfarOffsetDb;

    const double p = std::clamp(pfa, kMinPfa, kMaxPfa);
    const double offset = Statistics::computeQuantile(residual, 1.0 - p);
    return std::isfinite(offset) ? offset : kFallbackCfarOffsetDb;
}

std::vector<BinRun> groupRuns(const std::vector<size_t>& indices) {
    std::vector<BinRun> runs;
    if (indices.empty()) return runs;

    BinRun current{indices.front(), indices.front()};
    for (size_t i = 1; i < indices.size(); ++i) {
        if (indices[i] - current.last > 1) {
            runs.push_back(current);
            current = {indices[i], indices[i]};
        } else {
            current.last = indices[i];
        }
    }
    runs.push_back(current);
    return runs;
}

double runBandwidth(const BinRun& run, const std::vector<double>& frequencies, double df) noexcept {
    if (run.last > run.first && run.last < frequencies.size()) {
        return std::max(0.0, frequencies[run.last] - frequencies[run.first]);
    }
    return frequencies.size() > 1 ? df : 0.0;
}

CfarOutcome detectLinesCfar(const std::vector<double>& frequencies,
                            const std::vector<double>& levelDb, double df, int smoothBins,
                            double pfa, const std::string& type, CancelFlag cancel) {
    CfarOutcome out;
    const size_t n = std::min(frequencies.size(), levelDb.size());
    if (n == 0) return out;

    out.baseline = robustBaseline(levelDb, smoothBins);
    out.residual.resize(n);
    for (size_t i = 0; i < n; ++i) out.residual[i] = levelDb[i] - out.baseline[i];
    out.offset = cfarOffset(out.residual, pfa);

    if (isCancelled(cancel)) {
        out.cancelled = true;
        return out;
    }

    std::vector<size_t> above;
    for (size_t i = 0; i < n; ++i) {
        if (levelDb[i] > out.baseline[i] + out.offset) above.push_back(i);
    }

    for (const BinRun& run : groupRuns(above)) {
        size_t peak = run.first;
        for (size_t i = run.first + 1; i <= run.last; ++i) {
            if (out.residual[i] > out.residual[peak]) peak = i;
        }

        const PeakEstimate refined = refinePeak(levelDb.data(), n, peak);

        Detection d;
        d.type = type;
        d.f0Hz = frequencies[peak] + refined.offset * df;
        d.metricKind = MetricKind::SnrDb;
        d.metric = refined.value - out.baseline[peak];
        d.bandwidthHz = runBandwidth(run, frequencies, df);
        out.detections.push_back(std::move(d));
    }
    return out;
}

std::vector<Detection> detectRunsAtOrAbove(const std::vector<double>& frequencies,
                                           const std::vector<double>& values, double threshold,
                                           double df, const std::string& type, MetricKind metric) {
    std::vector<Detection> detections;
    const size_t n = std::min(frequencies.size(), values.size());

    std::vector<size_t> above;
    for (size_t i = 0; i < n; ++i) {
        if (values[i] >= threshold) above.push_back(i);
    }

    for (const BinRun& run : groupRuns(above)) {
        size_t peak = run.first;
        for (size_t i = run.first + 1; i <= run.last; ++i) {
            if (values[i] > values[peak]) peak = i;
        }

        Detection d;
        d.type = type;
        d.f0Hz = frequencies[peak];
        d.metricKind = metric;
        d.metric = values[peak];
        d.bandwidthHz = runBandwidth(run, frequencies, df);
        detections.push_back(std::move(d));
    }
    return detections;
}

bool hasAcContent(const float* x, size_t n) noexcept {
    if (x == nullptr || n == 0) return false;

    const double mean = Statistics::computeMean(x, n);
    const double rms = Statistics::computeStdDev(x, n, mean);
    return rms > kStdFloor * std::max(1.0, std::abs(mean));
}

std::vector<double> toDecibels(const std::vector<double>& power) {
    std::vector<double> db(power.size());
    for (size_t i = 0; i < power.size(); ++i) db[i] = powerToDb(power[i]);
    return db;
}

void requireSignal(const float* x, size_t n, double sampleRate) {
    if (x == nullptr || n == 0) {
        throw AnalysisError(ErrorKind::EmptySignal, "signal is empty");
    }
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        throwInvalidArgument("sample rate must be positive and finite");
    }
}

DetectorResult makeDetectorResult(AnalysisMethod method, size_t n, double sampleRate) {
    DetectorResult result;
    result.method = method;
    result.methodName = methodName(method);
    result.numSamples = n;
    result.sampleRate = sampleRate;
    return result;
}

void markCancelled(DetectorResult& result) {
    result.cancelled = true;
    result.detections.clear();
    result.warnings.emplace_back(kCancelledWarning);
}

} // namespace Scopelab::DSP
