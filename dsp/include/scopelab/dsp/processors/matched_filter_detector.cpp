// ==============================================================================
// Layer 2: DSP Processor - Matched Filter Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/matched_filter_detector.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/primitives/fft_correlation.h>
#include <scopelab/dsp/primitives/template_loader.h>
#include <scopelab/dsp/processors/line_detection.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <string>

namespace Scopelab::DSP {

namespace {

/// Demeaned copy scaled to unit Euclidean norm (norm + kStdFloor)
std::vector<float> normalizeUnitNorm(const float* data, size_t n) {
    const double mean = Statistics::computeMean(data, n);
    double energy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double v = static_cast<double>(data[i]) - mean;
        energy += v * v;
    }
    const double scale = 1.0 / (std::sqrt(energy) + kStdFloor);

    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<float>((static_cast<double>(data[i]) - mean) * scale);
    }
    return out;
}

} // anonymous namespace

DetectorResult detectMatchedFilter(const float* x, size_t n, double sampleRate,
                                   const std::vector<float>& templ,
                                   const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    if (templ.empty()) {
        throw AnalysisError(ErrorKind::EmptyTemplate, "matched-filter template has no samples");
    }
    if (templ.size() > n) {
        throw AnalysisError(ErrorKind::InsufficientSamples,
                            "template (" + std::to_string(templ.size()) +
                                " samples) is longer than the signal (" + std::to_string(n) + ")");
    }

    DetectorResult result = makeDetectorResult(AnalysisMethod::MatchedFilter, n, sampleRate);
    result.params.set("template_len", static_cast<double>(templ.size()));
    if (!params.templatePath.empty()) {
        result.params.set("template_path", params.templatePath);
    }

    const std::vector<float> signal = normalizeUnitNorm(x, n);
    const std::vector<float> kernel = normalizeUnitNorm(templ.data(), templ.size());

    FFTCrossCorrelation correlator;
    correlator.prepare(n, templ.size());
    std::vector<double> correlation(correlator.numLags(), 0.0);
    correlator.compute(signal.data(), kernel.data(), correlation.data());

    if (isCancelled(cancel)) {
        markCancelled(result);
        return result;
    }

    Curve curve;
    curve.x.resize(correlation.size());
    for (size_t k = 0; k < correlation.size(); ++k) {
        curve.x[k] = static_cast<double>(k) / sampleRate;
    }
    curve.y = correlation;
    curve.xLabel = "Lag (s)";
    curve.yLabel = "Normalized correlation";
    result.curve = std::move(curve);

    if (!hasAcContent(x, n)) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    const auto peak = std::max_element(correlation.begin(), correlation.end());
    const size_t lag = static_cast<size_t>(std::distance(correlation.begin(), peak));

    char note[96];
    std::snprintf(note, sizeof(note), "peak idx %zu (%.6g s)", lag,
                  static_cast<double>(lag) / sampleRate);

    Detection d;
    d.type = "corr";
    d.f0Hz = 0.0;
    d.metricKind = MetricKind::Correlation;
    d.metric = *peak;
    d.bandwidthHz = 0.0;
    d.notes = note;
    result.detections.push_back(std::move(d));
    return result;
}

DetectorResult detectMatchedFilter(const float* x, size_t n, double sampleRate,
                                   const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    const std::vector<float> templ = loadTemplate(params.templatePath);
    return detectMatchedFilter(x, n, sampleRate, templ, params, cancel);
}

} // namespace Scopelab::DSP
