// ==============================================================================
// Layer 3: System Component - Analysis Engine (implementation)
// ==============================================================================

#include <scopelab/dsp/systems/analysis_engine.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/analysis_log.h>
#include <scopelab/dsp/processors/ar_spectrum_detector.h>
#include <scopelab/dsp/processors/bicoherence.h>
#include <scopelab/dsp/processors/cepstrum_detector.h>
#include <scopelab/dsp/processors/coherence_detector.h>
#include <scopelab/dsp/processors/cyclostationary_analyzer.h>
#include <scopelab/dsp/processors/harmonic_analyzer.h>
#include <scopelab/dsp/processors/matched_filter_detector.h>
#include <scopelab/dsp/processors/multitaper_detector.h>
#include <scopelab/dsp/processors/psd_cfar_detector.h>
#include <scopelab/dsp/processors/spectral_kurtosis_detector.h>
#include <scopelab/dsp/processors/spectrogram_detector.h>
#include <scopelab/dsp/systems/analysis_presets.h>

#include <chrono>
#include <utility>

namespace Scopelab::DSP {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

DetectorResult dispatchDetector(const float* x, size_t n, double sampleRate,
                                AnalysisMethod method, const AnalysisParams& params,
                                CancelFlag cancel) {
    switch (method) {
        case AnalysisMethod::PsdCfar:
            return detectPsdCfar(x, n, sampleRate, params, cancel);
        case AnalysisMethod::Spectrogram:
            return detectSpectrogramPersistence(x, n, sampleRate, params, cancel);
        case AnalysisMethod::Multitaper:
            return detectMultitaper(x, n, sampleRate, params, cancel);
        case AnalysisMethod::SpectralKurtosis:
            return detectSpectralKurtosis(x, n, sampleRate, params, cancel);
        case AnalysisMethod::Cepstrum:
            return detectCepstrum(x, n, sampleRate, params, cancel);
        case AnalysisMethod::ArSpectrum:
            return detectArSpectrum(x, n, sampleRate, params, cancel);
        case AnalysisMethod::MatchedFilter:
            return detectMatchedFilter(x, n, sampleRate, params, cancel);
        case AnalysisMethod::Cyclostationary:
            return analyzeCyclostationary(x, n, sampleRate, params, cancel);
        case AnalysisMethod::Bicoherence:
            return detectBicoherence(x, n, sampleRate, params, cancel);
        case AnalysisMethod::Coherence:
            throw AnalysisError(ErrorKind::ChannelMismatch,
                                "MSC needs two channels; use analyzeTwoChannel()");
        case AnalysisMethod::Harmonics:
            break;
    }
    throwInvalidArgument("method is not a line detector");
}

void logFinished(const DetectorResult& result) {
    if (result.cancelled) {
        SCOPELAB_LOG_INFO("%s cancelled after %.3f s", result.methodName.c_str(),
                          result.elapsedSeconds);
        return;
    }
    SCOPELAB_LOG_INFO("%s finished in %.3f s, %zu detection(s), %zu warning(s)",
                      result.methodName.c_str(), result.elapsedSeconds,
                      result.detections.size(), result.warnings.size());
}

} // anonymous namespace

AnalysisResult analyze(const float* x, size_t n, double sampleRate, AnalysisMethod method,
                       const AnalysisParams& params, CancelFlag cancel) {
    const char* name = methodName(method);
    const auto start = Clock::now();

    try {
        if (x == nullptr || n == 0) {
            throw AnalysisError(ErrorKind::EmptySignal, "signal has no samples");
        }
        validate(params, method, sampleRate);
        SCOPELAB_LOG_DEBUG("%s: N=%zu fs=%.6g Hz", name, n, sampleRate);

        if (method == AnalysisMethod::Harmonics) {
            HarmonicResult result = analyzeHarmonics(x, n, sampleRate, params);
            result.elapsedSeconds = secondsSince(start);
            SCOPELAB_LOG_INFO("%s finished in %.3f s, f1=%.6g Hz THD=%.4f%%", name,
                              result.elapsedSeconds, result.fundamentalHz, 100.0 * result.thd);
            return result;
        }

        DetectorResult result = dispatchDetector(x, n, sampleRate, method, params, cancel);
        result.elapsedSeconds = secondsSince(start);
        logFinished(result);
        return result;
    } catch (const AnalysisError& e) {
        SCOPELAB_LOG_ERROR("%s failed (%s): %s", name, errorKindName(e.kind()), e.what());
        throw;
    }
}

AnalysisResult analyze(const std::vector<float>& x, double sampleRate, AnalysisMethod method,
                       const AnalysisParams& params, CancelFlag cancel) {
    return analyze(x.data(), x.size(), sampleRate, method, params, cancel);
}

DetectorResult analyzeTwoChannel(const float* x, size_t nx, double sampleRateX,
                                 const float* y, size_t ny, double sampleRateY,
                                 const AnalysisParams& params, CancelFlag cancel) {
    const char* name = methodName(AnalysisMethod::Coherence);
    const auto start = Clock::now();

    try {
        if (x == nullptr || nx == 0) {
            throw AnalysisError(ErrorKind::EmptySignal, "channel has no samples");
        }
        if (y == nullptr || ny == 0) {
            throw AnalysisError(ErrorKind::ChannelMismatch, "second channel unavailable");
        }
        validate(params, AnalysisMethod::Coherence, sampleRateX);
        SCOPELAB_LOG_DEBUG("%s: N=%zu/%zu fs=%.6g/%.6g Hz", name, nx, ny, sampleRateX, sampleRateY);

        DetectorResult result =
            detectCoherence(x, nx, sampleRateX, y, ny, sampleRateY, params, cancel);
        result.elapsedSeconds = secondsSince(start);
        logFinished(result);
        return result;
    } catch (const AnalysisError& e) {
        SCOPELAB_LOG_ERROR("%s failed (%s): %s", name, errorKindName(e.kind()), e.what());
        throw;
    }
}

} // namespace Scopelab::DSP
