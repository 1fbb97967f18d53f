// ==============================================================================
// Layer 2: DSP Processor - AR (Yule-Walker) Spectrum Detector (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/ar_spectrum_detector.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/math_constants.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/primitives/levinson.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/spectral_estimator.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace Scopelab::DSP {

std::vector<double> evaluateArSpectrum(const std::vector<double>& coefficients,
                                       double predictionError, size_t fftSize) {
    const size_t bins = fftSize / 2 + 1;
    std::vector<double> power(bins, 0.0);

    for (size_t k = 0; k < bins; ++k) {
        const double w = kTwoPi * static_cast<double>(k) / static_cast<double>(fftSize);
        double re = 0.0;
        double im = 0.0;
        for (size_t m = 0; m < coefficients.size(); ++m) {
            re += coefficients[m] * std::cos(w * static_cast<double>(m));
            im -= coefficients[m] * std::sin(w * static_cast<double>(m));
        }
        power[k] = safeDiv(predictionError, re * re + im * im, kPowerFloor);
    }
    return power;
}

DetectorResult detectArSpectrum(const float* x, size_t n, double sampleRate,
                                const AnalysisParams& params, CancelFlag cancel) {
    requireSignal(x, n, sampleRate);
    if (params.arOrder == 0) {
        throwInvalidArgument("AR order must be at least 1");
    }
    if (n <= params.arOrder) {
        throw AnalysisError(ErrorKind::InsufficientSamples,
                            "AR order " + std::to_string(params.arOrder) +
                                " needs more than " + std::to_string(n) + " samples");
    }

    DetectorResult result = makeDetectorResult(AnalysisMethod::ArSpectrum, n, sampleRate);
    const size_t nfft = std::max(kMinArFftSize, params.fftSize);
    result.params.set("order", static_cast<double>(params.arOrder));
    result.params.set("nfft", static_cast<double>(nfft));
    result.params.set("pfa", params.pfa);
    result.params.set("smooth_bins", static_cast<double>(params.smoothBins));

    const std::vector<double> centered = removeMean(x, n);
    const std::vector<double> r = computeAutocorrelation(centered.data(), n, params.arOrder);
    const AutoregressiveModel model = levinsonDurbin(r, params.arOrder);

    if (isCancelled(cancel)) {
        markCancelled(result);
        return result;
    }

    const std::vector<double> frequencies = rfftFrequencies(nfft, sampleRate);
    const std::vector<double> levelDb =
        toDecibels(evaluateArSpectrum(model.coefficients, model.predictionError, nfft));
    const double df = sampleRate / static_cast<double>(nfft);
    result.curve = Curve{frequencies, levelDb, "Frequency (Hz)", "AR PSD (dB)"};
    result.dfHz = df;

    if (!hasAcContent(x, n)) {
        result.warnings.emplace_back(kNoAcContentWarning);
        return result;
    }

    CfarOutcome cfar = detectLinesCfar(frequencies, levelDb, df, params.smoothBins, params.pfa, "ar",
                                       cancel);
    if (cfar.cancelled) {
        markCancelled(result);
        return result;
    }
    result.detections = std::move(cfar.detections);
    return result;
}

} // namespace Scopelab::DSP
