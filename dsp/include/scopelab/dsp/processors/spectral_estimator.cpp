// ==============================================================================
// Layer 2: DSP Processor - Spectral Estimator (implementation)
// ==============================================================================

#include <scopelab/dsp/processors/spectral_estimator.h>

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/core/window_functions.h>
#include <scopelab/dsp/primitives/dpss.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace Scopelab::DSP {

namespace {

/// Double every bin except DC and (for even fftSize) Nyquist
void applyOneSidedScaling(std::vector<double>& values, size_t fftSize) noexcept {
    const size_t last = values.size();
    const size_t end = (fftSize % 2 == 0) ? last - 1 : last;
    for (size_t k = 1; k < end; ++k) values[k] *= 2.0;
}

void applyOneSidedScaling(std::vector<std::complex<double>>& values, size_t fftSize) noexcept {
    const size_t last = values.size();
    const size_t end = (fftSize % 2 == 0) ? last - 1 : last;
    for (size_t k = 1; k < end; ++k) values[k] *= 2.0;
}

std::vector<float> periodicHann(size_t length) {
    std::vector<float> w(length, 0.0f);
    Window::generateHannPeriodic(w.data(), length);
    return w;
}

double sumOfSquares(const std::vector<float>& w) noexcept {
    double s = 0.0;
    for (float v : w) s += static_cast<double>(v) * static_cast<double>(v);
    return s;
}

/// Copy x[start..start+len) minus an optional offset, times window, into buf (zero tail)
void loadFrame(const double* x, size_t len, double offset, const float* window,
               std::vector<float>& buf) noexcept {
    std::fill(buf.begin(), buf.end(), 0.0f);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<float>((x[i] - offset) * static_cast<double>(window[i]));
    }
}

} // anonymous namespace

// =============================================================================
// Segmentation
// =============================================================================

size_t resolveSegmentLength(size_t requested, size_t available) {
    if (requested == 0) {
        throwInvalidArgument("segment length must be positive");
    }
    const size_t length = std::max(kMinSegmentLength, std::min(requested, available));
    if (available < length) {
        throw AnalysisError(ErrorKind::InsufficientSamples,
                            "need at least " + std::to_string(length) + " samples, got "
                                + std::to_string(available));
    }
    return length;
}

SegmentPlan planSegments(size_t available, size_t segmentLength, double overlapFraction,
                         size_t fftSize) {
    SegmentPlan plan;
    plan.length = resolveSegmentLength(segmentLength, available);

    const double raw = std::floor(overlapFraction * static_cast<double>(plan.length));
    const double clamped = std::clamp(raw, 0.0, static_cast<double>(plan.length - 1));
    plan.overlap = static_cast<size_t>(clamped);
    plan.hop = plan.length - plan.overlap;
    plan.fftSize = std::max(fftSize, plan.length);
    plan.count = (available - plan.length) / plan.hop + 1;
    return plan;
}

std::vector<double> rfftFrequencies(size_t fftSize, double sampleRate) {
    const size_t bins = fftSize / 2 + 1;
    std::vector<double> f(bins, 0.0);
    if (fftSize == 0) return f;
    const double df = sampleRate / static_cast<double>(fftSize);
    for (size_t k = 0; k < bins; ++k) f[k] = static_cast<double>(k) * df;
    return f;
}

// =============================================================================
// Single Block
// =============================================================================

std::vector<double> removeMean(const float* x, size_t n) {
    std::vector<double> out(n, 0.0);
    const double mean = Statistics::computeMean(x, n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<double>(x[i]) - mean;
    return out;
}

BlockSpectrum computeBlockSpectrum(const float* x, size_t n, double sampleRate,
                                   const std::vector<float>& window, bool removeDc,
                                   size_t fftSize) {
    BlockSpectrum result;
    if (x == nullptr || n == 0) return result;

    const size_t nfft = std::max(fftSize == 0 ? n : fftSize, n);
    const double offset = removeDc ? Statistics::computeMean(x, n) : 0.0;

    std::vector<float> buf(nfft, 0.0f);
    for (size_t i = 0; i < n; ++i) {
        const double w = i < window.size() ? static_cast<double>(window[i]) : 1.0;
        buf[i] = static_cast<float>((static_cast<double>(x[i]) - offset) * w);
    }

    FFT fft;
    fft.prepare(nfft);
    result.bins.assign(fft.numBins(), Complex{});
    fft.forward(buf.data(), result.bins.data());

    result.magnitude.resize(result.bins.size());
    for (size_t k = 0; k < result.bins.size(); ++k) {
        result.magnitude[k] = result.bins[k].magnitude();
    }
    result.frequencies = rfftFrequencies(nfft, sampleRate);
    result.df = sampleRate / static_cast<double>(nfft);
    result.fftSize = nfft;
    return result;
}

// =============================================================================
// Welch Estimators
// =============================================================================

PsdEstimate welchPsd(const std::vector<double>& x, double sampleRate, const SegmentPlan& plan,
                     CancelFlag cancel) {
    PsdEstimate result;
    const std::vector<float> window = periodicHann(plan.length);

    FFT fft;
    fft.prepare(plan.fftSize);
    std::vector<float> buf(plan.fftSize, 0.0f);
    std::vector<Complex> spectrum(fft.numBins());
    std::vector<double> acc(fft.numBins(), 0.0);

    for (size_t s = 0; s < plan.count; ++s) {
        if (isCancelled(cancel)) {
            result.cancelled = true;
            break;
        }
        const double* seg = x.data() + s * plan.hop;
        const double segMean = Statistics::computeMean(seg, plan.length);
        loadFrame(seg, plan.length, segMean, window.data(), buf);
        fft.forward(buf.data(), spectrum.data());
        for (size_t k = 0; k < acc.size(); ++k) acc[k] += spectrum[k].power();
        ++result.segmentsUsed;
    }

    if (result.segmentsUsed == 0) return result;

    const double scale = 1.0 / (sampleRate * sumOfSquares(window)
                                * static_cast<double>(result.segmentsUsed));
    for (double& v : acc) v *= scale;
    applyOneSidedScaling(acc, plan.fftSize);

    result.psd.values = std::move(acc);
    result.psd.frequencies = rfftFrequencies(plan.fftSize, sampleRate);
    result.psd.df = sampleRate / static_cast<double>(plan.fftSize);
    return result;
}

CrossSpectralEstimate welchCrossSpectra(const std::vector<double>& x, const std::vector<double>& y,
                                        double sampleRate, const SegmentPlan& plan,
                                        CancelFlag cancel) {
    CrossSpectralEstimate result;
    const std::vector<float> window = periodicHann(plan.length);

    FFT fft;
    fft.prepare(plan.fftSize);
    const size_t bins = fft.numBins();
    std::vector<float> buf(plan.fftSize, 0.0f);
    std::vector<Complex> sx(bins);
    std::vector<Complex> sy(bins);
    std::vector<double> pxx(bins, 0.0);
    std::vector<double> pyy(bins, 0.0);
    std::vector<std::complex<double>> pxy(bins, {0.0, 0.0});

    for (size_t s = 0; s < plan.count; ++s) {
        if (isCancelled(cancel)) {
            result.cancelled = true;
            break;
        }
        const double* segX = x.data() + s * plan.hop;
        const double* segY = y.data() + s * plan.hop;

        loadFrame(segX, plan.length, Statistics::computeMean(segX, plan.length), window.data(), buf);
        fft.forward(buf.data(), sx.data());
        loadFrame(segY, plan.length, Statistics::computeMean(segY, plan.length), window.data(), buf);
        fft.forward(buf.data(), sy.data());

        for (size_t k = 0; k < bins; ++k) {
            const std::complex<double> a(sx[k].real, sx[k].imag);
            const std::complex<double> b(sy[k].real, sy[k].imag);
            pxx[k] += std::norm(a);
            pyy[k] += std::norm(b);
            pxy[k] += std::conj(a) * b;
        }
        ++result.segmentsUsed;
    }

    if (result.segmentsUsed == 0) return result;

    const double scale = 1.0 / (sampleRate * sumOfSquares(window)
                                * static_cast<double>(result.segmentsUsed));
    for (size_t k = 0; k < bins; ++k) {
        pxx[k] *= scale;
        pyy[k] *= scale;
        pxy[k] *= scale;
    }
    applyOneSidedScaling(pxx, plan.fftSize);
    applyOneSidedScaling(pyy, plan.fftSize);
    applyOneSidedScaling(pxy, plan.fftSize);

    result.pxx = std::move(pxx);
    result.pyy = std::move(pyy);
    result.pxy = std::move(pxy);
    result.frequencies = rfftFrequencies(plan.fftSize, sampleRate);
    result.df = sampleRate / static_cast<double>(plan.fftSize);
    return result;
}

PsdEstimate multitaperPsd(const std::vector<double>& x, double sampleRate, const SegmentPlan& plan,
                          size_t numTapers, CancelFlag cancel) {
    PsdEstimate result;

    const double halfBandwidth = std::max(2.5, static_cast<double>(numTapers) / 2.0);
    const auto tapers = computeDpss(plan.length, halfBandwidth, numTapers, false);
    if (tapers.empty()) return result;

    std::vector<std::vector<float>> taperWeights;
    taperWeights.reserve(tapers.size());
    for (const auto& t : tapers) taperWeights.emplace_back(t.begin(), t.end());

    FFT fft;
    fft.prepare(plan.fftSize);
    std::vector<float> buf(plan.fftSize, 0.0f);
    std::vector<Complex> spectrum(fft.numBins());
    std::vector<double> acc(fft.numBins(), 0.0);
    const double taperScale = 1.0 / static_cast<double>(taperWeights.size());

    for (size_t s = 0; s < plan.count; ++s) {
        if (isCancelled(cancel)) {
            result.cancelled = true;
            break;
        }
        const double* seg = x.data() + s * plan.hop;
        for (const auto& taper : taperWeights) {
            loadFrame(seg, plan.length, 0.0, taper.data(), buf);
            fft.forward(buf.data(), spectrum.data());
            for (size_t k = 0; k < acc.size(); ++k) acc[k] += spectrum[k].power() * taperScale;
        }
        ++result.segmentsUsed;
    }

    if (result.segmentsUsed == 0) return result;

    // Unit-energy tapers: density = |X|^2 / fs
    const double scale = 1.0 / (sampleRate * static_cast<double>(result.segmentsUsed));
    for (double& v : acc) v *= scale;
    applyOneSidedScaling(acc, plan.fftSize);

    result.psd.values = std::move(acc);
    result.psd.frequencies = rfftFrequencies(plan.fftSize, sampleRate);
    result.psd.df = sampleRate / static_cast<double>(plan.fftSize);
    return result;
}

// =============================================================================
// Framed Spectra
// =============================================================================

namespace {

/// Transpose frame-major spectra into the bin-major FramedSpectra layout
void storeFrames(FramedSpectra& out, const std::vector<std::vector<std::complex<double>>>& frames,
                 size_t bins) {
    out.numBins = bins;
    out.numFrames = frames.size();
    out.values.assign(bins * frames.size(), {0.0, 0.0});
    for (size_t f = 0; f < frames.size(); ++f) {
        for (size_t k = 0; k < bins; ++k) {
            out.values[k * out.numFrames + f] = frames[f][k];
        }
    }
}

} // anonymous namespace

FramedSpectra shortTimeFourier(const std::vector<double>& x, double sampleRate,
                               size_t segmentLength, size_t hop, CancelFlag cancel) {
    FramedSpectra result;
    if (x.empty() || segmentLength == 0 || hop == 0) return result;

    const size_t half = segmentLength / 2;
    std::vector<double> padded(x.size() + 2 * half, 0.0);
    std::copy(x.begin(), x.end(), padded.begin() + static_cast<std::ptrdiff_t>(half));

    const size_t span = padded.size() - segmentLength;
    const size_t extra = (hop - span % hop) % hop;
    padded.resize(padded.size() + extra, 0.0);
    const size_t numFrames = (padded.size() - segmentLength) / hop + 1;

    const std::vector<float> window = periodicHann(segmentLength);
    double windowSum = 0.0;
    for (float w : window) windowSum += static_cast<double>(w);
    const double scale = windowSum > 0.0 ? 1.0 / windowSum : 1.0;

    FFT fft;
    fft.prepare(segmentLength);
    const size_t bins = fft.numBins();
    std::vector<float> buf(segmentLength, 0.0f);
    std::vector<Complex> spectrum(bins);
    std::vector<std::vector<std::complex<double>>> frames;
    frames.reserve(numFrames);

    for (size_t f = 0; f < numFrames; ++f) {
        if (isCancelled(cancel)) {
            result.cancelled = true;
            break;
        }
        loadFrame(padded.data() + f * hop, segmentLength, 0.0, window.data(), buf);
        fft.forward(buf.data(), spectrum.data());

        std::vector<std::complex<double>> frame(bins);
        for (size_t k = 0; k < bins; ++k) {
            frame[k] = std::complex<double>(spectrum[k].real, spectrum[k].imag) * scale;
        }
        frames.push_back(std::move(frame));
        result.times.push_back(static_cast<double>(f * hop) / sampleRate);
    }

    storeFrames(result, frames, bins);
    result.frequencies = rfftFrequencies(segmentLength, sampleRate);
    result.df = sampleRate / static_cast<double>(segmentLength);
    return result;
}

FramedSpectra frameSpectra(const std::vector<double>& x, double sampleRate,
                           const std::vector<float>& window, size_t hop, CancelFlag cancel) {
    FramedSpectra result;
    const size_t length = window.size();
    if (length == 0 || hop == 0 || x.size() < length) return result;

    const size_t numFrames = (x.size() - length) / hop + 1;

    FFT fft;
    fft.prepare(length);
    const size_t bins = fft.numBins();
    std::vector<float> buf(length, 0.0f);
    std::vector<Complex> spectrum(bins);
    std::vector<std::vector<std::complex<double>>> frames;
    frames.reserve(numFrames);

    for (size_t f = 0; f < numFrames; ++f) {
        if (isCancelled(cancel)) {
            result.cancelled = true;
            break;
        }
        loadFrame(x.data() + f * hop, length, 0.0, window.data(), buf);
        fft.forward(buf.data(), spectrum.data());

        std::vector<std::complex<double>> frame(bins);
        for (size_t k = 0; k < bins; ++k) {
            frame[k] = std::complex<double>(spectrum[k].real, spectrum[k].imag);
        }
        frames.push_back(std::move(frame));
        const double center = static_cast<double>(f * hop) + 0.5 * static_cast<double>(length);
        result.times.push_back(center / sampleRate);
    }

    storeFrames(result, frames, bins);
    result.frequencies = rfftFrequencies(length, sampleRate);
    result.df = sampleRate / static_cast<double>(length);
    return result;
}

} // namespace Scopelab::DSP
