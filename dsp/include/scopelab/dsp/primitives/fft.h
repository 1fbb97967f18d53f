// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated FFT via pffft (Pretty Fast FFT) for arbitrary lengths.
//
// - Sizes that are a multiple of 32 with only 2/3/5 factors run a direct
//   pffft real transform.
// - Every other size runs Bluestein's chirp-z algorithm: the length-N DFT is
//   rewritten as a circular convolution of length M = nextPow2(2N-1) that is
//   evaluated with a complex pffft transform.
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <scopelab/dsp/core/math_constants.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <vector>

#include <pffft.h>

namespace Scopelab {
namespace DSP {

// =============================================================================
// Forward Declarations
// =============================================================================

struct Complex;
class FFT;

// =============================================================================
// Constants
// =============================================================================

/// Smallest real transform pffft accepts (2 * SIMD width squared)
inline constexpr size_t kPffftRealQuantum = 32;

/// Smallest complex transform used for the Bluestein convolution
inline constexpr size_t kMinConvolutionSize = 32;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
/// @note POD type for performance - no virtual functions
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    [[nodiscard]] constexpr Complex conjugate() const noexcept {
        return {real, -imag};
    }

    /// @brief Squared magnitude |z|^2 in double precision
    [[nodiscard]] double power() const noexcept {
        return static_cast<double>(real) * real + static_cast<double>(imag) * imag;
    }

    /// @brief Magnitude |z|
    [[nodiscard]] double magnitude() const noexcept {
        return std::sqrt(power());
    }

    /// @brief Phase angle in radians
    [[nodiscard]] double phase() const noexcept {
        return std::atan2(static_cast<double>(imag), static_cast<double>(real));
    }
};

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

/// True when n has no prime factors other than 2, 3 and 5
[[nodiscard]] constexpr bool hasOnlySmallFactors(size_t n) noexcept {
    if (n == 0) return false;
    for (size_t p : {size_t{2}, size_t{3}, size_t{5}}) {
        while (n % p == 0) n /= p;
    }
    return n == 1;
}

} // namespace detail

/// @brief True if pffft can run a real transform of this length directly
[[nodiscard]] constexpr bool isDirectRealSize(size_t n) noexcept {
    return n >= kPffftRealQuantum && n % kPffftRealQuantum == 0 && detail::hasOnlySmallFactors(n);
}

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real-input FFT of any length (SIMD-accelerated via pffft)
///
/// forward() is unscaled; inverse() scales by 1/N so that
/// inverse(forward(x)) == x.
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates pffft setup and buffers)
    /// @param fftSize Any length >= 1
    /// @note Leaves the object unprepared if pffft rejects the setup
    void prepare(size_t fftSize) {
        release();
        if (fftSize == 0) return;

        if (isDirectRealSize(fftSize)) {
            setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
            if (!setup_) return;

            buf1_ = detail::makeAlignedBuffer(fftSize);
            buf2_ = detail::makeAlignedBuffer(fftSize);
            work_ = detail::makeAlignedBuffer(fftSize);
            size_ = fftSize;
            return;
        }

        prepareBluestein(fftSize);
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist)
    /// @pre prepare() has been called
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;

        if (bluestein_) {
            for (size_t n = 0; n < N; ++n) scratch_[n] = {input[n], 0.0f};
            bluesteinDft(scratch_.data(), scratch_.data());
            std::copy_n(scratch_.data(), numBins(), output);
            output[0].imag = 0.0f;
            if (N % 2 == 0) output[N / 2].imag = 0.0f;
            return;
        }

        std::copy_n(input, N, buf1_.get());
        pffft_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered real output: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
        const float* fftOut = buf2_.get();
        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};
        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    /// @brief Inverse FFT: complex frequency-domain -> real time-domain
    /// @param input N/2+1 complex bins (DC to Nyquist), Hermitian half
    /// @param output N real samples, scaled by 1/N
    /// @pre prepare() has been called
    void inverse(const Complex* input, float* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        const float scale = 1.0f / static_cast<float>(N);

        if (bluestein_) {
            // x = conj(DFT(conj(X))) / N over the full Hermitian spectrum
            const size_t half = numBins();
            for (size_t k = 0; k < half; ++k) scratch_[k] = input[k].conjugate();
            for (size_t k = half; k < N; ++k) scratch_[k] = input[N - k];
            bluesteinDft(scratch_.data(), scratch_.data());
            for (size_t n = 0; n < N; ++n) output[n] = scratch_[n].real * scale;
            return;
        }

        float* fftIn = buf1_.get();
        fftIn[0] = input[0].real;
        fftIn[1] = input[N / 2].real;
        for (size_t k = 1; k < N / 2; ++k) {
            fftIn[2 * k] = input[k].real;
            fftIn[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), fftIn, buf2_.get(),
                                work_.get(), PFFFT_BACKWARD);

        // pffft inverse is unscaled: IFFT(FFT(x)) = N*x
        const float* fftOut = buf2_.get();
        for (size_t i = 0; i < N; ++i) {
            output[i] = fftOut[i] * scale;
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured FFT size
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Get number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    /// @brief Check if prepare() succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

    /// @brief True when the chirp-z path is in use
    [[nodiscard]] bool usesBluestein() const noexcept { return bluestein_; }

private:
    void release() noexcept {
        size_ = 0;
        convSize_ = 0;
        bluestein_ = false;
        setup_.reset();
        buf1_.reset();
        buf2_.reset();
        work_.reset();
        chirpSpectrum_.reset();
        chirp_.clear();
        scratch_.clear();
    }

    void prepareBluestein(size_t n) {
        size_t m = std::bit_ceil(2 * n - 1);
        m = std::max(m, kMinConvolutionSize);

        setup_.reset(pffft_new_setup(static_cast<int>(m), PFFFT_COMPLEX));
        if (!setup_) return;

        buf1_ = detail::makeAlignedBuffer(2 * m);
        buf2_ = detail::makeAlignedBuffer(2 * m);
        work_ = detail::makeAlignedBuffer(2 * m);
        chirpSpectrum_ = detail::makeAlignedBuffer(2 * m);
        chirp_.assign(n, Complex{});
        scratch_.assign(n, Complex{});

        // w[k] = exp(-i*pi*k^2/N); k^2 reduced mod 2N to keep the angle exact
        const uint64_t twoN = 2 * static_cast<uint64_t>(n);
        for (size_t k = 0; k < n; ++k) {
            const uint64_t k2 = (static_cast<uint64_t>(k) * k) % twoN;
            const double angle = kPi * static_cast<double>(k2) / static_cast<double>(n);
            chirp_[k] = {static_cast<float>(std::cos(angle)), static_cast<float>(-std::sin(angle))};
        }

        // Convolution kernel b[m] = conj(w[|m|]), wrapped for negative m
        float* b = buf1_.get();
        std::fill_n(b, 2 * m, 0.0f);
        for (size_t k = 0; k < n; ++k) {
            const Complex c = chirp_[k].conjugate();
            b[2 * k] = c.real;
            b[2 * k + 1] = c.imag;
            if (k > 0) {
                b[2 * (m - k)] = c.real;
                b[2 * (m - k) + 1] = c.imag;
            }
        }
        pffft_transform_ordered(setup_.get(), b, chirpSpectrum_.get(), work_.get(), PFFFT_FORWARD);

        convSize_ = m;
        bluestein_ = true;
        size_ = n;
    }

    /// Unscaled length-N complex DFT; in and out may alias
    void bluesteinDft(const Complex* in, Complex* out) noexcept {
        const size_t N = size_;
        const size_t M = convSize_;
        float* a = buf1_.get();
        float* spec = buf2_.get();

        std::fill_n(a, 2 * M, 0.0f);
        for (size_t n = 0; n < N; ++n) {
            const Complex v = in[n] * chirp_[n];
            a[2 * n] = v.real;
            a[2 * n + 1] = v.imag;
        }

        pffft_transform_ordered(setup_.get(), a, spec, work_.get(), PFFFT_FORWARD);

        const float* kernel = chirpSpectrum_.get();
        for (size_t k = 0; k < M; ++k) {
            const Complex x{spec[2 * k], spec[2 * k + 1]};
            const Complex y = x * Complex{kernel[2 * k], kernel[2 * k + 1]};
            spec[2 * k] = y.real;
            spec[2 * k + 1] = y.imag;
        }

        pffft_transform_ordered(setup_.get(), spec, a, work_.get(), PFFFT_BACKWARD);

        const float scale = 1.0f / static_cast<float>(M);
        for (size_t k = 0; k < N; ++k) {
            const Complex c{a[2 * k] * scale, a[2 * k + 1] * scale};
            out[k] = c * chirp_[k];
        }
    }

    size_t size_ = 0;
    size_t convSize_ = 0;
    bool bluestein_ = false;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer buf1_;           // Input staging / convolution operand
    detail::AlignedBuffer buf2_;           // Output staging / spectrum
    detail::AlignedBuffer work_;           // pffft work buffer
    detail::AlignedBuffer chirpSpectrum_;  // FFT of the Bluestein kernel
    std::vector<Complex> chirp_;
    std::vector<Complex> scratch_;
};

} // namespace DSP
} // namespace Scopelab
