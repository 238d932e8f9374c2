// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Real-input forward FFT via pffft (Pretty Fast FFT), used for spectral
// measurement of generated and filtered buffers.
//
// Layer 1: depends only on Layer 0
// O(N log N); allocations only in prepare()
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <complex>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Earshot {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size
inline constexpr size_t kMinFFTSize = 256;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 32768;

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
    void operator()(float* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) {
    return AlignedBuffer{static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float)))};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real-to-complex forward FFT (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    /// @brief Prepare for a transform size (allocates setup and aligned buffers)
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @return false if the size is unsupported; the FFT is then unprepared
    bool prepare(size_t fftSize) {
        size_ = 0;
        setup_.reset();

        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            return false;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) {
            return false;
        }

        input_ = detail::makeAlignedBuffer(fftSize);
        output_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!input_ || !output_ || !work_) {
            setup_.reset();
            return false;
        }

        size_ = fftSize;
        return true;
    }

    /// @brief Forward FFT: N real samples to N/2+1 complex bins (DC..Nyquist)
    /// @pre prepare() succeeded
    void forward(const float* input, std::complex<float>* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t n = size_;
        std::copy_n(input, n, input_.get());

        pffft_transform_ordered(setup_.get(), input_.get(), output_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered layout: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
        const float* out = output_.get();
        output[0] = {out[0], 0.0f};
        output[n / 2] = {out[1], 0.0f};
        for (size_t k = 1; k < n / 2; ++k) {
            output[k] = {out[2 * k], out[2 * k + 1]};
        }
    }

    /// Configured FFT size (0 when unprepared)
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// Number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    /// Check if prepare() has succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer input_;
    detail::AlignedBuffer output_;
    detail::AlignedBuffer work_;
};

} // namespace DSP
} // namespace Earshot
