// ==============================================================================
// Layer 1: DSP Primitive - Voss-McCartney Pink Noise
// ==============================================================================
// Sum of N random sources where source k is redrawn every 2^(k+1) samples, giving
// an approximately 1/f power spectrum without any frequency-domain synthesis.
//
// Layer 1: depends only on Layer 0
// Reference: https://www.firstpr.com.au/dsp/pink-noise/ (Voss-McCartney)
// ==============================================================================

#pragma once

#include <earshot/dsp/core/random.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

namespace Earshot {
namespace DSP {

/// Default number of stochastic sources
inline constexpr size_t kDefaultPinkNoiseSources = 16;

/// Largest number of stochastic sources supported
inline constexpr size_t kMaxPinkNoiseSources = 32;

/// @brief Voss-McCartney pink noise source.
///
/// @par Algorithm
/// For output sample i (0-based) the lowest set bit of (i + 1) selects
/// source k = bitIndex mod N. That source is replaced by a fresh uniform
/// value in [-1/N, 1/N] and the running sum is updated by the difference.
/// Source 0 changes every other sample, source 1 every fourth sample, and so
/// on, so each source covers one octave of the spectrum.
///
/// The raw output is bounded by [-1, 1] but not normalized; see
/// generatePinkNoise() for DC removal and peak scaling.
///
/// @par Usage
/// @code
/// VossPinkNoise pink(16);
/// Xorshift32 rng(12345);
///
/// for (size_t i = 0; i < numSamples; ++i) {
///     work[i] = pink.process(rng);
/// }
/// @endcode
class VossPinkNoise {
public:
    /// @param numSources Number of sources, clamped to [1, kMaxPinkNoiseSources]
    explicit VossPinkNoise(size_t numSources = kDefaultPinkNoiseSources) noexcept {
        setNumSources(numSources);
    }

    /// Change the number of sources. Resets the generator.
    void setNumSources(size_t numSources) noexcept {
        numSources_ = std::clamp<size_t>(numSources, 1, kMaxPinkNoiseSources);
        sourceScale_ = 1.0 / static_cast<double>(numSources_);
        reset();
    }

    /// Zero all sources, the running sum and the sample counter.
    void reset() noexcept {
        sources_.fill(0.0);
        accumulator_ = 0.0;
        counter_ = 0;
    }

    /// @brief Generate the next sample.
    /// @param rng Random source supplying the replacement values
    /// @return Running sum of all sources, in [-1, 1]
    [[nodiscard]] double process(Xorshift32& rng) noexcept {
        ++counter_;
        // counter_ == i + 1 is never zero, so countr_zero is the index of the
        // lowest set bit of (i + 1) & -(i + 1)
        const auto k = static_cast<size_t>(std::countr_zero(counter_)) % numSources_;

        const double fresh = rng.nextDouble() * sourceScale_;
        accumulator_ += fresh - sources_[k];
        sources_[k] = fresh;

        return accumulator_;
    }

    /// Amplitude bound of a single source, 1/N
    [[nodiscard]] double sourceAmplitude() const noexcept { return sourceScale_; }

    /// Number of active sources
    [[nodiscard]] size_t numSources() const noexcept { return numSources_; }

private:
    std::array<double, kMaxPinkNoiseSources> sources_{};
    double accumulator_ = 0.0;
    double sourceScale_ = 1.0 / static_cast<double>(kDefaultPinkNoiseSources);
    uint64_t counter_ = 0;
    size_t numSources_ = kDefaultPinkNoiseSources;
};

} // namespace DSP
} // namespace Earshot
