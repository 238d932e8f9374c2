// ==============================================================================
// Layer 2: DSP Processor - Noise Synthesizer
// ==============================================================================
// Renders calibrated pink-noise buffers: Voss-McCartney generation, DC removal
// and peak normalization to a target amplitude.
//
// Layer 2: depends on Layer 0 (audio_buffer, random) and Layer 1
// (voss_pink_noise)
// ==============================================================================

#pragma once

#include <earshot/dsp/core/audio_buffer.h>
#include <earshot/dsp/core/random.h>
#include <earshot/dsp/primitives/voss_pink_noise.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace Earshot {
namespace DSP {

/// Largest dither, as a fraction of one source's amplitude
inline constexpr float kMaxDitherFraction = 0.1f;

/// @brief Number of samples in a buffer of the given duration.
/// @return floor(durationSeconds * sampleRate), or 0 for non-positive,
///         non-finite or unrepresentable input
[[nodiscard]] inline size_t sampleCount(double durationSeconds, double sampleRate) noexcept {
    // size_t max rounds up to 2^N as a double; anything at or above it does not fit
    constexpr double kSizeLimit = static_cast<double>(std::numeric_limits<size_t>::max());

    const double samples = std::floor(durationSeconds * sampleRate);
    if (!(durationSeconds > 0.0) || !(sampleRate > 0.0) || !std::isfinite(samples) || samples < 1.0) {
        return 0;
    }
    if (samples >= kSizeLimit) {
        return 0;
    }
    return static_cast<size_t>(samples);
}

/// @brief Generate a pink-noise buffer.
///
/// Samples come from a VossPinkNoise with `numSources` sources. After
/// generation the mean is subtracted, the buffer is divided by its peak
/// (skipped when the peak is at or below kNormalizationFloor) and finally
/// scaled by `amplitude`, so max |x| == amplitude for any non-degenerate
/// buffer. A near-silent result is returned as-is; callers check it with
/// isNearSilent().
///
/// @param durationSeconds Buffer length in seconds (<= 0 yields an empty buffer)
/// @param sampleRate Sample rate in Hz
/// @param amplitude Target peak amplitude
/// @param rng Random source; the same seed gives the same buffer
/// @param numSources Number of Voss-McCartney sources
/// @param ditherFraction Optional independent uniform dither added to each
///        sample, as a fraction of one source's amplitude, clamped to
///        [0, kMaxDitherFraction]
/// @return floor(durationSeconds * sampleRate) samples
[[nodiscard]] inline AudioBuffer generatePinkNoise(
    double durationSeconds,
    double sampleRate,
    float amplitude,
    Xorshift32& rng,
    size_t numSources = kDefaultPinkNoiseSources,
    float ditherFraction = 0.0f
) {
    const size_t numSamples = sampleCount(durationSeconds, sampleRate);
    if (numSamples == 0) {
        return {};
    }

    VossPinkNoise pink(numSources);
    const double dither = static_cast<double>(std::clamp(ditherFraction, 0.0f, kMaxDitherFraction)) *
                          pink.sourceAmplitude();

    std::vector<double> work(numSamples);
    for (auto& sample : work) {
        sample = pink.process(rng);
        if (dither > 0.0) {
            sample += rng.nextDouble() * dither;
        }
    }

    removeDcOffset(work);
    normalizePeak(work, 1.0);

    const double gain = static_cast<double>(amplitude);
    for (auto& sample : work) {
        sample *= gain;
    }

    return toAudioBuffer(work);
}

} // namespace DSP
} // namespace Earshot
