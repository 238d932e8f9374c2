// ==============================================================================
// Layer 2: DSP Processor - Zero-Phase Filter
// ==============================================================================
// Forward-backward application of an SOS cascade to a finite buffer. The
// result has no phase shift and a magnitude response equal to the square of
// the single-pass response.
//
// Edge transients are suppressed the usual way: the buffer is extended at
// both ends by an odd (point-symmetric) reflection and every pass starts from
// the steady state matching its first sample.
//
// Layer 2: depends on Layer 0 (audio_buffer) and Layer 1 (biquad)
// ==============================================================================

#pragma once

#include <earshot/dsp/core/audio_buffer.h>
#include <earshot/dsp/primitives/biquad.h>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace Earshot {
namespace DSP {
namespace ZeroPhase {

/// @brief Default reflection length for a cascade.
///
/// Three times the number of filter taps, where a cascade of S sections has
/// 2S + 1 taps less one per section that is only first order in both
/// numerator and denominator.
[[nodiscard]] inline size_t padLength(const SosCoefficients& sos) noexcept {
    size_t zeroB2 = 0;
    size_t zeroA2 = 0;
    for (const auto& section : sos) {
        if (section.b2 == 0.0) ++zeroB2;
        if (section.a2 == 0.0) ++zeroA2;
    }
    const size_t taps = 2 * sos.size() + 1 - std::min(zeroB2, zeroA2);
    return 3 * taps;
}

/// @brief Odd extension of `input` by `pad` samples on each side.
/// @pre pad < input.size()
[[nodiscard]] inline std::vector<double> oddExtend(const AudioBuffer& input, size_t pad) {
    const size_t n = input.size();
    std::vector<double> ext(n + 2 * pad);

    const double first = input.front();
    const double last = input.back();
    for (size_t i = 0; i < pad; ++i) {
        ext[i] = 2.0 * first - input[pad - i];
        ext[pad + n + i] = 2.0 * last - input[n - 2 - i];
    }
    std::copy(input.begin(), input.end(), ext.begin() + static_cast<std::ptrdiff_t>(pad));
    return ext;
}

/// @brief One primed pass of the cascade over `samples`, in place.
inline void primedPass(SosCascade& cascade, std::vector<double>& samples) noexcept {
    if (samples.empty()) return;
    cascade.reset();
    cascade.primeForLevel(samples.front());
    cascade.processBlock(samples.data(), samples.size());
}

/// @brief Zero-phase (forward-backward) filtering.
///
/// @param sos Sections to apply; an empty cascade returns the input unchanged
/// @param input Buffer to filter
/// @return Filtered buffer of the same length as `input`
///
/// @note Buffers shorter than the default reflection use the longest
///       reflection they allow (size - 1) instead of failing
[[nodiscard]] inline AudioBuffer filtfilt(const SosCoefficients& sos, const AudioBuffer& input) {
    if (sos.empty() || input.empty()) {
        return input;
    }

    const size_t n = input.size();
    const size_t pad = std::min(padLength(sos), n - 1);

    std::vector<double> ext = oddExtend(input, pad);
    SosCascade cascade(sos);

    primedPass(cascade, ext);
    std::reverse(ext.begin(), ext.end());
    primedPass(cascade, ext);
    std::reverse(ext.begin(), ext.end());

    AudioBuffer out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<float>(ext[pad + i]);
    }
    return out;
}

} // namespace ZeroPhase
} // namespace DSP
} // namespace Earshot
