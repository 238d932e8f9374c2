// ==============================================================================
// Layer 0: Core Utilities
// audio_buffer.h - Offline Mono Sample Buffers
// ==============================================================================
// Buffers are produced whole by the noise synthesizer and filter engine and
// handed to playback; every processing step returns a new buffer.
// Layer 0: NO dependencies on higher layers.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Earshot {
namespace DSP {

/// Mono sample buffer, nominal amplitude range [-1, 1].
using AudioBuffer = std::vector<float>;

// =============================================================================
// Constants
// =============================================================================

/// Peak below which a buffer is treated as unplayable silence.
inline constexpr float kSilenceFloor = 1e-6f;

/// Peak below which normalization is skipped (division would amplify noise).
inline constexpr double kNormalizationFloor = 1e-9;

// =============================================================================
// Measurements
// =============================================================================

/// Largest absolute sample value (0 for an empty buffer).
[[nodiscard]] inline float peakAbs(const AudioBuffer& buffer) noexcept {
    float peak = 0.0f;
    for (const float s : buffer) {
        peak = std::max(peak, std::abs(s));
    }
    return peak;
}

/// Arithmetic mean (0 for an empty buffer).
[[nodiscard]] inline double mean(const AudioBuffer& buffer) noexcept {
    if (buffer.empty()) return 0.0;
    double sum = 0.0;
    for (const float s : buffer) {
        sum += s;
    }
    return sum / static_cast<double>(buffer.size());
}

/// Root-mean-square level (0 for an empty buffer).
[[nodiscard]] inline double rms(const AudioBuffer& buffer) noexcept {
    if (buffer.empty()) return 0.0;
    double sumSquares = 0.0;
    for (const float s : buffer) {
        sumSquares += static_cast<double>(s) * s;
    }
    return std::sqrt(sumSquares / static_cast<double>(buffer.size()));
}

/// True when the buffer is empty or its peak is below the floor.
[[nodiscard]] inline bool isNearSilent(const AudioBuffer& buffer,
                                       float floor = kSilenceFloor) noexcept {
    return peakAbs(buffer) < floor;
}

// =============================================================================
// In-place conditioning (double working buffers)
// =============================================================================

/// Subtract the mean of the samples from every sample.
inline void removeDcOffset(std::vector<double>& samples) noexcept {
    if (samples.empty()) return;
    double sum = 0.0;
    for (const double s : samples) {
        sum += s;
    }
    const double dc = sum / static_cast<double>(samples.size());
    for (double& s : samples) {
        s -= dc;
    }
}

/// Scale samples so the peak equals targetPeak.
/// @return false, leaving the samples unchanged, when the current peak is at
///         or below kNormalizationFloor
inline bool normalizePeak(std::vector<double>& samples, double targetPeak) noexcept {
    double peak = 0.0;
    for (const double s : samples) {
        peak = std::max(peak, std::abs(s));
    }
    if (peak <= kNormalizationFloor) {
        return false;
    }
    const double scale = targetPeak / peak;
    for (double& s : samples) {
        s *= scale;
    }
    return true;
}

/// Narrow a double working buffer to output samples.
[[nodiscard]] inline AudioBuffer toAudioBuffer(const std::vector<double>& samples) {
    AudioBuffer out(samples.size());
    std::transform(samples.begin(), samples.end(), out.begin(),
                   [](double s) { return static_cast<float>(s); });
    return out;
}

} // namespace DSP
} // namespace Earshot
