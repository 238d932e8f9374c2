// ==============================================================================
// Layer 0: Core Utilities
// filter_design.h - Filter Design Utilities
// ==============================================================================
// Parameter clamping, Butterworth stage Q values, bilinear prewarping and the
// octave-bandwidth alpha term used by the peaking EQ design. The fallback
// constants that keep designs stable live here and nowhere else.
//
// Layer 0: depends only on math_constants.h, db_utils.h
// Formulas: Robert Bristow-Johnson's Audio EQ Cookbook
// ==============================================================================

#pragma once

#include <earshot/dsp/core/db_utils.h>
#include <earshot/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Earshot {
namespace DSP {

/// @brief Filter design utility functions.
///
/// Provides the calculations shared by the Butterworth and peaking designs:
/// - Cutoff normalization and clamping against Nyquist
/// - Butterworth stage Q values for odd and even orders
/// - Frequency prewarping for the bilinear transform
/// - Peaking EQ amplitude and alpha from gain and octave bandwidth
namespace FilterDesign {

// =============================================================================
// Design Constants
// =============================================================================

/// Lowest normalized cutoff (fraction of Nyquist) a passband design accepts
inline constexpr double kMinNormalizedCutoff = 0.001;

/// Highest normalized cutoff (fraction of Nyquist) a passband design accepts
inline constexpr double kMaxNormalizedCutoff = 0.999;

/// Default Butterworth order for lowpass/highpass designs
inline constexpr int kDefaultButterworthOrder = 5;

/// Largest Butterworth order designed; higher requests are clamped
inline constexpr int kMaxButterworthOrder = 16;

/// Lowest peaking center frequency in Hz
inline constexpr double kMinCenterHz = 1.0;

/// Distance in Hz kept between the peaking center frequency and Nyquist
inline constexpr double kNyquistGuardHz = 1.0;

/// Narrowest peaking bandwidth in octaves
inline constexpr double kMinBandwidthOctaves = 0.01;

/// |sin(w0)| below this selects the Q-based alpha approximation
inline constexpr double kSinEpsilon = 1e-9;

/// Smallest peaking alpha (also the substitute for a vanishing alpha)
inline constexpr double kMinAlpha = 1e-6;

/// Largest peaking alpha
inline constexpr double kMaxAlpha = 0.99;

/// |a0| below this makes the peaking design return the identity section
inline constexpr double kA0Epsilon = 1e-9;

// =============================================================================
// Passband (Butterworth) helpers
// =============================================================================

/// @brief Normalize a cutoff to Nyquist and clamp it into
///        [kMinNormalizedCutoff, kMaxNormalizedCutoff].
///
/// @param cutoffHz Cutoff frequency in Hz
/// @param sampleRate Sample rate in Hz
/// @return cutoff / (sampleRate / 2), clamped
///
/// @note A NaN cutoff or an invalid sample rate maps to kMaxNormalizedCutoff
[[nodiscard]] inline double normalizedCutoff(double cutoffHz, double sampleRate) noexcept {
    if (!(sampleRate > 0.0)) {
        return kMaxNormalizedCutoff;
    }
    const double wn = cutoffHz / (0.5 * sampleRate);
    if (std::isnan(wn)) {
        return kMaxNormalizedCutoff;
    }
    return std::clamp(wn, kMinNormalizedCutoff, kMaxNormalizedCutoff);
}

/// @brief Clamp a requested Butterworth order into [1, kMaxButterworthOrder].
[[nodiscard]] constexpr int clampOrder(int order) noexcept {
    return std::clamp(order, 1, kMaxButterworthOrder);
}

/// @brief Q of the k-th second-order stage of an N-th order Butterworth filter.
///
/// Butterworth poles sit evenly on the unit circle of the s-plane. Each
/// conjugate pair forms one biquad stage with
///
/// @formula Q_k = 1 / (2 * sin(pi * (2k + 1) / (2N)))
///
/// For odd N the remaining real pole is a first-order stage and has no Q.
///
/// @param stage 0-indexed biquad stage, 0 <= stage < N / 2
/// @param order Filter order N
/// @return Q value; stage 0 has the highest Q
///
/// @example
/// ```cpp
/// FilterDesign::butterworthQ(0, 5);  // 1.618
/// FilterDesign::butterworthQ(1, 5);  // 0.618
/// FilterDesign::butterworthQ(0, 2);  // 0.7071
/// ```
[[nodiscard]] inline double butterworthQ(size_t stage, size_t order) noexcept {
    if (order == 0) {
        return 1.0 / std::sqrt(2.0);
    }
    const double angle = kPi * (2.0 * static_cast<double>(stage) + 1.0) /
                         (2.0 * static_cast<double>(order));
    return 1.0 / (2.0 * std::sin(angle));
}

/// @brief Bilinear prewarp term K = tan(pi * Wn / 2) for a cutoff normalized
///        to Nyquist.
///
/// Section designs built from K place the digital -3 dB point exactly at Wn.
[[nodiscard]] inline double prewarp(double normalizedCutoffValue) noexcept {
    return std::tan(kHalfPi * normalizedCutoffValue);
}

// =============================================================================
// Peaking EQ helpers
// =============================================================================

/// @brief Clamp a peaking center frequency into [1, sampleRate/2 - 1].
[[nodiscard]] inline double clampCenterFrequency(double centerHz, double sampleRate) noexcept {
    const double upper = std::max(kMinCenterHz, 0.5 * sampleRate - kNyquistGuardHz);
    if (std::isnan(centerHz)) {
        return upper;
    }
    return std::clamp(centerHz, kMinCenterHz, upper);
}

/// @brief Clamp a bandwidth to at least kMinBandwidthOctaves.
[[nodiscard]] inline double clampBandwidth(double bandwidthOctaves) noexcept {
    if (std::isnan(bandwidthOctaves)) {
        return kMinBandwidthOctaves;
    }
    return std::max(kMinBandwidthOctaves, bandwidthOctaves);
}

/// @brief Peaking EQ amplitude A = 10^(gainDb / 40).
///
/// A is the square root of the linear gain at the center frequency, so the
/// response there is A^2 = 10^(gainDb / 20).
[[nodiscard]] inline double peakingAmplitude(double gainDb) noexcept {
    return dbToGain(0.5 * gainDb);
}

/// @brief Q equivalent of an octave bandwidth, ignoring bilinear warping.
///
/// @formula Q = 1 / (2 * sinh(ln(2) / 2 * BW))
[[nodiscard]] inline double bandwidthToQ(double bandwidthOctaves) noexcept {
    return 1.0 / (2.0 * std::sinh(0.5 * kLn2 * bandwidthOctaves));
}

/// @brief Alpha term of the peaking EQ for an octave bandwidth.
///
/// @formula alpha = sin(w0) * sinh(ln(2) / 2 * BW * w0 / sin(w0))
///
/// When sin(w0) vanishes (center at DC or Nyquist) the warped formula is
/// undefined; alpha = sin(w0) / (2Q) is used instead, with kMinAlpha
/// substituted for a vanishing result. The final value is always clamped to
/// [kMinAlpha, kMaxAlpha]; an overflowing sinh clamps to kMaxAlpha.
///
/// @param w0 Center frequency in radians per sample
/// @param bandwidthOctaves Bandwidth in octaves (already clamped)
[[nodiscard]] inline double peakingAlpha(double w0, double bandwidthOctaves) noexcept {
    const double sinW0 = std::sin(w0);

    double alpha = 0.0;
    if (std::abs(sinW0) < kSinEpsilon) {
        const double q = bandwidthToQ(bandwidthOctaves);
        alpha = sinW0 / (2.0 * q);
        if (std::abs(alpha) < kSinEpsilon) {
            alpha = kMinAlpha;
        }
    } else {
        alpha = sinW0 * std::sinh(0.5 * kLn2 * bandwidthOctaves * w0 / sinW0);
    }

    if (std::isnan(alpha)) {
        return kMaxAlpha;
    }
    return std::clamp(alpha, kMinAlpha, kMaxAlpha);
}

} // namespace FilterDesign

} // namespace DSP
} // namespace Earshot
