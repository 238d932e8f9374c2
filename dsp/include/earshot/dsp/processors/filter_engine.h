// ==============================================================================
// Layer 2: DSP Processor - Filter Engine
// ==============================================================================
// Designs the quiz filters and applies them to buffers with zero-phase
// filtering:
// - Butterworth lowpass/highpass of any order as a cascade of sections
// - Peaking EQ (boost or notch) as one cookbook biquad section
//
// No parameter value is an error. Frequencies are clamped into range and
// numerically degenerate designs fall back to the identity section, in which
// case the "filtered" buffer equals the input.
//
// Layer 2: depends on Layer 0 (filter_design, audio_buffer), Layer 1 (biquad)
// and Layer 2 (zero_phase_filter)
// Formulas: Robert Bristow-Johnson's Audio EQ Cookbook
// ==============================================================================

#pragma once

#include <earshot/dsp/core/audio_buffer.h>
#include <earshot/dsp/core/filter_design.h>
#include <earshot/dsp/core/math_constants.h>
#include <earshot/dsp/primitives/biquad.h>
#include <earshot/dsp/processors/zero_phase_filter.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace Earshot {
namespace DSP {

// =============================================================================
// Filter Parameter Sets
// =============================================================================

/// @brief Which side of the cutoff a Butterworth design passes.
enum class PassbandKind : uint8_t {
    Low,   ///< Passes below the cutoff
    High   ///< Passes above the cutoff
};

/// @brief Butterworth lowpass.
struct LowpassSpec {
    double cutoffHz = 5000.0;
    int order = FilterDesign::kDefaultButterworthOrder;
};

/// @brief Butterworth highpass.
struct HighpassSpec {
    double cutoffHz = 150.0;
    int order = FilterDesign::kDefaultButterworthOrder;
};

/// @brief Peaking cut at a center frequency. Always applied as a dip: the
///        sign of gainDb is ignored.
struct NotchSpec {
    double centerHz = 1000.0;
    double gainDb = -9.0;
    double bandwidthOctaves = 1.6;
};

/// @brief Peaking boost at a center frequency. Always applied as a boost:
///        the sign of gainDb is ignored.
struct BandpassSpec {
    double centerHz = 1000.0;
    double gainDb = 9.0;
    double bandwidthOctaves = 1.6;
};

/// Filter chosen for one quiz trial
using FilterSpec = std::variant<LowpassSpec, HighpassSpec, NotchSpec, BandpassSpec>;

// =============================================================================
// Butterworth Design
// =============================================================================

/// @brief Design a digital Butterworth filter as cascaded sections.
///
/// Each conjugate pole pair of the analog prototype becomes one biquad
/// (bilinear transform, prewarped to the cutoff); odd orders add one
/// first-order section for the real pole. Sections are ordered from the
/// first-order section through increasing Q.
///
/// @param order Filter order, clamped to [1, kMaxButterworthOrder]
/// @param normalizedCutoff Cutoff as a fraction of Nyquist, clamped to
///        [kMinNormalizedCutoff, kMaxNormalizedCutoff]
/// @param kind Lowpass or highpass
/// @return ceil(order / 2) sections
[[nodiscard]] inline SosCoefficients designButterworth(
    int order,
    double normalizedCutoff,
    PassbandKind kind
) {
    const auto n = static_cast<size_t>(FilterDesign::clampOrder(order));
    const double wn = std::isnan(normalizedCutoff)
        ? FilterDesign::kMaxNormalizedCutoff
        : std::clamp(normalizedCutoff, FilterDesign::kMinNormalizedCutoff,
                     FilterDesign::kMaxNormalizedCutoff);
    const double k = FilterDesign::prewarp(wn);

    SosCoefficients sos;
    sos.reserve((n + 1) / 2);

    if (n % 2 == 1) {
        sos.push_back(kind == PassbandKind::Low
            ? SectionDesign::firstOrderLowpass(k)
            : SectionDesign::firstOrderHighpass(k));
    }

    // Pole pairs nearest the unit circle (highest Q) go last
    for (size_t stage = n / 2; stage-- > 0;) {
        const double q = FilterDesign::butterworthQ(stage, n);
        sos.push_back(kind == PassbandKind::Low
            ? SectionDesign::lowpass(k, q)
            : SectionDesign::highpass(k, q));
    }

    return sos;
}

/// @brief Apply a zero-phase Butterworth lowpass or highpass.
///
/// @param buffer Input buffer
/// @param cutoffHz Cutoff in Hz; normalized to Nyquist and clamped into
///        [0.001, 0.999]
/// @param sampleRate Sample rate in Hz
/// @param order Butterworth order (default 5)
/// @param kind Lowpass or highpass
/// @return Buffer of the same length; the effective magnitude response is
///         the square of the designed one
[[nodiscard]] inline AudioBuffer applyPassband(
    const AudioBuffer& buffer,
    double cutoffHz,
    double sampleRate,
    int order,
    PassbandKind kind
) {
    const double wn = FilterDesign::normalizedCutoff(cutoffHz, sampleRate);
    return ZeroPhase::filtfilt(designButterworth(order, wn, kind), buffer);
}

// =============================================================================
// Peaking EQ Design
// =============================================================================

/// @brief Design a peaking (boost) or notching (cut) EQ section.
///
/// Positive gainDb boosts and negative gainDb cuts the band around centerHz;
/// the bandwidth and shape are otherwise identical, and the response at the
/// center is exactly 10^(gainDb / 20).
///
/// @param centerHz Center frequency, clamped into [1, sampleRate/2 - 1]
/// @param gainDb Gain at the center frequency in dB
/// @param bandwidthOctaves Bandwidth in octaves, at least 0.01
/// @param sampleRate Sample rate in Hz
/// @return One normalized section, or the identity section when the design
///         degenerates (|a0| ~ 0, non-finite or unstable coefficients,
///         invalid sample rate)
[[nodiscard]] inline SosCoefficients designPeakFilter(
    double centerHz,
    double gainDb,
    double bandwidthOctaves,
    double sampleRate
) {
    const SosCoefficients identity{SosSection::identity()};
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        return identity;
    }

    const double f0 = FilterDesign::clampCenterFrequency(centerHz, sampleRate);
    const double bw = FilterDesign::clampBandwidth(bandwidthOctaves);

    const double A = FilterDesign::peakingAmplitude(gainDb);
    const double w0 = kTwoPi * f0 / sampleRate;
    const double cosW0 = std::cos(w0);
    const double alpha = FilterDesign::peakingAlpha(w0, bw);

    const double b0 = 1.0 + alpha * A;
    const double b1 = -2.0 * cosW0;
    const double b2 = 1.0 - alpha * A;
    const double a0 = 1.0 + alpha / A;
    const double a1 = -2.0 * cosW0;
    const double a2 = 1.0 - alpha / A;

    if (!(std::abs(a0) >= FilterDesign::kA0Epsilon)) {
        return identity;
    }

    const SosSection section = SosSection::normalized(b0, b1, b2, a0, a1, a2);
    if (!section.isFinite() || !section.isStable()) {
        return identity;
    }

    return SosCoefficients{section};
}

/// @brief Apply sections with zero-phase filtering.
/// @return The input unchanged when `sos` is empty
[[nodiscard]] inline AudioBuffer applySos(const AudioBuffer& buffer, const SosCoefficients& sos) {
    return ZeroPhase::filtfilt(sos, buffer);
}

// =============================================================================
// Spec Dispatch
// =============================================================================

/// @brief Design the sections for a FilterSpec.
///
/// Notch always cuts and Bandpass always boosts by |gainDb|, so the two
/// labels share one design with opposite gain signs.
[[nodiscard]] inline SosCoefficients designFilter(const FilterSpec& spec, double sampleRate) {
    return std::visit([sampleRate](const auto& s) -> SosCoefficients {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, LowpassSpec>) {
            return designButterworth(s.order, FilterDesign::normalizedCutoff(s.cutoffHz, sampleRate),
                                     PassbandKind::Low);
        } else if constexpr (std::is_same_v<T, HighpassSpec>) {
            return designButterworth(s.order, FilterDesign::normalizedCutoff(s.cutoffHz, sampleRate),
                                     PassbandKind::High);
        } else if constexpr (std::is_same_v<T, NotchSpec>) {
            return designPeakFilter(s.centerHz, -std::abs(s.gainDb), s.bandwidthOctaves, sampleRate);
        } else {
            return designPeakFilter(s.centerHz, std::abs(s.gainDb), s.bandwidthOctaves, sampleRate);
        }
    }, spec);
}

/// @brief Design and apply a FilterSpec with zero-phase filtering.
[[nodiscard]] inline AudioBuffer applyFilter(const AudioBuffer& buffer,
                                             const FilterSpec& spec,
                                             double sampleRate) {
    return applySos(buffer, designFilter(spec, sampleRate));
}

} // namespace DSP
} // namespace Earshot
