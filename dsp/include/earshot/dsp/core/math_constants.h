// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
// All DSP components should import these constants instead of defining locally.
//
// Filter design and offline filtering run in double precision, so the
// constants are double; samples are narrowed to float only at buffer output.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Earshot {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr double kTwoPi = 2.0 * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr double kHalfPi = kPi / 2.0;

/// Natural log of 2
/// Used to convert octave bandwidth to the bilinear-domain alpha term
inline constexpr double kLn2 = 0.69314718055994530942;

} // namespace DSP
} // namespace Earshot
