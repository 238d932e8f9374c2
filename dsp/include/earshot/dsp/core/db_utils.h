// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion Functions
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
// Layer 0: NO dependencies on higher layers.
// ==============================================================================

#pragma once

#include <cmath>

namespace Earshot {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels.
/// Represents approximately 24-bit dynamic range (6.02 dB/bit * 24 = ~144 dB).
/// Used as the return value when gain is zero, negative, or NaN.
inline constexpr double kSilenceFloorDb = -144.0;

// ==============================================================================
// Conversions
// ==============================================================================

/// Convert decibels to linear amplitude gain.
/// @param dB Gain in decibels
/// @return 10^(dB/20)
[[nodiscard]] inline double dbToGain(double dB) noexcept {
    return std::pow(10.0, dB / 20.0);
}

/// Convert linear amplitude gain to decibels.
/// @param gain Linear gain
/// @return 20*log10(gain), or kSilenceFloorDb for gain <= 0 or NaN
[[nodiscard]] inline double gainToDb(double gain) noexcept {
    if (!(gain > 0.0)) {
        return kSilenceFloorDb;
    }
    const double dB = 20.0 * std::log10(gain);
    return dB < kSilenceFloorDb ? kSilenceFloorDb : dB;
}

/// Convert a power ratio to decibels.
/// @return 10*log10(power), or kSilenceFloorDb for power <= 0 or NaN
[[nodiscard]] inline double powerToDb(double power) noexcept {
    if (!(power > 0.0)) {
        return kSilenceFloorDb;
    }
    const double dB = 10.0 * std::log10(power);
    return dB < kSilenceFloorDb ? kSilenceFloorDb : dB;
}

} // namespace DSP
} // namespace Earshot
