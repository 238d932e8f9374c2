// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
// Layer 0: NO dependencies on higher layers.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Earshot {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Xorshift32 provides a good balance of speed and quality for noise
/// generation. It has a period of 2^32-1 and passes most statistical tests.
/// A generator seeded with the same value always yields the same sequence,
/// which is what makes generated noise buffers reproducible.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5
///
/// @note NOT cryptographically secure - for audio/DSP use only
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     double noise = rng.nextDouble();  // Returns [-1.0, 1.0]
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next float in bipolar range.
    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(nextDouble());
    }

    /// Generate next double in bipolar range.
    /// @return Random double in range [-1.0, 1.0]
    [[nodiscard]] constexpr double nextDouble() noexcept {
        return static_cast<double>(next()) * kToUnit * 2.0 - 1.0;
    }

    /// Generate next double in unipolar range.
    /// @return Random double in range [0.0, 1.0]
    [[nodiscard]] constexpr double nextUnipolar() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

    /// Generate a uniform value in [low, high].
    [[nodiscard]] constexpr double uniform(double low, double high) noexcept {
        return low + (high - low) * nextUnipolar();
    }

    /// Pick an index in [0, count). Returns 0 when count is 0.
    [[nodiscard]] constexpr size_t nextIndex(size_t count) noexcept {
        if (count == 0) return 0;
        return static_cast<size_t>(next() % static_cast<uint32_t>(count));
    }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    /// Get current state (for debugging).
    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr double kToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
};

} // namespace DSP
} // namespace Earshot
