// ==============================================================================
// Layer 1: DSP Primitive - Biquad Sections
// ==============================================================================
// Second-order-section (SOS) coefficients, a Transposed Direct Form II biquad
// and a cascade of biquads. Higher-order filters are always represented as a
// cascade of sections, never as one long transfer function.
//
// Layer 1: depends only on Layer 0 / standard library
// TDF2 topology for floating-point stability
// Formulas: Robert Bristow-Johnson's Audio EQ Cookbook
// ==============================================================================

#pragma once

#include <earshot/dsp/core/filter_design.h>
#include <earshot/dsp/core/math_constants.h>

#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Earshot {
namespace DSP {

// =============================================================================
// Forward Declarations
// =============================================================================

struct SosSection;
class Biquad;
class SosCascade;

// =============================================================================
// Constants
// =============================================================================

/// State magnitude below which filter memory is flushed to zero
inline constexpr double kDenormalThreshold = 1e-30;

// =============================================================================
// SOS Coefficients
// =============================================================================

/// @brief One second-order section: b0, b1, b2, a0 = 1, a1, a2.
///
/// First-order sections store b2 = a2 = 0.
struct SosSection {
    double b0 = 1.0;  ///< Feedforward coefficient 0
    double b1 = 0.0;  ///< Feedforward coefficient 1
    double b2 = 0.0;  ///< Feedforward coefficient 2
    double a0 = 1.0;  ///< Feedback coefficient 0 (always 1 once normalized)
    double a1 = 0.0;  ///< Feedback coefficient 1
    double a2 = 0.0;  ///< Feedback coefficient 2

    /// Passthrough section (b = [1, 0, 0], a = [1, 0, 0])
    [[nodiscard]] static constexpr SosSection identity() noexcept {
        return SosSection{};
    }

    /// Build a section from raw coefficients, dividing everything by a0.
    /// @note The caller must have checked that a0 is not near zero
    [[nodiscard]] static constexpr SosSection normalized(
        double b0, double b1, double b2,
        double a0, double a1, double a2) noexcept {
        const double invA0 = 1.0 / a0;
        return SosSection{b0 * invA0, b1 * invA0, b2 * invA0, 1.0, a1 * invA0, a2 * invA0};
    }

    /// Coefficients in (b0, b1, b2, a0, a1, a2) order
    [[nodiscard]] constexpr std::array<double, 6> toArray() const noexcept {
        return {b0, b1, b2, a0, a1, a2};
    }

    /// True when all six coefficients are finite
    [[nodiscard]] bool isFinite() const noexcept {
        return std::isfinite(b0) && std::isfinite(b1) && std::isfinite(b2) &&
               std::isfinite(a0) && std::isfinite(a1) && std::isfinite(a2);
    }

    /// Check if coefficients represent a stable filter
    /// @return true if both poles lie strictly inside the unit circle
    [[nodiscard]] bool isStable() const noexcept {
        // Jury stability criterion for a normalized second-order denominator:
        // |a2| < 1 and |a1| < 1 + a2
        return std::abs(a2) < 1.0 && std::abs(a1) < 1.0 + a2;
    }

    /// Check if this is effectively bypass (unity gain, no filtering)
    [[nodiscard]] bool isIdentity(double epsilon = 1e-12) const noexcept {
        return std::abs(b0 - 1.0) < epsilon &&
               std::abs(b1) < epsilon &&
               std::abs(b2) < epsilon &&
               std::abs(a0 - 1.0) < epsilon &&
               std::abs(a1) < epsilon &&
               std::abs(a2) < epsilon;
    }

    /// Gain at 0 Hz, (b0 + b1 + b2) / (1 + a1 + a2)
    /// @return 0 when the denominator vanishes (pole at DC)
    [[nodiscard]] double dcGain() const noexcept {
        const double den = a0 + a1 + a2;
        if (std::abs(den) < FilterDesign::kA0Epsilon) {
            return 0.0;
        }
        return (b0 + b1 + b2) / den;
    }

    /// Complex response H(e^{j*omega})
    /// @param omega Angular frequency in radians per sample
    [[nodiscard]] std::complex<double> response(double omega) const noexcept {
        const std::complex<double> z1 = std::polar(1.0, -omega);
        const std::complex<double> z2 = z1 * z1;
        return (b0 + b1 * z1 + b2 * z2) / (a0 + a1 * z1 + a2 * z2);
    }
};

/// Ordered cascade of sections; applied first to last.
using SosCoefficients = std::vector<SosSection>;

// =============================================================================
// Section Designs (bilinear transform, prewarped)
// =============================================================================

namespace SectionDesign {

/// @brief Second-order lowpass H(s) = 1 / (s^2 + s/Q + 1) at prewarp term K.
[[nodiscard]] inline SosSection lowpass(double k, double q) noexcept {
    const double k2 = k * k;
    const double norm = 1.0 / (1.0 + k / q + k2);
    const double b0 = k2 * norm;
    return SosSection{b0, 2.0 * b0, b0, 1.0, 2.0 * (k2 - 1.0) * norm, (1.0 - k / q + k2) * norm};
}

/// @brief Second-order highpass H(s) = s^2 / (s^2 + s/Q + 1) at prewarp term K.
[[nodiscard]] inline SosSection highpass(double k, double q) noexcept {
    const double k2 = k * k;
    const double norm = 1.0 / (1.0 + k / q + k2);
    return SosSection{norm, -2.0 * norm, norm, 1.0, 2.0 * (k2 - 1.0) * norm, (1.0 - k / q + k2) * norm};
}

/// @brief First-order lowpass H(s) = 1 / (s + 1) at prewarp term K.
[[nodiscard]] inline SosSection firstOrderLowpass(double k) noexcept {
    const double norm = 1.0 / (1.0 + k);
    return SosSection{k * norm, k * norm, 0.0, 1.0, (k - 1.0) * norm, 0.0};
}

/// @brief First-order highpass H(s) = s / (s + 1) at prewarp term K.
[[nodiscard]] inline SosSection firstOrderHighpass(double k) noexcept {
    const double norm = 1.0 / (1.0 + k);
    return SosSection{norm, -norm, 0.0, 1.0, (k - 1.0) * norm, 0.0};
}

} // namespace SectionDesign

// =============================================================================
// Frequency Response
// =============================================================================

/// @brief Magnitude of a cascade's single-pass response at a frequency.
///
/// Forward-backward application squares this value.
///
/// @param sos Sections (an empty cascade has unity response)
/// @param frequencyHz Frequency in Hz
/// @param sampleRate Sample rate in Hz
[[nodiscard]] inline double magnitudeResponse(const SosCoefficients& sos,
                                              double frequencyHz,
                                              double sampleRate) noexcept {
    if (!(sampleRate > 0.0)) {
        return 1.0;
    }
    const double omega = kTwoPi * frequencyHz / sampleRate;
    std::complex<double> h{1.0, 0.0};
    for (const auto& section : sos) {
        h *= section.response(omega);
    }
    return std::abs(h);
}

// =============================================================================
// Biquad Filter Class
// =============================================================================

/// @brief Transposed Direct Form II biquad filter.
///
/// Processes audio using the TDF2 difference equations:
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    /// Construct with initial coefficients
    explicit Biquad(const SosSection& coeffs) noexcept
        : coeffs_(coeffs) {}

    /// Set coefficients directly
    void setCoefficients(const SosSection& coeffs) noexcept {
        coeffs_ = coeffs;
    }

    /// Get current coefficients
    [[nodiscard]] const SosSection& coefficients() const noexcept {
        return coeffs_;
    }

    /// Process single sample using TDF2
    [[nodiscard]] double process(double input) noexcept {
        // Invalid input (NaN/Inf) clears the state instead of poisoning it
        if (!std::isfinite(input)) {
            reset();
            return 0.0;
        }

        const double output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;

        if (std::abs(z1_) < kDenormalThreshold) z1_ = 0.0;
        if (std::abs(z2_) < kDenormalThreshold) z2_ = 0.0;

        return output;
    }

    /// Clear filter state
    void reset() noexcept {
        z1_ = 0.0;
        z2_ = 0.0;
    }

    /// @brief Load the state the filter settles into for a constant input.
    ///
    /// Starting from this state, a constant input of `level` produces a
    /// constant output with no start-up transient.
    ///
    /// @param level Constant input level
    /// @return Steady-state output level (level * DC gain)
    double primeForLevel(double level) noexcept {
        const double gain = coeffs_.dcGain();
        const double out = gain * level;
        z2_ = coeffs_.b2 * level - coeffs_.a2 * out;
        z1_ = out - coeffs_.b0 * level;
        return out;
    }

    /// Get first state variable (for debugging/analysis)
    [[nodiscard]] double getZ1() const noexcept { return z1_; }

    /// Get second state variable (for debugging/analysis)
    [[nodiscard]] double getZ2() const noexcept { return z2_; }

private:
    SosSection coeffs_;
    double z1_ = 0.0;
    double z2_ = 0.0;
};

// =============================================================================
// SOS Cascade
// =============================================================================

/// @brief Runtime-sized cascade of biquad sections.
///
/// Unlike a fixed-stage cascade, the number of sections follows the designed
/// filter (an order-5 Butterworth has three sections).
class SosCascade {
public:
    SosCascade() = default;

    explicit SosCascade(const SosCoefficients& sos) {
        setSections(sos);
    }

    /// Replace all sections; state is cleared
    void setSections(const SosCoefficients& sos) {
        stages_.clear();
        stages_.reserve(sos.size());
        for (const auto& section : sos) {
            stages_.emplace_back(section);
        }
    }

    /// Process single sample through all sections
    [[nodiscard]] double process(double input) noexcept {
        double x = input;
        for (auto& stage : stages_) {
            x = stage.process(x);
        }
        return x;
    }

    /// Process buffer in-place through all sections
    void processBlock(double* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Clear all sections
    void reset() noexcept {
        for (auto& stage : stages_) {
            stage.reset();
        }
    }

    /// Prime every section for a constant input, propagating each section's
    /// steady-state output to the next.
    void primeForLevel(double level) noexcept {
        double x = level;
        for (auto& stage : stages_) {
            x = stage.primeForLevel(x);
        }
    }

    /// Number of sections
    [[nodiscard]] size_t numStages() const noexcept { return stages_.size(); }

    /// Access individual section
    [[nodiscard]] const Biquad& stage(size_t index) const noexcept {
        return stages_[index];
    }

private:
    std::vector<Biquad> stages_;
};

} // namespace DSP
} // namespace Earshot
