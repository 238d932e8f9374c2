// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis windows for spectral measurement.
// Layer 0: no DSP primitive dependencies.
// ==============================================================================

#pragma once

#include <earshot/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <vector>

namespace Earshot {
namespace DSP {
namespace Window {

/// @brief Fill buffer with Hann window (periodic/DFT-even variant)
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N)
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const double n = static_cast<double>(size);
    for (size_t i = 0; i < size; ++i) {
        output[i] = static_cast<float>(0.5 - 0.5 * std::cos(kTwoPi * static_cast<double>(i) / n));
    }
}

/// @brief Allocate and return a Hann window
[[nodiscard]] inline std::vector<float> hann(size_t size) {
    std::vector<float> window(size);
    generateHann(window.data(), size);
    return window;
}

/// @brief Sum of squared window values, used to normalize power spectra
[[nodiscard]] inline double energy(const std::vector<float>& window) noexcept {
    double sum = 0.0;
    for (const float w : window) {
        sum += static_cast<double>(w) * w;
    }
    return sum;
}

} // namespace Window
} // namespace DSP
} // namespace Earshot
