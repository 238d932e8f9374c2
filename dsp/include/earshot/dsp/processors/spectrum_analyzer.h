// ==============================================================================
// Layer 2: DSP Processor - Spectrum Analyzer
// ==============================================================================
// Welch-averaged power spectrum (Hann window, 50% overlap) and band energy
// measurements, used to verify what a filter did to a noise buffer.
//
// Layer 2: depends on Layer 0 (audio_buffer, db_utils, window_functions) and
// Layer 1 (fft)
// ==============================================================================

#pragma once

#include <earshot/dsp/core/audio_buffer.h>
#include <earshot/dsp/core/db_utils.h>
#include <earshot/dsp/core/window_functions.h>
#include <earshot/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Earshot {
namespace DSP {

/// Default analysis frame length
inline constexpr size_t kDefaultAnalysisFftSize = 4096;

/// @brief Averaged power spectrum and band level measurements.
///
/// @par Usage
/// @code
/// SpectrumAnalyzer analyzer;
/// analyzer.prepare(4096, 44100.0);
/// const double dipDb = analyzer.bandLevelDifferenceDb(reference, filtered,
///                                                      1300.0, 1700.0);
/// @endcode
class SpectrumAnalyzer {
public:
    /// @brief Allocate the FFT and window.
    /// @return false if fftSize is not a supported power of two
    bool prepare(size_t fftSize, double sampleRate) {
        sampleRate_ = sampleRate;
        if (!fft_.prepare(fftSize)) {
            window_.clear();
            return false;
        }
        window_ = Window::hann(fftSize);
        windowEnergy_ = Window::energy(window_);
        frame_.assign(fftSize, 0.0f);
        bins_.assign(fft_.numBins(), {});
        return true;
    }

    [[nodiscard]] bool isPrepared() const noexcept { return fft_.isPrepared(); }

    /// Frequency of an FFT bin in Hz
    [[nodiscard]] double binFrequency(size_t bin) const noexcept {
        if (!isPrepared()) return 0.0;
        return static_cast<double>(bin) * sampleRate_ / static_cast<double>(fft_.size());
    }

    /// @brief Welch power spectrum of a buffer.
    ///
    /// Frames hop by half the FFT size; each frame's power is normalized by
    /// the window energy and the frames are averaged.
    ///
    /// @return numBins() values, or an empty vector when unprepared or the
    ///         buffer is shorter than one frame
    [[nodiscard]] std::vector<double> powerSpectrum(const AudioBuffer& buffer) {
        if (!isPrepared() || buffer.size() < fft_.size()) {
            return {};
        }

        const size_t n = fft_.size();
        const size_t hop = n / 2;
        std::vector<double> power(fft_.numBins(), 0.0);
        size_t frames = 0;

        for (size_t start = 0; start + n <= buffer.size(); start += hop) {
            for (size_t i = 0; i < n; ++i) {
                frame_[i] = buffer[start + i] * window_[i];
            }
            fft_.forward(frame_.data(), bins_.data());
            for (size_t k = 0; k < power.size(); ++k) {
                power[k] += static_cast<double>(std::norm(bins_[k]));
            }
            ++frames;
        }

        const double scale = 1.0 / (static_cast<double>(frames) * windowEnergy_);
        for (auto& p : power) {
            p *= scale;
        }
        return power;
    }

    /// @brief Summed power of the bins whose frequency lies in [lowHz, highHz].
    [[nodiscard]] double bandPower(const std::vector<double>& spectrum,
                                   double lowHz, double highHz) const noexcept {
        double sum = 0.0;
        for (size_t k = 0; k < spectrum.size(); ++k) {
            const double f = binFrequency(k);
            if (f >= lowHz && f <= highHz) {
                sum += spectrum[k];
            }
        }
        return sum;
    }

    /// @brief Level change in dB of `processed` relative to `reference`
    ///        within [lowHz, highHz]. Negative values mean attenuation.
    [[nodiscard]] double bandLevelDifferenceDb(const AudioBuffer& reference,
                                               const AudioBuffer& processed,
                                               double lowHz, double highHz) {
        const double ref = bandPower(powerSpectrum(reference), lowHz, highHz);
        const double proc = bandPower(powerSpectrum(processed), lowHz, highHz);
        return powerToDb(proc) - powerToDb(ref);
    }

private:
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> frame_;
    std::vector<std::complex<float>> bins_;
    double windowEnergy_ = 1.0;
    double sampleRate_ = 44100.0;
};

} // namespace DSP
} // namespace Earshot
