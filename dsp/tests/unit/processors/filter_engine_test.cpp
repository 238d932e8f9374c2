// ==============================================================================
// Layer 2: Processor Tests - Filter Engine
// ==============================================================================
// Butterworth low/high-pass, peaking EQ design and zero-phase application.
//
// Tests for: dsp/include/earshot/dsp/processors/filter_engine.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <earshot/dsp/processors/filter_engine.h>
#include <earshot/dsp/processors/noise_synthesizer.h>

#include "test_helpers/test_signals.h"

#include <cmath>
#include <limits>
#include <variant>

using namespace Earshot::DSP;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 44100.0;

// Analytic magnitude of a bilinear Butterworth lowpass
double butterworthLowpassMagnitude(double f, double fc, int order) {
    const double ratio = std::tan(kPi * f / kSampleRate) / std::tan(kPi * fc / kSampleRate);
    return 1.0 / std::sqrt(1.0 + std::pow(ratio, 2.0 * order));
}

} // namespace

// ==============================================================================
// Butterworth design
// ==============================================================================

TEST_CASE("designButterworth section count follows the order", "[filter_engine][butterworth]") {
    REQUIRE(designButterworth(1, 0.2, PassbandKind::Low).size() == 1);
    REQUIRE(designButterworth(2, 0.2, PassbandKind::Low).size() == 1);
    REQUIRE(designButterworth(4, 0.2, PassbandKind::High).size() == 2);
    REQUIRE(designButterworth(5, 0.2, PassbandKind::Low).size() == 3);
    REQUIRE(designButterworth(0, 0.2, PassbandKind::Low).size() == 1);
    REQUIRE(designButterworth(100, 0.2, PassbandKind::Low).size() == 8);
}

TEST_CASE("designButterworth orders sections by rising Q", "[filter_engine][butterworth]") {
    const auto sos = designButterworth(5, 0.2, PassbandKind::Low);

    // First-order section leads
    REQUIRE(sos[0].b2 == 0.0);
    REQUIRE(sos[0].a2 == 0.0);
    // Higher Q means poles nearer the unit circle, i.e. larger a2
    REQUIRE(sos[1].a2 < sos[2].a2);
}

TEST_CASE("designButterworth is stable across the cutoff and order range",
          "[filter_engine][butterworth][stability]") {
    for (int order = 1; order <= FilterDesign::kMaxButterworthOrder; ++order) {
        for (double wn : {0.0, 0.001, 0.01, 0.5, 0.99, 0.999, 1.0}) {
            for (auto kind : {PassbandKind::Low, PassbandKind::High}) {
                for (const auto& section : designButterworth(order, wn, kind)) {
                    REQUIRE(section.isFinite());
                    REQUIRE(section.isStable());
                }
            }
        }
    }
}

TEST_CASE("Butterworth magnitude response", "[filter_engine][butterworth][response]") {

    SECTION("lowpass is -3 dB at the cutoff and unity at DC") {
        const auto sos = designButterworth(5, FilterDesign::normalizedCutoff(5000.0, kSampleRate),
                                           PassbandKind::Low);
        REQUIRE(magnitudeResponse(sos, 5000.0, kSampleRate) == Approx(0.70710678).margin(1e-6));
        REQUIRE(magnitudeResponse(sos, 0.0, kSampleRate) == Approx(1.0).margin(1e-9));
    }

    SECTION("lowpass matches the analytic rolloff") {
        const auto sos = designButterworth(5, FilterDesign::normalizedCutoff(5000.0, kSampleRate),
                                           PassbandKind::Low);
        for (double f : {1000.0, 4000.0, 8000.0, 10000.0, 15000.0}) {
            REQUIRE(magnitudeResponse(sos, f, kSampleRate) ==
                    Approx(butterworthLowpassMagnitude(f, 5000.0, 5)).epsilon(1e-6));
        }
    }

    SECTION("highpass is -3 dB at the cutoff and unity at Nyquist") {
        const auto sos = designButterworth(5, FilterDesign::normalizedCutoff(150.0, kSampleRate),
                                           PassbandKind::High);
        REQUIRE(magnitudeResponse(sos, 150.0, kSampleRate) == Approx(0.70710678).margin(1e-6));
        REQUIRE(magnitudeResponse(sos, 22050.0, kSampleRate) == Approx(1.0).margin(1e-9));
        REQUIRE(magnitudeResponse(sos, 50.0, kSampleRate) < 0.01);
    }
}

// ==============================================================================
// Passband application
// ==============================================================================

TEST_CASE("applyPassband keeps the buffer length at boundary cutoffs", "[filter_engine][passband][edge]") {
    Xorshift32 rng(5);
    const AudioBuffer noise = generatePinkNoise(0.1, kSampleRate, 0.4f, rng);

    for (double cutoff : {-100.0, 0.0, 1e-3, 22050.0, 30000.0}) {
        for (auto kind : {PassbandKind::Low, PassbandKind::High}) {
            const AudioBuffer out = applyPassband(noise, cutoff, kSampleRate, 5, kind);
            REQUIRE(out.size() == noise.size());
            for (const float s : out) {
                REQUIRE(std::isfinite(s));
            }
        }
    }
}

TEST_CASE("applyPassband lowpass attenuates above the cutoff", "[filter_engine][passband]") {
    const AudioBuffer low = TestHelpers::makeSine(44100, 1000.0, kSampleRate, 0.4f);
    const AudioBuffer high = TestHelpers::makeSine(44100, 12000.0, kSampleRate, 0.4f);

    const double passGain = TestHelpers::centralRmsGain(
        low, applyPassband(low, 5000.0, kSampleRate, 5, PassbandKind::Low));
    const double stopGain = TestHelpers::centralRmsGain(
        high, applyPassband(high, 5000.0, kSampleRate, 5, PassbandKind::Low));

    REQUIRE(passGain == Approx(1.0).margin(0.01));
    REQUIRE(stopGain < 0.01);
}

TEST_CASE("applyPassband highpass attenuates below the cutoff", "[filter_engine][passband]") {
    const AudioBuffer low = TestHelpers::makeSine(44100, 50.0, kSampleRate, 0.4f);
    const AudioBuffer high = TestHelpers::makeSine(44100, 2000.0, kSampleRate, 0.4f);

    const double stopGain = TestHelpers::centralRmsGain(
        low, applyPassband(low, 150.0, kSampleRate, 5, PassbandKind::High));
    const double passGain = TestHelpers::centralRmsGain(
        high, applyPassband(high, 150.0, kSampleRate, 5, PassbandKind::High));

    REQUIRE(stopGain < 0.01);
    REQUIRE(passGain == Approx(1.0).margin(0.01));
}

// ==============================================================================
// Peaking EQ design
// ==============================================================================

TEST_CASE("designPeakFilter hits the requested gain at the center", "[filter_engine][peak]") {
    for (double gainDb : {-60.0, -9.0, -3.0, 3.0, 9.0, 24.0}) {
        const auto sos = designPeakFilter(1500.0, gainDb, 1.6, kSampleRate);
        REQUIRE(sos.size() == 1);
        REQUIRE(sos[0].isStable());
        REQUIRE(magnitudeResponse(sos, 1500.0, kSampleRate) ==
                Approx(dbToGain(gainDb)).epsilon(1e-6));
    }
}

TEST_CASE("designPeakFilter cut and boost are reciprocal", "[filter_engine][peak]") {
    const auto cut = designPeakFilter(1500.0, -9.0, 1.6, kSampleRate);
    const auto boost = designPeakFilter(1500.0, 9.0, 1.6, kSampleRate);

    for (double f : {100.0, 1000.0, 1500.0, 5000.0, 15000.0}) {
        const double product = magnitudeResponse(cut, f, kSampleRate) *
                               magnitudeResponse(boost, f, kSampleRate);
        REQUIRE(product == Approx(1.0).margin(1e-9));
    }
}

TEST_CASE("designPeakFilter at 0 dB is an identity response", "[filter_engine][peak]") {
    const auto sos = designPeakFilter(1500.0, 0.0, 1.6, kSampleRate);
    REQUIRE(sos.size() == 1);
    REQUIRE(sos[0].b0 == Approx(sos[0].a0));
    REQUIRE(sos[0].b1 == Approx(sos[0].a1));
    REQUIRE(sos[0].b2 == Approx(sos[0].a2));

    const AudioBuffer input = TestHelpers::makeSine(4096, 700.0, kSampleRate, 0.4f);
    const AudioBuffer out = applySos(input, sos);
    for (size_t i = 0; i < input.size(); ++i) {
        REQUIRE(out[i] == Approx(input[i]).margin(1e-5));
    }
}

TEST_CASE("designPeakFilter survives degenerate parameters", "[filter_engine][peak][edge]") {

    SECTION("center at or above Nyquist is clamped") {
        for (double center : {22050.0, 30000.0}) {
            const auto sos = designPeakFilter(center, 9.0, 1.6, kSampleRate);
            REQUIRE(sos.size() == 1);
            REQUIRE(sos[0].isFinite());
            REQUIRE(sos[0].isStable());
        }
    }

    SECTION("center at or below DC is clamped") {
        const auto sos = designPeakFilter(0.0, -9.0, 1.6, kSampleRate);
        REQUIRE(sos[0].isFinite());
        REQUIRE(sos[0].isStable());
    }

    SECTION("zero bandwidth is clamped") {
        const auto sos = designPeakFilter(1500.0, -9.0, 0.0, kSampleRate);
        REQUIRE(sos[0].isFinite());
        REQUIRE(sos[0].isStable());
    }

    SECTION("-60 dB cut applies without failure") {
        Xorshift32 rng(8);
        const AudioBuffer noise = generatePinkNoise(0.25, kSampleRate, 0.4f, rng);
        const AudioBuffer out = applySos(noise, designPeakFilter(1500.0, -60.0, 1.6, kSampleRate));
        REQUIRE(out.size() == noise.size());
        for (const float s : out) {
            REQUIRE(std::isfinite(s));
        }
    }

    SECTION("invalid sample rate or NaN gain falls back to identity") {
        REQUIRE(designPeakFilter(1500.0, 9.0, 1.6, 0.0)[0].isIdentity());
        REQUIRE(designPeakFilter(1500.0, std::numeric_limits<double>::quiet_NaN(), 1.6,
                                 kSampleRate)[0].isIdentity());
    }
}

TEST_CASE("designPeakFilter near Nyquist behaves as a high shelf", "[filter_engine][peak][edge]") {
    const double clampedCenter = 0.5 * kSampleRate - 1.0;

    SECTION("boost is near unity low and exact at the clamped center") {
        const auto sos = designPeakFilter(22050.0, 9.0, 1.6, kSampleRate);
        const double low = magnitudeResponse(sos, 1000.0, kSampleRate);
        const double mid = magnitudeResponse(sos, 10000.0, kSampleRate);
        const double top = magnitudeResponse(sos, clampedCenter, kSampleRate);

        REQUIRE(low == Approx(1.0).margin(0.01));
        REQUIRE(top == Approx(dbToGain(9.0)).epsilon(1e-6));
        REQUIRE(low < mid);
        REQUIRE(mid < top);
    }

    SECTION("centers past Nyquist clamp to the same design") {
        const auto atNyquist = designPeakFilter(22050.0, 9.0, 1.6, kSampleRate);
        const auto beyond = designPeakFilter(30000.0, 9.0, 1.6, kSampleRate);
        for (double f : {100.0, 1000.0, 10000.0, clampedCenter}) {
            REQUIRE(magnitudeResponse(beyond, f, kSampleRate) ==
                    Approx(magnitudeResponse(atNyquist, f, kSampleRate)).epsilon(1e-12));
        }
    }

    SECTION("cut mirrors the boost") {
        const auto sos = designPeakFilter(30000.0, -9.0, 1.6, kSampleRate);
        REQUIRE(magnitudeResponse(sos, 1000.0, kSampleRate) == Approx(1.0).margin(0.01));
        REQUIRE(magnitudeResponse(sos, clampedCenter, kSampleRate) ==
                Approx(dbToGain(-9.0)).epsilon(1e-6));
    }
}

TEST_CASE("applySos with no sections is a no-op", "[filter_engine][edge]") {
    const AudioBuffer input = TestHelpers::makeSine(100, 440.0, kSampleRate);
    REQUIRE(applySos(input, {}) == input);
}

TEST_CASE("Peak filters shape a sine at the center frequency", "[filter_engine][peak]") {
    const AudioBuffer input = TestHelpers::makeSine(44100, 1500.0, kSampleRate, 0.05f);

    SECTION("notch: -9 dB applied twice") {
        const AudioBuffer out = applySos(input, designPeakFilter(1500.0, -9.0, 1.6, kSampleRate));
        REQUIRE(TestHelpers::centralRmsGain(input, out) == Approx(dbToGain(-18.0)).epsilon(0.01));
    }

    SECTION("bandpass: +9 dB applied twice") {
        const AudioBuffer out = applySos(input, designPeakFilter(1500.0, 9.0, 1.6, kSampleRate));
        REQUIRE(TestHelpers::centralRmsGain(input, out) == Approx(dbToGain(18.0)).epsilon(0.01));
    }
}

// ==============================================================================
// FilterSpec dispatch
// ==============================================================================

TEST_CASE("designFilter dispatches on the FilterSpec alternative", "[filter_engine][dispatch]") {

    SECTION("lowpass spec") {
        const auto sos = designFilter(LowpassSpec{5000.0, 5}, kSampleRate);
        REQUIRE(sos.size() == 3);
        REQUIRE(magnitudeResponse(sos, 5000.0, kSampleRate) == Approx(0.70710678).margin(1e-6));
    }

    SECTION("highpass spec") {
        const auto sos = designFilter(HighpassSpec{150.0, 4}, kSampleRate);
        REQUIRE(sos.size() == 2);
        REQUIRE(magnitudeResponse(sos, 150.0, kSampleRate) == Approx(0.70710678).margin(1e-6));
    }

    SECTION("notch always cuts, whatever the gain sign") {
        for (double gainDb : {-9.0, 9.0}) {
            const auto sos = designFilter(NotchSpec{1500.0, gainDb, 1.6}, kSampleRate);
            REQUIRE(magnitudeResponse(sos, 1500.0, kSampleRate) == Approx(dbToGain(-9.0)).epsilon(1e-6));
        }
    }

    SECTION("bandpass always boosts, whatever the gain sign") {
        for (double gainDb : {-9.0, 9.0}) {
            const auto sos = designFilter(BandpassSpec{1500.0, gainDb, 1.6}, kSampleRate);
            REQUIRE(magnitudeResponse(sos, 1500.0, kSampleRate) == Approx(dbToGain(9.0)).epsilon(1e-6));
        }
    }
}

TEST_CASE("applyFilter processes a three-second pink noise clip", "[filter_engine][integration]") {
    Xorshift32 rng(1);
    const AudioBuffer noise = generatePinkNoise(3.0, kSampleRate, 0.4f, rng);
    REQUIRE(noise.size() == 132300);

    const FilterSpec specs[] = {
        LowpassSpec{5000.0, 5},
        HighpassSpec{150.0, 5},
        NotchSpec{1500.0, -9.0, 1.6},
        BandpassSpec{8000.0, 9.0, 1.6},
    };

    for (const auto& spec : specs) {
        const AudioBuffer out = applyFilter(noise, spec, kSampleRate);
        REQUIRE(out.size() == noise.size());
        REQUIRE_FALSE(isNearSilent(out));
    }
}
