#include "trial.h"

#include <earshot/dsp/processors/noise_synthesizer.h>

#include <cmath>
#include <iomanip>
#include <sstream>

namespace Earshot::Quiz {

namespace {

std::string passbandDetails(int cutoffHz, int order) {
    std::ostringstream text;
    text << "Cutoff: " << cutoffHz << " Hz (Butterworth Order " << order << ")";
    return text.str();
}

std::string peakDetails(int centerHz, double bandwidthOctaves, double gainDb) {
    std::ostringstream text;
    text << "Center: " << formatBand(centerHz)
         << ", BW: " << std::fixed << std::setprecision(1) << bandwidthOctaves << " Oct"
         << ", Gain: " << std::showpos << gainDb << std::noshowpos << " dB";
    return text.str();
}

} // namespace

Trial makeTrial(FilterKind kind, const QuizConfig& config, DSP::Xorshift32& rng) {
    Trial trial;
    trial.kind = kind;

    switch (kind) {
        case FilterKind::Lowpass:
        case FilterKind::Highpass: {
            const double cutoff = (kind == FilterKind::Lowpass) ? config.lowpassCutoffHz
                                                                : config.highpassCutoffHz;
            trial.frequencyHz = static_cast<int>(std::lround(cutoff));
            trial.label = std::string(filterKindName(kind));
            trial.details = passbandDetails(trial.frequencyHz, config.butterworthOrder);
            if (kind == FilterKind::Lowpass) {
                trial.spec = DSP::LowpassSpec{cutoff, config.butterworthOrder};
            } else {
                trial.spec = DSP::HighpassSpec{cutoff, config.butterworthOrder};
            }
            break;
        }
        case FilterKind::Notch:
        case FilterKind::Bandpass: {
            const auto& band = kFrequencyBands[rng.nextIndex(kFrequencyBands.size())];
            const double magnitude = std::abs(config.peakGainDb);
            const double gainDb = (kind == FilterKind::Notch) ? -magnitude : magnitude;
            const auto centerHz = static_cast<double>(band.frequencyHz);

            trial.frequencyHz = band.frequencyHz;
            trial.label = std::string(band.label);
            trial.details = peakDetails(band.frequencyHz, config.peakBandwidthOctaves, gainDb);
            if (kind == FilterKind::Notch) {
                trial.spec = DSP::NotchSpec{centerHz, gainDb, config.peakBandwidthOctaves};
            } else {
                trial.spec = DSP::BandpassSpec{centerHz, gainDb, config.peakBandwidthOctaves};
            }
            break;
        }
    }

    return trial;
}

Trial drawTrial(const QuizConfig& config, DSP::Xorshift32& rng) {
    const FilterKind kind = kAllFilterKinds[rng.nextIndex(kAllFilterKinds.size())];
    return makeTrial(kind, config, rng);
}

RenderedTrial renderTrial(const Trial& trial, const QuizConfig& config, DSP::Xorshift32& rng) {
    RenderedTrial rendered;
    rendered.reference = DSP::generatePinkNoise(config.durationSeconds, config.sampleRate,
                                                config.noiseAmplitude, rng);
    rendered.filtered = DSP::applyFilter(rendered.reference, trial.spec, config.sampleRate);

    if (DSP::isNearSilent(rendered.filtered)) {
        rendered.filtered = rendered.reference;
        rendered.usedReferenceFallback = true;
    }
    return rendered;
}

} // namespace Earshot::Quiz
