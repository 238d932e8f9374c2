#pragma once

// ==============================================================================
// Quiz Configuration
// ==============================================================================
// Session settings for the filter-recognition quiz. Member defaults are the
// standard test setup; the command-line tool overrides a few of them.
// ==============================================================================

#include <earshot/dsp/core/filter_design.h>

#include <cstdint>

namespace Earshot::Quiz {

struct QuizConfig {
    double sampleRate = 44100.0;            // Hz
    double durationSeconds = 3.0;           // length of each clip
    float noiseAmplitude = 0.4f;            // peak of the reference noise
    double pauseBetweenQuestionsSeconds = 1.5;
    int numQuestions = 10;

    double lowpassCutoffHz = 5000.0;
    double highpassCutoffHz = 150.0;
    int butterworthOrder = DSP::FilterDesign::kDefaultButterworthOrder;

    double peakBandwidthOctaves = 1.6;
    double peakGainDb = 9.0;                // magnitude; Notch cuts, Bandpass boosts

    uint32_t seed = 1;                      // 0 is replaced by the generator's default
};

} // namespace Earshot::Quiz
