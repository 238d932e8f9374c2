#pragma once

// ==============================================================================
// Quiz Trial
// ==============================================================================
// One question: the filter that was chosen, its catalog label, the details
// text shown on request, and the rendered reference/filtered noise pair.
// ==============================================================================

#include "filter_catalog.h"
#include "quiz_config.h"

#include <earshot/dsp/core/audio_buffer.h>
#include <earshot/dsp/core/random.h>
#include <earshot/dsp/processors/filter_engine.h>

#include <string>

namespace Earshot::Quiz {

struct Trial {
    FilterKind kind = FilterKind::Lowpass;
    int frequencyHz = 0;       // cutoff for Lowpass/Highpass, center for Notch/Bandpass
    std::string label;         // band label, or the kind name for Lowpass/Highpass
    std::string details;       // e.g. "Center: 1500 Hz (Mid), BW: 1.6 Oct, Gain: -9.0 dB"
    DSP::FilterSpec spec;
};

struct RenderedTrial {
    DSP::AudioBuffer reference;
    DSP::AudioBuffer filtered;
    bool usedReferenceFallback = false;  // filtered output was near-silent
};

/// Build the trial for a given kind. Notch/Bandpass pick a random catalog
/// frequency from `rng`; Lowpass/Highpass use the configured cutoffs.
Trial makeTrial(FilterKind kind, const QuizConfig& config, DSP::Xorshift32& rng);

/// Pick a kind uniformly at random and build its trial.
Trial drawTrial(const QuizConfig& config, DSP::Xorshift32& rng);

/// Generate the reference noise and filter it. A near-silent filtered buffer
/// is replaced by a copy of the reference so the trial stays playable.
RenderedTrial renderTrial(const Trial& trial, const QuizConfig& config, DSP::Xorshift32& rng);

} // namespace Earshot::Quiz
