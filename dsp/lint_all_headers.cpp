// ==============================================================================
// EarshotDSP Lint Stub - Strict clang-tidy analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header, so each header is checked to be
// self-contained.
//
// This file is NOT part of the EarshotDSP library itself; it is compiled as a
// separate OBJECT library target (earshot_dsp_lint_stub) for
// compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <earshot/dsp/core/audio_buffer.h>
#include <earshot/dsp/core/db_utils.h>
#include <earshot/dsp/core/filter_design.h>
#include <earshot/dsp/core/math_constants.h>
#include <earshot/dsp/core/random.h>
#include <earshot/dsp/core/window_functions.h>

// Layer 1: Primitives
#include <earshot/dsp/primitives/biquad.h>
#include <earshot/dsp/primitives/fft.h>
#include <earshot/dsp/primitives/voss_pink_noise.h>

// Layer 2: Processors
#include <earshot/dsp/processors/filter_engine.h>
#include <earshot/dsp/processors/noise_synthesizer.h>
#include <earshot/dsp/processors/spectrum_analyzer.h>
#include <earshot/dsp/processors/zero_phase_filter.h>
