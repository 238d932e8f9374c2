#pragma once

// ==============================================================================
// WAV Writer
// ==============================================================================
// Hands rendered buffers to an external player as mono 16-bit PCM RIFF/WAVE
// files.
// ==============================================================================

#include <earshot/dsp/core/audio_buffer.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace Earshot::Quiz {

/// Bytes in the RIFF header written before the sample data
inline constexpr size_t kWavHeaderSize = 44;

/// Encode a buffer as a complete WAV file image. Samples are clamped to
/// [-1, 1] and scaled to 16-bit.
std::vector<uint8_t> encodeWav(const DSP::AudioBuffer& buffer, uint32_t sampleRate);

/// Write a buffer as a WAV file.
/// @return false (and prints the path to std::cerr) if the file cannot be written
bool writeWavFile(const std::filesystem::path& path,
                  const DSP::AudioBuffer& buffer,
                  uint32_t sampleRate);

} // namespace Earshot::Quiz
