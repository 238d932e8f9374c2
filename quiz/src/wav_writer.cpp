#include "wav_writer.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

namespace Earshot::Quiz {

namespace {

constexpr uint16_t kPcmFormat = 1;
constexpr uint16_t kNumChannels = 1;
constexpr uint16_t kBitsPerSample = 16;
constexpr uint16_t kBytesPerSample = kBitsPerSample / 8;

// Explicit little-endian byte order regardless of host
class LittleEndianWriter {
public:
    explicit LittleEndianWriter(std::vector<uint8_t>& out) : out_(out) {}

    void tag(const char (&fourcc)[5]) {
        out_.insert(out_.end(), fourcc, fourcc + 4);
    }

    void u16(uint16_t value) {
        out_.push_back(static_cast<uint8_t>(value & 0xFF));
        out_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }

    void u32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            out_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

private:
    std::vector<uint8_t>& out_;
};

int16_t toPcm16(float sample) {
    const float clamped = std::isfinite(sample) ? std::clamp(sample, -1.0f, 1.0f) : 0.0f;
    return static_cast<int16_t>(std::lround(clamped * 32767.0f));
}

} // namespace

std::vector<uint8_t> encodeWav(const DSP::AudioBuffer& buffer, uint32_t sampleRate) {
    const auto dataSize = static_cast<uint32_t>(buffer.size() * kBytesPerSample * kNumChannels);

    std::vector<uint8_t> bytes;
    bytes.reserve(kWavHeaderSize + dataSize);
    LittleEndianWriter w(bytes);

    // Layout:
    // [0-11]  "RIFF" <size> "WAVE"
    // [12-35] "fmt " chunk (16 bytes of PCM format)
    // [36-43] "data" <size>
    // [44...] samples
    w.tag("RIFF");
    w.u32(static_cast<uint32_t>(kWavHeaderSize - 8) + dataSize);
    w.tag("WAVE");

    w.tag("fmt ");
    w.u32(16);
    w.u16(kPcmFormat);
    w.u16(kNumChannels);
    w.u32(sampleRate);
    w.u32(sampleRate * kNumChannels * kBytesPerSample);
    w.u16(static_cast<uint16_t>(kNumChannels * kBytesPerSample));
    w.u16(kBitsPerSample);

    w.tag("data");
    w.u32(dataSize);
    for (const float sample : buffer) {
        w.u16(static_cast<uint16_t>(toPcm16(sample)));
    }

    return bytes;
}

bool writeWavFile(const std::filesystem::path& path,
                  const DSP::AudioBuffer& buffer,
                  uint32_t sampleRate) {
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "Failed to create: " << path << std::endl;
        return false;
    }

    const auto bytes = encodeWav(buffer, sampleRate);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        std::cerr << "Failed to write: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace Earshot::Quiz
