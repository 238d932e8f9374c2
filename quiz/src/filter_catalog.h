#pragma once

// ==============================================================================
// Filter Catalog
// ==============================================================================
// Filter kinds offered by the quiz and the labeled center frequencies used by
// the Notch and Bandpass questions. Labels live here only; the DSP layer sees
// plain frequencies.
// ==============================================================================

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Earshot::Quiz {

enum class FilterKind : uint8_t {
    Lowpass,
    Highpass,
    Notch,
    Bandpass
};

inline constexpr std::array<FilterKind, 4> kAllFilterKinds = {
    FilterKind::Lowpass, FilterKind::Highpass, FilterKind::Notch, FilterKind::Bandpass
};

struct FrequencyBand {
    int frequencyHz;
    std::string_view label;
};

/// Sorted by frequency
inline constexpr std::array<FrequencyBand, 6> kFrequencyBands = {{
    {500, "Low"},
    {600, "Low-Mid"},
    {1500, "Mid"},
    {5000, "High-Mid"},
    {8000, "High"},
    {10000, "Very High"},
}};

/// "Lowpass", "Highpass", "Notch" or "Bandpass"
std::string_view filterKindName(FilterKind kind);

/// True for the kinds that carry a center frequency (Notch, Bandpass)
bool hasCenterFrequency(FilterKind kind);

/// "Lowpass, Highpass, Notch, Bandpass"
std::string filterKindList();

/// Label of a catalog frequency, or nullopt when the frequency is not listed
std::optional<std::string_view> bandLabel(int frequencyHz);

/// "1500 Hz (Mid)"; unlisted frequencies print without a label
std::string formatBand(int frequencyHz);

/// "500 Hz (Low), 600 Hz (Low-Mid), ..."
std::string bandList();

} // namespace Earshot::Quiz
