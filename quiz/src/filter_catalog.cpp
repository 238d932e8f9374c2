#include "filter_catalog.h"

namespace Earshot::Quiz {

std::string_view filterKindName(FilterKind kind) {
    switch (kind) {
        case FilterKind::Lowpass:  return "Lowpass";
        case FilterKind::Highpass: return "Highpass";
        case FilterKind::Notch:    return "Notch";
        case FilterKind::Bandpass: return "Bandpass";
    }
    return "Unknown";
}

bool hasCenterFrequency(FilterKind kind) {
    return kind == FilterKind::Notch || kind == FilterKind::Bandpass;
}

std::string filterKindList() {
    std::string list;
    for (const auto kind : kAllFilterKinds) {
        if (!list.empty()) list += ", ";
        list += filterKindName(kind);
    }
    return list;
}

std::optional<std::string_view> bandLabel(int frequencyHz) {
    for (const auto& band : kFrequencyBands) {
        if (band.frequencyHz == frequencyHz) {
            return band.label;
        }
    }
    return std::nullopt;
}

std::string formatBand(int frequencyHz) {
    std::string text = std::to_string(frequencyHz) + " Hz";
    if (const auto label = bandLabel(frequencyHz)) {
        text += " (";
        text += *label;
        text += ")";
    }
    return text;
}

std::string bandList() {
    std::string list;
    for (const auto& band : kFrequencyBands) {
        if (!list.empty()) list += ", ";
        list += formatBand(band.frequencyHz);
    }
    return list;
}

} // namespace Earshot::Quiz
