#include "answer_parsing.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace Earshot::Quiz {

namespace {

std::string_view trim(std::string_view text) {
    const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

struct KindAlias {
    std::string_view text;
    FilterKind kind;
};

constexpr KindAlias kKindAliases[] = {
    {"lp", FilterKind::Lowpass},   {"low", FilterKind::Lowpass},   {"lowpass", FilterKind::Lowpass},
    {"hp", FilterKind::Highpass},  {"high", FilterKind::Highpass}, {"highpass", FilterKind::Highpass},
    {"n", FilterKind::Notch},      {"notch", FilterKind::Notch},
    {"bp", FilterKind::Bandpass},  {"band", FilterKind::Bandpass}, {"bandpass", FilterKind::Bandpass},
};

} // namespace

std::optional<FilterKind> parseFilterKind(std::string_view input) {
    const std::string guess = toLower(trim(input));
    for (const auto& alias : kKindAliases) {
        if (guess == alias.text) {
            return alias.kind;
        }
    }
    return std::nullopt;
}

std::optional<bool> parseYesNo(std::string_view input) {
    const std::string answer = toLower(trim(input));
    if (answer == "y") return true;
    if (answer == "n") return false;
    return std::nullopt;
}

std::optional<int> parseFrequencyGuess(std::string_view input) {
    const std::string_view text = trim(input);
    int value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    if (!bandLabel(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint32_t> parseSeed(std::string_view input) {
    const std::string_view text = trim(input);
    uint32_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace Earshot::Quiz
