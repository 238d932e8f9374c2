#pragma once

// ==============================================================================
// Answer Parsing
// ==============================================================================
// Turns a line typed by the listener into a guess. Every parser returns
// nullopt for input it does not accept so the caller can prompt again.
// ==============================================================================

#include "filter_catalog.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace Earshot::Quiz {

/// Filter type guess. Case-insensitive, surrounding whitespace ignored.
/// Accepts full names and the abbreviations lp/low, hp/high, n, bp/band.
std::optional<FilterKind> parseFilterKind(std::string_view input);

/// "y" / "n" (case-insensitive)
std::optional<bool> parseYesNo(std::string_view input);

/// Integer frequency that is one of the catalog frequencies.
std::optional<int> parseFrequencyGuess(std::string_view input);

/// Random seed in 0..UINT32_MAX. Out-of-range values are rejected, not wrapped.
std::optional<uint32_t> parseSeed(std::string_view input);

} // namespace Earshot::Quiz
