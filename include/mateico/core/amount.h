// MATEICO - Amount Formatting
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Conversion between 128-bit base-unit amounts and their decimal
// token representation (18 fractional digits).

#ifndef MATEICO_CORE_AMOUNT_H
#define MATEICO_CORE_AMOUNT_H

#include "mateico/core/types.h"

#include <optional>
#include <string>

namespace mateico {

/// Render an amount as decimal tokens with trailing zeros trimmed ("10.1")
std::string FormatAmount(Amount amount);

/// Render an amount as a plain integer of base units
std::string AmountToString(Amount amount);

/// Parse a decimal token string ("10", "0.25", "1,000.5")
/// @return std::nullopt on malformed input, more than 18 fractional
///         digits, or overflow
std::optional<Amount> ParseAmount(const std::string& str);

/// Parse a plain integer of base units
std::optional<Amount> ParseBaseUnits(const std::string& str);

/// Multiply then divide with truncation: a * num / den
/// @return std::nullopt if den is zero or the product overflows
std::optional<Amount> MulDiv(Amount a, Amount num, Amount den);

} // namespace mateico

#endif // MATEICO_CORE_AMOUNT_H
