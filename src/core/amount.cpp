// MATEICO - Amount Formatting Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/core/amount.h"

#include <algorithm>

namespace mateico {

std::string AmountToString(Amount amount) {
    if (amount == 0) {
        return "0";
    }
    std::string digits;
    while (amount > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(amount % 10)));
        amount /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string FormatAmount(Amount amount) {
    std::string result = AmountToString(amount / COIN);
    Amount frac = amount % COIN;
    if (frac == 0) {
        return result;
    }

    std::string fracDigits = AmountToString(frac);
    fracDigits.insert(0, COIN_DECIMALS - fracDigits.size(), '0');
    fracDigits.erase(fracDigits.find_last_not_of('0') + 1);

    return result + "." + fracDigits;
}

std::optional<Amount> ParseBaseUnits(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    Amount value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        Amount digit = static_cast<Amount>(c - '0');
        if (value > (MAX_AMOUNT - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::optional<Amount> ParseAmount(const std::string& str) {
    std::string s = str;

    // Remove commas
    s.erase(std::remove(s.begin(), s.end(), ','), s.end());

    size_t dotPos = s.find('.');
    std::string wholePart = (dotPos != std::string::npos) ? s.substr(0, dotPos) : s;
    std::string fracPart = (dotPos != std::string::npos) ? s.substr(dotPos + 1) : "";

    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    if (fracPart.size() > static_cast<size_t>(COIN_DECIMALS)) {
        return std::nullopt;
    }
    fracPart.append(COIN_DECIMALS - fracPart.size(), '0');

    auto whole = wholePart.empty() ? std::optional<Amount>(0) : ParseBaseUnits(wholePart);
    auto frac = ParseBaseUnits(fracPart);
    if (!whole || !frac) {
        return std::nullopt;
    }
    if (*whole > (MAX_AMOUNT - *frac) / COIN) {
        return std::nullopt;
    }
    return *whole * COIN + *frac;
}

std::optional<Amount> MulDiv(Amount a, Amount num, Amount den) {
    if (den == 0) {
        return std::nullopt;
    }
    if (a != 0 && num > MAX_AMOUNT / a) {
        return std::nullopt;
    }
    return a * num / den;
}

} // namespace mateico
