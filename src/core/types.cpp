// DAOSTAKE - Core Types Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/core/types.h"
#include "daostake/core/hex.h"

#include <cctype>
#include <stdexcept>

namespace daostake {

Amount PowerOfTen(int decimals) {
    Amount result = 1;
    for (int i = 0; i < decimals; ++i) {
        result *= 10;
    }
    return result;
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
std::optional<BaseHash<BITS>> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2 || !IsValidHex(digits)) {
        return std::nullopt;
    }

    std::vector<HexByte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(const Amount& amount, int decimals) {
    if (decimals <= 0) {
        return amount.str();
    }

    Amount unit = PowerOfTen(decimals);
    std::string whole = Amount(amount / unit).str();
    std::string frac = Amount(amount % unit).str();

    if (frac == "0") {
        return whole;
    }

    // Left-pad fraction and strip trailing zeros
    frac = std::string(static_cast<size_t>(decimals) - frac.size(), '0') + frac;
    while (!frac.empty() && frac.back() == '0') {
        frac.pop_back();
    }
    return whole + "." + frac;
}

std::optional<Amount> ParseAmount(const std::string& str, int decimals) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t dot = str.find('.');
    std::string whole = str.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : str.substr(dot + 1);

    if (whole.empty() && frac.empty()) {
        return std::nullopt;
    }
    if (static_cast<int>(frac.size()) > decimals) {
        return std::nullopt;
    }
    for (char c : whole) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    for (char c : frac) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }

    frac.append(static_cast<size_t>(decimals) - frac.size(), '0');
    std::string digits = whole + frac;

    try {
        Amount result = 0;
        for (char c : digits) {
            result = result * 10 + (c - '0');
        }
        return result;
    } catch (const std::overflow_error&) {
        return std::nullopt;
    }
}

} // namespace daostake
