#include "Amount.h"

#include <cctype>
#include <stdexcept>

#include "GachaError.h"
#include "Utils.h"

Amount pow10(unsigned exponent) {
    Amount result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

const Amount& tokenUnit() {
    static const Amount unit = pow10(kTokenDecimals);
    return unit;
}

Amount parseUnits(const std::string& text, unsigned decimals) {
    std::string value = trim(text);
    if (value.empty()) {
        throw GachaError(GachaErrorCode::InvalidConfig, "empty amount");
    }

    std::string whole = value;
    std::string fraction;
    auto dot = value.find('.');
    if (dot != std::string::npos) {
        whole = value.substr(0, dot);
        fraction = value.substr(dot + 1);
    }
    if (fraction.size() > decimals) {
        throw GachaError(GachaErrorCode::InvalidConfig, "too many fractional digits in '" + value + "'");
    }
    fraction.append(decimals - fraction.size(), '0');
    if (whole.empty()) {
        whole = "0";
    }
    return parseBaseUnits(whole + fraction);
}

Amount parseBaseUnits(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw GachaError(GachaErrorCode::InvalidConfig, "empty amount");
    }
    Amount result = 0;
    try {
        for (char ch : value) {
            if (!std::isdigit(static_cast<unsigned char>(ch))) {
                throw GachaError(GachaErrorCode::InvalidConfig, "invalid digit in amount '" + value + "'");
            }
            result = result * 10 + static_cast<unsigned>(ch - '0');
        }
    } catch (const std::overflow_error&) {
        throw GachaError(GachaErrorCode::OutOfBound, "amount does not fit in 256 bits: " + value);
    }
    return result;
}

std::string formatUnits(const Amount& value, unsigned decimals) {
    const Amount scale = pow10(decimals);
    std::string whole = Amount(value / scale).str();
    std::string fraction = Amount(value % scale).str();
    if (decimals == 0) {
        return whole;
    }
    fraction.insert(0, decimals - fraction.size(), '0');
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    if (fraction.empty()) {
        return whole;
    }
    return whole + "." + fraction;
}

Bytes32 toBigEndian(const Word256& value) {
    Bytes32 bytes{};
    Word256 rest = value;
    for (size_t i = bytes.size(); i-- > 0;) {
        bytes[i] = static_cast<std::uint8_t>(static_cast<unsigned>(rest & 0xFF));
        rest >>= 8;
    }
    return bytes;
}

Bytes32 toBigEndian(std::uint64_t value) {
    return toBigEndian(Word256(value));
}

Word256 fromBigEndian(const Bytes32& bytes) {
    Word256 value = 0;
    for (std::uint8_t byte : bytes) {
        value <<= 8;
        value |= byte;
    }
    return value;
}

std::string toHex(const Bytes32& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t byte : bytes) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}
