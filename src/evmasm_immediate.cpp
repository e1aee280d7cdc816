#include <cctype>
#include <algorithm>

// Include own header FIRST
#include "evmasm_immediate.h"
#include "evmasm_errors.h"
#include "keccak.h"
#include "common_defs.h"

using uint128 = unsigned __int128;

static int digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string radixPrefix(unsigned radix) {
    switch (radix) {
        case 2: return "0b";
        case 8: return "0o";
        case 16: return "0x";
        default: return "";
    }
}

std::vector<uint8_t> radixToBytes(const std::string& digits, unsigned radix) {
    const std::string literal = radixPrefix(radix) + digits;
    if (digits.empty()) {
        throw ParseError::lexer(SourceLocation{}, "empty numeric literal '" + literal + "'");
    }

    const uint128 max = ~static_cast<uint128>(0);
    uint128 value = 0;
    for (char c : digits) {
        int d = digitValue(c);
        if (d < 0 || static_cast<unsigned>(d) >= radix) {
            throw ParseError::lexer(SourceLocation{}, "invalid digit '" + std::string(1, c) + "' in '" + literal + "'");
        }
        if (value > (max - static_cast<unsigned>(d)) / radix) {
            // Past 128 bits, whatever the declared width
            throw ParseError::immediateTooLarge(literal, EVMASM_NUMERIC_LITERAL_BYTES);
        }
        value = value * radix + static_cast<unsigned>(d);
    }

    std::vector<uint8_t> bytes(EVMASM_NUMERIC_LITERAL_BYTES);
    for (int i = EVMASM_NUMERIC_LITERAL_BYTES - 1; i >= 0; --i) {
        bytes[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }

    // Zero still takes one byte
    auto firstSignificant = std::find_if(bytes.begin(), bytes.end() - 1, [](uint8_t b) { return b != 0; });
    bytes.erase(bytes.begin(), firstSignificant);
    return bytes;
}

std::vector<uint8_t> hexToBytes(const std::string& digits) {
    if (digits.empty() || digits.size() % 2 != 0) {
        throw ParseError::lexer(SourceLocation{}, "hex literal '0x" + digits + "' needs an even number of digits");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        int hi = digitValue(digits[i]);
        int lo = digitValue(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw ParseError::lexer(SourceLocation{}, "invalid hex literal '0x" + digits + "'");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::vector<uint8_t> selectorBytes(const std::string& signature, std::size_t width) {
    Hash256 hash = keccak256(signature);
    std::size_t count = std::min(width, hash.size());
    return std::vector<uint8_t>(hash.begin(), hash.begin() + count);
}

std::vector<uint8_t> normalizeImmediate(std::vector<uint8_t> raw, std::size_t width, const std::string& literal) {
    if (raw.size() > width) {
        throw ParseError::immediateTooLarge(literal, width);
    }
    raw.insert(raw.begin(), width - raw.size(), 0);
    return raw;
}
