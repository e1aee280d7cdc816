#ifndef EVMASM_IMMEDIATE_H
#define EVMASM_IMMEDIATE_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Raw bytes of a literal. These never pad; normalizeImmediate() does.
// Malformed digits throw ParseError (Lexer), oversized values ImmediateTooLarge.

// Minimal big-endian encoding (at least one byte) of a binary, octal or
// decimal digit string. Values that need more than 128 bits are too large.
std::vector<uint8_t> radixToBytes(const std::string& digits, unsigned radix);

// Digits without the 0x prefix; two digits per byte.
std::vector<uint8_t> hexToBytes(const std::string& digits);

// First `width` bytes of Keccak-256(signature).
std::vector<uint8_t> selectorBytes(const std::string& signature, std::size_t width);

// Left-pads `raw` with zeros to exactly `width` bytes. `literal` is only used
// in the error when raw is longer than width.
std::vector<uint8_t> normalizeImmediate(std::vector<uint8_t> raw, std::size_t width, const std::string& literal);

#endif // EVMASM_IMMEDIATE_H
