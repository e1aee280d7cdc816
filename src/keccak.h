#ifndef EVMASM_KECCAK_H
#define EVMASM_KECCAK_H

#include <array>
#include <string>
#include <cstdint>
#include <cstddef>
#include "common_defs.h"

using Hash256 = std::array<uint8_t, EVMASM_HASH_SIZE>;

// Original Keccak-256 (padding byte 0x01), not FIPS-202 SHA3-256.
Hash256 keccak256(const uint8_t* data, std::size_t length);
Hash256 keccak256(const std::string& text);

#endif // EVMASM_KECCAK_H
