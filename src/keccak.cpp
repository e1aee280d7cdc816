#include <nettle/sha3.h>

// Include own header FIRST
#include "keccak.h"

// Rate of the 256-bit variant: 1600 - 2 * 256 bits
static constexpr std::size_t KECCAK256_RATE = 136;

// Lanes are little-endian 64-bit words
static void xorIntoState(sha3_state& state, std::size_t offset, uint8_t byte) {
    state.a[offset / 8] ^= static_cast<uint64_t>(byte) << (8 * (offset % 8));
}

Hash256 keccak256(const uint8_t* data, std::size_t length) {
    sha3_state state{};

    // Absorb full blocks
    while (length >= KECCAK256_RATE) {
        for (std::size_t i = 0; i < KECCAK256_RATE; ++i) {
            xorIntoState(state, i, data[i]);
        }
        sha3_permute(&state);
        data += KECCAK256_RATE;
        length -= KECCAK256_RATE;
    }

    // Last partial block plus multi-rate padding
    for (std::size_t i = 0; i < length; ++i) {
        xorIntoState(state, i, data[i]);
    }
    xorIntoState(state, length, 0x01);
    xorIntoState(state, KECCAK256_RATE - 1, 0x80);
    sha3_permute(&state);

    Hash256 digest{};
    for (std::size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(state.a[i / 8] >> (8 * (i % 8)));
    }
    return digest;
}

Hash256 keccak256(const std::string& text) {
    return keccak256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}
