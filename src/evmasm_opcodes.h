#ifndef EVMASM_OPCODES_H
#define EVMASM_OPCODES_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "common_defs.h"

// Opcode Enum (one byte per instruction class)
enum Opcode : uint8_t {
    // Arithmetic
    STOP = 0x00, ADD, MUL, SUB, DIV, SDIV, MOD, SMOD, ADDMOD, MULMOD, EXP, SIGNEXTEND,
    // Comparison / Bitwise
    LT = 0x10, GT, SLT, SGT, EQ, ISZERO, AND, OR, XOR, NOT, BYTE, SHL, SHR, SAR,
    // Hashing
    KECCAK256 = 0x20,
    // Environment
    ADDRESS = 0x30, BALANCE, ORIGIN, CALLER, CALLVALUE, CALLDATALOAD, CALLDATASIZE, CALLDATACOPY,
    CODESIZE, CODECOPY, GASPRICE, EXTCODESIZE, EXTCODECOPY, RETURNDATASIZE, RETURNDATACOPY, EXTCODEHASH,
    // Block
    BLOCKHASH = 0x40, COINBASE, TIMESTAMP, NUMBER, DIFFICULTY, GASLIMIT, CHAINID, SELFBALANCE, BASEFEE,
    // Stack / Memory / Storage / Flow Control
    POP = 0x50, MLOAD, MSTORE, MSTORE8, SLOAD, SSTORE, JUMP, JUMPI, GETPC, MSIZE, GAS, JUMPDEST,
    // Families, the suffix is encoded in the byte: PUSHn = PUSH1 + n - 1, etc.
    PUSH1 = 0x60, PUSH32 = 0x7F,
    DUP1 = 0x80, DUP16 = 0x8F,
    SWAP1 = 0x90, SWAP16 = 0x9F,
    LOG0 = 0xA0, LOG4 = 0xA4,
    // System
    CREATE = 0xF0, CALL, CALLCODE, RETURN, DELEGATECALL, CREATE2,
    STATICCALL = 0xFA,
    REVERT = 0xFD, INVALID, SELFDESTRUCT
};

// One instruction class: opcode byte plus the number of immediate bytes it carries.
struct Specifier {
    Opcode opcode = STOP;
    unsigned immediateWidth = 0;

    // Total encoded size: opcode byte + immediate bytes
    unsigned size() const { return 1 + immediateWidth; }

    bool isPush() const { return immediateWidth > 0; }

    bool operator==(const Specifier& other) const {
        return opcode == other.opcode && immediateWidth == other.immediateWidth;
    }
    bool operator!=(const Specifier& other) const { return !(*this == other); }

    // pushN for N in 1..32, empty otherwise
    static std::optional<Specifier> push(unsigned width);
};

struct OpcodeInfo {
    std::string mnemonic;
    Specifier spec;
};

// Case-sensitive lookup in the opcode table.
std::optional<Specifier> specifierFromMnemonic(const std::string& mnemonic);

std::string mnemonicOf(const Specifier& spec);

// Whole table ordered by opcode byte.
const std::vector<OpcodeInfo>& opcodeTable();

#endif // EVMASM_OPCODES_H
