#include <unordered_map>
#include <algorithm>
#include <stdexcept>

// Include own header FIRST
#include "evmasm_opcodes.h"

static std::vector<OpcodeInfo> buildOpcodeTable() {
    std::vector<OpcodeInfo> table = {
        {"stop", {STOP}}, {"add", {ADD}}, {"mul", {MUL}}, {"sub", {SUB}}, {"div", {DIV}},
        {"sdiv", {SDIV}}, {"mod", {MOD}}, {"smod", {SMOD}}, {"addmod", {ADDMOD}}, {"mulmod", {MULMOD}},
        {"exp", {EXP}}, {"signextend", {SIGNEXTEND}},
        {"lt", {LT}}, {"gt", {GT}}, {"slt", {SLT}}, {"sgt", {SGT}}, {"eq", {EQ}}, {"iszero", {ISZERO}},
        {"and", {AND}}, {"or", {OR}}, {"xor", {XOR}}, {"not", {NOT}}, {"byte", {BYTE}},
        {"shl", {SHL}}, {"shr", {SHR}}, {"sar", {SAR}},
        {"keccak256", {KECCAK256}},
        {"address", {ADDRESS}}, {"balance", {BALANCE}}, {"origin", {ORIGIN}}, {"caller", {CALLER}},
        {"callvalue", {CALLVALUE}}, {"calldataload", {CALLDATALOAD}}, {"calldatasize", {CALLDATASIZE}},
        {"calldatacopy", {CALLDATACOPY}}, {"codesize", {CODESIZE}}, {"codecopy", {CODECOPY}},
        {"gasprice", {GASPRICE}}, {"extcodesize", {EXTCODESIZE}}, {"extcodecopy", {EXTCODECOPY}},
        {"returndatasize", {RETURNDATASIZE}}, {"returndatacopy", {RETURNDATACOPY}},
        {"extcodehash", {EXTCODEHASH}},
        {"blockhash", {BLOCKHASH}}, {"coinbase", {COINBASE}}, {"timestamp", {TIMESTAMP}},
        {"number", {NUMBER}}, {"difficulty", {DIFFICULTY}}, {"gaslimit", {GASLIMIT}},
        {"chainid", {CHAINID}}, {"selfbalance", {SELFBALANCE}}, {"basefee", {BASEFEE}},
        {"pop", {POP}}, {"mload", {MLOAD}}, {"mstore", {MSTORE}}, {"mstore8", {MSTORE8}},
        {"sload", {SLOAD}}, {"sstore", {SSTORE}}, {"jump", {JUMP}}, {"jumpi", {JUMPI}},
        {"pc", {GETPC}}, {"msize", {MSIZE}}, {"gas", {GAS}}, {"jumpdest", {JUMPDEST}},
        {"create", {CREATE}}, {"call", {CALL}}, {"callcode", {CALLCODE}}, {"return", {RETURN}},
        {"delegatecall", {DELEGATECALL}}, {"create2", {CREATE2}}, {"staticcall", {STATICCALL}},
        {"revert", {REVERT}}, {"invalid", {INVALID}}, {"selfdestruct", {SELFDESTRUCT}}
    };

    // Families carry their suffix in the mnemonic
    for (unsigned n = 1; n <= EVMASM_MAX_PUSH_WIDTH; ++n) {
        table.push_back({"push" + std::to_string(n), {static_cast<Opcode>(PUSH1 + n - 1), n}});
    }
    for (unsigned n = 1; n <= 16; ++n) {
        table.push_back({"dup" + std::to_string(n), {static_cast<Opcode>(DUP1 + n - 1)}});
        table.push_back({"swap" + std::to_string(n), {static_cast<Opcode>(SWAP1 + n - 1)}});
    }
    for (unsigned n = 0; n <= 4; ++n) {
        table.push_back({"log" + std::to_string(n), {static_cast<Opcode>(LOG0 + n)}});
    }

    std::sort(table.begin(), table.end(), [](const OpcodeInfo& a, const OpcodeInfo& b) {
        return a.spec.opcode < b.spec.opcode;
    });
    return table;
}

const std::vector<OpcodeInfo>& opcodeTable() {
    static const std::vector<OpcodeInfo> table = buildOpcodeTable();
    return table;
}

std::optional<Specifier> Specifier::push(unsigned width) {
    if (width < 1 || width > EVMASM_MAX_PUSH_WIDTH) {
        return std::nullopt;
    }
    return Specifier{static_cast<Opcode>(PUSH1 + width - 1), width};
}

std::optional<Specifier> specifierFromMnemonic(const std::string& mnemonic) {
    static const std::unordered_map<std::string, Specifier> mnemonicMap = [] {
        std::unordered_map<std::string, Specifier> map;
        for (const auto& info : opcodeTable()) {
            map.emplace(info.mnemonic, info.spec);
        }
        return map;
    }();

    auto it = mnemonicMap.find(mnemonic);
    if (it == mnemonicMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string mnemonicOf(const Specifier& spec) {
    for (const auto& info : opcodeTable()) {
        if (info.spec == spec) return info.mnemonic;
    }
    throw std::invalid_argument("No mnemonic for opcode byte " + std::to_string(static_cast<int>(spec.opcode)));
}
