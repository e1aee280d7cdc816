#ifndef EVMASM_AST_H
#define EVMASM_AST_H

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <filesystem>
#include <utility>
#include <cstdint>
#include "evmasm_opcodes.h"

// Operand of a push: concrete big-endian bytes, or a label resolved downstream.
class Immediate {
public:
    static Immediate fromBytes(std::vector<uint8_t> bytes);
    static Immediate fromLabel(std::string label);

    bool isLabel() const { return std::holds_alternative<std::string>(value); }

    // Throws std::logic_error when called on the other alternative
    const std::vector<uint8_t>& bytes() const;
    const std::string& label() const;

    std::string toString() const;

    bool operator==(const Immediate& other) const { return value == other.value; }
    bool operator!=(const Immediate& other) const { return !(*this == other); }

private:
    explicit Immediate(std::variant<std::vector<uint8_t>, std::string> v) : value(std::move(v)) {}

    std::variant<std::vector<uint8_t>, std::string> value;
};

// A concrete instruction. Push instructions always carry an immediate whose
// concrete length equals spec.immediateWidth; all others carry none.
class Op {
public:
    explicit Op(Specifier spec);
    Op(Specifier spec, Immediate immediate);

    const Specifier& specifier() const { return spec; }
    const std::optional<Immediate>& immediate() const { return imm; }
    unsigned size() const { return spec.size(); }

    std::string toString() const;

    bool operator==(const Op& other) const { return spec == other.spec && imm == other.imm; }
    bool operator!=(const Op& other) const { return !(*this == other); }

private:
    Specifier spec;
    std::optional<Immediate> imm;
};

// `name:` - binds name to the offset of the next instruction
struct LabelDef {
    std::string name;

    bool operator==(const LabelDef& other) const { return name == other.name; }
    bool operator!=(const LabelDef& other) const { return !(*this == other); }
};

// `%push(label)` - push width is picked once the label is resolved
struct PushLabel {
    Immediate operand;

    bool operator==(const PushLabel& other) const { return operand == other.operand; }
    bool operator!=(const PushLabel& other) const { return !(*this == other); }
};

using AbstractOp = std::variant<Op, LabelDef, PushLabel>;

// Encoded size in bytes; empty for %push(label)
std::optional<unsigned> abstractOpSize(const AbstractOp& aop);

// Directive nodes only carry the path; reading it is up to the assembler.
struct Import {
    std::filesystem::path path;

    bool operator==(const Import& other) const { return path == other.path; }
    bool operator!=(const Import& other) const { return !(*this == other); }
};

struct Include {
    std::filesystem::path path;

    bool operator==(const Include& other) const { return path == other.path; }
    bool operator!=(const Include& other) const { return !(*this == other); }
};

struct IncludeHex {
    std::filesystem::path path;

    bool operator==(const IncludeHex& other) const { return path == other.path; }
    bool operator!=(const IncludeHex& other) const { return !(*this == other); }
};

using Node = std::variant<AbstractOp, Import, Include, IncludeHex>;

// One listing line, e.g. "push2 0x002a", "start:", "%include(\"a.asm\")"
std::string formatNode(const Node& node);

#endif // EVMASM_AST_H
