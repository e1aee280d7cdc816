#include <sstream>
#include <iomanip>
#include <stdexcept>

// Include own header FIRST
#include "evmasm_ast.h"

static std::string bytesToHex(const std::vector<uint8_t>& bytes) {
    std::ostringstream ss;
    ss << "0x";
    for (uint8_t b : bytes) {
        ss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(b);
    }
    return ss.str();
}

// --- Immediate ---

Immediate Immediate::fromBytes(std::vector<uint8_t> bytes) {
    return Immediate(std::move(bytes));
}

Immediate Immediate::fromLabel(std::string label) {
    return Immediate(std::move(label));
}

const std::vector<uint8_t>& Immediate::bytes() const {
    if (isLabel()) throw std::logic_error("Immediate is the unresolved label '" + label() + "'");
    return std::get<std::vector<uint8_t>>(value);
}

const std::string& Immediate::label() const {
    if (!isLabel()) throw std::logic_error("Immediate is concrete, it has no label");
    return std::get<std::string>(value);
}

std::string Immediate::toString() const {
    if (isLabel()) return label();
    return bytesToHex(bytes());
}

// --- Op ---

Op::Op(Specifier spec) : spec(spec) {
    if (spec.isPush()) {
        throw std::invalid_argument(mnemonicOf(spec) + " requires an immediate");
    }
}

Op::Op(Specifier spec, Immediate immediate) : spec(spec), imm(std::move(immediate)) {
    if (!spec.isPush()) {
        throw std::invalid_argument(mnemonicOf(spec) + " takes no immediate");
    }
    if (!imm->isLabel() && imm->bytes().size() != spec.immediateWidth) {
        throw std::invalid_argument(mnemonicOf(spec) + " requires exactly " + std::to_string(spec.immediateWidth) +
                                    " immediate bytes, got " + std::to_string(imm->bytes().size()));
    }
}

std::string Op::toString() const {
    std::string text = mnemonicOf(spec);
    if (imm) text += " " + imm->toString();
    return text;
}

std::optional<unsigned> abstractOpSize(const AbstractOp& aop) {
    if (const Op* op = std::get_if<Op>(&aop)) return op->size();
    if (std::holds_alternative<LabelDef>(aop)) return 0u;
    return std::nullopt;
}

// --- Listing ---

static std::string formatAbstractOp(const AbstractOp& aop) {
    if (const Op* op = std::get_if<Op>(&aop)) return op->toString();
    if (const LabelDef* label = std::get_if<LabelDef>(&aop)) return label->name + ":";
    return "%push(" + std::get<PushLabel>(aop).operand.toString() + ")";
}

std::string formatNode(const Node& node) {
    if (const AbstractOp* aop = std::get_if<AbstractOp>(&node)) return formatAbstractOp(*aop);
    if (const Import* import = std::get_if<Import>(&node)) return "%import(\"" + import->path.string() + "\")";
    if (const Include* include = std::get_if<Include>(&node)) return "%include(\"" + include->path.string() + "\")";
    return "%include_hex(\"" + std::get<IncludeHex>(node).path.string() + "\")";
}
