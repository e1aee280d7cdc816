#include <iostream>
#include <stdexcept>

// Include own header FIRST
#include "evmasm_parser.h"
#include "evmasm_arguments.h"
#include "evmasm_immediate.h"
#include "evmasm_opcodes.h"

void AsmParser::setDebugMode(bool enabled) {
    debugMode = enabled;
    if (debugMode) std::cout << "[Debug][Parser] Debug mode enabled.\n";
}

void AsmParser::trace(const Node& node, const SourceLocation& where) const {
    if (!debugMode) return;
    std::cout << "[Debug][Parser]   " << where.toString() << ": " << formatNode(node) << "\n";
}

std::vector<Node> AsmParser::parse(const std::string& source) const {
    std::vector<Node> program;

    if (debugMode) std::cout << "[Debug][Parser] Parsing " << source.size() << " bytes of source\n";
    std::vector<ParsePair> pairs = parseProgram(source);

    for (const ParsePair& pair : pairs) {
        switch (pair.rule) {
            case Rule::InstructionMacro:
                program.push_back(parseInstructionMacro(pair.inner.at(0)));
                break;
            case Rule::LabelDefinition:
                program.push_back(AbstractOp(LabelDef{pair.inner.at(0).text}));
                break;
            case Rule::Push:
                program.push_back(parsePush(pair));
                break;
            case Rule::Op: {
                std::optional<Specifier> spec = specifierFromMnemonic(pair.text);
                if (!spec) throw std::logic_error("grammar accepted unknown mnemonic '" + pair.text + "'");
                program.push_back(AbstractOp(Op(*spec)));
                break;
            }
            default:
                continue;
        }
        trace(program.back(), pair.location);
    }

    if (debugMode) std::cout << "[Debug][Parser] Parsed " << program.size() << " nodes.\n";
    return program;
}

AbstractOp AsmParser::parsePush(const ParsePair& pair) const {
    const ParsePair& size = pair.inner.at(0);
    const ParsePair& operand = pair.inner.at(1);

    std::optional<Specifier> spec = Specifier::push(static_cast<unsigned>(std::stoul(size.text)));
    if (!spec) throw std::logic_error("grammar accepted push width " + size.text);
    const std::size_t width = spec->size() - 1;

    try {
        std::vector<uint8_t> raw;
        switch (operand.rule) {
            case Rule::Binary:
                raw = radixToBytes(operand.text.substr(2), 2);
                break;
            case Rule::Octal:
                raw = radixToBytes(operand.text.substr(2), 8);
                break;
            case Rule::Decimal:
                raw = radixToBytes(operand.text, 10);
                break;
            case Rule::Hex:
                raw = hexToBytes(operand.text.substr(2));
                break;
            case Rule::Selector:
                raw = selectorBytes(operand.inner.at(0).text, width);
                break;
            case Rule::Label:
                return Op(*spec, Immediate::fromLabel(operand.text));
            default:
                throw std::logic_error(std::string("unexpected push operand rule: ") + ruleName(operand.rule));
        }
        return Op(*spec, Immediate::fromBytes(normalizeImmediate(std::move(raw), width, operand.text)));
    } catch (const ParseError& e) {
        // Literals past 128 bits overflow before the width is known
        if (e.kind() == ParseError::Kind::ImmediateTooLarge && e.expected() != width) {
            throw ParseError::immediateTooLarge(operand.text, width).at(operand.location);
        }
        throw e.at(operand.location);
    }
}

Node AsmParser::parseInstructionMacro(const ParsePair& pair) const {
    try {
        switch (pair.rule) {
            case Rule::Import: {
                std::vector<Argument> args = parseArguments(pair.inner, {ArgumentKind::Path});
                return Import{args[0].asPath()};
            }
            case Rule::Include: {
                std::vector<Argument> args = parseArguments(pair.inner, {ArgumentKind::Path});
                return Include{args[0].asPath()};
            }
            case Rule::IncludeHex: {
                std::vector<Argument> args = parseArguments(pair.inner, {ArgumentKind::Path});
                return IncludeHex{args[0].asPath()};
            }
            case Rule::PushMacro: {
                // Only labels for now; literals go through pushN
                std::vector<Argument> args = parseArguments(pair.inner, {ArgumentKind::Label});
                return AbstractOp(PushLabel{Immediate::fromLabel(args[0].value)});
            }
            default:
                throw std::logic_error(std::string("unexpected macro rule: ") + ruleName(pair.rule));
        }
    } catch (const ParseError& e) {
        throw e.at(pair.location);
    }
}

std::vector<Node> parseAsm(const std::string& source) {
    AsmParser parser;
    return parser.parse(source);
}
