#ifndef EVMASM_PARSER_H
#define EVMASM_PARSER_H

#include <string>
#include <vector>
#include "evmasm_ast.h"
#include "evmasm_grammar.h"
#include "evmasm_errors.h"

// Turns assembly text into the ordered node list handed to the assembler.
// Holds no state between calls besides its flags; never touches the filesystem.
class AsmParser {
    bool debugMode = false;

    Node parseInstructionMacro(const ParsePair& pair) const;
    AbstractOp parsePush(const ParsePair& pair) const;
    void trace(const Node& node, const SourceLocation& where) const;

public:
    void setDebugMode(bool enabled);
    bool isDebugMode() const { return debugMode; }

    // Throws ParseError on the first fault; no partial result.
    std::vector<Node> parse(const std::string& source) const;
};

// parse() with default flags
std::vector<Node> parseAsm(const std::string& source);

#endif // EVMASM_PARSER_H
