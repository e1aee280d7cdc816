#ifndef EVMASM_GRAMMAR_H
#define EVMASM_GRAMMAR_H

#include <string>
#include <vector>
#include "evmasm_errors.h"

// Grammar rules that can appear in the parse tree.
enum class Rule {
    LabelDefinition, // inner: Label
    Label,           // identifier used as a label name
    InstructionMacro, // inner: one of Import, Include, IncludeHex, PushMacro
    Import,          // inner: macro arguments
    Include,
    IncludeHex,
    PushMacro,
    String,          // text holds the contents without the quotes
    Push,            // inner: WordSize, then the operand
    WordSize,
    Binary,          // text keeps the 0b/0o/0x prefix
    Octal,
    Decimal,
    Hex,
    Selector,        // inner: Signature
    Signature,
    Op,              // bare instruction without immediate
    EndOfInput
};

const char* ruleName(Rule rule);

struct ParsePair {
    Rule rule;
    std::string text;
    SourceLocation location;
    std::vector<ParsePair> inner;
};

// Top-level pairs of a program in document order, terminated by EndOfInput.
// Throws ParseError (Lexer) at the first character that does not fit.
std::vector<ParsePair> parseProgram(const std::string& source);

#endif // EVMASM_GRAMMAR_H
