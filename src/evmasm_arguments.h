#ifndef EVMASM_ARGUMENTS_H
#define EVMASM_ARGUMENTS_H

#include <string>
#include <vector>
#include <filesystem>
#include "evmasm_grammar.h"

// Semantic kind a macro expects at one argument position.
enum class ArgumentKind {
    Path,      // quoted string
    Label,     // bare identifier
    Signature  // quoted string
};

const char* argumentKindName(ArgumentKind kind);

// Ordered kinds, one per position; its size is the macro's arity.
using ArgumentSignature = std::vector<ArgumentKind>;

struct Argument {
    ArgumentKind kind;
    std::string value;

    std::filesystem::path asPath() const { return std::filesystem::path(value); }
};

// Checks arity and per-position kind of `pairs` against `signature` and
// converts each pair. Positions are checked in order; a missing argument or
// a wrong kind is reported at the first position where it happens, surplus
// arguments only after every expected position passed.
// Throws ParseError (MissingArgument, ExtraArgument, ArgumentType).
std::vector<Argument> parseArguments(const std::vector<ParsePair>& pairs, const ArgumentSignature& signature);

#endif // EVMASM_ARGUMENTS_H
