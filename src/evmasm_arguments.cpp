// Include own header FIRST
#include "evmasm_arguments.h"
#include "evmasm_errors.h"

const char* argumentKindName(ArgumentKind kind) {
    switch (kind) {
        case ArgumentKind::Path: return "path";
        case ArgumentKind::Label: return "label";
        case ArgumentKind::Signature: return "signature";
    }
    return "unknown";
}

static Rule requiredRule(ArgumentKind kind) {
    switch (kind) {
        case ArgumentKind::Label: return Rule::Label;
        case ArgumentKind::Path:
        case ArgumentKind::Signature: break;
    }
    return Rule::String;
}

static Argument convertArgument(const ParsePair& pair, ArgumentKind kind, std::size_t position) {
    if (pair.rule != requiredRule(kind)) {
        throw ParseError::argumentType(position, argumentKindName(kind), ruleName(pair.rule)).at(pair.location);
    }
    return Argument{kind, pair.text};
}

std::vector<Argument> parseArguments(const std::vector<ParsePair>& pairs, const ArgumentSignature& signature) {
    std::vector<Argument> arguments;
    arguments.reserve(signature.size());

    for (std::size_t i = 0; i < signature.size(); ++i) {
        if (i >= pairs.size()) {
            throw ParseError::missingArgument(pairs.size(), signature.size());
        }
        arguments.push_back(convertArgument(pairs[i], signature[i], i));
    }

    if (pairs.size() > signature.size()) {
        throw ParseError::extraArgument(signature.size(), pairs.size()).at(pairs[signature.size()].location);
    }
    return arguments;
}
