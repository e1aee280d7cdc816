#include <sstream>
#include <utility>

// Include own header FIRST
#include "evmasm_errors.h"

std::string SourceLocation::toString() const {
    if (!known()) return "unknown location";
    return "line " + std::to_string(line) + ", column " + std::to_string(column);
}

const char* errorKindName(ParseError::Kind kind) {
    switch (kind) {
        case ParseError::Kind::Lexer: return "Lexer";
        case ParseError::Kind::ImmediateTooLarge: return "ImmediateTooLarge";
        case ParseError::Kind::ExtraArgument: return "ExtraArgument";
        case ParseError::Kind::MissingArgument: return "MissingArgument";
        case ParseError::Kind::ArgumentType: return "ArgumentType";
    }
    return "Unknown";
}

ParseError::ParseError(Kind kind, SourceLocation where, std::string detail,
                       std::size_t expected, std::size_t got, std::size_t position)
    : std::runtime_error(describe(kind, where, detail, expected, got, position)),
      kind_(kind),
      location_(where),
      detail_(std::move(detail)),
      expected_(expected),
      got_(got),
      position_(position) {}

std::string ParseError::describe(Kind kind, const SourceLocation& where, const std::string& detail,
                                 std::size_t expected, std::size_t got, std::size_t position) {
    std::ostringstream msg;
    if (where.known()) msg << where.toString() << ": ";

    switch (kind) {
        case Kind::Lexer:
            msg << detail;
            break;
        case Kind::ImmediateTooLarge:
            msg << "immediate " << detail << " does not fit in " << expected
                << (expected == 1 ? " byte" : " bytes");
            break;
        case Kind::ExtraArgument:
            msg << "too many arguments: expected " << expected << ", got " << got;
            break;
        case Kind::MissingArgument:
            msg << "missing argument: expected " << expected << ", got " << got;
            break;
        case Kind::ArgumentType:
            msg << "argument " << (position + 1) << " has the wrong type: " << detail;
            break;
    }
    return msg.str();
}

ParseError ParseError::lexer(SourceLocation where, const std::string& detail) {
    return ParseError(Kind::Lexer, where, detail, 0, 0, 0);
}

ParseError ParseError::immediateTooLarge(const std::string& literal, std::size_t width) {
    return ParseError(Kind::ImmediateTooLarge, SourceLocation{}, literal, width, 0, 0);
}

ParseError ParseError::extraArgument(std::size_t expected, std::size_t got) {
    return ParseError(Kind::ExtraArgument, SourceLocation{}, "", expected, got, 0);
}

ParseError ParseError::missingArgument(std::size_t got, std::size_t expected) {
    return ParseError(Kind::MissingArgument, SourceLocation{}, "", expected, got, 0);
}

ParseError ParseError::argumentType(std::size_t position, const std::string& expectedKind,
                                    const std::string& gotKind) {
    return ParseError(Kind::ArgumentType, SourceLocation{}, "expected " + expectedKind + ", found " + gotKind,
                      0, 0, position);
}

ParseError ParseError::at(SourceLocation where) const {
    if (location_.known()) return *this;
    return ParseError(kind_, where, detail_, expected_, got_, position_);
}
