#ifndef EVMASM_ERRORS_H
#define EVMASM_ERRORS_H

#include <string>
#include <stdexcept>
#include <cstddef>

// 1-based position in the source text; line 0 means "unknown"
struct SourceLocation {
    std::size_t line = 0;
    std::size_t column = 0;

    bool known() const { return line != 0; }
    std::string toString() const;
};

// Every failure the parser can report. The first one aborts the whole parse.
class ParseError : public std::runtime_error {
public:
    enum class Kind {
        Lexer,             // text does not match the grammar
        ImmediateTooLarge, // literal does not fit the declared push width
        ExtraArgument,     // more macro arguments than the macro's arity
        MissingArgument,   // fewer macro arguments than the macro's arity
        ArgumentType       // wrong lexical kind at an argument position
    };

    static ParseError lexer(SourceLocation where, const std::string& detail);
    static ParseError immediateTooLarge(const std::string& literal, std::size_t width);
    static ParseError extraArgument(std::size_t expected, std::size_t got);
    static ParseError missingArgument(std::size_t got, std::size_t expected);
    static ParseError argumentType(std::size_t position, const std::string& expectedKind,
                                   const std::string& gotKind);

    Kind kind() const { return kind_; }
    const SourceLocation& location() const { return location_; }

    // Arity / width the construct required
    std::size_t expected() const { return expected_; }
    // Number of arguments actually supplied (argument errors only)
    std::size_t got() const { return got_; }
    // 0-based argument index of an ArgumentType error
    std::size_t position() const { return position_; }
    // Lexer message, offending literal, or expected/found kinds
    const std::string& detail() const { return detail_; }

    // Copy of this error pinned to the construct that produced it.
    // Keeps an already known location.
    ParseError at(SourceLocation where) const;

private:
    ParseError(Kind kind, SourceLocation where, std::string detail,
               std::size_t expected, std::size_t got, std::size_t position);

    static std::string describe(Kind kind, const SourceLocation& where, const std::string& detail,
                                std::size_t expected, std::size_t got, std::size_t position);

    Kind kind_;
    SourceLocation location_;
    std::string detail_;
    std::size_t expected_ = 0;
    std::size_t got_ = 0;
    std::size_t position_ = 0;
};

const char* errorKindName(ParseError::Kind kind);

#endif // EVMASM_ERRORS_H
