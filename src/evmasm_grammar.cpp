#include <utility>

// Include own header FIRST
#include "evmasm_grammar.h"
#include "evmasm_opcodes.h"

const char* ruleName(Rule rule) {
    switch (rule) {
        case Rule::LabelDefinition: return "label definition";
        case Rule::Label: return "label";
        case Rule::InstructionMacro: return "macro";
        case Rule::Import: return "import";
        case Rule::Include: return "include";
        case Rule::IncludeHex: return "include_hex";
        case Rule::PushMacro: return "push macro";
        case Rule::String: return "string";
        case Rule::Push: return "push";
        case Rule::WordSize: return "word size";
        case Rule::Binary: return "binary literal";
        case Rule::Octal: return "octal literal";
        case Rule::Decimal: return "decimal literal";
        case Rule::Hex: return "hex literal";
        case Rule::Selector: return "selector";
        case Rule::Signature: return "signature";
        case Rule::Op: return "instruction";
        case Rule::EndOfInput: return "end of input";
    }
    return "unknown";
}

static bool isDigit(char c) { return c >= '0' && c <= '9'; }
static bool isHexDigit(char c) { return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }
static bool isIdentStart(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
static bool isIdentChar(char c) { return isIdentStart(c) || isDigit(c); }
static bool isBlank(char c) { return c == ' ' || c == '\t' || c == '\r'; }
static bool isSeparator(char c) { return c == '\n' || c == ';'; }

// Single forward pass over the source; no backtracking past a statement.
class Scanner {
public:
    explicit Scanner(const std::string& source) : src(source) {}

    std::vector<ParsePair> program();

private:
    const std::string& src;
    std::size_t pos = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    bool atEnd() const { return pos >= src.size(); }
    char peek(std::size_t ahead = 0) const { return pos + ahead < src.size() ? src[pos + ahead] : '\0'; }
    SourceLocation here() const { return SourceLocation{line, column}; }
    std::string slice(std::size_t from) const { return src.substr(from, pos - from); }

    char advance() {
        char c = src[pos++];
        if (c == '\n') {
            line++;
            column = 1;
        } else {
            column++;
        }
        return c;
    }

    std::string found() const {
        if (atEnd()) return "end of input";
        if (peek() == '\n') return "newline";
        return "'" + std::string(1, peek()) + "'";
    }

    ParseError error(const std::string& what) const { return ParseError::lexer(here(), what); }
    ParseError error(SourceLocation where, const std::string& what) const { return ParseError::lexer(where, what); }

    void expect(char c, const std::string& context) {
        if (atEnd() || peek() != c) {
            throw error("expected '" + std::string(1, c) + "' " + context + ", found " + found());
        }
        advance();
    }

    bool skipBlanks() {
        bool skipped = false;
        while (!atEnd() && isBlank(peek())) {
            advance();
            skipped = true;
        }
        return skipped;
    }

    void skipComment() {
        if (peek() != '#') return;
        while (!atEnd() && peek() != '\n') advance();
    }

    std::string identifier() {
        std::size_t from = pos;
        while (!atEnd() && isIdentChar(peek())) advance();
        return slice(from);
    }

    ParsePair statement();
    ParsePair push(const std::string& mnemonic, SourceLocation start, std::size_t from);
    ParsePair operand();
    ParsePair numeric();
    ParsePair digitsLiteral(Rule rule, bool (*accept)(char), SourceLocation start, std::size_t from);
    ParsePair selector(SourceLocation start, std::size_t from);
    void signatureParameters();
    void signatureType();
    ParsePair macro();
    ParsePair macroArgument();
    ParsePair string();
};

std::vector<ParsePair> Scanner::program() {
    std::vector<ParsePair> pairs;
    for (;;) {
        skipBlanks();
        skipComment();
        if (atEnd()) break;
        if (isSeparator(peek())) {
            advance();
            continue;
        }

        pairs.push_back(statement());

        skipBlanks();
        skipComment();
        if (atEnd()) break;
        if (!isSeparator(peek())) {
            throw error("expected ';' or a newline after the statement, found " + found());
        }
    }
    pairs.push_back(ParsePair{Rule::EndOfInput, "", here(), {}});
    return pairs;
}

ParsePair Scanner::statement() {
    SourceLocation start = here();
    std::size_t from = pos;

    if (peek() == '%') return macro();
    if (!isIdentStart(peek())) {
        throw error("expected an instruction, label or macro, found " + found());
    }

    std::string name = identifier();
    std::size_t nameEnd = pos;

    // `name:` is always a definition, even when name is a mnemonic
    skipBlanks();
    if (peek() == ':') {
        advance();
        ParsePair label{Rule::Label, name, start, {}};
        return ParsePair{Rule::LabelDefinition, slice(from), start, {label}};
    }

    std::optional<Specifier> spec = specifierFromMnemonic(name);
    if (!spec) {
        throw error(start, "unknown instruction '" + name + "'");
    }
    if (spec->isPush()) {
        if (atEnd() || isSeparator(peek()) || peek() == '#') {
            throw error("'" + name + "' requires an operand");
        }
        if (pos == nameEnd) {
            throw error("expected whitespace after '" + name + "', found " + found());
        }
        return push(name, start, from);
    }
    return ParsePair{Rule::Op, name, start, {}};
}

ParsePair Scanner::push(const std::string& mnemonic, SourceLocation start, std::size_t from) {
    ParsePair size{Rule::WordSize, mnemonic.substr(4), start, {}};
    ParsePair value = operand();
    return ParsePair{Rule::Push, slice(from), start, {size, value}};
}

ParsePair Scanner::operand() {
    SourceLocation start = here();
    std::size_t from = pos;

    if (isDigit(peek())) return numeric();
    if (isIdentStart(peek())) {
        std::string name = identifier();
        if (name == "selector" && peek() == '(') return selector(start, from);
        return ParsePair{Rule::Label, name, start, {}};
    }
    throw error("expected a number, selector or label after push, found " + found());
}

ParsePair Scanner::digitsLiteral(Rule rule, bool (*accept)(char), SourceLocation start, std::size_t from) {
    std::size_t digitsFrom = pos;
    while (!atEnd() && accept(peek())) advance();
    if (pos == digitsFrom) {
        throw error("expected digits in " + std::string(ruleName(rule)) + ", found " + found());
    }
    if (isIdentChar(peek())) {
        throw error("invalid character " + found() + " in " + ruleName(rule));
    }
    return ParsePair{rule, slice(from), start, {}};
}

ParsePair Scanner::numeric() {
    SourceLocation start = here();
    std::size_t from = pos;

    if (peek() == '0' && peek(1) == 'x') {
        advance();
        advance();
        ParsePair hex = digitsLiteral(Rule::Hex, isHexDigit, start, from);
        if ((hex.text.size() - 2) % 2 != 0) {
            throw error(start, "hex literal '" + hex.text + "' needs an even number of digits");
        }
        return hex;
    }
    if (peek() == '0' && peek(1) == 'o') {
        advance();
        advance();
        return digitsLiteral(Rule::Octal, [](char c) { return c >= '0' && c <= '7'; }, start, from);
    }
    if (peek() == '0' && peek(1) == 'b') {
        advance();
        advance();
        return digitsLiteral(Rule::Binary, [](char c) { return c == '0' || c == '1'; }, start, from);
    }
    return digitsLiteral(Rule::Decimal, isDigit, start, from);
}

// selector("name(type,...)") - no whitespace anywhere inside
ParsePair Scanner::selector(SourceLocation start, std::size_t from) {
    expect('(', "after selector");
    expect('"', "to open the selector signature");

    SourceLocation sigStart = here();
    std::size_t sigFrom = pos;
    if (!isIdentStart(peek())) {
        throw error("malformed selector signature: expected a function name, found " + found());
    }
    identifier();
    signatureParameters();
    ParsePair signature{Rule::Signature, slice(sigFrom), sigStart, {}};

    expect('"', "to close the selector signature");
    expect(')', "after the selector signature");
    return ParsePair{Rule::Selector, slice(from), start, {signature}};
}

void Scanner::signatureParameters() {
    expect('(', "in selector signature");
    if (peek() == ')') {
        advance();
        return;
    }
    for (;;) {
        signatureType();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == ')') {
            advance();
            return;
        }
        throw error("malformed selector signature: expected ',' or ')', found " + found());
    }
}

void Scanner::signatureType() {
    if (peek() == '(') {
        signatureParameters(); // tuple
    } else if (isIdentStart(peek())) {
        identifier();
    } else {
        throw error("malformed selector signature: expected a parameter type, found " + found());
    }
    while (peek() == '[') {
        advance();
        while (isDigit(peek())) advance();
        expect(']', "to close the array type");
    }
}

ParsePair Scanner::macro() {
    SourceLocation start = here();
    std::size_t from = pos;

    advance(); // '%'
    if (!isIdentStart(peek())) {
        throw error("expected a macro name after '%', found " + found());
    }
    std::string name = identifier();

    Rule rule;
    if (name == "import") rule = Rule::Import;
    else if (name == "include") rule = Rule::Include;
    else if (name == "include_hex") rule = Rule::IncludeHex;
    else if (name == "push") rule = Rule::PushMacro;
    else throw error(start, "unknown macro '%" + name + "'");

    expect('(', "after '%" + name + "'");
    std::vector<ParsePair> arguments;
    skipBlanks();
    if (peek() != ')') {
        for (;;) {
            arguments.push_back(macroArgument());
            skipBlanks();
            if (peek() != ',') break;
            advance();
            skipBlanks();
        }
    }
    expect(')', "to close the argument list of '%" + name + "'");

    ParsePair directive{rule, slice(from), start, std::move(arguments)};
    return ParsePair{Rule::InstructionMacro, directive.text, start, {directive}};
}

ParsePair Scanner::macroArgument() {
    SourceLocation start = here();

    if (peek() == '"') return string();
    if (isDigit(peek())) return numeric();
    if (isIdentStart(peek())) return ParsePair{Rule::Label, identifier(), start, {}};
    throw error("expected a macro argument, found " + found());
}

ParsePair Scanner::string() {
    SourceLocation start = here();
    advance(); // opening quote

    std::size_t from = pos;
    while (!atEnd() && peek() != '"' && peek() != '\n') advance();
    if (peek() != '"') {
        throw error(start, "unterminated string");
    }
    std::string contents = slice(from);
    advance(); // closing quote
    return ParsePair{Rule::String, contents, start, {}};
}

std::vector<ParsePair> parseProgram(const std::string& source) {
    Scanner scanner(source);
    return scanner.program();
}
