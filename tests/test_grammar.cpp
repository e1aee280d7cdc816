#include <gtest/gtest.h>
#include "evmasm_grammar.h"
#include "test_helpers.h"

static std::vector<Rule> rulesOf(const std::vector<ParsePair>& pairs) {
    std::vector<Rule> rules;
    for (const auto& pair : pairs) rules.push_back(pair.rule);
    return rules;
}

static ParseError lexerError(const std::string& source) {
    return captureParseError([&] { parseProgram(source); });
}

TEST(Grammar, EmptySourceOnlyHasEndOfInput) {
    EXPECT_EQ(rulesOf(parseProgram("")), std::vector<Rule>{Rule::EndOfInput});
    EXPECT_EQ(rulesOf(parseProgram("\n\n  # just a comment\n;;\n")), std::vector<Rule>{Rule::EndOfInput});
}

TEST(Grammar, SeparatorsAndComments) {
    auto pairs = parseProgram("stop; pc # trailing\n  gas\n");
    EXPECT_EQ(rulesOf(pairs), (std::vector<Rule>{Rule::Op, Rule::Op, Rule::Op, Rule::EndOfInput}));
    EXPECT_EQ(pairs[1].text, "pc");
    EXPECT_EQ(pairs[2].location.line, 2u);
    EXPECT_EQ(pairs[2].location.column, 3u);
}

TEST(Grammar, LabelDefinitionWinsOverMnemonic) {
    auto pairs = parseProgram("push1:\npush1 push1");
    ASSERT_EQ(rulesOf(pairs), (std::vector<Rule>{Rule::LabelDefinition, Rule::Push, Rule::EndOfInput}));
    EXPECT_EQ(pairs[0].inner.at(0).rule, Rule::Label);
    EXPECT_EQ(pairs[0].inner.at(0).text, "push1");
    EXPECT_EQ(pairs[1].inner.at(0).text, "1");
    EXPECT_EQ(pairs[1].inner.at(1).rule, Rule::Label);
    EXPECT_EQ(pairs[1].inner.at(1).text, "push1");
}

TEST(Grammar, PushOperandKinds) {
    auto pairs = parseProgram(
        "push1 0b101\n"
        "push1 0o17\n"
        "push1 42\n"
        "push2 0xBEef\n"
        "push4 selector(\"transfer(address,uint256)\")\n"
        "push2 snake_case\n");
    ASSERT_EQ(pairs.size(), 7u);
    EXPECT_EQ(pairs[0].inner.at(1).rule, Rule::Binary);
    EXPECT_EQ(pairs[0].inner.at(1).text, "0b101");
    EXPECT_EQ(pairs[1].inner.at(1).rule, Rule::Octal);
    EXPECT_EQ(pairs[2].inner.at(1).rule, Rule::Decimal);
    EXPECT_EQ(pairs[3].inner.at(1).rule, Rule::Hex);
    EXPECT_EQ(pairs[3].inner.at(1).text, "0xBEef");
    EXPECT_EQ(pairs[4].inner.at(1).rule, Rule::Selector);
    EXPECT_EQ(pairs[4].inner.at(1).inner.at(0).text, "transfer(address,uint256)");
    EXPECT_EQ(pairs[5].inner.at(1).rule, Rule::Label);
}

TEST(Grammar, SelectorSignatureShapes) {
    EXPECT_NO_THROW(parseProgram("push4 selector(\"f((uint256,address)[],bytes32[2])\")"));
    EXPECT_NO_THROW(parseProgram("push4 selector(\"f()\")"));
    EXPECT_EQ(lexerError("push4 selector(\"name( )\")").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push4 selector(\"name(uint256, address)\")").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push4 selector( \"name()\")").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push4 selector(\"name\")").kind(), ParseError::Kind::Lexer);
}

TEST(Grammar, MacroArguments) {
    auto pairs = parseProgram("%import( \"a.asm\" ,  \"b.asm\" )\n%push(hello)\n%include()");
    ASSERT_EQ(rulesOf(pairs), (std::vector<Rule>{Rule::InstructionMacro, Rule::InstructionMacro,
                                                  Rule::InstructionMacro, Rule::EndOfInput}));

    const ParsePair& import = pairs[0].inner.at(0);
    EXPECT_EQ(import.rule, Rule::Import);
    ASSERT_EQ(import.inner.size(), 2u);
    EXPECT_EQ(import.inner[0].rule, Rule::String);
    EXPECT_EQ(import.inner[0].text, "a.asm");
    EXPECT_EQ(import.inner[1].text, "b.asm");

    const ParsePair& push = pairs[1].inner.at(0);
    EXPECT_EQ(push.rule, Rule::PushMacro);
    EXPECT_EQ(push.inner.at(0).rule, Rule::Label);

    EXPECT_TRUE(pairs[2].inner.at(0).inner.empty());
}

TEST(Grammar, MacroArgumentsKeepTheirLexicalKind) {
    auto pairs = parseProgram("%import(0x44)");
    EXPECT_EQ(pairs[0].inner.at(0).inner.at(0).rule, Rule::Hex);
}

TEST(Grammar, RejectsMalformedInput) {
    EXPECT_EQ(lexerError("frobnicate").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("stop pc").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push1").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push1 # no operand").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push33 1").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push1 0b2").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push1 0o8").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push1 12ab").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("push2 0x123").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("%frob(\"x\")").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("%import(\"unterminated)").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("%import(\"a\",)").kind(), ParseError::Kind::Lexer);
    EXPECT_EQ(lexerError("Stop").kind(), ParseError::Kind::Lexer);
}

TEST(Grammar, LexerErrorCarriesLocation) {
    ParseError e = lexerError("stop\n  jumpdest\n  push2 0x010\n");
    EXPECT_EQ(e.location().line, 3u);
    EXPECT_EQ(e.location().column, 9u);

    e = lexerError("stop\nbogus");
    EXPECT_EQ(e.location().line, 2u);
    EXPECT_EQ(e.location().column, 1u);
    EXPECT_NE(std::string(e.what()).find("bogus"), std::string::npos);
}
