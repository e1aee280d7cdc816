#include <gtest/gtest.h>
#include "evmasm_arguments.h"
#include "test_helpers.h"

static ParsePair stringArg(const std::string& text) {
    return ParsePair{Rule::String, text, SourceLocation{1, 9}, {}};
}

static ParsePair labelArg(const std::string& text) {
    return ParsePair{Rule::Label, text, SourceLocation{1, 7}, {}};
}

TEST(Arguments, ConvertsEachPosition) {
    std::vector<Argument> args = parseArguments({stringArg("lib/foo.asm")}, {ArgumentKind::Path});
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0].kind, ArgumentKind::Path);
    EXPECT_EQ(args[0].asPath(), std::filesystem::path("lib/foo.asm"));

    args = parseArguments({labelArg("main"), stringArg("f(uint8)")}, {ArgumentKind::Label, ArgumentKind::Signature});
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0].value, "main");
    EXPECT_EQ(args[1].kind, ArgumentKind::Signature);
    EXPECT_EQ(args[1].value, "f(uint8)");
}

TEST(Arguments, EmptySignatureAcceptsNoArguments) {
    EXPECT_TRUE(parseArguments({}, {}).empty());
    ParseError e = captureParseError([] { parseArguments({labelArg("x")}, {}); });
    EXPECT_EQ(e.kind(), ParseError::Kind::ExtraArgument);
    EXPECT_EQ(e.expected(), 0u);
}

TEST(Arguments, MissingArgumentReportsCounts) {
    ParseError e = captureParseError([] { parseArguments({}, {ArgumentKind::Path}); });
    EXPECT_EQ(e.kind(), ParseError::Kind::MissingArgument);
    EXPECT_EQ(e.got(), 0u);
    EXPECT_EQ(e.expected(), 1u);

    e = captureParseError([] {
        parseArguments({labelArg("a")}, {ArgumentKind::Label, ArgumentKind::Label, ArgumentKind::Path});
    });
    EXPECT_EQ(e.kind(), ParseError::Kind::MissingArgument);
    EXPECT_EQ(e.got(), 1u);
    EXPECT_EQ(e.expected(), 3u);
}

TEST(Arguments, ExtraArgumentReportsArity) {
    ParseError e = captureParseError([] {
        parseArguments({stringArg("foo.asm"), stringArg("bar.asm")}, {ArgumentKind::Path});
    });
    EXPECT_EQ(e.kind(), ParseError::Kind::ExtraArgument);
    EXPECT_EQ(e.expected(), 1u);
    EXPECT_EQ(e.got(), 2u);
}

TEST(Arguments, TypeMismatchReportsPosition) {
    ParseError e = captureParseError([] {
        parseArguments({labelArg("a"), labelArg("b")}, {ArgumentKind::Label, ArgumentKind::Path});
    });
    EXPECT_EQ(e.kind(), ParseError::Kind::ArgumentType);
    EXPECT_EQ(e.position(), 1u);
    EXPECT_EQ(e.location().column, 7u);
    EXPECT_NE(e.detail().find("path"), std::string::npos);

    ParsePair hexArg{Rule::Hex, "0x44", SourceLocation{1, 9}, {}};
    e = captureParseError([&] { parseArguments({hexArg}, {ArgumentKind::Path}); });
    EXPECT_EQ(e.kind(), ParseError::Kind::ArgumentType);
    EXPECT_EQ(e.position(), 0u);
}

TEST(Arguments, TypeCheckedBeforeSurplus) {
    ParsePair hexArg{Rule::Hex, "0x44", SourceLocation{1, 9}, {}};
    ParseError e = captureParseError([&] { parseArguments({hexArg, stringArg("a")}, {ArgumentKind::Path}); });
    EXPECT_EQ(e.kind(), ParseError::Kind::ArgumentType);
}
