//
//  lexer_test.cpp
//  minipy
//

#include <gtest/gtest.h>

#include <string>
#include <vector>
#include "minipy/lexer.h"

namespace {

std::vector<TokenKind> kinds(const std::string& src) {
    std::vector<TokenKind> out;
    for (const Token& t : tokenize(src).tokens) out.push_back(t.kind);
    return out;
}

} // namespace

TEST(Lexer, AssignmentTokens) {
    TokenizeResult r = tokenize("x = 42");
    ASSERT_EQ(r.tokens.size(), 4u);
    EXPECT_EQ(r.tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(r.tokens[0].text, "x");
    EXPECT_EQ(r.tokens[1].kind, TokenKind::Assign);
    EXPECT_EQ(r.tokens[2].kind, TokenKind::Number);
    EXPECT_FALSE(r.tokens[2].isFloat);
    EXPECT_EQ(r.tokens[2].integer, 42);
    EXPECT_EQ(r.tokens[3].kind, TokenKind::End);
    EXPECT_TRUE(r.diagnostics.empty());
}

TEST(Lexer, FloatLiteral) {
    TokenizeResult r = tokenize("2.5");
    ASSERT_EQ(r.tokens[0].kind, TokenKind::Number);
    EXPECT_TRUE(r.tokens[0].isFloat);
    EXPECT_DOUBLE_EQ(r.tokens[0].number, 2.5);
}

TEST(Lexer, TrailingDotIsIllegal) {
    TokenizeResult r = tokenize("1.");
    ASSERT_EQ(r.tokens[0].kind, TokenKind::Number);
    EXPECT_FALSE(r.tokens[0].isFloat);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].message, "Illegal character '.' at line 1");
}

TEST(Lexer, KeywordsAreCaseSensitive) {
    EXPECT_EQ(kinds("for in range while if else print True False"),
              (std::vector<TokenKind>{TokenKind::KW_FOR, TokenKind::KW_IN, TokenKind::KW_RANGE,
                                      TokenKind::KW_WHILE, TokenKind::KW_IF, TokenKind::KW_ELSE,
                                      TokenKind::KW_PRINT, TokenKind::True, TokenKind::False,
                                      TokenKind::End}));
    EXPECT_EQ(kinds("For true"),
              (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Identifier, TokenKind::End}));
}

TEST(Lexer, TwoCharOperatorsWin) {
    EXPECT_EQ(kinds("== != <= >= = < >"),
              (std::vector<TokenKind>{TokenKind::Equal, TokenKind::NotEqual, TokenKind::LessEqual,
                                      TokenKind::GreaterEqual, TokenKind::Assign, TokenKind::Less,
                                      TokenKind::Greater, TokenKind::End}));
}

TEST(Lexer, LoneBangIsIllegal) {
    TokenizeResult r = tokenize("a ! b");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].kind, DiagnosticKind::LexError);
    EXPECT_EQ(r.diagnostics[0].token, "!");
    EXPECT_EQ(kinds("a ! b"),
              (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Identifier, TokenKind::End}));
}

TEST(Lexer, StringStripsQuotes) {
    TokenizeResult r = tokenize("print(\"hi there\")");
    ASSERT_GE(r.tokens.size(), 3u);
    EXPECT_EQ(r.tokens[2].kind, TokenKind::String);
    EXPECT_EQ(r.tokens[2].text, "hi there");
}

TEST(Lexer, UnterminatedStringReportsOpeningLine) {
    TokenizeResult r = tokenize("x = 1\ny = \"abc\nz = 2");
    ASSERT_FALSE(r.diagnostics.empty());
    EXPECT_EQ(r.diagnostics[0].message, "Illegal character '\"' at line 2");
    EXPECT_EQ(r.diagnostics[0].line, 2);
}

TEST(Lexer, LineNumbersFollowNewlines) {
    TokenizeResult r = tokenize("a\n\nb\r\n\tc");
    ASSERT_EQ(r.tokens.size(), 4u);
    EXPECT_EQ(r.tokens[0].line, 1);
    EXPECT_EQ(r.tokens[1].line, 3);
    EXPECT_EQ(r.tokens[2].line, 4);
}

TEST(Lexer, IllegalCharactersAreSkipped) {
    TokenizeResult r = tokenize("x @= 1 $");
    EXPECT_EQ(r.diagnostics.size(), 2u);
    EXPECT_EQ(kinds("x @= 1 $"),
              (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Assign, TokenKind::Number,
                                      TokenKind::End}));
}

TEST(Lexer, TokenSpanCoversLexeme) {
    Lexer lx("  while x");
    Token t = lx.next();
    EXPECT_EQ(t.kind, TokenKind::KW_WHILE);
    EXPECT_EQ(lx.tokenStart, 2u);
    EXPECT_EQ(lx.tokenEnd, 7u);
    EXPECT_TRUE(is_keyword(t.kind));
    EXPECT_FALSE(is_keyword(lx.next().kind));
}

TEST(Lexer, KindNames) {
    EXPECT_STREQ(token_kind_name(TokenKind::Star), "TIMES");
    EXPECT_STREQ(token_kind_name(TokenKind::Slash), "DIVIDE");
    EXPECT_STREQ(token_kind_name(TokenKind::KW_PRINT), "PRINT");
    EXPECT_STREQ(token_kind_name(TokenKind::End), "END");
}

TEST(Lexer, IntegerLiteralBeyond64BitsIsAnError) {
    TokenizeResult r = tokenize("print(99999999999999999999)");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].kind, DiagnosticKind::LexError);
    EXPECT_EQ(r.diagnostics[0].token, "99999999999999999999");
    EXPECT_EQ(r.diagnostics[0].message, "Integer literal too large '99999999999999999999' at line 1");
    EXPECT_TRUE(tokenize("9223372036854775807").diagnostics.empty());
    EXPECT_FALSE(tokenize("9223372036854775808").diagnostics.empty());
}
