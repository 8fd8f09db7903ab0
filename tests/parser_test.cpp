//
//  parser_test.cpp
//  minipy
//

#include <gtest/gtest.h>

#include <string>
#include "minipy/parser.h"

namespace {

const BlockNode& root(const ParseResult& r) {
    return std::get<BlockNode>(r.ast->kind);
}

std::string error_of(const std::string& src) {
    ParseResult r = parse_program(src);
    EXPECT_FALSE(r.ok());
    return r.diagnostic ? r.diagnostic->message : std::string();
}

} // namespace

TEST(Parser, RootIsAlwaysBlock) {
    ParseResult r = parse_program("x = 42");
    ASSERT_TRUE(r.ok());
    const BlockNode& b = root(r);
    ASSERT_EQ(b.statements.size(), 1u);
    const auto& a = std::get<AssignmentNode>(b.statements[0]->kind);
    EXPECT_EQ(a.target.name, "x");
    EXPECT_EQ(std::get<NumberNode>(a.value->kind).integer, 42);
}

TEST(Parser, MultiplicationBindsTighter) {
    ParseResult r = parse_program("3 + 5 * 2");
    ASSERT_TRUE(r.ok());
    const auto& add = std::get<BinOpNode>(root(r).statements[0]->kind);
    EXPECT_EQ(add.op, "+");
    EXPECT_EQ(std::get<NumberNode>(add.left->kind).integer, 3);
    const auto& mul = std::get<BinOpNode>(add.right->kind);
    EXPECT_EQ(mul.op, "*");
}

TEST(Parser, SubtractionIsLeftAssociative) {
    ParseResult r = parse_program("10 - 4 - 3");
    ASSERT_TRUE(r.ok());
    const auto& outer = std::get<BinOpNode>(root(r).statements[0]->kind);
    EXPECT_EQ(outer.op, "-");
    EXPECT_EQ(std::get<NumberNode>(outer.right->kind).integer, 3);
    const auto& inner = std::get<BinOpNode>(outer.left->kind);
    EXPECT_EQ(std::get<NumberNode>(inner.left->kind).integer, 10);
}

TEST(Parser, ParenthesesGroup) {
    ParseResult r = parse_program("(1 + 2) * 3");
    ASSERT_TRUE(r.ok());
    const auto& mul = std::get<BinOpNode>(root(r).statements[0]->kind);
    EXPECT_EQ(mul.op, "*");
    EXPECT_EQ(std::get<BinOpNode>(mul.left->kind).op, "+");
}

TEST(Parser, ListAssignment) {
    ParseResult r = parse_program("y = [1, True, \"a\"]");
    ASSERT_TRUE(r.ok());
    const auto& a = std::get<AssignmentNode>(root(r).statements[0]->kind);
    const auto& list = std::get<ListNode>(a.value->kind);
    ASSERT_EQ(list.items.size(), 3u);
    EXPECT_TRUE(std::get<BooleanNode>(list.items[1]->kind).value);
    EXPECT_EQ(std::get<StringNode>(list.items[2]->kind).value, "a");
}

TEST(Parser, EmptyListAndCallWithoutArgs) {
    ASSERT_TRUE(parse_program("z = []").ok());
    ParseResult r = parse_program("str()");
    ASSERT_TRUE(r.ok());
    const auto& call = std::get<FunctionCallNode>(root(r).statements[0]->kind);
    EXPECT_EQ(call.name.name, "str");
    EXPECT_TRUE(call.args.empty());
}

TEST(Parser, IfElse) {
    ParseResult r = parse_program("if x == 5: y = 10 else: y = 20");
    ASSERT_TRUE(r.ok());
    const auto& n = std::get<IfNode>(root(r).statements[0]->kind);
    EXPECT_EQ(std::get<BinOpNode>(n.condition->kind).op, "==");
    EXPECT_TRUE(std::holds_alternative<AssignmentNode>(n.thenBody->kind));
    ASSERT_TRUE(n.elseBody != nullptr);
}

TEST(Parser, ElseBindsToInnermostIf) {
    ParseResult r = parse_program("if a > 1: if b > 1: print(1) else: print(2)");
    ASSERT_TRUE(r.ok());
    const auto& outer = std::get<IfNode>(root(r).statements[0]->kind);
    EXPECT_TRUE(outer.elseBody == nullptr);
    const auto& inner = std::get<IfNode>(outer.thenBody->kind);
    EXPECT_TRUE(inner.elseBody != nullptr);
}

TEST(Parser, SuiteTakesFollowingStatements) {
    ParseResult r = parse_program("x = 3; while x > 0: print(x); x = x - 1");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(root(r).statements.size(), 2u);
    const auto& loop = std::get<WhileNode>(root(r).statements[1]->kind);
    const auto& body = std::get<BlockNode>(loop.body->kind);
    EXPECT_EQ(body.statements.size(), 2u);
}

TEST(Parser, ForLoop) {
    ParseResult r = parse_program("for i in range(1, 5): print(i)");
    ASSERT_TRUE(r.ok());
    const auto& n = std::get<ForNode>(root(r).statements[0]->kind);
    EXPECT_EQ(n.iterator.name, "i");
    EXPECT_EQ(std::get<NumberNode>(n.start->kind).integer, 1);
    EXPECT_EQ(std::get<NumberNode>(n.end->kind).integer, 5);
    EXPECT_TRUE(std::holds_alternative<PrintNode>(n.body->kind));
}

TEST(Parser, NodesCarryLines) {
    ParseResult r = parse_program("x = 1;\n\nprint(x)");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(root(r).statements[0]->line, 1);
    EXPECT_EQ(root(r).statements[1]->line, 3);
}

TEST(Parser, MissingColon) {
    EXPECT_EQ(error_of("if x > 5 print(1)"),
              "Syntax error at line 1, token='print' (type='PRINT'): expected ':'");
}

TEST(Parser, MissingClosingParen) {
    EXPECT_EQ(error_of("print(1"), "Syntax error at end of input: expected ')'");
}

TEST(Parser, EmptyInput) {
    ParseResult r = parse_program("");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.diagnostic->line, 0);
    EXPECT_EQ(r.diagnostic->message, "Syntax error at end of input: expected statement");
}

TEST(Parser, ConditionNeedsComparison) {
    EXPECT_EQ(error_of("while x: print(x)"),
              "Syntax error at line 1, token=':' (type='COLON'): expected comparison operator");
}

TEST(Parser, ComparisonOutsideCondition) {
    ParseResult r = parse_program("x = 1 < 2");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.diagnostic->kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(r.diagnostic->token, "<");
    EXPECT_EQ(r.diagnostic->tokenKind, "LT");
}

TEST(Parser, StatementsNeedSeparator) {
    EXPECT_EQ(error_of("x = 1 y = 2"),
              "Syntax error at line 1, token='y' (type='IDENTIFIER'): expected ';' or end of input");
}

TEST(Parser, LexErrorAbortsParse) {
    ParseResult r = parse_program("x = 1 $ 2");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.diagnostic->kind, DiagnosticKind::LexError);
    EXPECT_EQ(r.diagnostic->message, "Illegal character '$' at line 1");
}

TEST(Parser, FirstLexErrorWins) {
    ParseResult r = parse_program("a = 1;\nb = @;\nc = #");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.diagnostic->message, "Illegal character '@' at line 2");
}

TEST(Parser, OversizedLiteralAbortsParse) {
    EXPECT_EQ(error_of("print(99999999999999999999)"),
              "Integer literal too large '99999999999999999999' at line 1");
}

TEST(Parser, DeepParenthesesAreRejected) {
    std::string src = std::string(200000, '(') + "1" + std::string(200000, ')');
    EXPECT_EQ(error_of(src),
              "Syntax error at line 1, token='(' (type='LPAREN'): nesting deeper than 200 levels");
}

TEST(Parser, LongOperatorChainIsRejected) {
    std::string src = "1";
    for (int i = 0; i < 5000; ++i) src += " + 1";
    ParseResult r = parse_program(src);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.diagnostic->kind, DiagnosticKind::SyntaxError);
    EXPECT_NE(r.diagnostic->message.find("nesting deeper than 200 levels"), std::string::npos);
}

TEST(Parser, ModerateNestingIsAccepted) {
    std::string src = std::string(100, '(') + "1" + std::string(100, ')');
    for (int i = 0; i < 50; ++i) src += " * 2";
    ParseResult r = parse_program(src);
    ASSERT_TRUE(r.ok()) << r.diagnostic->message;
    EXPECT_LE(r.ast->depth, 60);
}

TEST(Parser, DeeplyNestedIfsAreRejected) {
    std::string src;
    for (int i = 0; i < 1000; ++i) src += "if 1 < 2: ";
    src += "print(1)";
    EXPECT_NE(error_of(src).find("nesting deeper than 200 levels"), std::string::npos);
}
