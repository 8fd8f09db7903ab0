//
//  parser.h
//  minipy
//
#pragma once

#include <optional>
#include <string>
#include <utility>
#include "ast.h"
#include "env.h"
#include "lexer.h"
#include "token.h"

struct ParseResult {
    NodePtr ast; // root Block, null when diagnostic is set
    std::optional<Diagnostic> diagnostic;

    bool ok() const { return ast != nullptr; }
};

// Recursive descent over a lazily pulled token stream. One Parser parses one
// program once; it is not reentrant.
struct Parser {
    // Deepest statement/expression nesting, and deepest tree, a program may have.
    static constexpr int kMaxNesting = 200;

    Lexer lex;
    Token tok;
    int nesting = 0;

    // Counts one level of parser recursion for the lifetime of a parse call.
    struct NestingGuard {
        Parser& p;
        explicit NestingGuard(Parser& parser) : p(parser) {
            if (++p.nesting > kMaxNesting) {
                --p.nesting;
                p.tooDeep();
            }
        }
        ~NestingGuard() { --p.nesting; }
    };

    explicit Parser(std::string src) : lex(std::move(src)) {}

    // Throws ParseError on the first lex or syntax error.
    NodePtr parseProgram();

    void advance() {
        tok = lex.next();
        if (!lex.errors.empty()) throw ParseError(lex.errors.front());
    }

    void consume(TokenKind k, const char* what) {
        if (tok.kind != k) syntaxError(what);
        advance();
    }

    bool accept(TokenKind k) {
        if (tok.kind == k) { advance(); return true; }
        return false;
    }

    [[noreturn]] void syntaxError(const std::string& expected) const;
    [[noreturn]] void syntaxFailure(const std::string& detail) const;
    [[noreturn]] void tooDeep() const;

    // Expression parsing (Pratt); comparisons are not part of it.
    static int precedence(TokenKind k) {
        switch (k) {
            case TokenKind::Plus:
            case TokenKind::Minus: return 1;
            case TokenKind::Star:
            case TokenKind::Slash: return 2;
            default: return 0;
        }
    }

    static bool isComparison(TokenKind k) {
        switch (k) {
            case TokenKind::Equal: case TokenKind::NotEqual:
            case TokenKind::Less: case TokenKind::Greater:
            case TokenKind::LessEqual: case TokenKind::GreaterEqual:
                return true;
            default:
                return false;
        }
    }

    static bool startsExpression(TokenKind k) {
        switch (k) {
            case TokenKind::Number: case TokenKind::String: case TokenKind::Identifier:
            case TokenKind::True: case TokenKind::False: case TokenKind::LParen:
                return true;
            default:
                return false;
        }
    }

    NodePtr parsePrimary();
    NodePtr parseBinOpRHS(int exprPrec, NodePtr lhs);
    NodePtr parseExpression();
    NodePtr parseCondition();
    NodePtr parseCall(const std::string& name, int line);
    NodePtr parseListLiteral();

    // --- statements ---
    NodePtr parseStatement();
    NodePtr parseSuite();
    NodePtr parseAssignmentOrExpression();
    NodePtr parseIf();
    NodePtr parseFor();
    NodePtr parseWhile();
    NodePtr parsePrint();
};

ParseResult parse_program(const std::string& source);
