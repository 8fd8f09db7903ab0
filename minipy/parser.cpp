//
//  parser.cpp
//  minipy
//

#include "parser.h"

#include <utility>

void Parser::syntaxError(const std::string& expected) const {
    syntaxFailure("expected " + expected);
}

void Parser::tooDeep() const {
    syntaxFailure("nesting deeper than " + std::to_string(kMaxNesting) + " levels");
}

void Parser::syntaxFailure(const std::string& detail) const {
    Diagnostic d;
    d.kind = DiagnosticKind::SyntaxError;
    d.tokenKind = token_kind_name(tok.kind);
    if (tok.kind == TokenKind::End) {
        d.line = 0;
        d.message = "Syntax error at end of input: " + detail;
    } else {
        d.line = tok.line;
        d.token = tok.text;
        d.message = "Syntax error at line " + std::to_string(tok.line) + ", token='" + tok.text +
                    "' (type='" + d.tokenKind + "'): " + detail;
    }
    throw ParseError(std::move(d));
}

// -------------------- Expressions --------------------

NodePtr Parser::parsePrimary() {
    int line = tok.line;
    if (tok.kind == TokenKind::Number) {
        NumberNode n;
        n.isFloat = tok.isFloat;
        n.integer = tok.integer;
        n.number = tok.number;
        advance();
        return make_node(n, line);
    }
    if (tok.kind == TokenKind::String) {
        std::string s = tok.text;
        advance();
        return make_node(StringNode{s}, line);
    }
    if (tok.kind == TokenKind::True || tok.kind == TokenKind::False) {
        bool b = (tok.kind == TokenKind::True);
        advance();
        return make_node(BooleanNode{b}, line);
    }
    if (tok.kind == TokenKind::Identifier) {
        std::string name = tok.text;
        advance();
        if (tok.kind == TokenKind::LParen) return parseCall(name, line);
        return make_node(VariableNode{name}, line);
    }
    if (tok.kind == TokenKind::LParen) {
        advance();
        NodePtr inner = parseExpression();
        consume(TokenKind::RParen, "')'");
        return inner;
    }
    syntaxError("expression");
}

NodePtr Parser::parseBinOpRHS(int exprPrec, NodePtr lhs) {
    while (true) {
        int tokPrec = precedence(tok.kind);
        if (tokPrec < exprPrec || tokPrec == 0) return lhs;

        std::string op = tok.text;
        int line = lhs->line;
        advance();

        NodePtr rhs = parsePrimary();

        int nextPrec = precedence(tok.kind);
        if (tokPrec < nextPrec) {
            rhs = parseBinOpRHS(tokPrec + 1, std::move(rhs));
        }

        lhs = make_node(BinOpNode{std::move(lhs), op, std::move(rhs)}, line);
        if (lhs->depth > kMaxNesting) tooDeep();
    }
}

NodePtr Parser::parseExpression() {
    NestingGuard guard(*this);
    NodePtr lhs = parsePrimary();
    return parseBinOpRHS(1, std::move(lhs));
}

NodePtr Parser::parseCondition() {
    NodePtr lhs = parseExpression();
    if (!isComparison(tok.kind)) syntaxError("comparison operator");
    std::string op = tok.text;
    int line = lhs->line;
    advance();
    NodePtr rhs = parseExpression();
    return make_node(BinOpNode{std::move(lhs), op, std::move(rhs)}, line);
}

// name '(' [expr {',' expr}] ')', with tok sitting on '('
NodePtr Parser::parseCall(const std::string& name, int line) {
    FunctionCallNode call;
    call.name = VariableNode{name};
    consume(TokenKind::LParen, "'('");
    if (tok.kind != TokenKind::RParen) {
        while (true) {
            call.args.push_back(parseExpression());
            if (accept(TokenKind::Comma)) continue;
            break;
        }
    }
    consume(TokenKind::RParen, "')'");
    return make_node(std::move(call), line);
}

NodePtr Parser::parseListLiteral() {
    int line = tok.line;
    ListNode list;
    consume(TokenKind::LBracket, "'['");
    if (tok.kind != TokenKind::RBracket) {
        while (true) {
            list.items.push_back(parseExpression());
            if (accept(TokenKind::Comma)) continue;
            break;
        }
    }
    consume(TokenKind::RBracket, "']'");
    return make_node(std::move(list), line);
}

// -------------------- Statements --------------------

NodePtr Parser::parseStatement() {
    NestingGuard guard(*this);
    switch (tok.kind) {
        case TokenKind::KW_IF: return parseIf();
        case TokenKind::KW_FOR: return parseFor();
        case TokenKind::KW_WHILE: return parseWhile();
        case TokenKind::KW_PRINT: return parsePrint();
        case TokenKind::Identifier: return parseAssignmentOrExpression();
        default:
            break;
    }
    if (!startsExpression(tok.kind)) syntaxError("statement");
    return parseExpression();
}

// A body takes every following ';'-joined statement; more than one becomes a Block.
NodePtr Parser::parseSuite() {
    int line = tok.line;
    NodePtr first = parseStatement();
    if (tok.kind != TokenKind::Semicolon) return first;

    BlockNode block;
    block.statements.push_back(std::move(first));
    while (accept(TokenKind::Semicolon)) {
        block.statements.push_back(parseStatement());
    }
    return make_node(std::move(block), line);
}

NodePtr Parser::parseAssignmentOrExpression() {
    std::string name = tok.text;
    int line = tok.line;
    advance();

    if (accept(TokenKind::Assign)) {
        AssignmentNode a;
        a.target = VariableNode{name};
        a.value = (tok.kind == TokenKind::LBracket) ? parseListLiteral() : parseExpression();
        return make_node(std::move(a), line);
    }

    NodePtr lhs = (tok.kind == TokenKind::LParen) ? parseCall(name, line)
                                                  : make_node(VariableNode{name}, line);
    return parseBinOpRHS(1, std::move(lhs));
}

NodePtr Parser::parseIf() {
    int line = tok.line;
    advance();
    IfNode n;
    n.condition = parseCondition();
    consume(TokenKind::Colon, "':'");
    n.thenBody = parseSuite();
    // else pairs with the innermost if still open
    if (accept(TokenKind::KW_ELSE)) {
        consume(TokenKind::Colon, "':'");
        n.elseBody = parseSuite();
    }
    return make_node(std::move(n), line);
}

NodePtr Parser::parseFor() {
    int line = tok.line;
    advance();
    if (tok.kind != TokenKind::Identifier) syntaxError("loop variable");
    ForNode n;
    n.iterator = VariableNode{tok.text};
    advance();
    consume(TokenKind::KW_IN, "'in'");
    consume(TokenKind::KW_RANGE, "'range'");
    consume(TokenKind::LParen, "'('");
    n.start = parseExpression();
    consume(TokenKind::Comma, "','");
    n.end = parseExpression();
    consume(TokenKind::RParen, "')'");
    consume(TokenKind::Colon, "':'");
    n.body = parseSuite();
    return make_node(std::move(n), line);
}

NodePtr Parser::parseWhile() {
    int line = tok.line;
    advance();
    WhileNode n;
    n.condition = parseCondition();
    consume(TokenKind::Colon, "':'");
    n.body = parseSuite();
    return make_node(std::move(n), line);
}

NodePtr Parser::parsePrint() {
    int line = tok.line;
    advance();
    consume(TokenKind::LParen, "'('");
    PrintNode n;
    n.expr = parseExpression();
    consume(TokenKind::RParen, "')'");
    return make_node(std::move(n), line);
}

NodePtr Parser::parseProgram() {
    advance();
    int line = tok.line;
    BlockNode block;
    block.statements.push_back(parseStatement());
    while (accept(TokenKind::Semicolon)) {
        block.statements.push_back(parseStatement());
    }
    if (tok.kind != TokenKind::End) syntaxError("';' or end of input");
    return make_node(std::move(block), line);
}

ParseResult parse_program(const std::string& source) {
    ParseResult r;
    Parser p(source);
    try {
        r.ast = p.parseProgram();
    } catch (const ParseError& e) {
        r.diagnostic = e.diagnostic;
    }
    return r;
}
