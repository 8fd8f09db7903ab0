//
//  token.h
//  minipy
//

#pragma once

#include <string>
#include <unordered_map>

enum class TokenKind {
    End,
    Number,
    String,
    Identifier,
    // literals spelled as keywords
    True, False,
    // operators
    Plus, Minus, Star, Slash,
    Assign,
    Equal, NotEqual, Less, Greater, LessEqual, GreaterEqual,
    // delimiters
    LParen, RParen, LBracket, RBracket, Comma, Colon, Semicolon,
    // keywords
    KW_FOR, KW_IN, KW_RANGE, KW_WHILE, KW_IF, KW_ELSE, KW_PRINT
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;     // lexeme as written (string literals without quotes)
    long long integer = 0;
    double number = 0.0;
    bool isFloat = false; // Number only: literal had a decimal point
    int line = 1;
};

static inline const char* token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::End: return "END";
        case TokenKind::Number: return "NUMBER";
        case TokenKind::String: return "STRING";
        case TokenKind::Identifier: return "IDENTIFIER";
        case TokenKind::True: return "TRUE";
        case TokenKind::False: return "FALSE";
        case TokenKind::Plus: return "PLUS";
        case TokenKind::Minus: return "MINUS";
        case TokenKind::Star: return "TIMES";
        case TokenKind::Slash: return "DIVIDE";
        case TokenKind::Assign: return "ASSIGN";
        case TokenKind::Equal: return "EQUALS";
        case TokenKind::NotEqual: return "NE";
        case TokenKind::Less: return "LT";
        case TokenKind::Greater: return "GT";
        case TokenKind::LessEqual: return "LE";
        case TokenKind::GreaterEqual: return "GE";
        case TokenKind::LParen: return "LPAREN";
        case TokenKind::RParen: return "RPAREN";
        case TokenKind::LBracket: return "LBRACKET";
        case TokenKind::RBracket: return "RBRACKET";
        case TokenKind::Comma: return "COMMA";
        case TokenKind::Colon: return "COLON";
        case TokenKind::Semicolon: return "SEMICOLON";
        case TokenKind::KW_FOR: return "FOR";
        case TokenKind::KW_IN: return "IN";
        case TokenKind::KW_RANGE: return "RANGE";
        case TokenKind::KW_WHILE: return "WHILE";
        case TokenKind::KW_IF: return "IF";
        case TokenKind::KW_ELSE: return "ELSE";
        case TokenKind::KW_PRINT: return "PRINT";
    }
    return "?";
}

// Keywords are case-sensitive: "For" is an identifier.
static inline const std::unordered_map<std::string, TokenKind>& keyword_table() {
    static const std::unordered_map<std::string, TokenKind> kw = {
        {"for", TokenKind::KW_FOR}, {"in", TokenKind::KW_IN}, {"range", TokenKind::KW_RANGE},
        {"while", TokenKind::KW_WHILE}, {"if", TokenKind::KW_IF}, {"else", TokenKind::KW_ELSE},
        {"print", TokenKind::KW_PRINT}, {"True", TokenKind::True}, {"False", TokenKind::False}
    };
    return kw;
}

static inline bool is_keyword(TokenKind k) {
    switch (k) {
        case TokenKind::KW_FOR: case TokenKind::KW_IN: case TokenKind::KW_RANGE:
        case TokenKind::KW_WHILE: case TokenKind::KW_IF: case TokenKind::KW_ELSE:
        case TokenKind::KW_PRINT: case TokenKind::True: case TokenKind::False:
            return true;
        default:
            return false;
    }
}
