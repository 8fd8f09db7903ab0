//
//  lexer.h
//  minipy
//
#pragma once

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>
#include "env.h"
#include "token.h"

struct Lexer {
    std::string s;
    size_t i = 0;
    size_t tokenStart = 0;
    size_t tokenEnd = 0;
    int line = 1;

    // Every illegal character seen so far; the lexer skips it and keeps going.
    std::vector<Diagnostic> errors;

    explicit Lexer(std::string src) : s(std::move(src)), i(0) {}

    void skipSpace() {
        while (i < s.size()) {
            char c = s[i];
            if (c == '\n') { ++line; ++i; continue; }
            if (c == ' ' || c == '\t' || c == '\r') { ++i; continue; }
            break;
        }
    }

    void illegal(char c) {
        Diagnostic d;
        d.kind = DiagnosticKind::LexError;
        d.line = line;
        d.token = std::string(1, c);
        d.message = std::string("Illegal character '") + c + "' at line " + std::to_string(line);
        errors.push_back(std::move(d));
    }

    // Integers are 64-bit; a longer literal is an error, not a clamped value.
    void tooLarge(const std::string& lexeme) {
        Diagnostic d;
        d.kind = DiagnosticKind::LexError;
        d.line = line;
        d.token = lexeme;
        d.message = "Integer literal too large '" + lexeme + "' at line " + std::to_string(line);
        errors.push_back(std::move(d));
    }

    Token next() {
        while (true) {
            skipSpace();
            tokenStart = i;
            auto makeTok = [&](TokenKind k, const std::string& txt)->Token {
                tokenEnd = i;
                Token t;
                t.kind = k;
                t.text = txt;
                t.line = line;
                return t;
            };
            if (i >= s.size()) return makeTok(TokenKind::End, "");

            char c = s[i];

            // String literal, no raw newline inside
            if (c == '\"') {
                size_t j = i + 1;
                while (j < s.size() && s[j] != '\"' && s[j] != '\n') ++j;
                if (j >= s.size() || s[j] != '\"') {
                    illegal(c);
                    ++i;
                    continue;
                }
                std::string out = s.substr(i + 1, j - i - 1);
                i = j + 1;
                return makeTok(TokenKind::String, out);
            }

            // Number: digits, optionally '.' digits
            if (std::isdigit(static_cast<unsigned char>(c))) {
                size_t start = i;
                while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
                bool seenDot = false;
                if (i + 1 < s.size() && s[i] == '.' && std::isdigit(static_cast<unsigned char>(s[i+1]))) {
                    seenDot = true;
                    ++i;
                    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
                }
                std::string lexeme = s.substr(start, i - start);
                Token t = makeTok(TokenKind::Number, lexeme);
                t.isFloat = seenDot;
                if (seenDot) {
                    t.number = std::strtod(lexeme.c_str(), nullptr);
                } else {
                    errno = 0;
                    t.integer = std::strtoll(lexeme.c_str(), nullptr, 10);
                    if (errno == ERANGE) tooLarge(lexeme);
                }
                return t;
            }

            // Identifier or keyword
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                size_t start = i++;
                while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '_')) ++i;
                std::string ident = s.substr(start, i - start);
                const auto& kw = keyword_table();
                auto it = kw.find(ident);
                return makeTok(it != kw.end() ? it->second : TokenKind::Identifier, ident);
            }

            // Two-char comparison operators, ahead of their one-char prefixes
            if (i + 1 < s.size() && s[i+1] == '=') {
                if (c == '=') { i += 2; return makeTok(TokenKind::Equal, "=="); }
                if (c == '!') { i += 2; return makeTok(TokenKind::NotEqual, "!="); }
                if (c == '<') { i += 2; return makeTok(TokenKind::LessEqual, "<="); }
                if (c == '>') { i += 2; return makeTok(TokenKind::GreaterEqual, ">="); }
            }

            // Single char tokens
            ++i;
            switch (c) {
                case '+': return makeTok(TokenKind::Plus, "+");
                case '-': return makeTok(TokenKind::Minus, "-");
                case '*': return makeTok(TokenKind::Star, "*");
                case '/': return makeTok(TokenKind::Slash, "/");
                case '=': return makeTok(TokenKind::Assign, "=");
                case '<': return makeTok(TokenKind::Less, "<");
                case '>': return makeTok(TokenKind::Greater, ">");
                case '(': return makeTok(TokenKind::LParen, "(");
                case ')': return makeTok(TokenKind::RParen, ")");
                case '[': return makeTok(TokenKind::LBracket, "[");
                case ']': return makeTok(TokenKind::RBracket, "]");
                case ',': return makeTok(TokenKind::Comma, ",");
                case ':': return makeTok(TokenKind::Colon, ":");
                case ';': return makeTok(TokenKind::Semicolon, ";");
            }

            illegal(c);
        }
    }
};

struct TokenizeResult {
    std::vector<Token> tokens; // always ends with an End token
    std::vector<Diagnostic> diagnostics;
};

static inline TokenizeResult tokenize(const std::string& source) {
    Lexer lx(source);
    TokenizeResult r;
    while (true) {
        Token t = lx.next();
        bool end = (t.kind == TokenKind::End);
        r.tokens.push_back(std::move(t));
        if (end) break;
    }
    r.diagnostics = std::move(lx.errors);
    return r;
}
