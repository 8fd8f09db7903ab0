//
//  env.h
//  minipy
//

#pragma once

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// -------------------- Errors --------------------

enum class DiagnosticKind { LexError, SyntaxError };

// A parse-time failure. line is 0 when the parser ran out of input.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::SyntaxError;
    int line = 0;
    std::string message;
    std::string token;     // offending lexeme (SyntaxError) or character (LexError)
    std::string tokenKind; // SyntaxError only, e.g. "PRINT"
};

static inline const char* diagnostic_kind_name(DiagnosticKind k) {
    return k == DiagnosticKind::LexError ? "LexError" : "SyntaxError";
}

struct ParseError : public std::runtime_error {
    Diagnostic diagnostic;
    explicit ParseError(Diagnostic d) : std::runtime_error(d.message), diagnostic(std::move(d)) {}
};

enum class RuntimeErrorKind { NameError, TypeError, ZeroDivisionError, OverflowError, MemoryError };

static inline const char* runtime_error_kind_name(RuntimeErrorKind k) {
    switch (k) {
        case RuntimeErrorKind::NameError: return "NameError";
        case RuntimeErrorKind::TypeError: return "TypeError";
        case RuntimeErrorKind::ZeroDivisionError: return "ZeroDivisionError";
        case RuntimeErrorKind::OverflowError: return "OverflowError";
        case RuntimeErrorKind::MemoryError: return "MemoryError";
    }
    return "RuntimeError";
}

struct RuntimeError : public std::runtime_error {
    RuntimeErrorKind kind;
    RuntimeError(RuntimeErrorKind k, const std::string& msg) : std::runtime_error(msg), kind(k) {}
};

// "ZeroDivisionError: division by zero"
static inline std::string describe_error(const RuntimeError& e) {
    return std::string(runtime_error_kind_name(e.kind)) + ": " + e.what();
}

// -------------------- Values --------------------

// Shortest digits that read back to the same double. Fixed notation for
// decimal exponents in [-4, 16), exponent form ("1e+16", "1.5e-05") outside.
static inline std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    std::string sign;
    if (sci[0] == '-') { sign = "-"; sci.erase(0, 1); }
    size_t e = sci.find('e');
    int exp = std::atoi(sci.c_str() + e + 1);
    if (exp < -4 || exp >= 16) return sign + sci;

    std::string digits;
    for (size_t k = 0; k < e; ++k) {
        if (sci[k] != '.') digits.push_back(sci[k]);
    }

    std::string out;
    if (exp < 0) {
        out = "0." + std::string((size_t)(-exp - 1), '0') + digits;
    } else if (digits.size() <= (size_t)exp + 1) {
        out = digits + std::string((size_t)exp + 1 - digits.size(), '0') + ".0";
    } else {
        out = digits.substr(0, (size_t)exp + 1) + "." + digits.substr((size_t)exp + 1);
    }
    return sign + out;
}

static inline std::string quote_string(const std::string& s) {
    // Single quotes unless the text has a single quote and no double quote.
    char q = (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) ? '"' : '\'';
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back(q);
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == q) { out.push_back('\\'); out.push_back(c); }
        else if (c == '\t') out += "\\t";
        else out.push_back(c);
    }
    out.push_back(q);
    return out;
}

struct Value {
    using List = std::vector<Value>;

    std::variant<long long, double, bool, std::string, List> data;

    Value() : data(0LL) {}
    explicit Value(int i) : data(static_cast<long long>(i)) {}
    explicit Value(long long i) : data(i) {}
    explicit Value(double d) : data(d) {}
    explicit Value(bool b) : data(b) {}
    explicit Value(const char* s) : data(std::string(s)) {}
    explicit Value(const std::string& s) : data(s) {}
    explicit Value(List items) : data(std::move(items)) {}

    bool isInt() const { return std::holds_alternative<long long>(data); }
    bool isFloat() const { return std::holds_alternative<double>(data); }
    bool isBool() const { return std::holds_alternative<bool>(data); }
    bool isString() const { return std::holds_alternative<std::string>(data); }
    bool isList() const { return std::holds_alternative<List>(data); }

    // int, float and bool take part in arithmetic; bool counts as 0/1
    bool isNumeric() const { return isInt() || isFloat() || isBool(); }
    bool isIntegral() const { return isInt() || isBool(); }

    long long asInt() const {
        if (isBool()) return std::get<bool>(data) ? 1 : 0;
        if (isFloat()) return static_cast<long long>(std::get<double>(data));
        return std::get<long long>(data);
    }

    double asFloat() const {
        if (isFloat()) return std::get<double>(data);
        return static_cast<double>(asInt());
    }

    bool asBool() const { return std::get<bool>(data); }
    const std::string& asString() const { return std::get<std::string>(data); }
    const List& asList() const { return std::get<List>(data); }

    const char* typeName() const {
        if (isInt()) return "int";
        if (isFloat()) return "float";
        if (isBool()) return "bool";
        if (isString()) return "str";
        return "list";
    }

    bool truthy() const {
        if (isBool()) return asBool();
        if (isInt()) return asInt() != 0;
        if (isFloat()) return asFloat() != 0.0;
        if (isString()) return !asString().empty();
        return !asList().empty();
    }

    // Text written by print() and returned by str()
    std::string str() const {
        if (isString()) return asString();
        return repr();
    }

    // Text of a value nested inside a list: strings are quoted
    std::string repr() const {
        if (isInt()) return std::to_string(std::get<long long>(data));
        if (isFloat()) return format_float(std::get<double>(data));
        if (isBool()) return asBool() ? "True" : "False";
        if (isString()) return quote_string(asString());
        std::string out = "[";
        const List& items = asList();
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += items[i].repr();
        }
        out += "]";
        return out;
    }

    // Structural equality; numbers compare by value across int/float/bool.
    bool equals(const Value& o) const {
        if (isNumeric() && o.isNumeric()) {
            if (isIntegral() && o.isIntegral()) return asInt() == o.asInt();
            return asFloat() == o.asFloat();
        }
        if (isString() && o.isString()) return asString() == o.asString();
        if (isList() && o.isList()) {
            const List& a = asList();
            const List& b = o.asList();
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (!a[i].equals(b[i])) return false;
            }
            return true;
        }
        return false;
    }

    bool operator==(const Value& o) const { return equals(o); }
    bool operator!=(const Value& o) const { return !equals(o); }
};

// -------------------- Environment --------------------

struct Env {
    // One flat table for the whole run; no nested scopes.
    std::unordered_map<std::string, Value> vars;

    void clearVars() { vars.clear(); }

    bool hasVar(const std::string& name) const { return vars.find(name) != vars.end(); }

    const Value& getVar(const std::string& name) const {
        auto it = vars.find(name);
        if (it == vars.end()) throw RuntimeError(RuntimeErrorKind::NameError, "name '" + name + "' is not defined");
        return it->second;
    }

    void setVar(const std::string& name, const Value& v) { vars[name] = v; }

    // Sorted "name = repr" lines, for shells that show the table after a run.
    std::vector<std::string> dumpVars() const {
        std::vector<std::pair<std::string, std::string>> rows;
        rows.reserve(vars.size());
        for (const auto& [name, v] : vars) rows.emplace_back(name, v.repr());
        std::sort(rows.begin(), rows.end());
        std::vector<std::string> out;
        out.reserve(rows.size());
        for (const auto& [name, text] : rows) out.push_back(name + " = " + text);
        return out;
    }
};
