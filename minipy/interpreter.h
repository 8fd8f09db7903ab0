//
//  interpreter.h
//  minipy
//

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ast.h"
#include "env.h"

using Builtin = std::function<Value(const std::vector<Value>&)>;

// Tree-walking evaluator. Holds no state of its own besides the output buffer;
// variables live in the Env supplied by the caller.
struct Interpreter {
    Env& env;
    std::string output;

    // Called before every for/while iteration when set. Shells use it to break
    // runaway loops by throwing their own exception type.
    std::function<void()> onLoopIteration;

    explicit Interpreter(Env& e) : env(e) {}

    // Returns the value of an expression (or assignment), nothing for other statements.
    // Throws RuntimeError.
    std::optional<Value> evaluate(const Node& node);

    // Like evaluate, but the node must produce a value.
    Value evaluateValue(const Node& node);

    static Value applyOp(const Value& a, const std::string& op, const Value& b);
    static Value callFunction(const std::string& name, const std::vector<Value>& args);
    static bool isFunction(const std::string& name);
};

struct RunResult {
    std::string output; // everything printed, including before a failure
    std::optional<RuntimeError> error;
    std::optional<Value> value; // value of the last top-level statement, if it has one

    bool ok() const { return !error.has_value(); }
};

// Runs a parsed program against a fresh environment.
RunResult run_program(const Node& ast);

// Runs against a caller-owned environment; bindings made before a failure stay in env.
RunResult run_program(const Node& ast, Env& env, std::function<void()> onLoopIteration = {});
