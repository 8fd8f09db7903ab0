//
//  interpreter.cpp
//  minipy
//

#include "interpreter.h"

#include <algorithm>
#include <new>
#include <unordered_map>
#include <utility>

namespace {

[[noreturn]] void type_error(const std::string& msg) {
    throw RuntimeError(RuntimeErrorKind::TypeError, msg);
}

[[noreturn]] void unsupported(const std::string& op, const Value& a, const Value& b) {
    type_error("unsupported operand type(s) for " + op + ": '" + a.typeName() + "' and '" + b.typeName() + "'");
}

const std::unordered_map<std::string, Builtin>& builtin_table() {
    static const std::unordered_map<std::string, Builtin> fn = {
        {"str", [](const std::vector<Value>& args) -> Value {
            if (args.size() != 1) {
                type_error("str() takes exactly one argument (" + std::to_string(args.size()) + " given)");
            }
            return Value(args[0].str());
        }},
    };
    return fn;
}

// int op int stays int; anything involving a float is float.
Value numeric(const Value& a, char op, const Value& b) {
    if (a.isIntegral() && b.isIntegral()) {
        long long x = a.asInt();
        long long y = b.asInt();
        long long r = 0;
        bool overflow = false;
        switch (op) {
            case '+': overflow = __builtin_add_overflow(x, y, &r); break;
            case '-': overflow = __builtin_sub_overflow(x, y, &r); break;
            default: overflow = __builtin_mul_overflow(x, y, &r); break;
        }
        if (overflow) {
            throw RuntimeError(RuntimeErrorKind::OverflowError,
                               std::string("integer result of '") + op + "' does not fit in 64 bits");
        }
        return Value(r);
    }
    double x = a.asFloat();
    double y = b.asFloat();
    switch (op) {
        case '+': return Value(x + y);
        case '-': return Value(x - y);
        default: return Value(x * y);
    }
}

[[noreturn]] void too_long() {
    throw RuntimeError(RuntimeErrorKind::MemoryError, "repeated sequence is too long");
}

Value repeat(const Value& seq, long long count) {
    if (count <= 0) return seq.isString() ? Value(std::string()) : Value(Value::List{});
    size_t n = seq.isString() ? seq.asString().size() : seq.asList().size();
    size_t limit = seq.isString() ? std::string().max_size() : Value::List().max_size();
    if (n == 0) return seq;
    if ((unsigned long long)count > limit / n) too_long();

    if (seq.isString()) {
        std::string out;
        out.reserve(n * (size_t)count);
        for (long long i = 0; i < count; ++i) out += seq.asString();
        return Value(out);
    }
    Value::List out;
    out.reserve(n * (size_t)count);
    for (long long i = 0; i < count; ++i) {
        out.insert(out.end(), seq.asList().begin(), seq.asList().end());
    }
    return Value(std::move(out));
}

// <0, 0, >0 for the orderable pairs; TypeError otherwise.
int compare(const Value& a, const std::string& op, const Value& b) {
    if (a.isNumeric() && b.isNumeric()) {
        if (a.isIntegral() && b.isIntegral()) {
            long long x = a.asInt(), y = b.asInt();
            return (x < y) ? -1 : ((x > y) ? 1 : 0);
        }
        double x = a.asFloat(), y = b.asFloat();
        return (x < y) ? -1 : ((x > y) ? 1 : 0);
    }
    if (a.isString() && b.isString()) {
        int c = a.asString().compare(b.asString());
        return (c < 0) ? -1 : ((c > 0) ? 1 : 0);
    }
    if (a.isList() && b.isList()) {
        const Value::List& x = a.asList();
        const Value::List& y = b.asList();
        size_t n = std::min(x.size(), y.size());
        for (size_t i = 0; i < n; ++i) {
            if (!x[i].equals(y[i])) return compare(x[i], op, y[i]);
        }
        return (x.size() < y.size()) ? -1 : ((x.size() > y.size()) ? 1 : 0);
    }
    type_error("'" + op + "' not supported between instances of '" + a.typeName() + "' and '" + b.typeName() + "'");
}

long long range_bound(const Value& v) {
    if (!v.isIntegral()) type_error(std::string("'") + v.typeName() + "' object cannot be interpreted as an integer");
    return v.asInt();
}

struct Evaluator {
    Interpreter& in;

    std::optional<Value> operator()(const BlockNode& n) {
        for (const auto& s : n.statements) in.evaluate(*s);
        return std::nullopt;
    }

    std::optional<Value> operator()(const BinOpNode& n) {
        Value lhs = in.evaluateValue(*n.left);
        Value rhs = in.evaluateValue(*n.right);
        return Interpreter::applyOp(lhs, n.op, rhs);
    }

    std::optional<Value> operator()(const NumberNode& n) {
        if (n.isFloat) return Value(n.number);
        return Value(n.integer);
    }

    std::optional<Value> operator()(const BooleanNode& n) { return Value(n.value); }
    std::optional<Value> operator()(const StringNode& n) { return Value(n.value); }
    std::optional<Value> operator()(const VariableNode& n) { return in.env.getVar(n.name); }

    std::optional<Value> operator()(const AssignmentNode& n) {
        Value v = in.evaluateValue(*n.value);
        in.env.setVar(n.target.name, v);
        return v;
    }

    std::optional<Value> operator()(const ListNode& n) {
        Value::List items;
        items.reserve(n.items.size());
        for (const auto& item : n.items) items.push_back(in.evaluateValue(*item));
        return Value(std::move(items));
    }

    std::optional<Value> operator()(const IfNode& n) {
        if (in.evaluateValue(*n.condition).truthy()) in.evaluate(*n.thenBody);
        else if (n.elseBody) in.evaluate(*n.elseBody);
        return std::nullopt;
    }

    std::optional<Value> operator()(const ForNode& n) {
        long long start = range_bound(in.evaluateValue(*n.start));
        long long end = range_bound(in.evaluateValue(*n.end));
        for (long long i = start; i < end; ++i) {
            if (in.onLoopIteration) in.onLoopIteration();
            in.env.setVar(n.iterator.name, Value(i));
            in.evaluate(*n.body);
        }
        return std::nullopt;
    }

    std::optional<Value> operator()(const WhileNode& n) {
        while (in.evaluateValue(*n.condition).truthy()) {
            if (in.onLoopIteration) in.onLoopIteration();
            in.evaluate(*n.body);
        }
        return std::nullopt;
    }

    std::optional<Value> operator()(const PrintNode& n) {
        in.output += in.evaluateValue(*n.expr).str();
        in.output.push_back('\n');
        return std::nullopt;
    }

    std::optional<Value> operator()(const FunctionCallNode& n) {
        // Name first, then arguments left to right.
        if (!Interpreter::isFunction(n.name.name)) {
            throw RuntimeError(RuntimeErrorKind::NameError, "name '" + n.name.name + "' is not defined");
        }
        std::vector<Value> args;
        args.reserve(n.args.size());
        for (const auto& a : n.args) args.push_back(in.evaluateValue(*a));
        return Interpreter::callFunction(n.name.name, args);
    }
};

} // namespace

std::optional<Value> Interpreter::evaluate(const Node& node) {
    return std::visit(Evaluator{*this}, node.kind);
}

Value Interpreter::evaluateValue(const Node& node) {
    std::optional<Value> v = evaluate(node);
    if (!v) type_error("statement used where a value is required (line " + std::to_string(node.line) + ")");
    return std::move(*v);
}

bool Interpreter::isFunction(const std::string& name) {
    return builtin_table().count(name) != 0;
}

Value Interpreter::callFunction(const std::string& name, const std::vector<Value>& args) {
    const auto& fn = builtin_table();
    auto it = fn.find(name);
    if (it == fn.end()) throw RuntimeError(RuntimeErrorKind::NameError, "name '" + name + "' is not defined");
    return it->second(args);
}

Value Interpreter::applyOp(const Value& a, const std::string& op, const Value& b) {
    if (op == "+") {
        if (a.isString() && b.isString()) return Value(a.asString() + b.asString());
        if (a.isList() && b.isList()) {
            Value::List out = a.asList();
            out.insert(out.end(), b.asList().begin(), b.asList().end());
            return Value(std::move(out));
        }
        if (a.isNumeric() && b.isNumeric()) return numeric(a, '+', b);
        unsupported(op, a, b);
    }
    if (op == "-") {
        if (a.isNumeric() && b.isNumeric()) return numeric(a, '-', b);
        unsupported(op, a, b);
    }
    if (op == "*") {
        if (a.isNumeric() && b.isNumeric()) return numeric(a, '*', b);
        if ((a.isString() || a.isList()) && b.isIntegral()) return repeat(a, b.asInt());
        if (a.isIntegral() && (b.isString() || b.isList())) return repeat(b, a.asInt());
        unsupported(op, a, b);
    }
    if (op == "/") {
        if (!a.isNumeric() || !b.isNumeric()) unsupported(op, a, b);
        double denom = b.asFloat();
        if (denom == 0.0) throw RuntimeError(RuntimeErrorKind::ZeroDivisionError, "division by zero");
        return Value(a.asFloat() / denom);
    }

    if (op == "==") return Value(a.equals(b));
    if (op == "!=") return Value(!a.equals(b));

    int rel = compare(a, op, b);
    if (op == "<") return Value(rel < 0);
    if (op == "<=") return Value(rel <= 0);
    if (op == ">") return Value(rel > 0);
    if (op == ">=") return Value(rel >= 0);

    type_error("unknown operator '" + op + "'");
}

RunResult run_program(const Node& ast) {
    Env env;
    return run_program(ast, env);
}

RunResult run_program(const Node& ast, Env& env, std::function<void()> onLoopIteration) {
    Interpreter interp(env);
    interp.onLoopIteration = std::move(onLoopIteration);
    RunResult r;
    try {
        if (const auto* block = std::get_if<BlockNode>(&ast.kind)) {
            for (const auto& s : block->statements) r.value = interp.evaluate(*s);
        } else {
            r.value = interp.evaluate(ast);
        }
    } catch (const RuntimeError& e) {
        r.error = e;
    } catch (const std::bad_alloc&) {
        r.error = RuntimeError(RuntimeErrorKind::MemoryError, "out of memory");
    }
    r.output = std::move(interp.output);
    return r;
}
