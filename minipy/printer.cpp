//
//  printer.cpp
//  minipy
//

#include "printer.h"

#include "env.h"

namespace {

struct AstPrinter {
    std::string out;
    int depth = 0;

    void line(const std::string& text) {
        out.append(static_cast<size_t>(depth) * 2, ' ');
        out += text;
        out.push_back('\n');
    }

    void print(const Node& n) { std::visit(*this, n.kind); }

    // Prints a child two levels deep under a label one level deep.
    void section(const char* label, const Node& child) {
        ++depth;
        line(label);
        ++depth;
        print(child);
        depth -= 2;
    }

    void operator()(const BlockNode& n) {
        line("Block:");
        ++depth;
        for (const auto& s : n.statements) print(*s);
        --depth;
    }

    void operator()(const BinOpNode& n) {
        line("BinOp(op='" + n.op + "')");
        ++depth;
        print(*n.left);
        print(*n.right);
        --depth;
    }

    void operator()(const NumberNode& n) {
        line("Number(" + (n.isFloat ? format_float(n.number) : std::to_string(n.integer)) + ")");
    }

    void operator()(const BooleanNode& n) { line(n.value ? "Boolean(True)" : "Boolean(False)"); }
    void operator()(const StringNode& n) { line("String(" + n.value + ")"); }
    void operator()(const VariableNode& n) { line("Variable(" + n.name + ")"); }

    void operator()(const AssignmentNode& n) {
        line("Assignment:");
        ++depth;
        (*this)(n.target);
        print(*n.value);
        --depth;
    }

    void operator()(const ListNode& n) {
        line("List:");
        ++depth;
        for (const auto& item : n.items) print(*item);
        --depth;
    }

    void operator()(const IfNode& n) {
        line("If:");
        section("Condition:", *n.condition);
        section("Body:", *n.thenBody);
        if (n.elseBody) section("Else:", *n.elseBody);
    }

    void operator()(const ForNode& n) {
        line("For:");
        ++depth;
        line("Iterator: " + n.iterator.name);
        --depth;
        section("Range Start:", *n.start);
        section("Range End:", *n.end);
        section("Body:", *n.body);
    }

    void operator()(const WhileNode& n) {
        line("While:");
        section("Condition:", *n.condition);
        section("Body:", *n.body);
    }

    void operator()(const PrintNode& n) {
        line("Print:");
        ++depth;
        print(*n.expr);
        --depth;
    }

    void operator()(const FunctionCallNode& n) {
        line("FunctionCall(" + n.name.name + ")");
        ++depth;
        line("Args:");
        ++depth;
        for (const auto& a : n.args) print(*a);
        depth -= 2;
    }
};

} // namespace

std::string render_ast(const Node& node) {
    AstPrinter p;
    p.print(node);
    return p.out;
}
