//
//  ast.h
//  minipy
//

#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct BlockNode {
    std::vector<NodePtr> statements; // never empty when built by the parser
};

struct BinOpNode {
    NodePtr left;
    std::string op; // "+", "-", "*", "/", "==", "!=", "<", ">", "<=", ">="
    NodePtr right;
};

struct NumberNode {
    bool isFloat = false;
    long long integer = 0;
    double number = 0.0;
};

struct BooleanNode {
    bool value = false;
};

struct StringNode {
    std::string value;
};

struct VariableNode {
    std::string name;
};

struct AssignmentNode {
    VariableNode target;
    NodePtr value;
};

struct ListNode {
    std::vector<NodePtr> items;
};

struct IfNode {
    NodePtr condition;
    NodePtr thenBody;
    NodePtr elseBody; // null when there is no else
};

// for <iterator> in range(<start>, <end>): <body>, end exclusive
struct ForNode {
    VariableNode iterator;
    NodePtr start;
    NodePtr end;
    NodePtr body;
};

struct WhileNode {
    NodePtr condition;
    NodePtr body;
};

struct PrintNode {
    NodePtr expr;
};

struct FunctionCallNode {
    VariableNode name;
    std::vector<NodePtr> args;
};

struct Node {
    std::variant<BlockNode, BinOpNode, NumberNode, BooleanNode, StringNode, VariableNode,
                 AssignmentNode, ListNode, IfNode, ForNode, WhileNode, PrintNode, FunctionCallNode> kind;
    int line = 0;
    int depth = 1; // height of the subtree rooted here

    template <class T>
    Node(T k, int ln);
};

// Deepest direct child; children are complete when their parent is built.
struct ChildDepth {
    static int of(const NodePtr& p) { return p ? p->depth : 0; }
    static int of(const std::vector<NodePtr>& v) {
        int d = 0;
        for (const auto& p : v) d = std::max(d, of(p));
        return d;
    }

    int operator()(const BlockNode& n) const { return of(n.statements); }
    int operator()(const BinOpNode& n) const { return std::max(of(n.left), of(n.right)); }
    int operator()(const NumberNode&) const { return 0; }
    int operator()(const BooleanNode&) const { return 0; }
    int operator()(const StringNode&) const { return 0; }
    int operator()(const VariableNode&) const { return 0; }
    int operator()(const AssignmentNode& n) const { return of(n.value); }
    int operator()(const ListNode& n) const { return of(n.items); }
    int operator()(const IfNode& n) const {
        return std::max({of(n.condition), of(n.thenBody), of(n.elseBody)});
    }
    int operator()(const ForNode& n) const { return std::max({of(n.start), of(n.end), of(n.body)}); }
    int operator()(const WhileNode& n) const { return std::max(of(n.condition), of(n.body)); }
    int operator()(const PrintNode& n) const { return of(n.expr); }
    int operator()(const FunctionCallNode& n) const { return of(n.args); }
};

template <class T>
Node::Node(T k, int ln) : kind(std::move(k)), line(ln) {
    depth = 1 + std::visit(ChildDepth{}, kind);
}

template <class T>
static inline NodePtr make_node(T k, int line) {
    return std::make_unique<Node>(std::move(k), line);
}
