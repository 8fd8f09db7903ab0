//
//  printer_test.cpp
//  minipy
//

#include <gtest/gtest.h>

#include <string>
#include "minipy/parser.h"
#include "minipy/printer.h"

namespace {

std::string render(const std::string& src) {
    ParseResult r = parse_program(src);
    EXPECT_TRUE(r.ok()) << (r.diagnostic ? r.diagnostic->message : "");
    return r.ok() ? render_ast(*r.ast) : std::string();
}

} // namespace

TEST(Printer, Assignment) {
    EXPECT_EQ(render("x = 42"),
              "Block:\n"
              "  Assignment:\n"
              "    Variable(x)\n"
              "    Number(42)\n");
}

TEST(Printer, BinOpPrecedence) {
    EXPECT_EQ(render("3 + 5 * 2"),
              "Block:\n"
              "  BinOp(op='+')\n"
              "    Number(3)\n"
              "    BinOp(op='*')\n"
              "      Number(5)\n"
              "      Number(2)\n");
}

TEST(Printer, FloatsKeepFraction) {
    EXPECT_EQ(render("2.0 / 0.1"),
              "Block:\n"
              "  BinOp(op='/')\n"
              "    Number(2.0)\n"
              "    Number(0.1)\n");
}

TEST(Printer, ListWithLiterals) {
    EXPECT_EQ(render("y = [1, True, \"a\"]"),
              "Block:\n"
              "  Assignment:\n"
              "    Variable(y)\n"
              "    List:\n"
              "      Number(1)\n"
              "      Boolean(True)\n"
              "      String(a)\n");
}

TEST(Printer, IfWithElse) {
    EXPECT_EQ(render("if x == 5: y = 10 else: y = 20"),
              "Block:\n"
              "  If:\n"
              "    Condition:\n"
              "      BinOp(op='==')\n"
              "        Variable(x)\n"
              "        Number(5)\n"
              "    Body:\n"
              "      Assignment:\n"
              "        Variable(y)\n"
              "        Number(10)\n"
              "    Else:\n"
              "      Assignment:\n"
              "        Variable(y)\n"
              "        Number(20)\n");
}

TEST(Printer, IfWithoutElseHasNoElseSection) {
    std::string out = render("if x < 1: print(x)");
    EXPECT_EQ(out.find("Else:"), std::string::npos);
}

TEST(Printer, ForLoop) {
    EXPECT_EQ(render("for i in range(1, 5): print(i)"),
              "Block:\n"
              "  For:\n"
              "    Iterator: i\n"
              "    Range Start:\n"
              "      Number(1)\n"
              "    Range End:\n"
              "      Number(5)\n"
              "    Body:\n"
              "      Print:\n"
              "        Variable(i)\n");
}

TEST(Printer, WhileWithBlockBody) {
    EXPECT_EQ(render("while x > 8: print(str(x)); x = x - 1"),
              "Block:\n"
              "  While:\n"
              "    Condition:\n"
              "      BinOp(op='>')\n"
              "        Variable(x)\n"
              "        Number(8)\n"
              "    Body:\n"
              "      Block:\n"
              "        Print:\n"
              "          FunctionCall(str)\n"
              "            Args:\n"
              "              Variable(x)\n"
              "        Assignment:\n"
              "          Variable(x)\n"
              "          BinOp(op='-')\n"
              "            Variable(x)\n"
              "            Number(1)\n");
}

TEST(Printer, BooleanFalse) {
    EXPECT_EQ(render("b = False"),
              "Block:\n"
              "  Assignment:\n"
              "    Variable(b)\n"
              "    Boolean(False)\n");
}
