//
//  menu.cpp
//  minipy
//

#include "menu.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include "editor.h"
#include "interpreter.h"
#include "parser.h"
#include "printer.h"
#include "strutil.h"

namespace {

std::atomic<bool> g_sigint_requested{false};

void minipy_sigint_handler(int) {
    g_sigint_requested.store(true, std::memory_order_relaxed);
}

// Ctrl+C stops the running program instead of the process while installed.
struct SigintGuard {
    using Handler = void (*)(int);
    Handler previous;

    SigintGuard() {
        g_sigint_requested.store(false, std::memory_order_relaxed);
        previous = std::signal(SIGINT, minipy_sigint_handler);
    }
    ~SigintGuard() { std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous); }
};

void break_on_sigint() {
    if (g_sigint_requested.exchange(false, std::memory_order_relaxed)) throw BreakRequested();
}

const char* const kBanner = "==================== RESULT ====================";
const char* const kFooter = "================================================";

struct Choice {
    const char* key;
    const char* label;
    const char* prompt;
};

const Choice kChoices[] = {
    {"1", "Arithmetic Expression (e.g., 3 + 5 * 2)", "Enter arithmetic expression: "},
    {"2", "List Declaration (e.g., myList = [1, 2, 3])", "Enter list declaration: "},
    {"3", "For Loop (e.g., for i in range(1, 5): print(i))", "Enter for loop: "},
    {"4", "While Loop (e.g., while x < 5: x = x + 1)", "Enter while loop: "},
    {"5", "If Statement (e.g., if x == 5: y = 10 else: y = 20)", "Enter if statement: "},
    {"6", "Simple Assignment (e.g., x = 42)", "Enter simple assignment: "},
    {"7", "General Statement (anything built from the above)", "Enter any statement: "},
};

} // namespace

std::optional<std::string> check_construct(const std::string& choice, const std::string& input) {
    if (choice == "1" && !contains_any(input, {"+", "-", "*", "/"}))
        return std::string("Invalid arithmetic expression. Must contain operators (+,-,*,/)");
    if (choice == "2" && !contains_all(input, {"=", "[", "]"}))
        return std::string("Invalid list declaration. Format: name = [items]");
    if (choice == "3" && !contains_all(input, {"for", "in", "range", ":", "("}))
        return std::string("Invalid for loop. Format: for var in range(start, end): statement");
    if (choice == "4" && !contains_all(input, {"while", ":"}))
        return std::string("Invalid while loop. Format: while condition: statement");
    if (choice == "5" && !contains_all(input, {"if", ":"}))
        return std::string("Invalid if statement. Format: if condition: statement [else: statement]");
    if (choice == "6" && !contains_all(input, {"="}))
        return std::string("Invalid assignment. Format: variable = value");
    return std::nullopt;
}

std::string run_and_report(const std::string& source, Env& env, std::function<void()> onLoopIteration) {
    std::ostringstream out;
    out << "\n" << kBanner << "\n";
    out << "Input: " << source << "\n\n";

    ParseResult parsed = parse_program(source);
    if (!parsed.ok()) {
        out << "--- Output ---\n";
        out << parsed.diagnostic->message << "\n";
        out << "Failed to parse: " << diagnostic_kind_name(parsed.diagnostic->kind) << "\n";
        out << kFooter << "\n";
        return out.str();
    }

    out << "--- Abstract Syntax Tree (AST) ---\n";
    out << render_ast(*parsed.ast);

    try {
        RunResult r = run_program(*parsed.ast, env, std::move(onLoopIteration));
        if (!r.output.empty()) {
            out << "\n--- Program Output ---\n" << r.output;
        }
        if (r.error) {
            out << "\n--- Runtime Error ---\n" << describe_error(*r.error) << "\n";
        } else if (r.value) {
            out << "\n--- Evaluation Result ---\n";
            out << "Output: " << r.value->str() << "\n";
            out << "Type: " << r.value->typeName() << "\n";
        }
    } catch (const BreakRequested& e) {
        out << "\n" << e.what() << "\n";
    }
    out << kFooter << "\n";
    return out.str();
}

bool load_source_file(const std::string& filename, std::string& out) {
    std::ifstream in(filename);
    if (!in) {
        std::cout << "Cannot open file for reading: " << filename << "\n";
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int run_file(const std::string& filename, bool showAst) {
    std::string source;
    if (!load_source_file(filename, source)) return EXIT_FAILURE;

    ParseResult parsed = parse_program(source);
    if (!parsed.ok()) {
        std::cout << parsed.diagnostic->message << "\n";
        return EXIT_FAILURE;
    }
    if (showAst) std::cout << render_ast(*parsed.ast);

    Env env;
    SigintGuard guard;
    try {
        RunResult r = run_program(*parsed.ast, env, break_on_sigint);
        std::cout << r.output;
        if (r.error) {
            std::cout << describe_error(*r.error) << "\n";
            return EXIT_FAILURE;
        }
    } catch (const BreakRequested& e) {
        std::cout << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

void Menu::runSource(const std::string& source) {
    SigintGuard guard;
    std::cout << run_and_report(source, env, break_on_sigint) << "\n";
}

void Menu::handleChoice(const std::string& choice) {
    if (choice == "8") {
        run_editor(program);
        if (trim(program).empty()) {
            std::cout << "Empty program.\n\n";
            return;
        }
        runSource(program);
        return;
    }

    for (const Choice& c : kChoices) {
        if (choice != c.key) continue;
        std::cout << c.prompt;
        std::string input;
        if (!std::getline(std::cin, input)) return;
        if (auto hint = check_construct(choice, input)) {
            std::cout << "\nSyntax Error: " << *hint << "\n\n";
            return;
        }
        runSource(input);
        return;
    }

    std::cout << "Invalid choice. Please try again.\n\n";
}

void Menu::run() {
    std::string line;
    while (true) {
        std::cout << "minipy - select an option:\n";
        for (const Choice& c : kChoices) std::cout << c.key << ". " << c.label << "\n";
        std::cout << "8. Edit Program (multi-line editor)\n";
        std::cout << "9. Exit\n";
        std::cout << "Enter choice: ";
        if (!std::getline(std::cin, line)) break;
        std::string choice = trim(line);
        if (choice == "9") {
            std::cout << "Exiting.\n";
            break;
        }
        handleChoice(choice);
    }
}
