//
//  menu.h
//  minipy
//

#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include "env.h"

// Thrown from a shell's loop hook when the user asks to stop a running program.
struct BreakRequested : public std::runtime_error {
    BreakRequested() : std::runtime_error("Break") {}
};

// Shape check for menu choices 1-6, done on the raw text before parsing.
// Returns a hint when the text cannot be the chosen construct.
std::optional<std::string> check_construct(const std::string& choice, const std::string& input);

// Parses and runs source against env and returns the RESULT block the
// shells display: input echo, AST dump or diagnostic, program output,
// last value, runtime error.
std::string run_and_report(const std::string& source, Env& env, std::function<void()> onLoopIteration = {});

// Reads a whole program file. Prints the reason and returns false on failure.
bool load_source_file(const std::string& filename, std::string& out);

// Runs one program file and prints its output. Returns the process exit status.
int run_file(const std::string& filename, bool showAst);

struct Menu {
    Env env;             // variables survive between menu entries
    std::string program; // buffer shown by the editor

    void run();
    void handleChoice(const std::string& choice);
    void runSource(const std::string& source);
};
