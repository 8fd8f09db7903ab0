//
//  main.cpp
//  minipy
//

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include "menu.h"

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--ast] [file]\n"
              << "  With a file, runs it and prints its output.\n"
              << "  Without one, starts the interactive menu.\n"
              << "  --ast  also print the syntax tree before running.\n";
}

int main(int argc, const char * argv[]) {
    bool showAst = false;
    std::string filename;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (std::strcmp(arg, "--ast") == 0) {
            showAst = true;
            continue;
        }
        if (arg[0] == '-' || !filename.empty()) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        filename = arg;
    }

    if (!filename.empty()) return run_file(filename, showAst);

    Menu menu;
    menu.run();
    return EXIT_SUCCESS;
}
