//
//  gui_main.cpp
//  minipy
//

#include <cstdlib>
#include <iostream>
#include <string>
#include "gui.h"
#include "menu.h"
#include "strutil.h"

int main(int argc, const char * argv[]) {
    std::string source;

    // Optional: preload a program file into the editor pane.
    // Example: ./minipy-gui demo.mpy
    if (argc >= 2 && argv[1] && argv[1][0] != '\0') {
        if (!load_source_file(argv[1], source)) return EXIT_FAILURE;
        std::cout << "Loaded " << split_lines(source).size() << " lines.\n";
    }

    run_gui_shell(source);
    return EXIT_SUCCESS;
}
