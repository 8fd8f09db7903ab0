//
//  gui.h
//  minipy
//

#pragma once

#include <string>

// Opens the SDL2 window with the program editor on top and the output pane
// below, preloaded with source. F5 runs, F6 shows the AST, Ctrl+L clears the
// output, ESC breaks a running program or closes the window.
// Falls back to the console menu when SDL, the window or a font are unavailable.
void run_gui_shell(const std::string& source);
