//
//  editor.h
//  minipy
//

#pragma once

#include <string>

// Launches the full-screen terminal editor on source and writes the edited
// text back on exit. ESC returns to the menu. When stdin is not a terminal,
// lines are read until a line holding a single '.' or end of input.
void run_editor(std::string& source);
