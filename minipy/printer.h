//
//  printer.h
//  minipy
//
#pragma once

#include <string>
#include "ast.h"

// Indented dump of a tree, one line per node or section label, two spaces per level.
std::string render_ast(const Node& node);
