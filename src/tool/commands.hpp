#pragma once

#include <string>

#include "options.hpp"

// Read the whole of `path`, or stdin when `path` is empty.
// Throws std::runtime_error if the file cannot be read.
std::string readInput(const std::string& path);

// Apply the command in `opts` to `input` and return the text to print.
// Formatting errors propagate as markup::Error.
std::string runCommand(const Options& opts, const std::string& input);
