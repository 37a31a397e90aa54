#pragma once

#include "repository.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// Parses `control_text`, walks the dependencies of `root` and returns the
// rendered tree, one entry per output line.
std::vector<std::string> visualize_dependencies(const std::string& root, const std::string& filter, std::string_view control_text);

// Same walk over an already loaded repository, written to `out`.
void print_dependencies(const std::string& root, const std::string& filter, const Repository& repository, std::ostream& out);
