#pragma once

#include <string>
#include <string_view>
#include <vector>

// Turns a folded Depends field into bare package names.
//
// Terms are split on ',', version constraints in parentheses are dropped and
// every alternative of an 'a | b' group becomes its own entry. The result is
// duplicate-free; the first occurrence of a name fixes its position.
std::vector<std::string> parse_dependency_field(std::string_view raw);
