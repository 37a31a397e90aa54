#pragma once

#include "dependency_graph.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// Marks a package that appears again among its own ancestors.
inline const std::string CYCLIC_DEPENDENCY = "(cyclic dependency)";

// Indentation for a node at `depth`: four spaces per ancestor level, then
// the connector. Empty at depth 0.
std::string tree_prefix(size_t depth);

// Depth-first, pre-order rendering of `graph` starting at `root`. A package
// reached through several branches is printed under each of them; one that
// repeats along a single path is printed once more and then cut off with
// CYCLIC_DEPENDENCY.
std::vector<std::string> render_tree(const std::string& root, const DependencyGraph& graph);
void print_tree(const std::string& root, const DependencyGraph& graph, std::ostream& out);
