#pragma once

#include "repository.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Stands in for the dependency list of a name missing from the repository.
inline const std::string PACKAGE_NOT_FOUND = "(package not found)";

// Adjacency lists of every package expanded during traversal, in the order
// the packages were visited.
class DependencyGraph {
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    void set(const std::string& name, std::vector<std::string> dependencies);
    bool contains(const std::string& name) const;

    // Empty for names without an entry (filtered or never reached).
    const std::vector<std::string>& dependencies_of(const std::string& name) const;

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const DependencyGraph& other) const { return entries_ == other.entries_; }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// Breadth-first walk from `root`. Names containing `filter` (when non-empty)
// are never expanded; they still show up in their parents' lists. Every name
// is expanded at most once.
DependencyGraph build_dependency_graph(const std::string& root, const Repository& repository, const std::string& filter);
