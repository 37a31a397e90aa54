#include "dependency_graph.hpp"

#include <queue>
#include <unordered_set>

namespace {

bool matches_filter(const std::string& name, const std::string& filter) {
    return !filter.empty() && name.find(filter) != std::string::npos;
}

} // anonymous namespace

void DependencyGraph::set(const std::string& name, std::vector<std::string> dependencies) {
    if (auto it = index_.find(name); it != index_.end()) {
        entries_[it->second].second = std::move(dependencies);
        return;
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(name, std::move(dependencies));
}

bool DependencyGraph::contains(const std::string& name) const {
    return index_.contains(name);
}

const std::vector<std::string>& DependencyGraph::dependencies_of(const std::string& name) const {
    static const std::vector<std::string> no_dependencies;
    auto it = index_.find(name);
    if (it == index_.end()) return no_dependencies;
    return entries_[it->second].second;
}

DependencyGraph build_dependency_graph(const std::string& root, const Repository& repository, const std::string& filter) {
    DependencyGraph graph;
    std::queue<std::string> queue;
    std::unordered_set<std::string> visited;

    queue.push(root);
    visited.insert(root);

    while (!queue.empty()) {
        const std::string current = std::move(queue.front());
        queue.pop();

        if (matches_filter(current, filter)) continue;

        auto pkg = repository.find_package(current);
        if (!pkg) {
            graph.set(current, {PACKAGE_NOT_FOUND});
            continue;
        }

        for (const auto& dep : pkg->dependencies) {
            if (matches_filter(dep, filter)) continue;
            if (visited.insert(dep).second) {
                queue.push(dep);
            }
        }
        graph.set(current, std::move(pkg->dependencies));
    }
    return graph;
}
