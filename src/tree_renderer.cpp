#include "tree_renderer.hpp"

#include <algorithm>
#include <functional>
#include <ostream>
#include <utility>

namespace {

using LineSink = std::function<void(std::string)>;

class TreeWalker {
public:
    TreeWalker(const DependencyGraph& graph, LineSink sink)
        : graph_(graph), sink_(std::move(sink)) {}

    void emit(const std::string& name, size_t depth) {
        sink_(tree_prefix(depth) + name);

        if (std::find(ancestors_.begin(), ancestors_.end(), name) != ancestors_.end()) {
            sink_(tree_prefix(depth + 1) + CYCLIC_DEPENDENCY);
            return;
        }

        ancestors_.push_back(name);
        for (const auto& dep : graph_.dependencies_of(name)) {
            emit(dep, depth + 1);
        }
        ancestors_.pop_back();
    }

private:
    const DependencyGraph& graph_;
    LineSink sink_;
    std::vector<std::string> ancestors_; // current root-to-node path
};

} // anonymous namespace

std::string tree_prefix(size_t depth) {
    if (depth == 0) return {};
    std::string prefix;
    prefix.reserve(depth * 4 + 6);
    for (size_t i = 0; i + 1 < depth; ++i) {
        prefix += "    ";
    }
    prefix += "└── ";
    return prefix;
}

std::vector<std::string> render_tree(const std::string& root, const DependencyGraph& graph) {
    std::vector<std::string> lines;
    TreeWalker walker(graph, [&lines](std::string line) { lines.push_back(std::move(line)); });
    walker.emit(root, 0);
    return lines;
}

void print_tree(const std::string& root, const DependencyGraph& graph, std::ostream& out) {
    TreeWalker walker(graph, [&out](std::string line) { out << line << '\n'; });
    walker.emit(root, 0);
    out.flush();
}
