#include "visualizer.hpp"
#include "dependency_graph.hpp"
#include "tree_renderer.hpp"

std::vector<std::string> visualize_dependencies(const std::string& root, const std::string& filter, std::string_view control_text) {
    const Repository repository = load_repository(control_text);
    const DependencyGraph graph = build_dependency_graph(root, repository, filter);
    return render_tree(root, graph);
}

void print_dependencies(const std::string& root, const std::string& filter, const Repository& repository, std::ostream& out) {
    const DependencyGraph graph = build_dependency_graph(root, repository, filter);
    print_tree(root, graph, out);
}
