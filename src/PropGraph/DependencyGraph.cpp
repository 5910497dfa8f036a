/**
 * @file DependencyGraph.cpp
 * @brief Implementation of DependencyGraph and build_graph()
 */

#include "PropGraph/detail/DependencyGraph.hpp"

namespace propgraph {

DependencyGraph::Vertex DependencyGraph::add_vertex(std::string_view name) {
    if (auto existing = find(name)) {
        return *existing;
    }
    Vertex v = names_.size();
    names_.emplace_back(name);
    index_.emplace(std::string{name}, v);
    successors_.emplace_back();
    predecessors_.emplace_back();
    return v;
}

void DependencyGraph::add_edge(std::string_view from, std::string_view to) {
    Vertex u = add_vertex(from);
    Vertex v = add_vertex(to);
    if (successors_[u].insert(v).second) {
        predecessors_[v].insert(u);
        ++edge_count_;
    }
}

std::optional<DependencyGraph::Vertex> DependencyGraph::find(std::string_view name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

bool DependencyGraph::has_edge(std::string_view from, std::string_view to) const noexcept {
    auto u = find(from);
    auto v = find(to);
    if (!u || !v) return false;
    return successors_[*u].count(*v) != 0;
}

DependencyGraph build_graph(const std::vector<PropertyDeclaration>& declarations) {
    DependencyGraph graph;
    // All declared names first so vertex indices follow declaration order
    for (const auto& declaration : declarations) {
        graph.add_vertex(declaration.name);
    }
    for (const auto& declaration : declarations) {
        for (const auto& required : declaration.required_names()) {
            graph.add_edge(required, declaration.name);
        }
    }
    return graph;
}

} // namespace propgraph
