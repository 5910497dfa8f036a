/**
 * @file DependencyGraph.hpp
 * @brief Directed "must-precede" graph over property names
 *
 * Vertices are numbered in the order their names were first added, which
 * build_graph() makes the declaration order. An edge r -> p means r must
 * be computed before p. Edges form a set: adding the same edge twice has
 * no effect.
 */

#ifndef PROPGRAPH_DETAIL_DEPENDENCY_GRAPH_HPP
#define PROPGRAPH_DETAIL_DEPENDENCY_GRAPH_HPP

#include "Declaration.hpp"
#include "Record.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace propgraph {

class DependencyGraph {
public:
    using Vertex = std::size_t;

    DependencyGraph() = default;

    /**
     * @brief Add a vertex, or return the existing one with this name
     * @return The vertex index
     */
    Vertex add_vertex(std::string_view name);

    /**
     * @brief Add the edge from -> to, creating missing vertices
     */
    void add_edge(std::string_view from, std::string_view to);

    [[nodiscard]] std::optional<Vertex> find(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name).has_value(); }
    [[nodiscard]] bool has_edge(std::string_view from, std::string_view to) const noexcept;

    [[nodiscard]] const std::string& name(Vertex v) const { return names_.at(v); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    /// Vertices that must precede v
    [[nodiscard]] const std::set<Vertex>& predecessors(Vertex v) const { return predecessors_.at(v); }
    /// Vertices that v must precede
    [[nodiscard]] const std::set<Vertex>& successors(Vertex v) const { return successors_.at(v); }

    [[nodiscard]] std::size_t vertex_count() const noexcept { return names_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }

private:
    std::vector<std::string> names_;
    detail::TransparentStringMap<Vertex> index_;
    std::vector<std::set<Vertex>> successors_;
    std::vector<std::set<Vertex>> predecessors_;
    std::size_t edge_count_ = 0;
};

/**
 * @brief Build the dependency graph of a declaration sequence
 *
 * Every declared name becomes a vertex, in declaration order. For each
 * declaration p and each r in p.required_names(), the edge r -> p is
 * added. A property requiring itself produces a self-loop. Required
 * names that are not declared still become vertices; no validation is
 * performed here.
 */
[[nodiscard]] DependencyGraph build_graph(const std::vector<PropertyDeclaration>& declarations);

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_DEPENDENCY_GRAPH_HPP
