/**
 * @file GraphAlgorithms.hpp
 * @brief Cycle detection and deterministic topological sort
 *
 * Both algorithms run once per schema construction, never per evaluation.
 */

#ifndef PROPGRAPH_DETAIL_GRAPH_ALGORITHMS_HPP
#define PROPGRAPH_DETAIL_GRAPH_ALGORITHMS_HPP

#include "DependencyGraph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace propgraph {

/**
 * @brief Find the vertices that participate in some cycle
 *
 * A vertex is cyclic when it belongs to a strongly connected component
 * with more than one vertex, or has an edge to itself. Vertices that
 * merely depend on a cycle are not reported.
 *
 * @return The cyclic property names in vertex (declaration) order, or
 *         std::nullopt when the graph is acyclic
 */
[[nodiscard]] std::optional<std::vector<std::string>> find_cycle(const DependencyGraph& graph);

/**
 * @brief Compute a deterministic topological order
 *
 * Repeatedly selects, among the vertices whose predecessors have all been
 * emitted, the one with the smallest vertex index. Since build_graph()
 * numbers vertices in declaration order, unrelated properties keep their
 * declaration order.
 *
 * @return Every vertex exactly once; for each edge r -> p, r precedes p
 * @throws CycleError if the graph is cyclic
 */
[[nodiscard]] std::vector<DependencyGraph::Vertex> topological_sort(const DependencyGraph& graph);

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_GRAPH_ALGORITHMS_HPP
