/**
 * @file GraphAlgorithms.cpp
 * @brief Tarjan strongly connected components and Kahn's algorithm
 */

#include "PropGraph/detail/GraphAlgorithms.hpp"
#include "PropGraph/detail/Exceptions.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <set>

namespace propgraph {

namespace {

using Vertex = DependencyGraph::Vertex;

constexpr std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();

struct Frame {
    Vertex vertex;
    std::set<Vertex>::const_iterator next;
};

} // namespace

std::optional<std::vector<std::string>> find_cycle(const DependencyGraph& graph) {
    const std::size_t n = graph.vertex_count();
    std::vector<std::size_t> index(n, UNVISITED);
    std::vector<std::size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<bool> cyclic(n, false);
    std::vector<Vertex> stack;
    std::vector<Frame> frames;
    std::size_t counter = 0;

    auto enter = [&](Vertex v) {
        index[v] = lowlink[v] = counter++;
        stack.push_back(v);
        on_stack[v] = true;
        frames.push_back(Frame{v, graph.successors(v).begin()});
    };

    // Iterative Tarjan so deep dependency chains cannot overflow the call stack
    for (Vertex root = 0; root < n; ++root) {
        if (index[root] != UNVISITED) continue;
        enter(root);

        while (!frames.empty()) {
            Vertex v = frames.back().vertex;
            auto& next = frames.back().next;
            if (next != graph.successors(v).end()) {
                Vertex w = *next++;
                if (index[w] == UNVISITED) {
                    enter(w);
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            frames.pop_back();
            if (!frames.empty()) {
                Vertex parent = frames.back().vertex;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }

            if (lowlink[v] != index[v]) continue;

            std::vector<Vertex> component;
            Vertex w;
            do {
                w = stack.back();
                stack.pop_back();
                on_stack[w] = false;
                component.push_back(w);
            } while (w != v);

            if (component.size() > 1 || graph.successors(v).count(v) != 0) {
                for (Vertex c : component) {
                    cyclic[c] = true;
                }
            }
        }
    }

    std::vector<std::string> result;
    for (Vertex v = 0; v < n; ++v) {
        if (cyclic[v]) result.push_back(graph.name(v));
    }
    if (result.empty()) return std::nullopt;
    return result;
}

std::vector<Vertex> topological_sort(const DependencyGraph& graph) {
    const std::size_t n = graph.vertex_count();
    std::vector<std::size_t> in_degree(n, 0);
    std::priority_queue<Vertex, std::vector<Vertex>, std::greater<>> ready;

    for (Vertex v = 0; v < n; ++v) {
        in_degree[v] = graph.predecessors(v).size();
        if (in_degree[v] == 0) {
            ready.push(v);
        }
    }

    std::vector<Vertex> order;
    order.reserve(n);
    while (!ready.empty()) {
        Vertex v = ready.top();
        ready.pop();
        order.push_back(v);

        for (Vertex succ : graph.successors(v)) {
            if (--in_degree[succ] == 0) {
                ready.push(succ);
            }
        }
    }

    if (order.size() < n) {
        throw CycleError(find_cycle(graph).value_or(std::vector<std::string>{}));
    }
    return order;
}

} // namespace propgraph
