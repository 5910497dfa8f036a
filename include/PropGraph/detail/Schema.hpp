/**
 * @file Schema.hpp
 * @brief Immutable, validated property set with its evaluation order
 *
 * A Schema is produced once per property set by build_schema() and can
 * then be evaluated against any number of inputs, from any number of
 * threads, without synchronization.
 */

#ifndef PROPGRAPH_DETAIL_SCHEMA_HPP
#define PROPGRAPH_DETAIL_SCHEMA_HPP

#include "Config.hpp"
#include "Declaration.hpp"
#include "DependencyGraph.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace propgraph {

class Schema {
public:
    /**
     * @brief Property names in the order evaluate() computes them
     */
    [[nodiscard]] const std::vector<std::string>& evaluation_order() const noexcept {
        return evaluation_order_;
    }

    /**
     * @brief Property names in the order they were first declared
     */
    [[nodiscard]] const std::vector<std::string>& declaration_order() const noexcept {
        return graph_.names();
    }

    /**
     * @brief Get the merged declaration of a property
     * @throws PropertyNotFoundError if no such property is declared
     */
    [[nodiscard]] const PropertyDeclaration& declaration(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return graph_.contains(name); }
    [[nodiscard]] std::size_t size() const noexcept { return declarations_.size(); }
    [[nodiscard]] const DependencyGraph& graph() const noexcept { return graph_; }

    /**
     * @brief Properties that must be computed before the given one
     * @throws PropertyNotFoundError if no such property is declared
     */
    [[nodiscard]] std::vector<std::string> dependencies_of(std::string_view name) const;

    /**
     * @brief Properties that require the given one
     * @throws PropertyNotFoundError if no such property is declared
     */
    [[nodiscard]] std::vector<std::string> dependents_of(std::string_view name) const;

    [[nodiscard]] const std::optional<std::type_index>& input_type() const noexcept { return input_type_; }
    [[nodiscard]] const std::string& input_type_name() const noexcept { return input_type_name_; }

    /**
     * @brief Declarations in evaluation order
     *
     * ordered_declaration(i) is the declaration of evaluation_order()[i].
     */
    [[nodiscard]] const PropertyDeclaration& ordered_declaration(std::size_t i) const {
        return declarations_.at(order_.at(i));
    }

private:
    friend Schema build_schema(std::vector<PropertyDeclaration> declarations,
                               const SchemaOptions& options);

    Schema() = default;

    DependencyGraph::Vertex vertex_of(std::string_view name) const;

    std::vector<PropertyDeclaration> declarations_;     ///< Indexed by graph vertex
    DependencyGraph graph_;
    std::vector<DependencyGraph::Vertex> order_;
    std::vector<std::string> evaluation_order_;
    std::optional<std::type_index> input_type_;
    std::string input_type_name_;
};

/**
 * @brief Validate a declaration set and resolve its evaluation order
 *
 * Declarations sharing a name are merged: their clauses are concatenated
 * in sequence order and the property keeps the position of its first
 * declaration.
 *
 * @throws InvalidDeclarationError for an empty name, a property without
 *         clauses, or a clause without a body
 * @throws UnknownPropertyError if a clause requires an undeclared property
 * @throws CycleError carrying every property on a dependency cycle
 */
[[nodiscard]] Schema build_schema(std::vector<PropertyDeclaration> declarations,
                                  const SchemaOptions& options = {});

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_SCHEMA_HPP
