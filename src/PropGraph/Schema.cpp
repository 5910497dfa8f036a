/**
 * @file Schema.cpp
 * @brief Schema construction: merge, validate, build graph, detect cycles, sort
 */

#include "PropGraph/detail/Schema.hpp"
#include "PropGraph/detail/Exceptions.hpp"
#include "PropGraph/detail/GraphAlgorithms.hpp"
#include "PropGraph/detail/Log.hpp"

#include <string>
#include <utility>

namespace propgraph {

namespace {

std::vector<PropertyDeclaration> merge_declarations(std::vector<PropertyDeclaration> declarations) {
    std::vector<PropertyDeclaration> merged;
    detail::TransparentStringMap<std::size_t> positions;

    for (auto& declaration : declarations) {
        auto it = positions.find(declaration.name);
        if (it == positions.end()) {
            positions.emplace(declaration.name, merged.size());
            merged.push_back(std::move(declaration));
            continue;
        }

        PropertyDeclaration& target = merged[it->second];
        for (auto& clause : declaration.clauses) {
            target.clauses.push_back(std::move(clause));
        }
        if (!target.value_type && declaration.value_type) {
            target.value_type = declaration.value_type;
            target.value_type_name = std::move(declaration.value_type_name);
        } else if (target.value_type && declaration.value_type &&
                   *target.value_type != *declaration.value_type) {
            throw InvalidDeclarationError(target.name,
                "declared as both '" + target.value_type_name + "' and '" +
                declaration.value_type_name + "'");
        }
    }
    return merged;
}

void validate(const std::vector<PropertyDeclaration>& declarations) {
    detail::TransparentStringMap<bool> declared;
    for (const auto& declaration : declarations) {
        if (declaration.name.empty()) {
            throw InvalidDeclarationError(declaration.name, "property name is empty");
        }
        if (declaration.clauses.empty()) {
            throw InvalidDeclarationError(declaration.name, "property has no clauses");
        }
        for (std::size_t i = 0; i < declaration.clauses.size(); ++i) {
            if (!declaration.clauses[i].body) {
                throw InvalidDeclarationError(declaration.name,
                    "clause " + std::to_string(i) + " has no body");
            }
        }
        declared.emplace(declaration.name, true);
    }

    for (const auto& declaration : declarations) {
        for (const auto& required : declaration.required_names()) {
            if (declared.find(required) == declared.end()) {
                throw UnknownPropertyError(declaration.name, required);
            }
        }
    }
}

} // namespace

const PropertyDeclaration& Schema::declaration(std::string_view name) const {
    return declarations_[vertex_of(name)];
}

std::vector<std::string> Schema::dependencies_of(std::string_view name) const {
    std::vector<std::string> result;
    for (auto v : graph_.predecessors(vertex_of(name))) {
        result.push_back(graph_.name(v));
    }
    return result;
}

std::vector<std::string> Schema::dependents_of(std::string_view name) const {
    std::vector<std::string> result;
    for (auto v : graph_.successors(vertex_of(name))) {
        result.push_back(graph_.name(v));
    }
    return result;
}

DependencyGraph::Vertex Schema::vertex_of(std::string_view name) const {
    auto v = graph_.find(name);
    if (!v) {
        throw PropertyNotFoundError(name, graph_.names());
    }
    return *v;
}

Schema build_schema(std::vector<PropertyDeclaration> declarations, const SchemaOptions& options) {
    auto merged = merge_declarations(std::move(declarations));
    validate(merged);

    Schema schema;
    schema.graph_ = build_graph(merged);

    if (auto cycle = find_cycle(schema.graph_)) {
        PROPGRAPH_DEBUG("rejecting schema, cyclic properties: " << detail::join_names(*cycle));
        throw CycleError(std::move(*cycle));
    }

    schema.order_ = topological_sort(schema.graph_);
    schema.evaluation_order_.reserve(schema.order_.size());
    for (auto v : schema.order_) {
        schema.evaluation_order_.push_back(schema.graph_.name(v));
    }

    schema.declarations_ = std::move(merged);
    schema.input_type_ = options.input_type;
    schema.input_type_name_ = options.input_type_name;

    if (options.log_order) {
        PROPGRAPH_INFO("evaluation order: " << detail::join_names(schema.evaluation_order_));
    }
    PROPGRAPH_DEBUG("built schema with " << schema.size() << " properties and "
                    << schema.graph_.edge_count() << " dependencies");
    return schema;
}

} // namespace propgraph
