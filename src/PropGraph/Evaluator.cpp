/**
 * @file Evaluator.cpp
 * @brief First-match clause dispatch over the schema's evaluation order
 */

#include "PropGraph/detail/Evaluator.hpp"
#include "PropGraph/detail/Exceptions.hpp"
#include "PropGraph/detail/Log.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace propgraph {

namespace {

/**
 * @brief Index of the first clause whose pattern and guard hold
 */
std::optional<std::size_t> select_clause(const PropertyDeclaration& declaration,
                                         const Value& input,
                                         const Record& partial) {
    for (std::size_t i = 0; i < declaration.clauses.size(); ++i) {
        const Clause& clause = declaration.clauses[i];
        PartialResult bindings;
        if (clause.pattern && !clause.pattern(partial, bindings)) continue;
        if (clause.guard && !clause.guard(input, bindings)) continue;
        return i;
    }
    return std::nullopt;
}

} // namespace

Record evaluate(const Schema& schema, const Value& input, const EvaluationOptions& options) {
    if (schema.input_type() && input.type() != *schema.input_type()) {
        throw InputTypeMismatchError(schema.input_type_name(), input.type_name());
    }

    PartialResult partial;
    const auto& order = schema.evaluation_order();

    for (std::size_t i = 0; i < order.size(); ++i) {
        const PropertyDeclaration& declaration = schema.ordered_declaration(i);

        auto selected = select_clause(declaration, input, partial);
        if (!selected) {
            PROPGRAPH_DEBUG("no clause of '" << declaration.name << "' matches " << partial);
            std::string text = partial.to_string();
            throw DispatchError(declaration.name,
                                std::make_shared<const Record>(std::move(partial)),
                                text);
        }

        Value value = declaration.clauses[*selected].body(input, partial);

        if (declaration.value_type && value.type() != *declaration.value_type) {
            throw PropertyTypeMismatchError(declaration.name, declaration.value_type_name,
                                            value.type_name());
        }

        if (options.trace) {
            PROPGRAPH_DEBUG(declaration.name << " <- clause " << *selected << " = " << value);
        }
        partial.bind(declaration.name, std::move(value));
    }

    return partial;
}

} // namespace propgraph
