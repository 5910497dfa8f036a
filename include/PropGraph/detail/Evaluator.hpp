/**
 * @file Evaluator.hpp
 * @brief Evaluation of a schema against one input
 */

#ifndef PROPGRAPH_DETAIL_EVALUATOR_HPP
#define PROPGRAPH_DETAIL_EVALUATOR_HPP

#include "Config.hpp"
#include "Record.hpp"
#include "Schema.hpp"
#include "TypeTraits.hpp"
#include "Value.hpp"

#include <concepts>
#include <type_traits>

namespace propgraph {

/**
 * @brief Compute every property of a schema for one input
 *
 * Properties are computed in schema.evaluation_order(). For each one the
 * clauses are scanned in declaration order and the first clause whose
 * pattern matches the partial result and whose guard holds is applied;
 * its value is bound under the property name.
 *
 * The schema is only read, so concurrent calls on one schema are safe.
 *
 * @return A record holding exactly one value per declared property
 * @throws InputTypeMismatchError if the schema fixes an input type and
 *         input has another type
 * @throws DispatchError if no clause of some property matches; no partial
 *         record escapes
 * @throws PropertyTypeMismatchError if a clause result does not have the
 *         property's declared type
 */
[[nodiscard]] Record evaluate(const Schema& schema, const Value& input,
                              const EvaluationOptions& options = {});

/**
 * @brief Typed convenience overload wrapping the input in a Value
 */
template<typename Input>
    requires Storable<Input> && (!std::same_as<std::decay_t<Input>, Value>)
[[nodiscard]] Record evaluate(const Schema& schema, Input&& input,
                              const EvaluationOptions& options = {}) {
    return evaluate(schema, Value::create(std::forward<Input>(input)), options);
}

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_EVALUATOR_HPP
