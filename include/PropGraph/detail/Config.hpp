/**
 * @file Config.hpp
 * @brief Options controlling schema construction and evaluation
 */

#ifndef PROPGRAPH_DETAIL_CONFIG_HPP
#define PROPGRAPH_DETAIL_CONFIG_HPP

#include <optional>
#include <string>
#include <typeindex>

namespace propgraph {

/**
 * @brief Options for build_schema()
 */
struct SchemaOptions {
    /// Type every evaluate() input must have; unchecked when empty
    std::optional<std::type_index> input_type;
    std::string input_type_name;

    /// Log the resolved evaluation order at info level
    bool log_order = false;
};

/**
 * @brief Options for evaluate()
 */
struct EvaluationOptions {
    /// Log every dispatch (property, selected clause, value) at debug level
    bool trace = false;
};

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_CONFIG_HPP
