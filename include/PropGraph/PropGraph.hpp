/**
 * @file PropGraph.hpp
 * @brief Main header for the PropGraph property dependency library
 *
 * PropGraph computes a set of named, mutually dependent properties from a
 * single input value:
 * - build_schema() validates the declarations once, rejects dependency
 *   cycles and fixes a deterministic evaluation order
 * - evaluate() computes every property for one input by first-match
 *   clause dispatch against the partial result built so far
 *
 * @code
 * #include <PropGraph/PropGraph.hpp>
 * using namespace propgraph;
 *
 * SchemaBuilder<int> builder;
 * builder.property<int>("p").clause([](int i, const Record&) { return i + 1; });
 * builder.property<int>("z").clause(Pattern().bind("p"),
 *     [](int, const Record& r) { return r.get<int>("p") * 5; });
 *
 * Schema schema = builder.build();
 * Record result = evaluate(schema, 2);     // {p: 3, z: 15}
 * @endcode
 */

#ifndef PROPGRAPH_HPP
#define PROPGRAPH_HPP

#include "detail/TypeTraits.hpp"
#include "detail/Exceptions.hpp"
#include "detail/Log.hpp"
#include "detail/Config.hpp"
#include "detail/Value.hpp"
#include "detail/Record.hpp"
#include "detail/Declaration.hpp"
#include "detail/DependencyGraph.hpp"
#include "detail/GraphAlgorithms.hpp"
#include "detail/Schema.hpp"
#include "detail/Evaluator.hpp"
#include "detail/SchemaBuilder.hpp"

#endif // PROPGRAPH_HPP
