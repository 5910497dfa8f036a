/**
 * @file Declaration.hpp
 * @brief Plain data describing properties and their clauses
 *
 * This file defines the declaration model consumed by build_schema():
 * - Clause: one guarded alternative (pattern, guard, body) of a property
 * - PropertyDeclaration: a named property with its ordered clauses
 * - Pattern: structural pattern over the partial result that also reports
 *   which properties a clause references
 */

#ifndef PROPGRAPH_DETAIL_DECLARATION_HPP
#define PROPGRAPH_DETAIL_DECLARATION_HPP

#include "Record.hpp"
#include "TypeTraits.hpp"
#include "Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

namespace propgraph {

/// Tests the partial result and fills the bindings exposed to the guard
using PatternFn = std::function<bool(const Record& partial, PartialResult& bindings)>;

/// Additional condition over the input and the values bound by the pattern
using GuardFn = std::function<bool(const Value& input, const Record& bindings)>;

/// Computes the property value; must be pure given (input, partial)
using BodyFn = std::function<Value(const Value& input, const Record& partial)>;

/**
 * @brief One guarded alternative of a property
 *
 * An empty pattern matches any partial result and an empty guard always
 * holds. The body is mandatory.
 */
struct Clause {
    PatternFn pattern;
    GuardFn guard;
    BodyFn body;
    std::vector<std::string> required_names;    ///< Properties referenced by pattern or guard
};

/**
 * @brief A named property and its clauses in definition order
 *
 * The first clause whose pattern and guard hold is selected (first match
 * wins), so clause order is significant.
 */
struct PropertyDeclaration {
    std::string name;
    std::vector<Clause> clauses;
    std::optional<std::type_index> value_type;  ///< Expected type of every clause result
    std::string value_type_name;

    PropertyDeclaration() = default;

    explicit PropertyDeclaration(std::string n)
        : name{std::move(n)} {}

    PropertyDeclaration(std::string n, std::vector<Clause> c)
        : name{std::move(n)}
        , clauses{std::move(c)} {}

    /**
     * @brief Union of the clauses' required names
     * @return Names in first-reference order, without duplicates
     */
    [[nodiscard]] std::vector<std::string> required_names() const;

    /**
     * @brief Declare the type every clause must produce
     */
    template<typename T>
    PropertyDeclaration& expect_type() {
        value_type = std::type_index(typeid(T));
        value_type_name = std::string{detail::type_name<T>()};
        return *this;
    }
};

/**
 * @brief Structural pattern over a partial result
 *
 * A pattern lists the properties a clause looks at. Each field requires
 * the property to be bound, optionally to a specific value, and exposes
 * the bound value to the clause guard.
 *
 * @code
 * Pattern().equals("p", 3);          // p is bound and equals 3
 * Pattern().bind("p").bind("q");     // p and q are bound
 * @endcode
 */
class Pattern {
public:
    Pattern() = default;

    /**
     * @brief Require a property to be bound and expose it to the guard
     */
    Pattern& bind(std::string_view name);

    /**
     * @brief Require a property to be bound to a value equal to expected
     */
    template<Storable T>
    Pattern& equals(std::string_view name, T&& expected) {
        fields_.push_back(Field{std::string{name}, Value::create(std::forward<T>(expected))});
        return *this;
    }

    Pattern& equals(std::string_view name, const char* expected) {
        return equals(name, std::string{expected});
    }

    /**
     * @brief Match against a partial result
     *
     * On success every referenced property value is bound into bindings.
     * On failure bindings may hold a prefix of the fields.
     */
    [[nodiscard]] bool match(const Record& partial, PartialResult& bindings) const;

    /**
     * @brief Properties referenced by this pattern, without duplicates
     */
    [[nodiscard]] std::vector<std::string> referenced_names() const;

    /**
     * @brief Convert to a plain predicate usable in a Clause
     */
    [[nodiscard]] PatternFn predicate() const;

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

private:
    struct Field {
        std::string name;
        Value expected;     ///< Empty when any value matches
    };

    std::vector<Field> fields_;
};

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_DECLARATION_HPP
