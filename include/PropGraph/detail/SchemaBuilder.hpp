/**
 * @file SchemaBuilder.hpp
 * @brief Typed, fluent construction of property declarations
 *
 * SchemaBuilder<Input> collects one PropertyDeclaration per property and
 * hands them to build_schema(). Clause bodies and guards are written
 * against the typed input; the builder wraps them into the type-erased
 * Clause form and derives each clause's required names from its Pattern.
 *
 * @code
 * SchemaBuilder<int> builder;
 * builder.property<int>("p")
 *     .clause([](int i, const Record&) { return i + 1; });
 * builder.property<int>("q")
 *     .clause(Pattern().bind("p"),
 *             [](int, const Record& b) { return b.get<int>("p") > 0; },
 *             [](int i, const Record&) { return i * 5; })
 *     .clause(Pattern().bind("p"),
 *             [](int i, const Record& r) { return r.get<int>("p") * i; });
 * Schema schema = builder.build();
 * @endcode
 */

#ifndef PROPGRAPH_DETAIL_SCHEMA_BUILDER_HPP
#define PROPGRAPH_DETAIL_SCHEMA_BUILDER_HPP

#include "Config.hpp"
#include "Declaration.hpp"
#include "Exceptions.hpp"
#include "Schema.hpp"
#include "TypeTraits.hpp"
#include "Value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

namespace propgraph {

template<Storable Input>
class SchemaBuilder;

/**
 * @brief Adds clauses to one property of a SchemaBuilder
 *
 * @tparam Input The input type of the schema
 * @tparam T The property value type
 */
template<Storable Input, Storable T>
class PropertyBuilder {
public:
    PropertyBuilder(SchemaBuilder<Input>& owner, std::size_t index)
        : owner_(&owner)
        , index_(index) {}

    /**
     * @brief Add a clause that always matches
     */
    template<ClauseBody<Input, T> Body>
    PropertyBuilder& clause(Body body) {
        return add(Pattern{}, GuardFn{}, wrap_body(std::move(body)));
    }

    /**
     * @brief Add a clause selected when pattern matches the partial result
     */
    template<ClauseBody<Input, T> Body>
    PropertyBuilder& clause(Pattern pattern, Body body) {
        return add(std::move(pattern), GuardFn{}, wrap_body(std::move(body)));
    }

    /**
     * @brief Add a clause selected when pattern matches and guard holds
     *
     * The guard receives the values bound by the pattern.
     */
    template<ClauseGuard<Input> Guard, ClauseBody<Input, T> Body>
    PropertyBuilder& clause(Pattern pattern, Guard guard, Body body) {
        return add(std::move(pattern), wrap_guard(std::move(guard)), wrap_body(std::move(body)));
    }

    /**
     * @brief Continue with another property of the same builder
     */
    template<Storable U>
    PropertyBuilder<Input, U> property(std::string_view name) {
        return owner_->template property<U>(name);
    }

private:
    PropertyBuilder& add(Pattern pattern, GuardFn guard, BodyFn body) {
        Clause clause;
        clause.required_names = pattern.referenced_names();
        clause.pattern = pattern.predicate();
        clause.guard = std::move(guard);
        clause.body = std::move(body);
        owner_->declarations_[index_].clauses.push_back(std::move(clause));
        return *this;
    }

    template<typename Body>
    static BodyFn wrap_body(Body body) {
        return [body = std::move(body)](const Value& input, const Record& partial) -> Value {
            return Value::create(static_cast<T>(body(input.get<Input>(), partial)));
        };
    }

    template<typename Guard>
    static GuardFn wrap_guard(Guard guard) {
        return [guard = std::move(guard)](const Value& input, const Record& bindings) -> bool {
            return static_cast<bool>(guard(input.get<Input>(), bindings));
        };
    }

    SchemaBuilder<Input>* owner_;
    std::size_t index_;
};

/**
 * @brief Collects property declarations for one input type
 *
 * @tparam Input The type of the value every property is derived from
 */
template<Storable Input>
class SchemaBuilder {
public:
    SchemaBuilder() = default;

    /**
     * @brief Start or continue the declaration of a property
     *
     * Calling property() again with the same name appends further clauses
     * to the same declaration. A declaration added through declare()
     * without a value type adopts T.
     *
     * @tparam T The property value type; every clause must produce it
     * @throws InvalidDeclarationError if the property already has another
     *         value type
     */
    template<Storable T>
    PropertyBuilder<Input, T> property(std::string_view name) {
        for (std::size_t i = 0; i < declarations_.size(); ++i) {
            PropertyDeclaration& existing = declarations_[i];
            if (existing.name != name) continue;

            if (!existing.value_type) {
                existing.template expect_type<T>();
            } else if (*existing.value_type != std::type_index(typeid(T))) {
                throw InvalidDeclarationError(name,
                    "declared as both '" + existing.value_type_name + "' and '" +
                    std::string{detail::type_name<T>()} + "'");
            }
            return PropertyBuilder<Input, T>(*this, i);
        }
        PropertyDeclaration declaration{std::string{name}};
        declaration.template expect_type<T>();
        declarations_.push_back(std::move(declaration));
        return PropertyBuilder<Input, T>(*this, declarations_.size() - 1);
    }

    /**
     * @brief Add an already assembled declaration
     */
    SchemaBuilder& declare(PropertyDeclaration declaration) {
        declarations_.push_back(std::move(declaration));
        return *this;
    }

    [[nodiscard]] const std::vector<PropertyDeclaration>& declarations() const noexcept {
        return declarations_;
    }

    /**
     * @brief Validate the declarations and resolve their evaluation order
     *
     * The resulting schema only accepts inputs of type Input.
     */
    [[nodiscard]] Schema build(SchemaOptions options = {}) const {
        options.input_type = std::type_index(typeid(Input));
        options.input_type_name = std::string{detail::type_name<Input>()};
        return build_schema(declarations_, options);
    }

private:
    template<Storable, Storable>
    friend class PropertyBuilder;

    std::vector<PropertyDeclaration> declarations_;
};

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_SCHEMA_BUILDER_HPP
