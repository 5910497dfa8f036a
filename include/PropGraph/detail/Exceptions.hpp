/**
 * @file Exceptions.hpp
 * @brief Exception hierarchy for the PropGraph library
 *
 * This file defines all exception types used by PropGraph:
 * - PropertyGraphError: Base exception class
 * - ValueTypeMismatchError: Thrown when a Value is read as the wrong type
 * - PropertyNotFoundError: Thrown when a record or schema has no such property
 * - PropertyAlreadyBoundError: Thrown when a partial result would be overwritten
 * - InvalidDeclarationError: Thrown for malformed property declarations
 * - UnknownPropertyError: Thrown when a clause requires an undeclared property
 * - CycleError: Thrown when the dependency graph is not acyclic
 * - DispatchError: Thrown when no clause of a property matches
 * - PropertyTypeMismatchError: Thrown when a clause body returns the wrong type
 * - InputTypeMismatchError: Thrown when evaluate() receives the wrong input type
 * - SerializationError: Thrown when a value cannot be converted to JSON
 */

#ifndef PROPGRAPH_DETAIL_EXCEPTIONS_HPP
#define PROPGRAPH_DETAIL_EXCEPTIONS_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace propgraph {

class Record;

namespace detail {

inline std::string join_names(const std::vector<std::string>& names) {
    std::string out = "[";
    bool first = true;
    for (const auto& name : names) {
        if (!first) out += ", ";
        out += name;
        first = false;
    }
    out += "]";
    return out;
}

} // namespace detail

/**
 * @brief Base exception class for all PropGraph errors
 *
 * All PropGraph-specific exceptions derive from this class,
 * allowing users to catch every schema or evaluation failure
 * with a single catch block.
 */
class PropertyGraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    explicit PropertyGraphError(const std::string& message)
        : std::runtime_error(message) {}

    explicit PropertyGraphError(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a Value is accessed as the wrong type
 */
class ValueTypeMismatchError : public PropertyGraphError {
public:
    ValueTypeMismatchError(std::string_view expected_type, std::string_view actual_type)
        : PropertyGraphError(format_message(expected_type, actual_type))
        , expected_type_(expected_type)
        , actual_type_(actual_type) {}

    [[nodiscard]] std::string_view expected_type() const noexcept { return expected_type_; }
    [[nodiscard]] std::string_view actual_type() const noexcept { return actual_type_; }

private:
    static std::string format_message(std::string_view expected, std::string_view actual) {
        return std::string{"Value type mismatch: expected '"} + std::string{expected} +
               "', got '" + std::string{actual} + "'";
    }

    std::string expected_type_;
    std::string actual_type_;
};

/**
 * @brief Exception thrown when a property is not found
 *
 * This exception includes the list of available properties
 * to help users identify the correct property name.
 *
 * @code
 * try {
 *     auto v = record.get<int>("nonexistent");
 * } catch (const PropertyNotFoundError& e) {
 *     std::cout << "Property not found: " << e.property_name() << std::endl;
 * }
 * @endcode
 */
class PropertyNotFoundError : public PropertyGraphError {
public:
    PropertyNotFoundError(std::string_view prop_name, const std::vector<std::string>& available)
        : PropertyGraphError(format_message(prop_name, available))
        , property_name_(prop_name)
        , available_properties_(available) {}

    /**
     * @brief Get the name of the property that was not found
     * @return The property name
     */
    [[nodiscard]] std::string_view property_name() const noexcept {
        return property_name_;
    }

    /**
     * @brief Get the list of available property names
     * @return Vector of available property names
     */
    [[nodiscard]] const std::vector<std::string>& available_properties() const noexcept {
        return available_properties_;
    }

private:
    static std::string format_message(std::string_view prop,
                                      const std::vector<std::string>& available) {
        return "Property '" + std::string{prop} + "' not found. Available properties: " +
               detail::join_names(available);
    }

    std::string property_name_;
    std::vector<std::string> available_properties_;
};

/**
 * @brief Exception thrown when a bound property would be bound again
 *
 * Partial results only grow; a name is bound at most once.
 */
class PropertyAlreadyBoundError : public PropertyGraphError {
public:
    explicit PropertyAlreadyBoundError(std::string_view prop_name)
        : PropertyGraphError("Property '" + std::string{prop_name} + "' is already bound")
        , property_name_(prop_name) {}

    [[nodiscard]] std::string_view property_name() const noexcept { return property_name_; }

private:
    std::string property_name_;
};

/**
 * @brief Exception thrown for a malformed property declaration
 *
 * Raised by build_schema() for an empty name, a property without clauses,
 * or a clause without a body.
 */
class InvalidDeclarationError : public PropertyGraphError {
public:
    InvalidDeclarationError(std::string_view prop_name, std::string_view reason)
        : PropertyGraphError("Invalid declaration of property '" + std::string{prop_name} +
                             "': " + std::string{reason})
        , property_name_(prop_name)
        , reason_(reason) {}

    [[nodiscard]] std::string_view property_name() const noexcept { return property_name_; }
    [[nodiscard]] std::string_view reason() const noexcept { return reason_; }

private:
    std::string property_name_;
    std::string reason_;
};

/**
 * @brief Exception thrown when a clause requires a property nobody declares
 */
class UnknownPropertyError : public PropertyGraphError {
public:
    UnknownPropertyError(std::string_view prop_name, std::string_view required_name)
        : PropertyGraphError("Property '" + std::string{prop_name} +
                             "' requires undeclared property '" + std::string{required_name} + "'")
        , property_name_(prop_name)
        , required_name_(required_name) {}

    [[nodiscard]] std::string_view property_name() const noexcept { return property_name_; }
    [[nodiscard]] std::string_view required_name() const noexcept { return required_name_; }

private:
    std::string property_name_;
    std::string required_name_;
};

/**
 * @brief Exception thrown when property dependencies form a cycle
 *
 * Carries every property that participates in some cycle, in
 * declaration order, so callers can report exactly which properties
 * are mutually dependent.
 *
 * @code
 * try {
 *     auto schema = build_schema(declarations);
 * } catch (const CycleError& e) {
 *     for (const auto& name : e.cyclic_properties()) {
 *         std::cout << name << " ";
 *     }
 * }
 * @endcode
 */
class CycleError : public PropertyGraphError {
public:
    explicit CycleError(std::vector<std::string> cyclic_properties)
        : PropertyGraphError("Dependency cycle detected among properties: " +
                             detail::join_names(cyclic_properties))
        , cyclic_properties_(std::move(cyclic_properties)) {}

    /**
     * @brief Get the properties participating in a cycle
     * @return Property names in declaration order
     */
    [[nodiscard]] const std::vector<std::string>& cyclic_properties() const noexcept {
        return cyclic_properties_;
    }

private:
    std::vector<std::string> cyclic_properties_;
};

/**
 * @brief Exception thrown when no clause of a property matches
 *
 * Carries the property name and a snapshot of the partial result
 * reached at the point of failure.
 */
class DispatchError : public PropertyGraphError {
public:
    DispatchError(std::string_view prop_name, std::shared_ptr<const Record> snapshot,
                  std::string_view snapshot_text)
        : PropertyGraphError("No clause of property '" + std::string{prop_name} +
                             "' matches partial result " + std::string{snapshot_text})
        , property_name_(prop_name)
        , snapshot_(std::move(snapshot)) {}

    [[nodiscard]] std::string_view property_name() const noexcept { return property_name_; }

    /**
     * @brief Get the partial result at the point of failure
     * @return The snapshot record
     */
    [[nodiscard]] const Record& snapshot() const noexcept { return *snapshot_; }

private:
    std::string property_name_;
    std::shared_ptr<const Record> snapshot_;
};

/**
 * @brief Exception thrown when a clause body returns a value of the wrong type
 */
class PropertyTypeMismatchError : public PropertyGraphError {
public:
    PropertyTypeMismatchError(std::string_view prop_name,
                              std::string_view expected_type,
                              std::string_view actual_type)
        : PropertyGraphError(format_message(prop_name, expected_type, actual_type))
        , property_name_(prop_name)
        , expected_type_(expected_type)
        , actual_type_(actual_type) {}

    [[nodiscard]] std::string_view property_name() const noexcept { return property_name_; }
    [[nodiscard]] std::string_view expected_type() const noexcept { return expected_type_; }
    [[nodiscard]] std::string_view actual_type() const noexcept { return actual_type_; }

private:
    static std::string format_message(std::string_view prop_name,
                                      std::string_view expected_type,
                                      std::string_view actual_type) {
        return std::string{"Property '"} + std::string{prop_name} +
               "' type mismatch: expected '" + std::string{expected_type} +
               "', got '" + std::string{actual_type} + "'";
    }

    std::string property_name_;
    std::string expected_type_;
    std::string actual_type_;
};

/**
 * @brief Exception thrown when evaluate() receives an input of the wrong type
 */
class InputTypeMismatchError : public PropertyGraphError {
public:
    InputTypeMismatchError(std::string_view expected_type, std::string_view actual_type)
        : PropertyGraphError(std::string{"Input type mismatch: schema expects '"} +
                             std::string{expected_type} + "', got '" +
                             std::string{actual_type} + "'")
        , expected_type_(expected_type)
        , actual_type_(actual_type) {}

    [[nodiscard]] std::string_view expected_type() const noexcept { return expected_type_; }
    [[nodiscard]] std::string_view actual_type() const noexcept { return actual_type_; }

private:
    std::string expected_type_;
    std::string actual_type_;
};

/**
 * @brief Exception thrown when a value has no JSON conversion
 */
class SerializationError : public PropertyGraphError {
public:
    using PropertyGraphError::PropertyGraphError;
};

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_EXCEPTIONS_HPP
