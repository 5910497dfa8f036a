/**
 * @file TypeTraits.hpp
 * @brief C++20 concepts and type traits for the PropGraph library
 *
 * This file defines the concepts used to constrain property value types,
 * typed clause callables, and the compile-time type name helper used in
 * diagnostics.
 */

#ifndef PROPGRAPH_DETAIL_TYPE_TRAITS_HPP
#define PROPGRAPH_DETAIL_TYPE_TRAITS_HPP

#include <concepts>
#include <type_traits>
#include <ostream>
#include <string_view>
#include <utility>

namespace propgraph {

class Value;
class Record;

/**
 * @brief Concept for types that can be stored as a property value
 *
 * Values are copied into snapshots and result records, so they must be
 * copy constructible. Storing a Value inside a Value is not allowed.
 *
 * @tparam T The type to check
 */
template<typename T>
concept Storable = std::is_copy_constructible_v<std::decay_t<T>> &&
                   !std::is_same_v<std::decay_t<T>, Value> &&
                   !std::is_array_v<std::remove_reference_t<T>>;

/**
 * @brief Concept for types comparable with operator==
 *
 * @tparam T The type to check
 */
template<typename T>
concept EqualityComparable = requires(const T& a, const T& b) {
    { a == b } -> std::convertible_to<bool>;
};

/**
 * @brief Concept for types that can be written to an std::ostream
 *
 * @tparam T The type to check
 */
template<typename T>
concept Streamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

/**
 * @brief Concept for a typed clause body
 *
 * A body receives the typed input and the partial result and returns
 * something convertible to the declared property type.
 */
template<typename F, typename Input, typename T>
concept ClauseBody = std::invocable<const F&, const Input&, const Record&> &&
    std::convertible_to<std::invoke_result_t<const F&, const Input&, const Record&>, T>;

/**
 * @brief Concept for a typed clause guard
 *
 * A guard receives the typed input and the values bound by the pattern.
 */
template<typename F, typename Input>
concept ClauseGuard = std::invocable<const F&, const Input&, const Record&> &&
    std::convertible_to<std::invoke_result_t<const F&, const Input&, const Record&>, bool>;

namespace detail {

/**
 * @brief Compile-time type name generation
 *
 * Uses compiler-specific intrinsics to get type name at compile time.
 */
template<typename T>
consteval std::string_view type_name() {
#if defined(__clang__)
    constexpr std::string_view name = __PRETTY_FUNCTION__;
    constexpr std::string_view prefix = "std::string_view propgraph::detail::type_name() [T = ";
    constexpr std::string_view suffix = "]";
#elif defined(__GNUC__)
    constexpr std::string_view name = __PRETTY_FUNCTION__;
    constexpr std::string_view prefix = "consteval std::string_view propgraph::detail::type_name() [with T = ";
    constexpr std::string_view suffix = "]";
#elif defined(_MSC_VER)
    constexpr std::string_view name = __FUNCSIG__;
    constexpr std::string_view prefix = "std::string_view __cdecl propgraph::detail::type_name<";
    constexpr std::string_view suffix = ">(void)";
#else
    #error "Unsupported compiler"
#endif

    constexpr auto start = name.find(prefix) + prefix.size();
    // GCC appends "; std::string_view = ..." before the closing bracket
    constexpr auto alias = name.find(';', start);
    constexpr auto end = alias != std::string_view::npos ? alias : name.rfind(suffix);
    return name.substr(start, end - start);
}

} // namespace detail

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_TYPE_TRAITS_HPP
