/**
 * @file Record.hpp
 * @brief Property-name keyed records built during evaluation
 *
 * This file implements:
 * - Record: read-only mapping from property name to Value, used for the
 *   final result and for every snapshot handed to clauses
 * - PartialResult: a Record that grows monotonically while a single
 *   evaluation runs
 */

#ifndef PROPGRAPH_DETAIL_RECORD_HPP
#define PROPGRAPH_DETAIL_RECORD_HPP

#include "Value.hpp"
#include "Exceptions.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace propgraph {

namespace detail {

/**
 * @brief Heterogeneous string hash for lookups by std::string_view
 */
struct TransparentStringHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

template<typename V>
using TransparentStringMap = std::unordered_map<std::string, V, TransparentStringHash, std::equal_to<>>;

} // namespace detail

/**
 * @brief Read-only mapping from property name to value
 *
 * Entries are kept in binding order, which for a result record is the
 * schema's evaluation order.
 */
class Record {
public:
    struct Entry {
        std::string name;
        Value value;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    Record() = default;

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return index_.find(name) != index_.end();
    }

    /**
     * @brief Look up a property value
     * @return Pointer to the value, or nullptr if the name is not bound
     */
    [[nodiscard]] const Value* find(std::string_view name) const noexcept;

    /**
     * @brief Look up a property value
     * @throws PropertyNotFoundError if the name is not bound
     */
    [[nodiscard]] const Value& at(std::string_view name) const;

    /**
     * @brief Typed access to a property value
     * @throws PropertyNotFoundError if the name is not bound
     * @throws ValueTypeMismatchError if the value is not a T
     */
    template<typename T>
    [[nodiscard]] const T& get(std::string_view name) const {
        return at(name).get<T>();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Bound property names in binding order
     */
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    /**
     * @brief Compare two records
     *
     * Records are equal when they bind the same names to equal values,
     * independently of binding order.
     */
    [[nodiscard]] bool operator==(const Record& other) const;

    /**
     * @brief Render the record as text, e.g. "{p: 3, q: 10}"
     */
    [[nodiscard]] std::string to_string() const;

protected:
    void insert(std::string_view name, Value value);

private:
    std::vector<Entry> entries_;
    detail::TransparentStringMap<std::size_t> index_;
};

std::ostream& operator<<(std::ostream& os, const Record& record);

/**
 * @brief Record under construction
 *
 * A PartialResult only grows: binding a name that is already bound
 * throws PropertyAlreadyBoundError.
 */
class PartialResult : public Record {
public:
    PartialResult() = default;

    /**
     * @brief Bind a property value
     * @throws PropertyAlreadyBoundError if the name is already bound
     */
    void bind(std::string_view name, Value value);
};

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_RECORD_HPP
