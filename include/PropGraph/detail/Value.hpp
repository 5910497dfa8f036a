/**
 * @file Value.hpp
 * @brief Type-erased value container for inputs and property values
 *
 * Value stores the input given to evaluate() and every computed property
 * value without compile-time knowledge of their types. It supports:
 * - Any copyable type with Small Buffer Optimization
 * - Type-safe access and arithmetic conversions
 * - Equality and text rendering for result comparison and diagnostics
 */

#ifndef PROPGRAPH_DETAIL_VALUE_HPP
#define PROPGRAPH_DETAIL_VALUE_HPP

#include "TypeTraits.hpp"
#include "Exceptions.hpp"

#include <cstddef>
#include <new>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace propgraph {

/**
 * @brief Type-erased value container with Small Buffer Optimization
 *
 * Value can hold any copyable value and provides type-safe access without
 * needing compile-time type knowledge. Uses SBO to avoid heap allocation
 * for small types (up to 16 bytes).
 */
class Value {
    // Small Buffer Optimization
    static constexpr std::size_t SBO_SIZE = 16;
    static constexpr std::size_t SBO_ALIGN = 8;

    // Type-erased operations
    using DestroyFn = void(*)(void*) noexcept;
    using CopyFn = void(*)(void* dst, const void* src);
    using MoveFn = void(*)(void* dst, void* src) noexcept;
    using TypeFn = std::type_index(*)() noexcept;
    using EqualsFn = bool(*)(const void* lhs, const void* rhs);
    using PrintFn = void(*)(std::ostream& os, const void* ptr);

    struct Ops {
        DestroyFn destroy;
        CopyFn copy;
        MoveFn move;
        TypeFn type;
        EqualsFn equals;    ///< nullptr when T has no operator==
        PrintFn print;
        std::string_view name;
        std::size_t size;
        std::size_t align;
        bool use_sbo;
    };

    template<typename T>
    static constexpr bool fits_sbo = sizeof(T) <= SBO_SIZE &&
                                     alignof(T) <= SBO_ALIGN &&
                                     std::is_nothrow_move_constructible_v<T>;

    // Heap storage honours the stored type's alignment, including over-aligned types
    static void* allocate(std::size_t size, std::size_t align) {
        return ::operator new(size, std::align_val_t{align});
    }

    static void deallocate(void* ptr, std::size_t align) noexcept {
        ::operator delete(ptr, std::align_val_t{align});
    }

    template<typename T>
    static const Ops* get_ops() {
        static const Ops ops = {
            [](void* ptr) noexcept { static_cast<T*>(ptr)->~T(); },
            [](void* dst, const void* src) { new (dst) T(*static_cast<const T*>(src)); },
            [](void* dst, void* src) noexcept { new (dst) T(std::move(*static_cast<T*>(src))); },
            []() noexcept { return std::type_index(typeid(T)); },
            equals_fn<T>(),
            [](std::ostream& os, const void* ptr) {
                if constexpr (std::is_same_v<T, bool>) {
                    os << (*static_cast<const bool*>(ptr) ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    os << '"' << *static_cast<const std::string*>(ptr) << '"';
                } else if constexpr (Streamable<T>) {
                    os << *static_cast<const T*>(ptr);
                } else {
                    os << '<' << detail::type_name<T>() << '>';
                }
            },
            detail::type_name<T>(),
            sizeof(T),
            alignof(T),
            fits_sbo<T>
        };
        return &ops;
    }

    template<typename T>
    static constexpr EqualsFn equals_fn() {
        if constexpr (EqualityComparable<T>) {
            return [](const void* lhs, const void* rhs) {
                return static_cast<bool>(*static_cast<const T*>(lhs) ==
                                         *static_cast<const T*>(rhs));
            };
        } else {
            return nullptr;
        }
    }

public:
    Value() noexcept : ops_(nullptr), heap_ptr_(nullptr) {}

    template<Storable T>
    static Value create(T&& value) {
        using DecayT = std::decay_t<T>;
        Value v;
        const Ops* ops = get_ops<DecayT>();
        if constexpr (fits_sbo<DecayT>) {
            new (v.sbo_) DecayT(std::forward<T>(value));
        } else {
            void* storage = allocate(sizeof(DecayT), alignof(DecayT));
            try {
                new (storage) DecayT(std::forward<T>(value));
            } catch (...) {
                deallocate(storage, alignof(DecayT));
                throw;
            }
            v.heap_ptr_ = storage;
        }
        v.ops_ = ops;
        return v;
    }

    /**
     * @brief Create a string value from a C string literal
     */
    static Value create(const char* value) {
        return create(std::string{value});
    }

    ~Value() { clear(); }

    Value(const Value& other) : ops_(nullptr), heap_ptr_(nullptr) {
        copy_from(other);
    }

    Value& operator=(const Value& other) {
        if (this != &other) {
            clear();
            copy_from(other);
        }
        return *this;
    }

    Value(Value&& other) noexcept : ops_(nullptr), heap_ptr_(nullptr) {
        move_from(std::move(other));
    }

    Value& operator=(Value&& other) noexcept {
        if (this != &other) {
            clear();
            move_from(std::move(other));
        }
        return *this;
    }

    [[nodiscard]] bool is_valid() const noexcept { return ops_ != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_valid(); }

    template<typename T>
    [[nodiscard]] bool is_type() const noexcept {
        return ops_ && ops_->type() == std::type_index(typeid(T));
    }

    [[nodiscard]] std::type_index type() const noexcept {
        return ops_ ? ops_->type() : std::type_index(typeid(void));
    }

    /**
     * @brief Human-readable name of the stored type
     * @return The type name, or "void" for an empty value
     */
    [[nodiscard]] std::string_view type_name() const noexcept {
        return ops_ ? ops_->name : std::string_view{"void"};
    }

    [[nodiscard]] const void* get_raw() const noexcept {
        if (!ops_) return nullptr;
        return ops_->use_sbo ? static_cast<const void*>(sbo_) : heap_ptr_;
    }

    template<typename T>
    [[nodiscard]] const T& get() const {
        if (!is_type<T>()) {
            throw ValueTypeMismatchError(detail::type_name<T>(), type_name());
        }
        return *static_cast<const T*>(get_raw());
    }

    template<typename T>
    [[nodiscard]] const T& get_unchecked() const noexcept {
        return *static_cast<const T*>(get_raw());
    }

    template<typename T>
    [[nodiscard]] const T* try_get() const noexcept {
        return is_type<T>() ? static_cast<const T*>(get_raw()) : nullptr;
    }

    template<typename T>
    [[nodiscard]] bool can_convert() const noexcept;

    template<typename T>
    [[nodiscard]] T convert() const;

    /**
     * @brief Compare two values
     *
     * Values of the same type compare with that type's operator==.
     * Values whose type has no operator== never compare equal.
     * Two empty values are equal.
     */
    [[nodiscard]] bool operator==(const Value& other) const {
        if (!ops_ || !other.ops_) return ops_ == other.ops_;
        if (ops_->type() != other.ops_->type()) return false;
        if (!ops_->equals) return false;
        return ops_->equals(get_raw(), other.get_raw());
    }

    /**
     * @brief Render the value as text
     * @return "nil" for an empty value, the streamed value otherwise
     */
    [[nodiscard]] std::string to_string() const {
        if (!ops_) return "nil";
        std::ostringstream os;
        ops_->print(os, get_raw());
        return os.str();
    }

    void clear() noexcept {
        if (ops_) {
            if (ops_->use_sbo) {
                ops_->destroy(sbo_);
            } else if (heap_ptr_) {
                ops_->destroy(heap_ptr_);
                deallocate(heap_ptr_, ops_->align);
            }
            ops_ = nullptr;
            heap_ptr_ = nullptr;
        }
    }

private:
    void copy_from(const Value& other) {
        if (!other.ops_) return;
        if (other.ops_->use_sbo) {
            other.ops_->copy(sbo_, other.sbo_);
        } else {
            void* storage = allocate(other.ops_->size, other.ops_->align);
            try {
                other.ops_->copy(storage, other.heap_ptr_);
            } catch (...) {
                deallocate(storage, other.ops_->align);
                throw;
            }
            heap_ptr_ = storage;
        }
        ops_ = other.ops_;
    }

    void move_from(Value&& other) noexcept {
        if (!other.ops_) return;
        ops_ = other.ops_;
        if (ops_->use_sbo) {
            ops_->move(sbo_, other.sbo_);
            other.ops_->destroy(other.sbo_);
        } else {
            heap_ptr_ = other.heap_ptr_;
            other.heap_ptr_ = nullptr;
        }
        other.ops_ = nullptr;
    }

    const Ops* ops_;
    alignas(SBO_ALIGN) unsigned char sbo_[SBO_SIZE];
    void* heap_ptr_;
};

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.to_string();
}

// Type conversions
template<typename T>
bool Value::can_convert() const noexcept {
    if (!ops_) return false;
    if (is_type<T>()) return true;

    if constexpr (std::is_arithmetic_v<T>) {
        auto ti = type();
        return ti == typeid(int) || ti == typeid(float) || ti == typeid(double) ||
               ti == typeid(long) || ti == typeid(short) || ti == typeid(char) ||
               ti == typeid(unsigned int) || ti == typeid(unsigned long) ||
               ti == typeid(long long) || ti == typeid(unsigned long long);
    }
    return false;
}

template<typename T>
T Value::convert() const {
    if (!ops_) throw ValueTypeMismatchError(detail::type_name<T>(), "void");
    if (is_type<T>()) return get<T>();

    if constexpr (std::is_arithmetic_v<T>) {
        auto ti = type();
        if (ti == typeid(int)) return static_cast<T>(get_unchecked<int>());
        if (ti == typeid(float)) return static_cast<T>(get_unchecked<float>());
        if (ti == typeid(double)) return static_cast<T>(get_unchecked<double>());
        if (ti == typeid(long)) return static_cast<T>(get_unchecked<long>());
        if (ti == typeid(long long)) return static_cast<T>(get_unchecked<long long>());
        if (ti == typeid(short)) return static_cast<T>(get_unchecked<short>());
        if (ti == typeid(char)) return static_cast<T>(get_unchecked<char>());
        if (ti == typeid(unsigned int)) return static_cast<T>(get_unchecked<unsigned int>());
        if (ti == typeid(unsigned long)) return static_cast<T>(get_unchecked<unsigned long>());
        if (ti == typeid(unsigned long long)) return static_cast<T>(get_unchecked<unsigned long long>());
    }
    throw ValueTypeMismatchError(detail::type_name<T>(), type_name());
}

} // namespace propgraph

#endif // PROPGRAPH_DETAIL_VALUE_HPP
