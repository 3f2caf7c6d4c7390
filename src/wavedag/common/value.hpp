/**
 * @file value.hpp
 * @brief Definition of Value, the scalar carried by step params, outputs and state.
 * @see value.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "wavedag/common/common.hpp"

namespace wavedag
{

/**
 * @brief Exception thrown when Value type access fails.
 */
class ValueTypeError : public std::runtime_error
{
public:
    explicit ValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when accessing a null Value.
 */
class ValueEmptyError : public std::runtime_error
{
public:
    ValueEmptyError()
        : std::runtime_error("Value is empty")
    {}
};

/**
 * @brief A null-able scalar: bool, 64-bit integer, double or string.
 *
 * @details
 * Value has plain value semantics. Copying a Value (or a ValueMap) copies
 * the payload, so a copied map shares nothing with its source. Checkpoints
 * rely on this to keep their snapshots independent of the live run.
 *
 * Integral arguments of any width are stored as `std::int64_t`, and
 * `const char*` is stored as `std::string`.
 *
 * @par Thread Safety
 * - Safe for simultaneous reading and being copied from.
 * - No internal mutex; synchronization is the caller's responsibility.
 */
class Value
{
public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    /**
     * @brief Default constructor creates a null Value.
     */
    Value() = default;

    Value(bool value)
        : m_storage{value}
    {}

    Value(int value)
        : m_storage{static_cast<std::int64_t>(value)}
    {}

    Value(long value)
        : m_storage{static_cast<std::int64_t>(value)}
    {}

    Value(long long value)
        : m_storage{static_cast<std::int64_t>(value)}
    {}

    Value(double value)
        : m_storage{value}
    {}

    Value(const char* value)
        : m_storage{std::string{value}}
    {}

    Value(std::string value)
        : m_storage{std::move(value)}
    {}

    /**
     * @brief Check if the Value holds anything other than null.
     */
    [[nodiscard]] bool has_value() const noexcept
    {
        return !std::holds_alternative<std::monostate>(m_storage);
    }

    /**
     * @brief Check if the stored alternative is T.
     * @tparam T One of bool, std::int64_t, double, std::string.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Name of the stored alternative ("null", "bool", "int", "double", "string").
     */
    [[nodiscard]] const char* type_name() const noexcept;

    /**
     * @brief Reset to null.
     * @post has_value() == false
     */
    void reset() noexcept
    {
        m_storage = std::monostate{};
    }

    /**
     * @brief Replace the stored value.
     * @param value Anything a Value can be constructed from.
     */
    template <typename T>
    void set(T&& value);

    /**
     * @brief Access the stored value as reference.
     * @tparam T The expected alternative.
     * @throws ValueEmptyError if null.
     * @throws ValueTypeError if type mismatch.
     */
    template <typename T>
    [[nodiscard]] T& as();

    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Try to access the stored value as pointer.
     * @return Pointer to stored value, or nullptr if null or type mismatch.
     */
    template <typename T>
    [[nodiscard]] T* try_as() noexcept;

    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Numeric view: int and double are both accepted.
     * @throws ValueEmptyError if null.
     * @throws ValueTypeError if the value is not numeric.
     */
    [[nodiscard]] double as_number() const;

    /**
     * @brief Render for logs and YAML output. Null renders as "null".
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const Storage& storage() const noexcept
    {
        return m_storage;
    }

    friend bool operator==(const Value& lhs, const Value& rhs)
    {
        return lhs.m_storage == rhs.m_storage;
    }

    friend bool operator!=(const Value& lhs, const Value& rhs)
    {
        return !(lhs == rhs);
    }

private:
    Storage m_storage{};
};

/**
 * @brief Named values used for step params, step outputs, shared state and
 *        checkpoint metadata. Ordered so that snapshots render deterministically.
 */
using ValueMap = std::map<std::string, Value>;

/**
 * @brief Render a ValueMap as `{key=value, ...}` for logs.
 */
std::string to_string(const ValueMap& values);

} // namespace wavedag
