/**
 * @file value.inline.hpp
 * @brief Implementations for type-parameterized member methods in the Value class.
 */
#pragma once
#include "wavedag/common/value.hpp"

namespace wavedag
{

namespace detail
{

/**
 * @brief Type trait to validate a Value access type.
 * @details T must be one of the non-null alternatives, without cv or reference.
 */
template <typename T>
struct is_value_alternative
{
    static constexpr bool value =
        std::is_same_v<T, bool> ||
        std::is_same_v<T, std::int64_t> ||
        std::is_same_v<T, double> ||
        std::is_same_v<T, std::string>;
};

template <typename T>
inline constexpr bool is_value_alternative_v = is_value_alternative<T>::value;

template <typename T>
const char* alternative_name() noexcept
{
    if constexpr (std::is_same_v<T, bool>)
    {
        return "bool";
    }
    else if constexpr (std::is_same_v<T, std::int64_t>)
    {
        return "int";
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return "double";
    }
    else
    {
        return "string";
    }
}

} // namespace detail

template <typename T>
bool Value::has_type() const noexcept
{
    static_assert(detail::is_value_alternative_v<T>,
                  "Value: T must be bool, std::int64_t, double or std::string");
    return std::holds_alternative<T>(m_storage);
}

template <typename T>
void Value::set(T&& value)
{
    *this = Value(std::forward<T>(value));
}

template <typename T>
T& Value::as()
{
    static_assert(detail::is_value_alternative_v<T>,
                  "Value: T must be bool, std::int64_t, double or std::string");
    if (!has_value())
    {
        throw ValueEmptyError{};
    }
    if (!std::holds_alternative<T>(m_storage))
    {
        throw ValueTypeError{
            std::string{"Value type mismatch: expected "} + detail::alternative_name<T>() +
            ", got " + type_name()
        };
    }
    return std::get<T>(m_storage);
}

template <typename T>
const T& Value::as() const
{
    static_assert(detail::is_value_alternative_v<T>,
                  "Value: T must be bool, std::int64_t, double or std::string");
    if (!has_value())
    {
        throw ValueEmptyError{};
    }
    if (!std::holds_alternative<T>(m_storage))
    {
        throw ValueTypeError{
            std::string{"Value type mismatch: expected "} + detail::alternative_name<T>() +
            ", got " + type_name()
        };
    }
    return std::get<T>(m_storage);
}

template <typename T>
T* Value::try_as() noexcept
{
    static_assert(detail::is_value_alternative_v<T>,
                  "Value: T must be bool, std::int64_t, double or std::string");
    return std::get_if<T>(&m_storage);
}

template <typename T>
const T* Value::try_as() const noexcept
{
    static_assert(detail::is_value_alternative_v<T>,
                  "Value: T must be bool, std::int64_t, double or std::string");
    return std::get_if<T>(&m_storage);
}

} // namespace wavedag
