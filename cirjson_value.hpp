#ifndef CIRJSON_VALUE_H
#define CIRJSON_VALUE_H

#include <charconv>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "cirjson_error.hpp"

namespace cirjson
{

namespace detail
{

// forward declaration
template<typename T>
struct as;

} // namespace detail

enum value_type
{
    String,
    Number,
    Boolean,
    Null
};

// View over the current scalar token of a parser. The raw text is only valid
// until the parser is advanced again.
class value final
{
    template<typename T> friend struct detail::as;

private:

    value_type m_type = Null;
    std::string_view m_raw_value = "null";

public:

    explicit value() noexcept = default;

    explicit value(
        const value_type type,
        const std::string_view raw_value = "") noexcept
    : m_type(type)
    , m_raw_value(raw_value)
    {
    }

    value_type type() const noexcept
    {
        return m_type;
    }

    std::string_view raw() const
    {
        return m_raw_value;
    }

    template<typename T>
    T as() const
    {
        return detail::as<T>()(*this);
    }
}; // class value

namespace detail
{

// Trick to prevent static_assert() from always going off (see as_impl() below)
template<typename>
inline constexpr bool type_dependent_false = false;

// NaN and the infinities only reach a value when ALLOW_NON_NUMERIC_NUMBERS
// is enabled
template<typename T>
std::optional<T> non_numeric_number(const std::string_view raw_value)
{
    if (raw_value == "NaN")
    {
        return std::numeric_limits<T>::quiet_NaN();
    }
    if (raw_value == "Infinity" || raw_value == "+Infinity")
    {
        return std::numeric_limits<T>::infinity();
    }
    if (raw_value == "-Infinity")
    {
        return -std::numeric_limits<T>::infinity();
    }

    return std::nullopt;
}

template<typename T>
T as_impl(const value_type type, const std::string_view raw_value)
{
    // Here we can assume that type is not Null: that was already checked
    // by as<T> or its partial specialization as<std::optional<T>>

    if constexpr (std::is_same_v<T, std::string_view>)
    {
        if (type != String)
        {
            throw bad_value_cast("value::as<T>(): value type is not String");
        }

        return raw_value;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        if (type != Boolean)
        {
            throw bad_value_cast("value::as<T>(): value type is not Boolean");
        }

        return !raw_value.empty() && raw_value[0] == 't';
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        if (type != Number)
        {
            throw bad_value_cast("value::as<T>(): value type is not Number");
        }

        if constexpr (std::is_floating_point_v<T>)
        {
            if (const std::optional<T> special =
                    non_numeric_number<T>(raw_value))
            {
                return *special;
            }
        }

        T result {}; // value initialize to silence compiler warnings
        const auto begin = raw_value.data();
        const auto end = raw_value.data() + raw_value.size();
        const auto [parse_end, error] = std::from_chars(begin, end, result);
        if (parse_end != end || error != std::errc())
        {
            throw std::range_error("value::as<T>() could not parse the number");
        }
        return result;
    }
    else // if constexpr
    {
        static_assert(
            type_dependent_false<T>,
            "value::as<T>(): T is not one of the supported types "
            "(std::string_view, bool, arithmetic types, plus all of the "
            "above wrapped in std::optional)");
    }
}

template<typename T>
struct as
{
    T operator()(const value v) const
    {
        if (v.m_type == Null)
        {
            throw bad_value_cast(
                "cannot call value::as<T>() on values of type Null: "
                "consider checking value::type() first, or use "
                "value::as<std::optional<T>>()");
        }

        return as_impl<T>(v.m_type, v.m_raw_value);
    }
}; // struct as

template<typename T>
struct as<std::optional<T>>
{
    std::optional<T> operator()(const value v) const
    {
        if (v.m_type == Null)
        {
            return std::nullopt;
        }

        return as_impl<T>(v.m_type, v.m_raw_value);
    }
}; // struct as<std::optional<T>>

} // namespace detail

} // namespace cirjson

#endif // CIRJSON_VALUE_H
