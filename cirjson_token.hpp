#ifndef CIRJSON_TOKEN_H
#define CIRJSON_TOKEN_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace cirjson
{

// Name of the property every CirJSON object must start with
inline constexpr std::string_view CIRJSON_ID_PROPERTY = "__cirJsonId__";

enum token_type
{
    NO_TOKEN,
    NOT_AVAILABLE,
    START_OBJECT,
    END_OBJECT,
    START_ARRAY,
    END_ARRAY,
    CIRJSON_ID_PROPERTY_NAME,
    CIRJSON_ID_ARRAY_ELEMENT,
    PROPERTY_NAME,
    VALUE_STRING,
    VALUE_NUMBER_INT,
    VALUE_NUMBER_FLOAT,
    VALUE_TRUE,
    VALUE_FALSE,
    VALUE_NULL,
    END_OF_STREAM,
};

// Fixed textual representation of a token, empty for tokens whose text
// depends on the input
inline std::string_view token_text(const token_type token) noexcept
{
    switch (token)
    {
    case START_OBJECT:
        return "{";
    case END_OBJECT:
        return "}";
    case START_ARRAY:
        return "[";
    case END_ARRAY:
        return "]";
    case CIRJSON_ID_PROPERTY_NAME:
        return CIRJSON_ID_PROPERTY;
    case VALUE_TRUE:
        return "true";
    case VALUE_FALSE:
        return "false";
    case VALUE_NULL:
        return "null";
    default:
        return {};
    }
}

inline bool is_numeric(const token_type token) noexcept
{
    return token == VALUE_NUMBER_INT || token == VALUE_NUMBER_FLOAT;
}

inline bool is_boolean(const token_type token) noexcept
{
    return token == VALUE_TRUE || token == VALUE_FALSE;
}

inline bool is_struct_start(const token_type token) noexcept
{
    return token == START_OBJECT || token == START_ARRAY;
}

inline bool is_struct_end(const token_type token) noexcept
{
    return token == END_OBJECT || token == END_ARRAY;
}

// The array id element counts as a scalar: it is a string in the input
inline bool is_scalar_value(const token_type token) noexcept
{
    switch (token)
    {
    case CIRJSON_ID_ARRAY_ELEMENT:
    case VALUE_STRING:
    case VALUE_NUMBER_INT:
    case VALUE_NUMBER_FLOAT:
    case VALUE_TRUE:
    case VALUE_FALSE:
    case VALUE_NULL:
        return true;
    default:
        return false;
    }
}

// LCOV_EXCL_START
inline std::ostream& operator<<(std::ostream& out, const token_type token)
{
    switch (token)
    {
    case NO_TOKEN:
        return out << "NO_TOKEN";
    case NOT_AVAILABLE:
        return out << "NOT_AVAILABLE";
    case START_OBJECT:
        return out << "START_OBJECT";
    case END_OBJECT:
        return out << "END_OBJECT";
    case START_ARRAY:
        return out << "START_ARRAY";
    case END_ARRAY:
        return out << "END_ARRAY";
    case CIRJSON_ID_PROPERTY_NAME:
        return out << "CIRJSON_ID_PROPERTY_NAME";
    case CIRJSON_ID_ARRAY_ELEMENT:
        return out << "CIRJSON_ID_ARRAY_ELEMENT";
    case PROPERTY_NAME:
        return out << "PROPERTY_NAME";
    case VALUE_STRING:
        return out << "VALUE_STRING";
    case VALUE_NUMBER_INT:
        return out << "VALUE_NUMBER_INT";
    case VALUE_NUMBER_FLOAT:
        return out << "VALUE_NUMBER_FLOAT";
    case VALUE_TRUE:
        return out << "VALUE_TRUE";
    case VALUE_FALSE:
        return out << "VALUE_FALSE";
    case VALUE_NULL:
        return out << "VALUE_NULL";
    case END_OF_STREAM:
        return out << "END_OF_STREAM";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

} // namespace cirjson

#endif // CIRJSON_TOKEN_H
