#ifndef CIRJSON_ERROR_H
#define CIRJSON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "cirjson_token.hpp"

namespace cirjson
{

// Position within the fed input. Lines and columns are 1-based.
struct stream_location
{
    std::uint64_t byte_offset = 0;
    std::size_t line = 1;
    std::size_t column = 1;
};

// Thrown when the input is not valid CirJSON (or violates a configured
// constraint). The parser is unusable after one of these escapes advance().
class parse_error : public std::exception
{
public:

    enum error_reason
    {
        UNKNOWN,
        UNEXPECTED_CHARACTER,
        UNRECOGNIZED_TOKEN,
        INVALID_NUMBER,
        NON_STANDARD_TOKEN,
        INVALID_ESCAPE_SEQUENCE,
        EXPECTED_UTF16_LOW_SURROGATE,
        INVALID_UTF16_CHARACTER,
        INVALID_UTF8,
        UNESCAPED_CONTROL_CHARACTER,
        INVALID_BOM,
        INVALID_COMMENT,
        UNTERMINATED_VALUE,
        UNCLOSED_SCOPE,
        EXPECTED_OPENING_QUOTE,
        EXPECTED_COLON,
        EXPECTED_COMMA_OR_CLOSING_BRACKET,
        EXPECTED_VALUE,
        MISMATCHED_CLOSING_BRACKET,
        EXPECTED_CIRJSON_ID,
        DUPLICATE_PROPERTY,
        EXCEEDED_NESTING_LIMIT,
        EXCEEDED_DOCUMENT_LENGTH,
        EXCEEDED_NUMBER_LENGTH,
        EXCEEDED_STRING_LENGTH,
        EXCEEDED_NAME_LENGTH,
        SYMBOL_TABLE_OVERFLOW,
    };

    enum error_category
    {
        MALFORMED_TOKEN,
        UNEXPECTED_END_OF_INPUT,
        STRUCTURAL,
        CONSTRAINT_VIOLATION,
    };

private:

    error_reason m_reason;
    stream_location m_location;
    token_type m_token;
    std::string m_message;
    std::string m_what;

public:

    explicit parse_error(
        const error_reason reason,
        const stream_location& location = {},
        const token_type token = NO_TOKEN,
        std::string message = {})
    : m_reason(reason)
    , m_location(location)
    , m_token(token)
    , m_message(message.empty() ? describe(reason) : std::move(message))
    {
        m_what = m_message
            + " (line " + std::to_string(m_location.line)
            + ", column " + std::to_string(m_location.column) + ")";
    }

    static const char* describe(const error_reason reason) noexcept
    {
        switch (reason)
        {
        case UNKNOWN:
            return "Unknown parse error";
        case UNEXPECTED_CHARACTER:
            return "Unexpected character";
        case UNRECOGNIZED_TOKEN:
            return "Unrecognized token";
        case INVALID_NUMBER:
            return "Invalid numeric value";
        case NON_STANDARD_TOKEN:
            return "Non-standard numeric token not allowed";
        case INVALID_ESCAPE_SEQUENCE:
            return "Invalid escape sequence";
        case EXPECTED_UTF16_LOW_SURROGATE:
            return "Expected UTF-16 low surrogate";
        case INVALID_UTF16_CHARACTER:
            return "Invalid UTF-16 character";
        case INVALID_UTF8:
            return "Invalid UTF-8 byte sequence";
        case UNESCAPED_CONTROL_CHARACTER:
            return "Illegal unquoted control character";
        case INVALID_BOM:
            return "Invalid UTF-8 byte order mark";
        case INVALID_COMMENT:
            return "Invalid or disallowed comment";
        case UNTERMINATED_VALUE:
            return "Unexpected end-of-input within a token";
        case UNCLOSED_SCOPE:
            return "Unexpected end-of-input: expected close marker";
        case EXPECTED_OPENING_QUOTE:
            return "Expected opening quote of a property name";
        case EXPECTED_COLON:
            return "Expected colon";
        case EXPECTED_COMMA_OR_CLOSING_BRACKET:
            return "Expected comma or closing bracket";
        case EXPECTED_VALUE:
            return "Expected a value";
        case MISMATCHED_CLOSING_BRACKET:
            return "Mismatched closing bracket";
        case EXPECTED_CIRJSON_ID:
            return "Expected CirJSON id";
        case DUPLICATE_PROPERTY:
            return "Duplicate Object property";
        case EXCEEDED_NESTING_LIMIT:
            return "Exceeded nesting limit";
        case EXCEEDED_DOCUMENT_LENGTH:
            return "Exceeded maximum document length";
        case EXCEEDED_NUMBER_LENGTH:
            return "Exceeded maximum number length";
        case EXCEEDED_STRING_LENGTH:
            return "Exceeded maximum string length";
        case EXCEEDED_NAME_LENGTH:
            return "Exceeded maximum property name length";
        case SYMBOL_TABLE_OVERFLOW:
            return "Too many hash collisions in the symbol table";
        }

        return ""; // to suppress compiler warnings -- LCOV_EXCL_LINE
    }

    error_reason reason() const noexcept
    {
        return m_reason;
    }

    error_category category() const noexcept
    {
        switch (m_reason)
        {
        case UNTERMINATED_VALUE:
        case UNCLOSED_SCOPE:
            return UNEXPECTED_END_OF_INPUT;
        case EXPECTED_OPENING_QUOTE:
        case EXPECTED_COLON:
        case EXPECTED_COMMA_OR_CLOSING_BRACKET:
        case EXPECTED_VALUE:
        case MISMATCHED_CLOSING_BRACKET:
        case EXPECTED_CIRJSON_ID:
        case DUPLICATE_PROPERTY:
            return STRUCTURAL;
        case EXCEEDED_NESTING_LIMIT:
        case EXCEEDED_DOCUMENT_LENGTH:
        case EXCEEDED_NUMBER_LENGTH:
        case EXCEEDED_STRING_LENGTH:
        case EXCEEDED_NAME_LENGTH:
        case SYMBOL_TABLE_OVERFLOW:
            return CONSTRAINT_VIOLATION;
        default:
            return MALFORMED_TOKEN;
        }
    }

    // Kind of token that was being decoded when the error was detected
    token_type token() const noexcept
    {
        return m_token;
    }

    const stream_location& location() const noexcept
    {
        return m_location;
    }

    std::uint64_t offset() const noexcept
    {
        return m_location.byte_offset;
    }

    std::size_t line() const noexcept
    {
        return m_location.line;
    }

    std::size_t column() const noexcept
    {
        return m_location.column;
    }

    const std::string& message() const noexcept
    {
        return m_message;
    }

    const char* what() const noexcept override
    {
        return m_what.c_str();
    }
}; // class parse_error

// Thrown when the library is driven incorrectly: these indicate a bug in the
// calling code rather than bad input.
class usage_error : public std::logic_error
{
public:

    using std::logic_error::logic_error;
}; // class usage_error

class bad_value_cast : public std::invalid_argument
{
public:

    using std::invalid_argument::invalid_argument;
}; // class bad_value_cast

// LCOV_EXCL_START
inline std::ostream& operator<<(
    std::ostream& out,
    const parse_error::error_reason reason)
{
    switch (reason)
    {
    case parse_error::UNKNOWN:
        return out << "UNKNOWN";
    case parse_error::UNEXPECTED_CHARACTER:
        return out << "UNEXPECTED_CHARACTER";
    case parse_error::UNRECOGNIZED_TOKEN:
        return out << "UNRECOGNIZED_TOKEN";
    case parse_error::INVALID_NUMBER:
        return out << "INVALID_NUMBER";
    case parse_error::NON_STANDARD_TOKEN:
        return out << "NON_STANDARD_TOKEN";
    case parse_error::INVALID_ESCAPE_SEQUENCE:
        return out << "INVALID_ESCAPE_SEQUENCE";
    case parse_error::EXPECTED_UTF16_LOW_SURROGATE:
        return out << "EXPECTED_UTF16_LOW_SURROGATE";
    case parse_error::INVALID_UTF16_CHARACTER:
        return out << "INVALID_UTF16_CHARACTER";
    case parse_error::INVALID_UTF8:
        return out << "INVALID_UTF8";
    case parse_error::UNESCAPED_CONTROL_CHARACTER:
        return out << "UNESCAPED_CONTROL_CHARACTER";
    case parse_error::INVALID_BOM:
        return out << "INVALID_BOM";
    case parse_error::INVALID_COMMENT:
        return out << "INVALID_COMMENT";
    case parse_error::UNTERMINATED_VALUE:
        return out << "UNTERMINATED_VALUE";
    case parse_error::UNCLOSED_SCOPE:
        return out << "UNCLOSED_SCOPE";
    case parse_error::EXPECTED_OPENING_QUOTE:
        return out << "EXPECTED_OPENING_QUOTE";
    case parse_error::EXPECTED_COLON:
        return out << "EXPECTED_COLON";
    case parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET:
        return out << "EXPECTED_COMMA_OR_CLOSING_BRACKET";
    case parse_error::EXPECTED_VALUE:
        return out << "EXPECTED_VALUE";
    case parse_error::MISMATCHED_CLOSING_BRACKET:
        return out << "MISMATCHED_CLOSING_BRACKET";
    case parse_error::EXPECTED_CIRJSON_ID:
        return out << "EXPECTED_CIRJSON_ID";
    case parse_error::DUPLICATE_PROPERTY:
        return out << "DUPLICATE_PROPERTY";
    case parse_error::EXCEEDED_NESTING_LIMIT:
        return out << "EXCEEDED_NESTING_LIMIT";
    case parse_error::EXCEEDED_DOCUMENT_LENGTH:
        return out << "EXCEEDED_DOCUMENT_LENGTH";
    case parse_error::EXCEEDED_NUMBER_LENGTH:
        return out << "EXCEEDED_NUMBER_LENGTH";
    case parse_error::EXCEEDED_STRING_LENGTH:
        return out << "EXCEEDED_STRING_LENGTH";
    case parse_error::EXCEEDED_NAME_LENGTH:
        return out << "EXCEEDED_NAME_LENGTH";
    case parse_error::SYMBOL_TABLE_OVERFLOW:
        return out << "SYMBOL_TABLE_OVERFLOW";
    }

    return out << "UNKNOWN";
}

inline std::ostream& operator<<(
    std::ostream& out,
    const parse_error::error_category category)
{
    switch (category)
    {
    case parse_error::MALFORMED_TOKEN:
        return out << "MALFORMED_TOKEN";
    case parse_error::UNEXPECTED_END_OF_INPUT:
        return out << "UNEXPECTED_END_OF_INPUT";
    case parse_error::STRUCTURAL:
        return out << "STRUCTURAL";
    case parse_error::CONSTRAINT_VIOLATION:
        return out << "CONSTRAINT_VIOLATION";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

} // namespace cirjson

#endif // CIRJSON_ERROR_H
