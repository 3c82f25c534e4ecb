#ifndef CIRJSON_ASYNC_PARSER_H
#define CIRJSON_ASYNC_PARSER_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cirjson_buffers.hpp"
#include "cirjson_error.hpp"
#include "cirjson_features.hpp"
#include "cirjson_feeder.hpp"
#include "cirjson_read_context.hpp"
#include "cirjson_symbols.hpp"
#include "cirjson_token.hpp"
#include "cirjson_value.hpp"

namespace cirjson
{

namespace detail
{

// There is an std::isdigit() but it's weird (takes an int among other things)
inline bool is_digit(const std::uint8_t c)
{
    return c >= '0' && c <= '9';
}

inline bool is_ascii_letter(const std::uint8_t c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Characters allowed in unquoted property names and in the read-ahead of
// unrecognized tokens. Non-ASCII bytes in names must form valid UTF-8.
inline bool is_identifier_part(const std::uint8_t c)
{
    return is_ascii_letter(c) || is_digit(c) || c == '_' || c == '$'
        || c >= 0x80;
}

// This exception is thrown internally by the functions dealing with UTF-16
// escape sequences and is not propagated outside of the library
struct encoding_error
{
};

inline std::uint32_t utf16_to_utf32(std::uint16_t high, std::uint16_t low)
{
    std::uint32_t result;

    if (high <= 0xD7FF || high >= 0xE000)
    {
        if (low != 0)
        {
            // Since the high code unit is not a surrogate, the low code unit
            // should be zero
            throw encoding_error();
        }

        result = high;
    }
    else
    {
        if (high > 0xDBFF) // we already know high >= 0xD800
        {
            throw encoding_error();
        }

        if (low < 0xDC00 || low > 0xDFFF)
        {
            throw encoding_error();
        }

        high -= 0xD800;
        low -= 0xDC00;
        result = 0x010000 + ((high << 10) | low);
    }

    return result;
}

// Unused trailing bytes of the result are zero
inline std::array<std::uint8_t, 4> utf32_to_utf8(const std::uint32_t utf32_char)
{
    std::array<std::uint8_t, 4> result {};

    if (utf32_char <= 0x00007F)
    {
        std::get<0>(result) = static_cast<std::uint8_t>(utf32_char);
    }
    else if (utf32_char <= 0x0007FF)
    {
        std::get<0>(result) =
            static_cast<std::uint8_t>(0xC0 | (utf32_char >> 6));
        std::get<1>(result) =
            static_cast<std::uint8_t>(0x80 | (utf32_char & 0x3F));
    }
    else if (utf32_char <= 0x00FFFF)
    {
        std::get<0>(result) =
            static_cast<std::uint8_t>(0xE0 | (utf32_char >> 12));
        std::get<1>(result) =
            static_cast<std::uint8_t>(0x80 | ((utf32_char >> 6) & 0x3F));
        std::get<2>(result) =
            static_cast<std::uint8_t>(0x80 | (utf32_char & 0x3F));
    }
    else if (utf32_char <= 0x10FFFF)
    {
        std::get<0>(result) =
            static_cast<std::uint8_t>(0xF0 | (utf32_char >> 18));
        std::get<1>(result) =
            static_cast<std::uint8_t>(0x80 | ((utf32_char >> 12) & 0x3F));
        std::get<2>(result) =
            static_cast<std::uint8_t>(0x80 | ((utf32_char >> 6) & 0x3F));
        std::get<3>(result) =
            static_cast<std::uint8_t>(0x80 | (utf32_char & 0x3F));
    }
    else
    {
        throw encoding_error();
    }

    return result;
}

inline std::array<std::uint8_t, 4> utf16_to_utf8(
    const std::uint16_t high,
    const std::uint16_t low)
{
    return utf32_to_utf8(utf16_to_utf32(high, low));
}

inline std::uint8_t parse_hex_digit(const std::uint8_t c)
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 0xa);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 0xa);
    }

    throw encoding_error();
}

inline std::string hex_byte(const std::uint8_t c)
{
    static constexpr char digits[] = "0123456789ABCDEF";

    std::string result = "0x";
    result += digits[c >> 4];
    result += digits[c & 0xF];
    return result;
}

// Printable description of an input byte for error messages
inline std::string describe_byte(const std::uint8_t c)
{
    if (c < 0x20)
    {
        return "(CTRL-CHAR, code " + std::to_string(c) + ")";
    }
    if (c < 0x7F)
    {
        return "'" + std::string(1, static_cast<char>(c)) + "' (code "
            + std::to_string(c) + ")";
    }
    return "(code " + hex_byte(c) + ")";
}

} // namespace detail

// Push-driven CirJSON tokenizer. Input arrives in chunks through feeder();
// advance() returns NOT_AVAILABLE whenever the fed bytes run out and resumes
// from the exact same point once more bytes are fed.
template<typename Feeder>
class basic_async_parser
{
public:

    enum major_state_type
    {
        MAJOR_INITIAL,
        MAJOR_ROOT,
        MAJOR_OBJECT_PROPERTY_FIRST,
        MAJOR_OBJECT_PROPERTY_NEXT,
        MAJOR_OBJECT_VALUE,
        MAJOR_ARRAY_ELEMENT_FIRST,
        MAJOR_ARRAY_ELEMENT_NEXT,
        MAJOR_CLOSED
    };

    enum minor_state_type
    {
        MINOR_NONE,
        MINOR_ROOT_BOM,
        MINOR_ROOT_GOT_SEPARATOR,
        MINOR_PROPERTY_LEADING_WS,
        MINOR_PROPERTY_LEADING_COMMA,
        MINOR_PROPERTY_NAME,
        MINOR_PROPERTY_APOS_NAME,
        MINOR_PROPERTY_UNQUOTED_NAME,
        MINOR_VALUE_LEADING_WS,
        MINOR_VALUE_EXPECTING_COMMA,
        MINOR_VALUE_EXPECTING_COLON,
        MINOR_VALUE_WS_AFTER_COMMA,
        MINOR_VALUE_TOKEN_NULL,
        MINOR_VALUE_TOKEN_TRUE,
        MINOR_VALUE_TOKEN_FALSE,
        MINOR_VALUE_TOKEN_NON_STD,
        MINOR_NUMBER_PLUS,
        MINOR_NUMBER_MINUS,
        MINOR_NUMBER_ZERO,
        MINOR_NUMBER_MINUS_ZERO,
        MINOR_NUMBER_INTEGER_DIGITS,
        MINOR_NUMBER_FRACTION_DIGITS,
        MINOR_NUMBER_EXPONENT_MARKER,
        MINOR_NUMBER_EXPONENT_DIGITS,
        MINOR_VALUE_STRING,
        MINOR_VALUE_APOS_STRING,
        MINOR_STRING_ESCAPE,
        MINOR_STRING_UTF8_2,
        MINOR_STRING_UTF8_3,
        MINOR_STRING_UTF8_4,
        MINOR_VALUE_TOKEN_ERROR,
        MINOR_COMMENT_LEADING_SLASH,
        MINOR_COMMENT_CLOSING_ASTERISK,
        MINOR_COMMENT_C,
        MINOR_COMMENT_CPP,
        MINOR_COMMENT_YAML
    };

private:

    // Returned by the state handlers when the state changed and decoding
    // should go on
    static constexpr token_type CONTINUE = NO_TOKEN;

    // Returned by skip_whitespace() when the chunk is exhausted or a comment
    // has been entered
    static constexpr int NO_BYTE = -1;

    static constexpr std::string_view EXPECTED_VALUE_TOKEN =
        "(JSON String, Number, Array, Object or token 'null', 'true' or "
        "'false')";

    Feeder m_input;

    read_features m_features;
    stream_read_constraints m_constraints;

    std::shared_ptr<byte_quads_canonicalizer> m_root_symbols;
    std::unique_ptr<byte_quads_canonicalizer> m_symbols;
    bool m_fail_on_symbol_overflow;

    io_context m_io_context;
    detail::text_buffer m_text;
    detail::text_buffer m_name_copy;

    std::unique_ptr<cirjson::read_context> m_root_context;
    cirjson::read_context* m_context;

    token_type m_token = NO_TOKEN;
    token_type m_pending_token = NO_TOKEN; // token being decoded
    major_state_type m_major = MAJOR_INITIAL;
    minor_state_type m_minor = MINOR_NONE;
    minor_state_type m_minor_after_split = MINOR_NONE;
    minor_state_type m_minor_after_comment = MINOR_NONE;
    bool m_failed = false;
    bool m_expect_id_value = false;

    // locations
    std::size_t m_line = 1;
    std::size_t m_line_alt = 1; // counts '\r'
    std::uint64_t m_line_start = 0;
    stream_location m_token_location;

    // BOM and literals
    std::size_t m_bom_index = 0;
    std::string_view m_literal;
    std::size_t m_literal_index = 0;
    std::string m_error_token;

    // numbers
    std::size_t m_fraction_digits = 0;
    std::size_t m_exponent_digits = 0;

    // strings and names
    std::uint8_t m_quote_char = '"';
    bool m_in_name = false;
    std::size_t m_escape_index = 0;
    std::uint16_t m_escape_value = 0;
    std::uint16_t m_high_surrogate = 0;
    std::size_t m_utf8_remaining = 0;
    std::uint32_t m_utf8_code = 0;
    std::vector<std::uint32_t> m_quads;
    std::uint32_t m_quad = 0;
    std::size_t m_quad_bytes = 0;

    // Errors

    parse_error error(
        const parse_error::error_reason reason,
        std::string message = {}) const
    {
        return parse_error(
            reason,
            current_location(),
            m_pending_token,
            std::move(message));
    }

    parse_error unexpected_byte(
        const parse_error::error_reason reason,
        const std::uint8_t c,
        const std::string_view expectation) const
    {
        return error(
            reason,
            "Unexpected character " + detail::describe_byte(c) + ": "
                + std::string(expectation));
    }

    parse_error unrecognized_token() const
    {
        return error(
            parse_error::UNRECOGNIZED_TOKEN,
            "Unrecognized token '" + m_error_token + "': was expecting "
                + std::string(EXPECTED_VALUE_TOKEN));
    }

    // Locations

    stream_location location_at(const std::uint64_t offset) const noexcept
    {
        stream_location result;
        result.byte_offset = offset;
        result.line = std::max(m_line, m_line_alt);
        result.column = static_cast<std::size_t>(offset - m_line_start) + 1;
        return result;
    }

    // The byte just consumed starts the next token
    void mark_token_start() noexcept
    {
        m_token_location = location_at(m_input.position() - 1);
    }

    void newline(const std::uint8_t c) noexcept
    {
        if (c == '\n')
        {
            ++m_line;
        }
        else
        {
            ++m_line_alt;
        }
        m_line_start = m_input.position();
    }

    // State transitions

    major_state_type major_after_value() const noexcept
    {
        if (m_context->in_object())
        {
            return MAJOR_OBJECT_PROPERTY_NEXT;
        }
        if (m_context->in_array())
        {
            return MAJOR_ARRAY_ELEMENT_NEXT;
        }
        return MAJOR_ROOT;
    }

    token_type value_complete(const token_type token) noexcept
    {
        m_pending_token = NO_TOKEN;
        m_major = major_after_value();
        m_minor = MINOR_NONE;
        return token;
    }

    token_type start_object_scope()
    {
        m_constraints.validate_nesting_depth(
            m_context->depth() + 1,
            m_token_location);

        m_context = &m_context->create_child_object(
            m_token_location.line,
            m_token_location.column);
        m_major = MAJOR_OBJECT_PROPERTY_FIRST;
        m_minor = MINOR_NONE;
        return START_OBJECT;
    }

    token_type start_array_scope()
    {
        m_constraints.validate_nesting_depth(
            m_context->depth() + 1,
            m_token_location);

        m_context = &m_context->create_child_array(
            m_token_location.line,
            m_token_location.column);
        m_major = MAJOR_ARRAY_ELEMENT_FIRST;
        m_minor = MINOR_NONE;
        return START_ARRAY;
    }

    token_type close_scope(const token_type token)
    {
        m_context = m_context->clear_and_get_parent();
        m_major = major_after_value();
        m_minor = MINOR_NONE;
        return token;
    }

    void release_symbols()
    {
        if (m_symbols)
        {
            m_symbols->release();
        }
    }

    // Initial minor state of a major state
    void begin_major_state()
    {
        switch (m_major)
        {
        case MAJOR_INITIAL:
            if (m_input.next_byte() == 0xEF)
            {
                m_bom_index = 1;
                m_minor = MINOR_ROOT_BOM;
                return;
            }
            m_input.unread();
            m_major = MAJOR_ROOT;
            m_minor = MINOR_ROOT_GOT_SEPARATOR;
            return;
        case MAJOR_ROOT:
            m_minor = MINOR_ROOT_GOT_SEPARATOR;
            return;
        case MAJOR_OBJECT_PROPERTY_FIRST:
            m_minor = MINOR_PROPERTY_LEADING_WS;
            return;
        case MAJOR_OBJECT_PROPERTY_NEXT:
            m_minor = MINOR_PROPERTY_LEADING_COMMA;
            return;
        case MAJOR_OBJECT_VALUE:
            m_minor = MINOR_VALUE_EXPECTING_COLON;
            return;
        case MAJOR_ARRAY_ELEMENT_FIRST:
            m_minor = MINOR_VALUE_LEADING_WS;
            return;
        case MAJOR_ARRAY_ELEMENT_NEXT:
            m_minor = MINOR_VALUE_EXPECTING_COMMA;
            return;
        case MAJOR_CLOSED:
            return;
        }
    }

    token_type step()
    {
        if (!m_input.has_byte())
        {
            return end_of_buffer();
        }

        switch (m_minor)
        {
        case MINOR_NONE:
            begin_major_state();
            return CONTINUE;
        case MINOR_ROOT_BOM:
            return finish_bom();
        case MINOR_ROOT_GOT_SEPARATOR:
            return root_value();
        case MINOR_PROPERTY_LEADING_WS:
            return property_leading_whitespace();
        case MINOR_PROPERTY_LEADING_COMMA:
            return property_leading_comma();
        case MINOR_PROPERTY_NAME:
        case MINOR_PROPERTY_APOS_NAME:
        case MINOR_VALUE_STRING:
        case MINOR_VALUE_APOS_STRING:
            return finish_string();
        case MINOR_PROPERTY_UNQUOTED_NAME:
            return finish_unquoted_name();
        case MINOR_STRING_ESCAPE:
            return finish_escape();
        case MINOR_STRING_UTF8_2:
        case MINOR_STRING_UTF8_3:
        case MINOR_STRING_UTF8_4:
            return finish_utf8();
        case MINOR_VALUE_LEADING_WS:
            return value_leading_whitespace();
        case MINOR_VALUE_EXPECTING_COMMA:
            return value_expecting_comma();
        case MINOR_VALUE_EXPECTING_COLON:
            return value_expecting_colon();
        case MINOR_VALUE_WS_AFTER_COMMA:
            return value_whitespace_after_comma();
        case MINOR_VALUE_TOKEN_NULL:
        case MINOR_VALUE_TOKEN_TRUE:
        case MINOR_VALUE_TOKEN_FALSE:
        case MINOR_VALUE_TOKEN_NON_STD:
            return finish_literal();
        case MINOR_NUMBER_PLUS:
        case MINOR_NUMBER_MINUS:
        case MINOR_NUMBER_ZERO:
        case MINOR_NUMBER_MINUS_ZERO:
        case MINOR_NUMBER_INTEGER_DIGITS:
        case MINOR_NUMBER_FRACTION_DIGITS:
        case MINOR_NUMBER_EXPONENT_MARKER:
        case MINOR_NUMBER_EXPONENT_DIGITS:
            return finish_number();
        case MINOR_VALUE_TOKEN_ERROR:
            return finish_token_error();
        case MINOR_COMMENT_LEADING_SLASH:
        case MINOR_COMMENT_CLOSING_ASTERISK:
        case MINOR_COMMENT_C:
        case MINOR_COMMENT_CPP:
        case MINOR_COMMENT_YAML:
            return finish_comment();
        }

        return CONTINUE; // to suppress compiler warnings -- LCOV_EXCL_LINE
    }

    // Called when the fed bytes are exhausted
    token_type end_of_buffer()
    {
        if (!m_input.is_end_of_input())
        {
            return NOT_AVAILABLE;
        }

        switch (m_minor)
        {
        case MINOR_COMMENT_CPP:
        case MINOR_COMMENT_YAML:
            m_minor = m_minor_after_comment;
            return CONTINUE;
        case MINOR_COMMENT_LEADING_SLASH:
        case MINOR_COMMENT_CLOSING_ASTERISK:
        case MINOR_COMMENT_C:
            throw error(
                parse_error::UNTERMINATED_VALUE,
                "Unexpected end-of-input in a comment");
        case MINOR_ROOT_BOM:
            throw error(parse_error::INVALID_BOM);
        case MINOR_VALUE_TOKEN_NULL:
        case MINOR_VALUE_TOKEN_TRUE:
        case MINOR_VALUE_TOKEN_FALSE:
        case MINOR_VALUE_TOKEN_NON_STD:
            if (m_literal_index == m_literal.size())
            {
                return literal_complete();
            }
            throw error(
                parse_error::UNTERMINATED_VALUE,
                "Unexpected end-of-input in token '"
                    + std::string(m_literal.substr(0, m_literal_index))
                    + "': was expecting '" + std::string(m_literal) + "'");
        case MINOR_VALUE_TOKEN_ERROR:
            throw unrecognized_token();
        case MINOR_NUMBER_PLUS:
        case MINOR_NUMBER_MINUS:
        case MINOR_NUMBER_ZERO:
        case MINOR_NUMBER_MINUS_ZERO:
        case MINOR_NUMBER_INTEGER_DIGITS:
        case MINOR_NUMBER_FRACTION_DIGITS:
        case MINOR_NUMBER_EXPONENT_MARKER:
        case MINOR_NUMBER_EXPONENT_DIGITS:
            return finish_number_at_end();
        case MINOR_PROPERTY_NAME:
        case MINOR_PROPERTY_APOS_NAME:
        case MINOR_PROPERTY_UNQUOTED_NAME:
        case MINOR_VALUE_STRING:
        case MINOR_VALUE_APOS_STRING:
        case MINOR_STRING_ESCAPE:
        case MINOR_STRING_UTF8_2:
        case MINOR_STRING_UTF8_3:
        case MINOR_STRING_UTF8_4:
            throw error(
                parse_error::UNTERMINATED_VALUE,
                m_in_name
                    ? "Unexpected end-of-input in property name"
                    : "Unexpected end-of-input in a String value");
        default:
            break;
        }

        if (m_context->in_root())
        {
            m_major = MAJOR_CLOSED;
            m_minor = MINOR_NONE;
            release_symbols();
            return END_OF_STREAM;
        }

        const bool in_object = m_context->in_object();
        throw parse_error(
            parse_error::UNCLOSED_SCOPE,
            current_location(),
            in_object ? END_OBJECT : END_ARRAY,
            std::string("Unexpected end-of-input: expected close marker for ")
                + (in_object ? "Object" : "Array") + " (start marker at line "
                + std::to_string(m_context->start_line()) + ", column "
                + std::to_string(m_context->start_column()) + ")");
    }

    // Whitespace and comments

    int skip_whitespace()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();
            switch (c)
            {
            case ' ':
            case '\t':
                break;
            case '\n':
            case '\r':
                newline(c);
                break;
            case '/':
                if (!m_features.is_enabled(ALLOW_C_COMMENTS))
                {
                    throw unexpected_byte(
                        parse_error::INVALID_COMMENT,
                        c,
                        "maybe a (non-standard) comment? (not recognized as "
                        "one since feature 'ALLOW_C_COMMENTS' not enabled "
                        "for parser)");
                }
                m_minor_after_comment = m_minor;
                m_minor = MINOR_COMMENT_LEADING_SLASH;
                return NO_BYTE;
            case '#':
                if (!m_features.is_enabled(ALLOW_YAML_COMMENTS))
                {
                    return c;
                }
                m_minor_after_comment = m_minor;
                m_minor = MINOR_COMMENT_YAML;
                return NO_BYTE;
            default:
                return c;
            }
        }

        return NO_BYTE;
    }

    token_type finish_comment()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();
            switch (m_minor)
            {
            case MINOR_COMMENT_LEADING_SLASH:
                if (c == '*')
                {
                    m_minor = MINOR_COMMENT_C;
                }
                else if (c == '/')
                {
                    m_minor = MINOR_COMMENT_CPP;
                }
                else
                {
                    throw unexpected_byte(
                        parse_error::INVALID_COMMENT,
                        c,
                        "was expecting either '*' or '/' for a comment");
                }
                break;
            case MINOR_COMMENT_C:
                if (c == '*')
                {
                    m_minor = MINOR_COMMENT_CLOSING_ASTERISK;
                }
                else if (c == '\n' || c == '\r')
                {
                    newline(c);
                }
                break;
            case MINOR_COMMENT_CLOSING_ASTERISK:
                if (c == '/')
                {
                    m_minor = m_minor_after_comment;
                    return CONTINUE;
                }
                if (c != '*')
                {
                    if (c == '\n' || c == '\r')
                    {
                        newline(c);
                    }
                    m_minor = MINOR_COMMENT_C;
                }
                break;
            default: // C++ and YAML comments
                if (c == '\n' || c == '\r')
                {
                    newline(c);
                    m_minor = m_minor_after_comment;
                    return CONTINUE;
                }
                break;
            }
        }

        return CONTINUE;
    }

    // Structure

    token_type finish_bom()
    {
        static constexpr std::array<std::uint8_t, 3> bom {0xEF, 0xBB, 0xBF};

        while (m_bom_index < bom.size())
        {
            if (!m_input.has_byte())
            {
                return CONTINUE;
            }

            const std::uint8_t c = m_input.next_byte();
            if (c != bom[m_bom_index])
            {
                throw error(
                    parse_error::INVALID_BOM,
                    "Unexpected byte " + detail::hex_byte(c)
                        + " in UTF-8 byte order mark");
            }
            ++m_bom_index;
        }

        m_major = MAJOR_ROOT;
        m_minor = MINOR_ROOT_GOT_SEPARATOR;
        return CONTINUE;
    }

    token_type root_value()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        mark_token_start();
        return start_value(static_cast<std::uint8_t>(c));
    }

    token_type property_leading_whitespace()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        mark_token_start();
        if (c == '}')
        {
            if (m_major == MAJOR_OBJECT_PROPERTY_FIRST)
            {
                throw error(
                    parse_error::EXPECTED_CIRJSON_ID,
                    "Expected CirJSON id property '"
                        + std::string(CIRJSON_ID_PROPERTY)
                        + "', got '}': empty Objects are not allowed");
            }
            if (m_features.is_enabled(ALLOW_TRAILING_COMMA))
            {
                return close_scope(END_OBJECT);
            }
        }

        return start_property_name(static_cast<std::uint8_t>(c));
    }

    token_type property_leading_comma()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        switch (c)
        {
        case '}':
            mark_token_start();
            return close_scope(END_OBJECT);
        case ',':
            m_minor = MINOR_PROPERTY_LEADING_WS;
            return CONTINUE;
        case ']':
            throw error(
                parse_error::MISMATCHED_CLOSING_BRACKET,
                "Unexpected close marker ']': expected '}' (for Object "
                "starting at line " + std::to_string(m_context->start_line())
                    + ", column " + std::to_string(m_context->start_column())
                    + ")");
        default:
            throw unexpected_byte(
                parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET,
                static_cast<std::uint8_t>(c),
                "was expecting comma to separate Object entries");
        }
    }

    token_type value_expecting_colon()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        if (c != ':')
        {
            throw unexpected_byte(
                parse_error::EXPECTED_COLON,
                static_cast<std::uint8_t>(c),
                "was expecting a colon to separate property name and value");
        }

        m_minor = MINOR_VALUE_LEADING_WS;
        return CONTINUE;
    }

    token_type value_leading_whitespace()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        mark_token_start();
        return start_value(static_cast<std::uint8_t>(c));
    }

    token_type value_expecting_comma()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        switch (c)
        {
        case ']':
            mark_token_start();
            return close_scope(END_ARRAY);
        case ',':
            m_minor = MINOR_VALUE_WS_AFTER_COMMA;
            return CONTINUE;
        case '}':
            throw error(
                parse_error::MISMATCHED_CLOSING_BRACKET,
                "Unexpected close marker '}': expected ']' (for Array "
                "starting at line " + std::to_string(m_context->start_line())
                    + ", column " + std::to_string(m_context->start_column())
                    + ")");
        default:
            throw unexpected_byte(
                parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET,
                static_cast<std::uint8_t>(c),
                "was expecting comma to separate Array entries");
        }
    }

    token_type value_whitespace_after_comma()
    {
        const int c = skip_whitespace();
        if (c == NO_BYTE)
        {
            return CONTINUE;
        }

        mark_token_start();
        if (c == ']' && m_features.is_enabled(ALLOW_TRAILING_COMMA))
        {
            return close_scope(END_ARRAY);
        }
        if ((c == ']' || c == ',')
            && m_features.is_enabled(ALLOW_MISSING_VALUES))
        {
            // The separator is decoded again as part of the next token
            m_input.unread();
            m_context->value_read();
            return value_complete(VALUE_NULL);
        }

        return start_value(static_cast<std::uint8_t>(c));
    }

    // Values

    token_type start_value(const std::uint8_t c)
    {
        m_context->value_read();

        if (m_major == MAJOR_ARRAY_ELEMENT_FIRST || m_expect_id_value)
        {
            const bool in_array = m_major == MAJOR_ARRAY_ELEMENT_FIRST;
            if (c == '"'
                || (c == '\'' && m_features.is_enabled(ALLOW_SINGLE_QUOTES)))
            {
                start_string(
                    c,
                    in_array ? CIRJSON_ID_ARRAY_ELEMENT : VALUE_STRING);
                return CONTINUE;
            }
            if (in_array && c == ']')
            {
                throw error(
                    parse_error::EXPECTED_CIRJSON_ID,
                    "Expected CirJSON id as first Array element, got ']': "
                    "empty Arrays are not allowed");
            }
            throw unexpected_byte(
                parse_error::EXPECTED_CIRJSON_ID,
                c,
                in_array
                    ? "expected CirJSON id (a String) as first Array element"
                    : "expected CirJSON id value (a String)");
        }

        switch (c)
        {
        case '"':
            start_string(c, VALUE_STRING);
            return CONTINUE;
        case '\'':
            if (!m_features.is_enabled(ALLOW_SINGLE_QUOTES))
            {
                break;
            }
            start_string(c, VALUE_STRING);
            return CONTINUE;
        case '{':
            return start_object_scope();
        case '[':
            return start_array_scope();
        case 'n':
            return start_literal("null", MINOR_VALUE_TOKEN_NULL, VALUE_NULL);
        case 't':
            return start_literal("true", MINOR_VALUE_TOKEN_TRUE, VALUE_TRUE);
        case 'f':
            return start_literal("false", MINOR_VALUE_TOKEN_FALSE, VALUE_FALSE);
        case 'N':
            return start_literal(
                "NaN",
                MINOR_VALUE_TOKEN_NON_STD,
                VALUE_NUMBER_FLOAT);
        case 'I':
            return start_literal(
                "Infinity",
                MINOR_VALUE_TOKEN_NON_STD,
                VALUE_NUMBER_FLOAT);
        case '-':
            start_number(MINOR_NUMBER_MINUS, "-");
            return CONTINUE;
        case '+':
            start_number(MINOR_NUMBER_PLUS, "");
            return CONTINUE;
        case '0':
            start_number(MINOR_NUMBER_ZERO, "0");
            return CONTINUE;
        case '.':
            if (!m_features.is_enabled(ALLOW_LEADING_DECIMAL_POINT_FOR_NUMBERS))
            {
                throw unexpected_byte(
                    parse_error::INVALID_NUMBER,
                    c,
                    "Decimal point not preceded by a digit (enable "
                    "ALLOW_LEADING_DECIMAL_POINT_FOR_NUMBERS to allow)");
            }
            start_number(MINOR_NUMBER_FRACTION_DIGITS, ".");
            m_pending_token = VALUE_NUMBER_FLOAT;
            m_fraction_digits = 0;
            return CONTINUE;
        case ']':
        case '}':
        case ',':
        case ':':
            throw unexpected_byte(
                parse_error::EXPECTED_VALUE,
                c,
                "expected a value");
        default:
            break;
        }

        if (detail::is_digit(c))
        {
            start_number(MINOR_NUMBER_INTEGER_DIGITS, "");
            append_number_char(c);
            return CONTINUE;
        }

        if (detail::is_identifier_part(c))
        {
            m_error_token.assign(1, static_cast<char>(c));
            m_minor = MINOR_VALUE_TOKEN_ERROR;
            return CONTINUE;
        }

        throw unexpected_byte(
            parse_error::UNEXPECTED_CHARACTER,
            c,
            "expected a valid value " + std::string(EXPECTED_VALUE_TOKEN));
    }

    // Literals

    token_type start_literal(
        const std::string_view literal,
        const minor_state_type minor,
        const token_type token)
    {
        m_literal = literal;
        m_literal_index = 1;
        m_minor = minor;
        m_pending_token = token;
        return CONTINUE;
    }

    // Switches to the read-ahead of an unrecognized token
    token_type begin_token_error(
        const std::string_view matched,
        const std::uint8_t c)
    {
        m_error_token.assign(matched);
        if (!detail::is_identifier_part(c))
        {
            throw unrecognized_token();
        }

        m_error_token += static_cast<char>(c);
        m_minor = MINOR_VALUE_TOKEN_ERROR;
        return CONTINUE;
    }

    token_type finish_literal()
    {
        while (m_literal_index < m_literal.size())
        {
            if (!m_input.has_byte())
            {
                return CONTINUE;
            }

            const std::uint8_t c = m_input.next_byte();
            if (c != static_cast<std::uint8_t>(m_literal[m_literal_index]))
            {
                return begin_token_error(
                    m_literal.substr(0, m_literal_index),
                    c);
            }
            ++m_literal_index;
        }

        // The literal only ends with a byte that cannot continue it
        if (!m_input.has_byte())
        {
            return CONTINUE;
        }

        const std::uint8_t c = m_input.next_byte();
        if (c < '0' || c == ']' || c == '}')
        {
            m_input.unread();
            return literal_complete();
        }

        return begin_token_error(m_literal, c);
    }

    token_type literal_complete()
    {
        const token_type token = m_pending_token;
        if (m_minor == MINOR_VALUE_TOKEN_NON_STD)
        {
            if (!m_features.is_enabled(ALLOW_NON_NUMERIC_NUMBERS))
            {
                throw error(
                    parse_error::NON_STANDARD_TOKEN,
                    "Non-standard token '" + std::string(m_literal)
                        + "': enable ALLOW_NON_NUMERIC_NUMBERS to allow");
            }
            m_text.assign(m_literal);
        }

        return value_complete(token);
    }

    token_type finish_token_error()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();
            if (!detail::is_identifier_part(c))
            {
                throw unrecognized_token();
            }

            m_error_token += static_cast<char>(c);
            if (m_error_token.size() >= CJR_MAX_ERROR_TOKEN_LENGTH)
            {
                m_error_token += "...";
                throw unrecognized_token();
            }
        }

        return CONTINUE;
    }

    // Numbers

    void start_number(
        const minor_state_type minor,
        const std::string_view prefix)
    {
        m_text.assign(prefix);
        m_minor = minor;
        m_pending_token = VALUE_NUMBER_INT;
    }

    void append_number_char(const std::uint8_t c)
    {
        m_text.append(static_cast<char>(c));
        m_constraints.validate_number_length(
            m_text.size(),
            current_location(),
            m_pending_token);
    }

    token_type number_complete(const token_type token)
    {
        return value_complete(token);
    }

    // Handles the byte following the integer part
    token_type end_integer_part(const std::uint8_t c)
    {
        if (c == '.')
        {
            append_number_char(c);
            m_fraction_digits = 0;
            m_pending_token = VALUE_NUMBER_FLOAT;
            m_minor = MINOR_NUMBER_FRACTION_DIGITS;
            return CONTINUE;
        }
        if (c == 'e' || c == 'E')
        {
            append_number_char(c);
            m_pending_token = VALUE_NUMBER_FLOAT;
            m_minor = MINOR_NUMBER_EXPONENT_MARKER;
            return CONTINUE;
        }

        m_input.unread();
        return number_complete(VALUE_NUMBER_INT);
    }

    token_type finish_number()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();

            switch (m_minor)
            {
            case MINOR_NUMBER_PLUS:
            case MINOR_NUMBER_MINUS:
            {
                const bool plus = m_minor == MINOR_NUMBER_PLUS;
                if (c == 'I')
                {
                    m_literal = plus ? "+Infinity" : "-Infinity";
                    m_literal_index = 2;
                    m_minor = MINOR_VALUE_TOKEN_NON_STD;
                    m_pending_token = VALUE_NUMBER_FLOAT;
                    return CONTINUE;
                }
                if (plus
                    && (detail::is_digit(c) || c == '.')
                    && !m_features.is_enabled(
                        ALLOW_LEADING_PLUS_SIGN_FOR_NUMBERS))
                {
                    throw unexpected_byte(
                        parse_error::INVALID_NUMBER,
                        '+',
                        "in numeric value: JSON does not allow numbers "
                        "to have plus signs: enable "
                        "ALLOW_LEADING_PLUS_SIGN_FOR_NUMBERS to allow");
                }
                if (c == '0')
                {
                    append_number_char(c);
                    m_minor = plus ? MINOR_NUMBER_ZERO : MINOR_NUMBER_MINUS_ZERO;
                }
                else if (detail::is_digit(c))
                {
                    append_number_char(c);
                    m_minor = MINOR_NUMBER_INTEGER_DIGITS;
                }
                else if (c == '.'
                    && m_features.is_enabled(
                        ALLOW_LEADING_DECIMAL_POINT_FOR_NUMBERS))
                {
                    append_number_char(c);
                    m_fraction_digits = 0;
                    m_pending_token = VALUE_NUMBER_FLOAT;
                    m_minor = MINOR_NUMBER_FRACTION_DIGITS;
                }
                else
                {
                    throw unexpected_byte(
                        parse_error::INVALID_NUMBER,
                        c,
                        std::string("in numeric value: expected digit (0-9) "
                            "to follow ") + (plus ? "plus" : "minus")
                            + " sign, for valid numeric value");
                }
                break;
            }
            case MINOR_NUMBER_ZERO:
            case MINOR_NUMBER_MINUS_ZERO:
                if (detail::is_digit(c))
                {
                    if (!m_features.is_enabled(ALLOW_LEADING_ZEROS_FOR_NUMBERS))
                    {
                        throw error(
                            parse_error::INVALID_NUMBER,
                            "Invalid numeric value: Leading zeroes not allowed");
                    }
                    // Superfluous leading zeros are dropped
                    if (c != '0')
                    {
                        m_text.pop_back();
                        append_number_char(c);
                        m_minor = MINOR_NUMBER_INTEGER_DIGITS;
                    }
                }
                else if (const token_type token = end_integer_part(c);
                         token != CONTINUE)
                {
                    return token;
                }
                break;
            case MINOR_NUMBER_INTEGER_DIGITS:
                if (detail::is_digit(c))
                {
                    append_number_char(c);
                }
                else if (const token_type token = end_integer_part(c);
                         token != CONTINUE)
                {
                    return token;
                }
                break;
            case MINOR_NUMBER_FRACTION_DIGITS:
                if (detail::is_digit(c))
                {
                    append_number_char(c);
                    ++m_fraction_digits;
                    break;
                }
                if (m_fraction_digits == 0
                    && !m_features.is_enabled(
                        ALLOW_TRAILING_DECIMAL_POINT_FOR_NUMBERS))
                {
                    throw unexpected_byte(
                        parse_error::INVALID_NUMBER,
                        c,
                        "Decimal point not followed by a digit");
                }
                if (c == 'e' || c == 'E')
                {
                    append_number_char(c);
                    m_minor = MINOR_NUMBER_EXPONENT_MARKER;
                    break;
                }
                m_input.unread();
                return number_complete(VALUE_NUMBER_FLOAT);
            case MINOR_NUMBER_EXPONENT_MARKER:
                m_exponent_digits = 0;
                if (c == '+' || c == '-')
                {
                    append_number_char(c);
                }
                else if (detail::is_digit(c))
                {
                    append_number_char(c);
                    m_exponent_digits = 1;
                }
                else
                {
                    throw unexpected_byte(
                        parse_error::INVALID_NUMBER,
                        c,
                        "Exponent indicator not followed by a digit");
                }
                m_minor = MINOR_NUMBER_EXPONENT_DIGITS;
                break;
            case MINOR_NUMBER_EXPONENT_DIGITS:
                if (detail::is_digit(c))
                {
                    append_number_char(c);
                    ++m_exponent_digits;
                    break;
                }
                if (m_exponent_digits == 0)
                {
                    throw unexpected_byte(
                        parse_error::INVALID_NUMBER,
                        c,
                        "Exponent indicator not followed by a digit");
                }
                m_input.unread();
                return number_complete(VALUE_NUMBER_FLOAT);
            default:
                return CONTINUE; // LCOV_EXCL_LINE
            }
        }

        return CONTINUE;
    }

    token_type finish_number_at_end()
    {
        switch (m_minor)
        {
        case MINOR_NUMBER_ZERO:
        case MINOR_NUMBER_MINUS_ZERO:
        case MINOR_NUMBER_INTEGER_DIGITS:
            return number_complete(VALUE_NUMBER_INT);
        case MINOR_NUMBER_FRACTION_DIGITS:
            if (m_fraction_digits > 0
                || m_features.is_enabled(
                    ALLOW_TRAILING_DECIMAL_POINT_FOR_NUMBERS))
            {
                return number_complete(VALUE_NUMBER_FLOAT);
            }
            break;
        case MINOR_NUMBER_EXPONENT_DIGITS:
            if (m_exponent_digits > 0)
            {
                return number_complete(VALUE_NUMBER_FLOAT);
            }
            break;
        default:
            break;
        }

        throw error(
            parse_error::UNTERMINATED_VALUE,
            "Unexpected end-of-input in a numeric value");
    }

    // Strings and property names

    void start_string(const std::uint8_t quote, const token_type token)
    {
        m_text.clear();
        m_quote_char = quote;
        m_in_name = false;
        m_high_surrogate = 0;
        m_minor = (quote == '"') ? MINOR_VALUE_STRING : MINOR_VALUE_APOS_STRING;
        m_pending_token = token;
    }

    void start_name(const minor_state_type minor, const std::uint8_t quote)
    {
        m_name_copy.clear();
        m_quads.clear();
        m_quad = 0;
        m_quad_bytes = 0;
        m_quote_char = quote;
        m_in_name = true;
        m_high_surrogate = 0;
        m_minor = minor;
        m_pending_token = PROPERTY_NAME;
    }

    token_type start_property_name(const std::uint8_t c)
    {
        if (c == '"')
        {
            start_name(MINOR_PROPERTY_NAME, c);
            return CONTINUE;
        }
        if (c == '\'' && m_features.is_enabled(ALLOW_SINGLE_QUOTES))
        {
            start_name(MINOR_PROPERTY_APOS_NAME, c);
            return CONTINUE;
        }
        if (m_features.is_enabled(ALLOW_UNQUOTED_PROPERTY_NAMES)
            && detail::is_identifier_part(c))
        {
            start_name(MINOR_PROPERTY_UNQUOTED_NAME, 0);
            if (c < 0x80)
            {
                emit(c);
            }
            else
            {
                start_utf8(c);
            }
            return CONTINUE;
        }

        throw unexpected_byte(
            parse_error::EXPECTED_OPENING_QUOTE,
            c,
            "was expecting double-quote to start property name");
    }

    // Appends a decoded byte to the string or name being read
    void emit(const std::uint8_t c)
    {
        if (m_in_name)
        {
            m_name_copy.append(static_cast<char>(c));
            m_quad = (m_quad << 8) | c;
            if (++m_quad_bytes == 4)
            {
                m_quads.push_back(m_quad);
                m_quad = 0;
                m_quad_bytes = 0;
            }
            m_constraints.validate_name_length(
                m_name_copy.size(),
                current_location());
        }
        else
        {
            m_text.append(static_cast<char>(c));
            m_constraints.validate_string_length(
                m_text.size(),
                current_location());
        }
    }

    void emit_utf8(const std::array<std::uint8_t, 4>& c)
    {
        emit(std::get<0>(c));

        for (std::size_t i = 1; i < c.size() && c[i]; ++i)
        {
            emit(c[i]);
        }
    }

    token_type finish_string()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();

            if (m_high_surrogate != 0 && c != '\\')
            {
                throw error(parse_error::EXPECTED_UTF16_LOW_SURROGATE);
            }
            if (c == m_quote_char)
            {
                return m_in_name ? name_complete() : string_complete();
            }
            if (c == '\\')
            {
                m_minor_after_split = m_minor;
                m_minor = MINOR_STRING_ESCAPE;
                m_escape_index = 0;
                return CONTINUE;
            }
            if (c < 0x20)
            {
                if (!m_features.is_enabled(ALLOW_UNESCAPED_CONTROL_CHARS))
                {
                    throw error(
                        parse_error::UNESCAPED_CONTROL_CHARACTER,
                        "Illegal unquoted character "
                            + detail::describe_byte(c)
                            + ": has to be escaped using backslash to be "
                            "included in "
                            + (m_in_name ? "name" : "string value"));
                }
                emit(c);
                continue;
            }
            if (c < 0x80)
            {
                emit(c);
                continue;
            }

            start_utf8(c);
            return CONTINUE;
        }

        return CONTINUE;
    }

    // Emits the lead byte of a multi-byte UTF-8 sequence and switches to the
    // state reading its continuation bytes
    void start_utf8(const std::uint8_t c)
    {
        if (c >= 0xC2 && c <= 0xDF)
        {
            m_utf8_code = c & 0x1F;
            m_utf8_remaining = 1;
            m_minor_after_split = m_minor;
            m_minor = MINOR_STRING_UTF8_2;
        }
        else if (c >= 0xE0 && c <= 0xEF)
        {
            m_utf8_code = c & 0x0F;
            m_utf8_remaining = 2;
            m_minor_after_split = m_minor;
            m_minor = MINOR_STRING_UTF8_3;
        }
        else if (c >= 0xF0 && c <= 0xF4)
        {
            m_utf8_code = c & 0x07;
            m_utf8_remaining = 3;
            m_minor_after_split = m_minor;
            m_minor = MINOR_STRING_UTF8_4;
        }
        else
        {
            throw error(
                parse_error::INVALID_UTF8,
                "Invalid UTF-8 start byte " + detail::hex_byte(c));
        }
        emit(c);
    }

    token_type finish_utf8()
    {
        while (m_utf8_remaining > 0)
        {
            if (!m_input.has_byte())
            {
                return CONTINUE;
            }

            const std::uint8_t c = m_input.next_byte();
            if ((c & 0xC0) != 0x80)
            {
                throw error(
                    parse_error::INVALID_UTF8,
                    "Invalid UTF-8 middle byte " + detail::hex_byte(c));
            }
            m_utf8_code = (m_utf8_code << 6) | (c & 0x3F);
            emit(c);
            --m_utf8_remaining;
        }

        // Overlong encodings, surrogates and code points past U+10FFFF
        const bool invalid =
            (m_minor == MINOR_STRING_UTF8_3
                && (m_utf8_code < 0x800
                    || (m_utf8_code >= 0xD800 && m_utf8_code <= 0xDFFF)))
            || (m_minor == MINOR_STRING_UTF8_4
                && (m_utf8_code < 0x10000 || m_utf8_code > 0x10FFFF));
        if (invalid)
        {
            throw error(
                parse_error::INVALID_UTF8,
                "Invalid UTF-8 sequence for code point "
                    + std::to_string(m_utf8_code));
        }

        m_minor = m_minor_after_split;
        return CONTINUE;
    }

    char unescape(const std::uint8_t c) const
    {
        switch (c)
        {
        case '"':
        case '\\':
        case '/':
            return static_cast<char>(c);
        case 'b':
            return '\b';
        case 'f':
            return '\f';
        case 'n':
            return '\n';
        case 'r':
            return '\r';
        case 't':
            return '\t';
        case '\'':
            if (m_features.is_enabled(ALLOW_SINGLE_QUOTES))
            {
                return '\'';
            }
            break;
        default:
            break;
        }

        if (c < 0x80
            && m_features.is_enabled(ALLOW_BACKSLASH_ESCAPING_ANY_CHARACTER))
        {
            return static_cast<char>(c);
        }

        throw error(
            parse_error::INVALID_ESCAPE_SEQUENCE,
            "Unrecognized character escape " + detail::describe_byte(c));
    }

    token_type finish_escape()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();

            if (m_escape_index == 0)
            {
                if (c == 'u')
                {
                    m_escape_index = 1;
                    m_escape_value = 0;
                    continue;
                }
                if (m_high_surrogate != 0)
                {
                    throw error(parse_error::EXPECTED_UTF16_LOW_SURROGATE);
                }

                emit(static_cast<std::uint8_t>(unescape(c)));
                m_minor = m_minor_after_split;
                return CONTINUE;
            }

            try
            {
                m_escape_value = static_cast<std::uint16_t>(
                    (m_escape_value << 4) | detail::parse_hex_digit(c));
            }
            catch (const detail::encoding_error&)
            {
                throw error(
                    parse_error::INVALID_ESCAPE_SEQUENCE,
                    "Expected a hex-digit for character escape sequence, got "
                        + detail::describe_byte(c));
            }

            if (++m_escape_index <= 4)
            {
                continue;
            }

            complete_utf16_escape(m_escape_value);
            m_minor = m_minor_after_split;
            return CONTINUE;
        }

        return CONTINUE;
    }

    void complete_utf16_escape(const std::uint16_t code_unit)
    {
        const bool is_high = code_unit >= 0xD800 && code_unit <= 0xDBFF;
        const bool is_low = code_unit >= 0xDC00 && code_unit <= 0xDFFF;

        if (m_high_surrogate != 0)
        {
            if (!is_low)
            {
                throw error(parse_error::EXPECTED_UTF16_LOW_SURROGATE);
            }
            emit_utf8(detail::utf16_to_utf8(m_high_surrogate, code_unit));
            m_high_surrogate = 0;
        }
        else if (is_high)
        {
            // Written out once the low surrogate arrives
            m_high_surrogate = code_unit;
        }
        else if (is_low)
        {
            throw error(parse_error::INVALID_UTF16_CHARACTER);
        }
        else
        {
            emit_utf8(detail::utf16_to_utf8(code_unit, 0));
        }
    }

    token_type finish_unquoted_name()
    {
        while (m_input.has_byte())
        {
            const std::uint8_t c = m_input.next_byte();
            if (!detail::is_identifier_part(c))
            {
                m_input.unread();
                return name_complete();
            }
            if (c >= 0x80)
            {
                start_utf8(c);
                return CONTINUE;
            }
            emit(c);
        }

        return CONTINUE;
    }

    token_type string_complete()
    {
        m_expect_id_value = false;
        return value_complete(m_pending_token);
    }

    name_ref canonicalize(const std::string_view name_text)
    {
        if (!m_root_symbols)
        {
            return std::make_shared<const canonical_name>(
                std::string(name_text));
        }

        if (m_symbols->mode() == byte_quads_canonicalizer::PLACEHOLDER)
        {
            m_symbols = m_root_symbols->make_child(m_fail_on_symbol_overflow);
        }

        if (name_ref found = m_symbols->find_name(m_quads.data(), m_quads.size()))
        {
            return found;
        }

        try
        {
            return m_symbols->add_name(
                std::string(name_text),
                m_quads.data(),
                m_quads.size());
        }
        catch (const parse_error& e)
        {
            throw parse_error(
                e.reason(),
                current_location(),
                PROPERTY_NAME,
                e.message());
        }
    }

    token_type name_complete()
    {
        if (m_quad_bytes > 0 || m_quads.empty())
        {
            m_quads.push_back(pad_last_quad(m_quad, m_quad_bytes));
        }

        name_ref name = canonicalize(m_name_copy.view());

        token_type token = PROPERTY_NAME;
        if (m_major == MAJOR_OBJECT_PROPERTY_FIRST)
        {
            if (name->text() != CIRJSON_ID_PROPERTY)
            {
                throw error(
                    parse_error::EXPECTED_CIRJSON_ID,
                    "Expected CirJSON id property '"
                        + std::string(CIRJSON_ID_PROPERTY)
                        + "' as first property, got '"
                        + std::string(name->text()) + "'");
            }
            token = CIRJSON_ID_PROPERTY_NAME;
            m_expect_id_value = true;
        }

        const std::string_view name_text = name->text();
        if (!m_context->set_current_name(std::move(name)))
        {
            throw error(
                parse_error::DUPLICATE_PROPERTY,
                "Duplicate Object property \"" + std::string(name_text)
                    + "\"");
        }

        m_pending_token = NO_TOKEN;
        m_major = MAJOR_OBJECT_VALUE;
        m_minor = MINOR_NONE;
        return token;
    }

public:

    // Without a root symbol table property names are not canonicalized
    explicit basic_async_parser(
        const read_features features = read_features(),
        const stream_read_constraints& constraints = stream_read_constraints(),
        std::shared_ptr<byte_quads_canonicalizer> root_symbols = nullptr,
        const bool fail_on_symbol_overflow = true,
        buffer_recycler* const recycler = nullptr)
    : m_features(features)
    , m_constraints(constraints)
    , m_root_symbols(std::move(root_symbols))
    , m_symbols(byte_quads_canonicalizer::create_placeholder())
    , m_fail_on_symbol_overflow(fail_on_symbol_overflow)
    , m_io_context(recycler)
    , m_text(m_io_context, buffer_recycler::CHAR_TOKEN_BUFFER)
    , m_name_copy(m_io_context, buffer_recycler::CHAR_NAME_COPY_BUFFER)
    , m_root_context(cirjson::read_context::create_root(
          features.is_enabled(STRICT_DUPLICATE_DETECTION)))
    , m_context(m_root_context.get())
    {
    }

    basic_async_parser(const basic_async_parser&) = delete;
    basic_async_parser(basic_async_parser&&) = delete;
    basic_async_parser& operator=(const basic_async_parser&) = delete;
    basic_async_parser& operator=(basic_async_parser&&) = delete;

    ~basic_async_parser()
    {
        release_symbols();
    }

    Feeder& feeder() noexcept
    {
        return m_input;
    }

    const Feeder& feeder() const noexcept
    {
        return m_input;
    }

    // Decodes the next token. Returns NOT_AVAILABLE when more input must be
    // fed, END_OF_STREAM once end_of_input() was signaled and everything
    // was consumed.
    token_type advance()
    {
        if (m_failed)
        {
            throw usage_error(
                "advance() called on a parser that already failed");
        }
        if (m_major == MAJOR_CLOSED)
        {
            m_token = END_OF_STREAM;
            return m_token;
        }

        try
        {
            m_constraints.validate_document_length(
                m_input.total_fed(),
                current_location());

            token_type token;
            do
            {
                token = step();
            }
            while (token == CONTINUE);

            m_token = token;
            return m_token;
        }
        catch (const parse_error&)
        {
            m_failed = true;
            m_major = MAJOR_CLOSED;
            m_minor = MINOR_NONE;
            release_symbols();
            throw;
        }
    }

    token_type current_token() const noexcept
    {
        return m_token;
    }

    // Property name of the current token: the name itself for names, the
    // name of the enclosing property for values
    std::string_view current_name() const noexcept
    {
        return current_name_ref()
            ? current_name_ref()->text()
            : std::string_view();
    }

    const name_ref& current_name_ref() const noexcept
    {
        if (is_struct_start(m_token) && m_context->parent())
        {
            return m_context->parent()->current_name_ref();
        }
        return m_context->current_name_ref();
    }

    // Text of the current token, valid until the next call to advance()
    std::string_view text() const noexcept
    {
        switch (m_token)
        {
        case PROPERTY_NAME:
        case CIRJSON_ID_PROPERTY_NAME:
            return m_context->current_name();
        case VALUE_STRING:
        case CIRJSON_ID_ARRAY_ELEMENT:
        case VALUE_NUMBER_INT:
        case VALUE_NUMBER_FLOAT:
            return m_text.view();
        default:
            return token_text(m_token);
        }
    }

    cirjson::value value() const
    {
        switch (m_token)
        {
        case PROPERTY_NAME:
        case CIRJSON_ID_PROPERTY_NAME:
        case VALUE_STRING:
        case CIRJSON_ID_ARRAY_ELEMENT:
            return cirjson::value(String, text());
        case VALUE_NUMBER_INT:
        case VALUE_NUMBER_FLOAT:
            return cirjson::value(Number, text());
        case VALUE_TRUE:
        case VALUE_FALSE:
            return cirjson::value(Boolean, text());
        case VALUE_NULL:
            return cirjson::value(Null, text());
        default:
            throw bad_value_cast("current token is not a scalar value");
        }
    }

    template<typename T>
    T value_as() const
    {
        return value().template as<T>();
    }

    const cirjson::read_context& read_context() const noexcept
    {
        return *m_context;
    }

    stream_location current_location() const noexcept
    {
        return location_at(m_input.position());
    }

    // Start of the current (or last completed) token
    const stream_location& token_location() const noexcept
    {
        return m_token_location;
    }

    bool is_closed() const noexcept
    {
        return m_major == MAJOR_CLOSED;
    }

    bool has_failed() const noexcept
    {
        return m_failed;
    }

    // Stops decoding and hands the names discovered so far to the root
    // symbol table
    void close()
    {
        if (m_major == MAJOR_CLOSED)
        {
            return;
        }

        m_major = MAJOR_CLOSED;
        m_minor = MINOR_NONE;
        release_symbols();
    }

    major_state_type major_state() const noexcept
    {
        return m_major;
    }

    minor_state_type minor_state() const noexcept
    {
        return m_minor;
    }

    const byte_quads_canonicalizer& symbols() const noexcept
    {
        return *m_symbols;
    }
}; // class basic_async_parser

using byte_array_parser = basic_async_parser<byte_array_feeder>;
using byte_buffer_parser = basic_async_parser<byte_buffer_feeder>;

} // namespace cirjson

#endif // CIRJSON_ASYNC_PARSER_H
