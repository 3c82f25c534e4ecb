#ifndef CIRJSON_FEATURES_H
#define CIRJSON_FEATURES_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "cirjson_error.hpp"

#ifndef CJR_DEFAULT_MAX_NESTING_DEPTH
#define CJR_DEFAULT_MAX_NESTING_DEPTH 500
#endif

// Negative means unlimited
#ifndef CJR_DEFAULT_MAX_DOCUMENT_LENGTH
#define CJR_DEFAULT_MAX_DOCUMENT_LENGTH -1
#endif

#ifndef CJR_DEFAULT_MAX_NUMBER_LENGTH
#define CJR_DEFAULT_MAX_NUMBER_LENGTH 1000
#endif

#ifndef CJR_DEFAULT_MAX_STRING_LENGTH
#define CJR_DEFAULT_MAX_STRING_LENGTH 20000000
#endif

#ifndef CJR_DEFAULT_MAX_NAME_LENGTH
#define CJR_DEFAULT_MAX_NAME_LENGTH 50000
#endif

#ifndef CJR_MAX_ERROR_TOKEN_LENGTH
#define CJR_MAX_ERROR_TOKEN_LENGTH 256
#endif

namespace cirjson
{

enum read_feature : std::uint32_t
{
    ALLOW_C_COMMENTS = 1u << 0,
    ALLOW_YAML_COMMENTS = 1u << 1,
    ALLOW_UNQUOTED_PROPERTY_NAMES = 1u << 2,
    ALLOW_SINGLE_QUOTES = 1u << 3,
    ALLOW_UNESCAPED_CONTROL_CHARS = 1u << 4,
    ALLOW_BACKSLASH_ESCAPING_ANY_CHARACTER = 1u << 5,
    ALLOW_LEADING_ZEROS_FOR_NUMBERS = 1u << 6,
    ALLOW_LEADING_PLUS_SIGN_FOR_NUMBERS = 1u << 7,
    ALLOW_LEADING_DECIMAL_POINT_FOR_NUMBERS = 1u << 8,
    ALLOW_TRAILING_DECIMAL_POINT_FOR_NUMBERS = 1u << 9,
    ALLOW_NON_NUMERIC_NUMBERS = 1u << 10,
    ALLOW_MISSING_VALUES = 1u << 11,
    ALLOW_TRAILING_COMMA = 1u << 12,
    STRICT_DUPLICATE_DETECTION = 1u << 13,
};

// Set of read_feature flags; everything is off by default, which gives
// strict CirJSON
class read_features
{
private:

    std::uint32_t m_mask = 0;

public:

    constexpr read_features() noexcept = default;

    constexpr explicit read_features(const std::uint32_t mask) noexcept
    : m_mask(mask)
    {
    }

    constexpr bool is_enabled(const read_feature feature) const noexcept
    {
        return (m_mask & feature) != 0;
    }

    read_features& enable(const read_feature feature) noexcept
    {
        m_mask |= feature;
        return *this;
    }

    read_features& disable(const read_feature feature) noexcept
    {
        m_mask &= ~static_cast<std::uint32_t>(feature);
        return *this;
    }

    read_features& configure(
        const read_feature feature,
        const bool state) noexcept
    {
        return state ? enable(feature) : disable(feature);
    }

    constexpr std::uint32_t mask() const noexcept
    {
        return m_mask;
    }
}; // class read_features

// Limits enforced while reading. Checks are done as soon as the limit is
// crossed, before the offending token is completed.
struct stream_read_constraints
{
    std::size_t max_nesting_depth = CJR_DEFAULT_MAX_NESTING_DEPTH;
    std::int64_t max_document_length = CJR_DEFAULT_MAX_DOCUMENT_LENGTH;
    std::size_t max_number_length = CJR_DEFAULT_MAX_NUMBER_LENGTH;
    std::size_t max_string_length = CJR_DEFAULT_MAX_STRING_LENGTH;
    std::size_t max_name_length = CJR_DEFAULT_MAX_NAME_LENGTH;

    void validate_nesting_depth(
        const std::size_t depth,
        const stream_location& location) const
    {
        if (depth > max_nesting_depth)
        {
            throw parse_error(
                parse_error::EXCEEDED_NESTING_LIMIT,
                location,
                NO_TOKEN,
                exceeded("Document nesting depth", depth, max_nesting_depth));
        }
    }

    void validate_document_length(
        const std::uint64_t length,
        const stream_location& location) const
    {
        if (max_document_length >= 0
            && length > static_cast<std::uint64_t>(max_document_length))
        {
            throw parse_error(
                parse_error::EXCEEDED_DOCUMENT_LENGTH,
                location,
                NO_TOKEN,
                exceeded(
                    "Document length",
                    length,
                    static_cast<std::uint64_t>(max_document_length)));
        }
    }

    void validate_number_length(
        const std::size_t length,
        const stream_location& location,
        const token_type token) const
    {
        if (length > max_number_length)
        {
            throw parse_error(
                parse_error::EXCEEDED_NUMBER_LENGTH,
                location,
                token,
                exceeded("Number value length", length, max_number_length));
        }
    }

    void validate_string_length(
        const std::size_t length,
        const stream_location& location) const
    {
        if (length > max_string_length)
        {
            throw parse_error(
                parse_error::EXCEEDED_STRING_LENGTH,
                location,
                VALUE_STRING,
                exceeded("String value length", length, max_string_length));
        }
    }

    void validate_name_length(
        const std::size_t length,
        const stream_location& location) const
    {
        if (length > max_name_length)
        {
            throw parse_error(
                parse_error::EXCEEDED_NAME_LENGTH,
                location,
                PROPERTY_NAME,
                exceeded("Name length", length, max_name_length));
        }
    }

private:

    static std::string exceeded(
        const char* const what,
        const std::uint64_t actual,
        const std::uint64_t limit)
    {
        return std::string(what) + " (" + std::to_string(actual)
            + ") exceeds the maximum allowed (" + std::to_string(limit) + ")";
    }
}; // struct stream_read_constraints

} // namespace cirjson

#endif // CIRJSON_FEATURES_H
