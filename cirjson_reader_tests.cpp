#include "cirjson_reader.hpp"

#include "test/token_reader.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using cirjson_test::read_error;
using cirjson_test::read_tokens;
using cirjson_test::token_record;

TEST(cirjson_reader_detail, utf16_to_utf32)
{
    // code points 0000 to D7FF and E000 to FFFF
    ASSERT_EQ(0x000000u, cirjson::detail::utf16_to_utf32(0x0000, 0x0000));
    ASSERT_EQ(0x000001u, cirjson::detail::utf16_to_utf32(0x0001, 0x0000));
    ASSERT_EQ(0x00D7FFu, cirjson::detail::utf16_to_utf32(0xD7FF, 0x0000));
    ASSERT_EQ(0x00E000u, cirjson::detail::utf16_to_utf32(0xE000, 0x0000));
    ASSERT_EQ(0x00FFFFu, cirjson::detail::utf16_to_utf32(0xFFFF, 0x0000));

    // code points 010000 to 10FFFF
    ASSERT_EQ(0x010000u, cirjson::detail::utf16_to_utf32(0xD800, 0xDC00));
    ASSERT_EQ(0x01F600u, cirjson::detail::utf16_to_utf32(0xD83D, 0xDE00));
    ASSERT_EQ(0x10FFFFu, cirjson::detail::utf16_to_utf32(0xDBFF, 0xDFFF));
}

TEST(cirjson_reader_detail, utf16_to_utf32_invalid)
{
    ASSERT_THROW(
        cirjson::detail::utf16_to_utf32(0x0000, 0x0001),
        cirjson::detail::encoding_error);
    ASSERT_THROW(
        cirjson::detail::utf16_to_utf32(0xD800, 0xDBFF),
        cirjson::detail::encoding_error);
    ASSERT_THROW(
        cirjson::detail::utf16_to_utf32(0xD800, 0xE000),
        cirjson::detail::encoding_error);
    ASSERT_THROW(
        cirjson::detail::utf16_to_utf32(0xDC00, 0xDC00),
        cirjson::detail::encoding_error);
}

TEST(cirjson_reader_detail, utf32_to_utf8)
{
    using bytes = std::array<std::uint8_t, 4>;

    ASSERT_EQ((bytes {0x41, 0, 0, 0}), cirjson::detail::utf32_to_utf8(0x41));
    ASSERT_EQ(
        (bytes {0xC3, 0xA9, 0, 0}),
        cirjson::detail::utf32_to_utf8(0xE9));
    ASSERT_EQ(
        (bytes {0xE2, 0x82, 0xAC, 0}),
        cirjson::detail::utf32_to_utf8(0x20AC));
    ASSERT_EQ(
        (bytes {0xF0, 0x9F, 0x98, 0x80}),
        cirjson::detail::utf32_to_utf8(0x1F600));
    ASSERT_THROW(
        cirjson::detail::utf32_to_utf8(0x110000),
        cirjson::detail::encoding_error);
}

TEST(cirjson_reader_detail, parse_hex_digit)
{
    ASSERT_EQ(0, cirjson::detail::parse_hex_digit('0'));
    ASSERT_EQ(9, cirjson::detail::parse_hex_digit('9'));
    ASSERT_EQ(0xa, cirjson::detail::parse_hex_digit('a'));
    ASSERT_EQ(0xF, cirjson::detail::parse_hex_digit('F'));
    ASSERT_THROW(
        cirjson::detail::parse_hex_digit('g'),
        cirjson::detail::encoding_error);
}

TEST(cirjson_reader, token_predicates)
{
    ASSERT_TRUE(cirjson::is_struct_start(cirjson::START_OBJECT));
    ASSERT_TRUE(cirjson::is_struct_start(cirjson::START_ARRAY));
    ASSERT_FALSE(cirjson::is_struct_start(cirjson::END_ARRAY));
    ASSERT_TRUE(cirjson::is_struct_end(cirjson::END_OBJECT));
    ASSERT_TRUE(cirjson::is_numeric(cirjson::VALUE_NUMBER_FLOAT));
    ASSERT_FALSE(cirjson::is_numeric(cirjson::VALUE_STRING));
    ASSERT_TRUE(cirjson::is_boolean(cirjson::VALUE_FALSE));
    ASSERT_TRUE(cirjson::is_scalar_value(cirjson::CIRJSON_ID_ARRAY_ELEMENT));
    ASSERT_FALSE(cirjson::is_scalar_value(cirjson::PROPERTY_NAME));

    ASSERT_EQ("{", cirjson::token_text(cirjson::START_OBJECT));
    ASSERT_EQ("__cirJsonId__", cirjson::token_text(cirjson::CIRJSON_ID_PROPERTY_NAME));
    ASSERT_EQ("", cirjson::token_text(cirjson::VALUE_STRING));

    std::ostringstream out;
    out << cirjson::CIRJSON_ID_ARRAY_ELEMENT;
    ASSERT_EQ("CIRJSON_ID_ARRAY_ELEMENT", out.str());
}

TEST(cirjson_reader, parse_error)
{
    {
        const cirjson::parse_error parse_error(cirjson::parse_error::UNKNOWN);

        ASSERT_EQ(0U, parse_error.offset());
        ASSERT_EQ(1U, parse_error.line());
        ASSERT_EQ(1U, parse_error.column());
        ASSERT_EQ(cirjson::parse_error::UNKNOWN, parse_error.reason());
        ASSERT_EQ(cirjson::NO_TOKEN, parse_error.token());
        ASSERT_EQ("Unknown parse error", parse_error.message());
        ASSERT_STREQ("Unknown parse error (line 1, column 1)", parse_error.what());
    }
    {
        cirjson::stream_location location;
        location.byte_offset = 12;
        location.line = 2;
        location.column = 5;

        const cirjson::parse_error parse_error(
            cirjson::parse_error::UNCLOSED_SCOPE,
            location,
            cirjson::END_ARRAY,
            "custom");

        ASSERT_EQ(12U, parse_error.offset());
        ASSERT_EQ(cirjson::END_ARRAY, parse_error.token());
        ASSERT_EQ(
            cirjson::parse_error::UNEXPECTED_END_OF_INPUT,
            parse_error.category());
        ASSERT_STREQ("custom (line 2, column 5)", parse_error.what());
    }

    ASSERT_EQ(
        cirjson::parse_error::STRUCTURAL,
        cirjson::parse_error(cirjson::parse_error::EXPECTED_CIRJSON_ID).category());
    ASSERT_EQ(
        cirjson::parse_error::CONSTRAINT_VIOLATION,
        cirjson::parse_error(cirjson::parse_error::SYMBOL_TABLE_OVERFLOW).category());
    ASSERT_EQ(
        cirjson::parse_error::MALFORMED_TOKEN,
        cirjson::parse_error(cirjson::parse_error::INVALID_UTF8).category());

    std::ostringstream out;
    out << cirjson::parse_error::DUPLICATE_PROPERTY << ' '
        << cirjson::parse_error::STRUCTURAL;
    ASSERT_EQ("DUPLICATE_PROPERTY STRUCTURAL", out.str());
}

TEST(cirjson_reader, value_default_constructed)
{
    const cirjson::value value;
    ASSERT_EQ(cirjson::Null, value.type());
    ASSERT_EQ("null", value.raw());

    ASSERT_THROW(value.as<std::string_view>(), cirjson::bad_value_cast);
    ASSERT_THROW(value.as<int>(), cirjson::bad_value_cast);
    ASSERT_FALSE(value.as<std::optional<int>>().has_value());
}

TEST(cirjson_reader, value_conversions)
{
    ASSERT_EQ(42, cirjson::value(cirjson::Number, "42").as<int>());
    ASSERT_EQ(-1.5, cirjson::value(cirjson::Number, "-1.5").as<double>());
    ASSERT_TRUE(cirjson::value(cirjson::Boolean, "true").as<bool>());
    ASSERT_FALSE(cirjson::value(cirjson::Boolean, "false").as<bool>());
    ASSERT_EQ("x", cirjson::value(cirjson::String, "x").as<std::string_view>());
    ASSERT_EQ(7, *cirjson::value(cirjson::Number, "7").as<std::optional<long>>());

    ASSERT_TRUE(std::isnan(cirjson::value(cirjson::Number, "NaN").as<double>()));
    ASSERT_EQ(
        -std::numeric_limits<double>::infinity(),
        cirjson::value(cirjson::Number, "-Infinity").as<double>());

    ASSERT_THROW(
        cirjson::value(cirjson::String, "42").as<int>(),
        cirjson::bad_value_cast);
    ASSERT_THROW(
        cirjson::value(cirjson::Number, "300").as<std::uint8_t>(),
        std::range_error);
    ASSERT_THROW(
        cirjson::value(cirjson::Number, "1.5").as<int>(),
        std::range_error);
}

TEST(cirjson_reader, object_with_id)
{
    static constexpr std::string_view document =
        "{\"__cirJsonId__\":\"root\",\"a\":1}";

    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    cirjson::byte_array_parser& p = *parser;

    ASSERT_EQ(cirjson::NO_TOKEN, p.current_token());
    ASSERT_EQ(cirjson::NOT_AVAILABLE, p.advance());
    ASSERT_TRUE(p.feeder().needs_more_input());
    p.feeder().feed_input(document);

    ASSERT_EQ(cirjson::START_OBJECT, p.advance());
    ASSERT_TRUE(p.read_context().in_object());
    ASSERT_EQ(1U, p.read_context().depth());

    ASSERT_EQ(cirjson::CIRJSON_ID_PROPERTY_NAME, p.advance());
    ASSERT_EQ("__cirJsonId__", p.current_name());
    ASSERT_EQ("__cirJsonId__", p.text());

    ASSERT_EQ(cirjson::VALUE_STRING, p.advance());
    ASSERT_EQ("root", p.text());
    ASSERT_EQ("root", p.value_as<std::string_view>());
    ASSERT_EQ("__cirJsonId__", p.current_name());

    ASSERT_EQ(cirjson::PROPERTY_NAME, p.advance());
    ASSERT_EQ("a", p.current_name());

    ASSERT_EQ(cirjson::VALUE_NUMBER_INT, p.advance());
    ASSERT_EQ("1", p.text());
    ASSERT_EQ(1, p.value_as<int>());
    ASSERT_EQ("a", p.current_name());
    ASSERT_EQ(cirjson::Number, p.value().type());

    ASSERT_EQ(cirjson::END_OBJECT, p.advance());
    ASSERT_TRUE(p.read_context().in_root());
    ASSERT_EQ(cirjson::byte_array_parser::MINOR_NONE, p.minor_state());

    // More root values could follow
    ASSERT_EQ(cirjson::NOT_AVAILABLE, p.advance());
    ASSERT_FALSE(p.is_closed());

    p.feeder().end_of_input();
    ASSERT_EQ(cirjson::END_OF_STREAM, p.advance());
    ASSERT_TRUE(p.is_closed());
    ASSERT_EQ(cirjson::END_OF_STREAM, p.advance());
}

TEST(cirjson_reader, object_with_id_byte_by_byte)
{
    const std::string document = "{\"__cirJsonId__\":\"root\",\"a\":1}";

    const std::vector<token_record> expected = {
        {cirjson::START_OBJECT, "{"},
        {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
        {cirjson::VALUE_STRING, "root"},
        {cirjson::PROPERTY_NAME, "a"},
        {cirjson::VALUE_NUMBER_INT, "1"},
        {cirjson::END_OBJECT, "}"},
    };
    ASSERT_EQ(expected, read_tokens(document, cirjson::read_features(), 1));
    ASSERT_EQ(expected, read_tokens(document));
}

TEST(cirjson_reader, array_with_id)
{
    const std::vector<token_record> expected = {
        {cirjson::START_ARRAY, "["},
        {cirjson::CIRJSON_ID_ARRAY_ELEMENT, "id"},
        {cirjson::VALUE_NUMBER_INT, "1"},
        {cirjson::VALUE_STRING, "x"},
        {cirjson::VALUE_TRUE, "true"},
        {cirjson::VALUE_FALSE, "false"},
        {cirjson::VALUE_NULL, "null"},
        {cirjson::START_OBJECT, "{"},
        {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
        {cirjson::VALUE_STRING, "o"},
        {cirjson::END_OBJECT, "}"},
        {cirjson::START_ARRAY, "["},
        {cirjson::CIRJSON_ID_ARRAY_ELEMENT, "n"},
        {cirjson::END_ARRAY, "]"},
        {cirjson::END_ARRAY, "]"},
    };

    ASSERT_EQ(
        expected,
        read_tokens(
            "[\"id\", 1, \"x\", true, false, null, "
            "{\"__cirJsonId__\":\"o\"}, [\"n\"]]"));
}

TEST(cirjson_reader, array_context)
{
    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input("[\"id\",10,20]");
    parser->feeder().end_of_input();

    ASSERT_EQ(cirjson::START_ARRAY, parser->advance());
    ASSERT_EQ(-1, parser->read_context().index());

    ASSERT_EQ(cirjson::CIRJSON_ID_ARRAY_ELEMENT, parser->advance());
    ASSERT_EQ(0, parser->read_context().index());
    ASSERT_EQ(cirjson::String, parser->value().type());

    ASSERT_EQ(cirjson::VALUE_NUMBER_INT, parser->advance());
    ASSERT_EQ(1, parser->read_context().index());
    ASSERT_EQ(cirjson::VALUE_NUMBER_INT, parser->advance());
    ASSERT_EQ(3U, parser->read_context().entry_count());
    ASSERT_EQ(20, parser->value_as<int>());

    ASSERT_EQ(cirjson::END_ARRAY, parser->advance());
    ASSERT_THROW(parser->value(), cirjson::bad_value_cast);
    ASSERT_EQ(cirjson::END_OF_STREAM, parser->advance());
}

TEST(cirjson_reader, nested_names)
{
    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input(
        "{\"__cirJsonId__\":\"1\",\"outer\":{\"__cirJsonId__\":\"2\"}}");
    parser->feeder().end_of_input();

    for (int i = 0; i < 5; ++i)
    {
        parser->advance();
    }
    ASSERT_EQ(cirjson::START_OBJECT, parser->current_token());
    ASSERT_EQ("outer", parser->current_name());
    ASSERT_EQ(2U, parser->read_context().depth());

    ASSERT_EQ(cirjson::CIRJSON_ID_PROPERTY_NAME, parser->advance());
    ASSERT_EQ(cirjson::VALUE_STRING, parser->advance());
    ASSERT_EQ(cirjson::END_OBJECT, parser->advance());
    ASSERT_EQ("outer", parser->current_name());
    ASSERT_EQ(cirjson::END_OBJECT, parser->advance());
}

TEST(cirjson_reader, multiple_root_values)
{
    const std::vector<token_record> expected = {
        {cirjson::VALUE_NUMBER_INT, "1"},
        {cirjson::VALUE_STRING, "two"},
        {cirjson::START_ARRAY, "["},
        {cirjson::CIRJSON_ID_ARRAY_ELEMENT, "3"},
        {cirjson::END_ARRAY, "]"},
        {cirjson::VALUE_NULL, "null"},
    };

    ASSERT_EQ(expected, read_tokens(" 1 \"two\"\n[\"3\"]\tnull "));
    ASSERT_TRUE(read_tokens("").empty());
    ASSERT_TRUE(read_tokens(" \r\n\t").empty());
}

TEST(cirjson_reader, id_first_format)
{
    struct
    {
        const char* document;
        const char* message;
    } cases[] = {
        {"{}", "Expected CirJSON id property '__cirJsonId__', got '}': empty Objects are not allowed"},
        {"[]", "Expected CirJSON id as first Array element, got ']': empty Arrays are not allowed"},
        {"{\"a\":1}", "Expected CirJSON id property '__cirJsonId__' as first property, got 'a'"},
        {"{\"__cirJsonId__\":1}", nullptr},
        {"{\"__cirJsonId__\":null}", nullptr},
        {"[1]", nullptr},
        {"[{\"__cirJsonId__\":\"x\"}]", nullptr},
    };

    for (const auto& c : cases)
    {
        SCOPED_TRACE(c.document);
        const cirjson::parse_error parse_error = read_error(c.document);
        ASSERT_EQ(cirjson::parse_error::EXPECTED_CIRJSON_ID, parse_error.reason());
        ASSERT_EQ(cirjson::parse_error::STRUCTURAL, parse_error.category());
        if (c.message)
        {
            ASSERT_EQ(c.message, parse_error.message());
        }
    }

    // Only the first property is the id
    const std::vector<token_record> expected = {
        {cirjson::START_OBJECT, "{"},
        {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
        {cirjson::VALUE_STRING, "x"},
        {cirjson::PROPERTY_NAME, "__cirJsonId__"},
        {cirjson::VALUE_NUMBER_INT, "2"},
        {cirjson::END_OBJECT, "}"},
    };
    ASSERT_EQ(
        expected,
        read_tokens("{\"__cirJsonId__\":\"x\",\"__cirJsonId__\":2}"));
}

TEST(cirjson_reader, structural_errors)
{
    struct
    {
        const char* document;
        cirjson::parse_error::error_reason reason;
    } cases[] = {
        {"{\"__cirJsonId__\" \"i\"}", cirjson::parse_error::EXPECTED_COLON},
        {"[\"i\" 1]", cirjson::parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET},
        {"{\"__cirJsonId__\":\"i\" \"a\":1}", cirjson::parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET},
        {"[\"i\"}", cirjson::parse_error::MISMATCHED_CLOSING_BRACKET},
        {"{\"__cirJsonId__\":\"i\"]", cirjson::parse_error::MISMATCHED_CLOSING_BRACKET},
        {"[\"i\",]", cirjson::parse_error::EXPECTED_VALUE},
        {"[\"i\",,1]", cirjson::parse_error::EXPECTED_VALUE},
        {"]", cirjson::parse_error::EXPECTED_VALUE},
        {"{\"__cirJsonId__\":\"i\",}", cirjson::parse_error::EXPECTED_OPENING_QUOTE},
        {"{\"__cirJsonId__\":\"i\",a:1}", cirjson::parse_error::EXPECTED_OPENING_QUOTE},
        {"{\"__cirJsonId__\":\"i\",\"a\":}", cirjson::parse_error::EXPECTED_VALUE},
        {"[\"i\",@]", cirjson::parse_error::UNEXPECTED_CHARACTER},
    };

    for (const auto& c : cases)
    {
        SCOPED_TRACE(c.document);
        const cirjson::parse_error parse_error = read_error(c.document);
        ASSERT_EQ(c.reason, parse_error.reason());
    }
}

TEST(cirjson_reader, truncated_input)
{
    struct
    {
        const char* document;
        cirjson::parse_error::error_reason reason;
        cirjson::token_type token;
    } cases[] = {
        {"\"abc", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_STRING},
        {"\"ab\\u00", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_STRING},
        {"[\"i", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::CIRJSON_ID_ARRAY_ELEMENT},
        {"{\"__cirJsonId__\":\"i\",\"ab", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::PROPERTY_NAME},
        {"tr", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_TRUE},
        {"nul", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_NULL},
        {"-", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_NUMBER_INT},
        {"12.", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_NUMBER_FLOAT},
        {"1e+", cirjson::parse_error::UNTERMINATED_VALUE, cirjson::VALUE_NUMBER_FLOAT},
        {"[\"i\"", cirjson::parse_error::UNCLOSED_SCOPE, cirjson::END_ARRAY},
        {"[\"i\",1", cirjson::parse_error::UNCLOSED_SCOPE, cirjson::END_ARRAY},
        {"{\"__cirJsonId__\":\"i\",\"a\":1", cirjson::parse_error::UNCLOSED_SCOPE, cirjson::END_OBJECT},
        {"{\"__cirJsonId__\":\"i\",\"a\"", cirjson::parse_error::UNCLOSED_SCOPE, cirjson::END_OBJECT},
    };

    for (const auto& c : cases)
    {
        SCOPED_TRACE(c.document);
        const cirjson::parse_error parse_error = read_error(c.document);
        ASSERT_EQ(c.reason, parse_error.reason());
        ASSERT_EQ(c.token, parse_error.token());
        ASSERT_EQ(
            cirjson::parse_error::UNEXPECTED_END_OF_INPUT,
            parse_error.category());
    }

    ASSERT_EQ(
        "Unexpected end-of-input: expected close marker for Array (start "
        "marker at line 1, column 1)",
        read_error("[\"i\"").message());
}

TEST(cirjson_reader, locations)
{
    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input("{\"__cirJsonId__\":\"i\",\n  \"a\":true,\r\n\"b\":[\"x\"]}");
    parser->feeder().end_of_input();

    ASSERT_EQ(cirjson::START_OBJECT, parser->advance());
    ASSERT_EQ(0U, parser->token_location().byte_offset);
    ASSERT_EQ(1U, parser->token_location().line);
    ASSERT_EQ(1U, parser->token_location().column);

    ASSERT_EQ(cirjson::CIRJSON_ID_PROPERTY_NAME, parser->advance());
    ASSERT_EQ(1U, parser->token_location().byte_offset);
    ASSERT_EQ(2U, parser->token_location().column);

    ASSERT_EQ(cirjson::VALUE_STRING, parser->advance());
    ASSERT_EQ(17U, parser->token_location().byte_offset);
    ASSERT_EQ(20U, parser->current_location().byte_offset);

    ASSERT_EQ(cirjson::PROPERTY_NAME, parser->advance());
    ASSERT_EQ(24U, parser->token_location().byte_offset);
    ASSERT_EQ(2U, parser->token_location().line);
    ASSERT_EQ(3U, parser->token_location().column);

    ASSERT_EQ(cirjson::VALUE_TRUE, parser->advance());
    ASSERT_EQ(2U, parser->token_location().line);
    ASSERT_EQ(7U, parser->token_location().column);

    // "\r\n" is a single line break
    ASSERT_EQ(cirjson::PROPERTY_NAME, parser->advance());
    ASSERT_EQ(3U, parser->token_location().line);
    ASSERT_EQ(1U, parser->token_location().column);

    ASSERT_EQ(cirjson::START_ARRAY, parser->advance());
    ASSERT_EQ(3U, parser->read_context().start_line());
    ASSERT_EQ(5U, parser->read_context().start_column());
}

TEST(cirjson_reader, error_location)
{
    const cirjson::parse_error parse_error =
        read_error("{\"__cirJsonId__\":\"i\",\n  \"a\" 1}");

    ASSERT_EQ(cirjson::parse_error::EXPECTED_COLON, parse_error.reason());
    ASSERT_EQ(29U, parse_error.offset());
    ASSERT_EQ(2U, parse_error.line());
    ASSERT_EQ(8U, parse_error.column());
    ASSERT_EQ(
        "Unexpected character '1' (code 49): was expecting a colon to "
        "separate property name and value (line 2, column 8)",
        std::string(parse_error.what()));

    // '\r' alone counts as a line break too
    ASSERT_EQ(2U, read_error("[\"i\",\r@]").line());
}

TEST(cirjson_reader, failed_parser)
{
    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input("[\"i\"}");

    ASSERT_EQ(cirjson::START_ARRAY, parser->advance());
    ASSERT_EQ(cirjson::CIRJSON_ID_ARRAY_ELEMENT, parser->advance());
    ASSERT_THROW(parser->advance(), cirjson::parse_error);
    ASSERT_TRUE(parser->is_closed());
    ASSERT_TRUE(parser->has_failed());
    ASSERT_THROW(parser->advance(), cirjson::usage_error);
}

TEST(cirjson_reader, close)
{
    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input("{\"__cirJsonId__\":\"i\",\"name\":1}");

    ASSERT_EQ(cirjson::START_OBJECT, parser->advance());
    ASSERT_EQ(cirjson::CIRJSON_ID_PROPERTY_NAME, parser->advance());
    ASSERT_EQ(cirjson::VALUE_STRING, parser->advance());
    ASSERT_EQ(cirjson::PROPERTY_NAME, parser->advance());
    ASSERT_EQ(0U, factory.root_symbols()->size());

    parser->close();
    ASSERT_TRUE(parser->is_closed());
    ASSERT_EQ(cirjson::END_OF_STREAM, parser->advance());

    // The names seen so far were handed to the factory
    ASSERT_EQ(2U, factory.root_symbols()->size());
    ASSERT_NE(nullptr, factory.root_symbols()->find_name("name"));
    ASSERT_EQ(1U, factory.root_symbols()->generation());
}

TEST(cirjson_reader, value_example)
{
    cirjson::factory factory;
    factory.enable(cirjson::ALLOW_NON_NUMERIC_NUMBERS);
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input(
        "[\"values\", -42, 3.25e2, \"text\", false, null, NaN, -Infinity]");
    parser->feeder().end_of_input();

    ASSERT_EQ(cirjson::START_ARRAY, parser->advance());
    ASSERT_EQ(cirjson::CIRJSON_ID_ARRAY_ELEMENT, parser->advance());
    ASSERT_EQ("values", parser->value_as<std::string_view>());

    ASSERT_EQ(cirjson::VALUE_NUMBER_INT, parser->advance());
    ASSERT_EQ(-42, parser->value_as<int>());
    ASSERT_EQ(-42LL, parser->value_as<long long>());
    ASSERT_THROW(parser->value_as<unsigned>(), std::range_error);

    ASSERT_EQ(cirjson::VALUE_NUMBER_FLOAT, parser->advance());
    ASSERT_EQ(325.0, parser->value_as<double>());

    ASSERT_EQ(cirjson::VALUE_STRING, parser->advance());
    ASSERT_THROW(parser->value_as<bool>(), cirjson::bad_value_cast);

    ASSERT_EQ(cirjson::VALUE_FALSE, parser->advance());
    ASSERT_FALSE(parser->value_as<bool>());

    ASSERT_EQ(cirjson::VALUE_NULL, parser->advance());
    ASSERT_FALSE(parser->value_as<std::optional<double>>().has_value());
    ASSERT_THROW(parser->value_as<double>(), cirjson::bad_value_cast);

    ASSERT_EQ(cirjson::VALUE_NUMBER_FLOAT, parser->advance());
    ASSERT_TRUE(std::isnan(parser->value_as<double>()));

    ASSERT_EQ(cirjson::VALUE_NUMBER_FLOAT, parser->advance());
    ASSERT_EQ("-Infinity", parser->text());
    ASSERT_EQ(
        -std::numeric_limits<double>::infinity(),
        parser->value_as<double>());

    ASSERT_EQ(cirjson::END_ARRAY, parser->advance());
    ASSERT_EQ(cirjson::END_OF_STREAM, parser->advance());
}
