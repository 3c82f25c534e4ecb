// Copyright (c) Giacomo Drago <giacomo@giacomodrago.com>
// All rights reserved.

// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. Neither the name of Giacomo Drago nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.

// THIS SOFTWARE IS PROVIDED BY GIACOMO DRAGO "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL GIACOMO DRAGO BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "cirjson_reader.hpp"

#include "token_reader.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

using cirjson_test::read_tokens;
using cirjson_test::token_record;

namespace
{

const std::string DOCUMENT =
    "\xEF\xBB\xBF{\"__cirJsonId__\":\"root\","
    "\"name\":\"caf\\u00e9 \\ud83d\\ude00 \xC3\xA9\","
    "\"n\":[ \"arr\", -12.5e+3, 0, 42, true, false, null, "
    "\"\\\"\\\\/\\b\\f\\n\\r\\t\" ],"
    "\"nested\":{\"__cirJsonId__\":\"n\",\"x\":{\"__cirJsonId__\":\"m\"}}"
    " /* c */ , \"last\":1e10 } 7 \"x\"";

const std::vector<token_record> DOCUMENT_TOKENS = {
    {cirjson::START_OBJECT, "{"},
    {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
    {cirjson::VALUE_STRING, "root"},
    {cirjson::PROPERTY_NAME, "name"},
    {cirjson::VALUE_STRING, "caf\xC3\xA9 \xF0\x9F\x98\x80 \xC3\xA9"},
    {cirjson::PROPERTY_NAME, "n"},
    {cirjson::START_ARRAY, "["},
    {cirjson::CIRJSON_ID_ARRAY_ELEMENT, "arr"},
    {cirjson::VALUE_NUMBER_FLOAT, "-12.5e+3"},
    {cirjson::VALUE_NUMBER_INT, "0"},
    {cirjson::VALUE_NUMBER_INT, "42"},
    {cirjson::VALUE_TRUE, "true"},
    {cirjson::VALUE_FALSE, "false"},
    {cirjson::VALUE_NULL, "null"},
    {cirjson::VALUE_STRING, "\"\\/\b\f\n\r\t"},
    {cirjson::END_ARRAY, "]"},
    {cirjson::PROPERTY_NAME, "nested"},
    {cirjson::START_OBJECT, "{"},
    {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
    {cirjson::VALUE_STRING, "n"},
    {cirjson::PROPERTY_NAME, "x"},
    {cirjson::START_OBJECT, "{"},
    {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
    {cirjson::VALUE_STRING, "m"},
    {cirjson::END_OBJECT, "}"},
    {cirjson::END_OBJECT, "}"},
    {cirjson::PROPERTY_NAME, "last"},
    {cirjson::VALUE_NUMBER_FLOAT, "1e10"},
    {cirjson::END_OBJECT, "}"},
    {cirjson::VALUE_NUMBER_INT, "7"},
    {cirjson::VALUE_STRING, "x"},
};

// Every non-standard construct at once
const cirjson::read_features LENIENT(
    cirjson::ALLOW_C_COMMENTS | cirjson::ALLOW_YAML_COMMENTS
    | cirjson::ALLOW_UNQUOTED_PROPERTY_NAMES | cirjson::ALLOW_SINGLE_QUOTES
    | cirjson::ALLOW_UNESCAPED_CONTROL_CHARS
    | cirjson::ALLOW_BACKSLASH_ESCAPING_ANY_CHARACTER
    | cirjson::ALLOW_LEADING_ZEROS_FOR_NUMBERS
    | cirjson::ALLOW_LEADING_PLUS_SIGN_FOR_NUMBERS
    | cirjson::ALLOW_LEADING_DECIMAL_POINT_FOR_NUMBERS
    | cirjson::ALLOW_TRAILING_DECIMAL_POINT_FOR_NUMBERS
    | cirjson::ALLOW_NON_NUMERIC_NUMBERS | cirjson::ALLOW_MISSING_VALUES
    | cirjson::ALLOW_TRAILING_COMMA | cirjson::STRICT_DUPLICATE_DETECTION);

const std::string LENIENT_DOCUMENT =
    "# header\n"
    "{__cirJsonId__:'root', // ids come first\n"
    "$key_1 : [ 'arr', 007, -00.5, +.5, 1., 2.e3, +12, +Infinity, NaN, "
    "-Infinity,, 'it\\'s', \"a\tb\", \"\\q\", ],\n"
    "'apos': {\"__cirJsonId__\":\"n\" /* c */, x: 0, \xC3\xA9t\xC3\xA9: true,},\r\n"
    "last: null,}\n"
    "# done";

const std::vector<token_record> LENIENT_TOKENS = {
    {cirjson::START_OBJECT, "{"},
    {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
    {cirjson::VALUE_STRING, "root"},
    {cirjson::PROPERTY_NAME, "$key_1"},
    {cirjson::START_ARRAY, "["},
    {cirjson::CIRJSON_ID_ARRAY_ELEMENT, "arr"},
    {cirjson::VALUE_NUMBER_INT, "7"},
    {cirjson::VALUE_NUMBER_FLOAT, "-0.5"},
    {cirjson::VALUE_NUMBER_FLOAT, ".5"},
    {cirjson::VALUE_NUMBER_FLOAT, "1."},
    {cirjson::VALUE_NUMBER_FLOAT, "2.e3"},
    {cirjson::VALUE_NUMBER_INT, "12"},
    {cirjson::VALUE_NUMBER_FLOAT, "+Infinity"},
    {cirjson::VALUE_NUMBER_FLOAT, "NaN"},
    {cirjson::VALUE_NUMBER_FLOAT, "-Infinity"},
    {cirjson::VALUE_NULL, "null"},
    {cirjson::VALUE_STRING, "it's"},
    {cirjson::VALUE_STRING, "a\tb"},
    {cirjson::VALUE_STRING, "q"},
    {cirjson::END_ARRAY, "]"},
    {cirjson::PROPERTY_NAME, "apos"},
    {cirjson::START_OBJECT, "{"},
    {cirjson::CIRJSON_ID_PROPERTY_NAME, "__cirJsonId__"},
    {cirjson::VALUE_STRING, "n"},
    {cirjson::PROPERTY_NAME, "x"},
    {cirjson::VALUE_NUMBER_INT, "0"},
    {cirjson::PROPERTY_NAME, "\xC3\xA9t\xC3\xA9"},
    {cirjson::VALUE_TRUE, "true"},
    {cirjson::END_OBJECT, "}"},
    {cirjson::PROPERTY_NAME, "last"},
    {cirjson::VALUE_NULL, "null"},
    {cirjson::END_OBJECT, "}"},
};

struct token_position
{
    std::uint64_t offset;
    std::size_t line;
    std::size_t column;

    bool operator==(const token_position& other) const
    {
        return offset == other.offset && line == other.line
            && column == other.column;
    }
};

std::ostream& operator<<(std::ostream& out, const token_position& position)
{
    return out << position.offset << " (" << position.line << ":"
               << position.column << ")";
}

// Where the tokens of document start, read in chunks of chunk_size
std::vector<token_position> token_positions(
    const std::string& document,
    const cirjson::read_features features,
    const std::size_t chunk_size)
{
    cirjson::factory factory(features);
    auto parser = factory.create_non_blocking_byte_array_parser();

    std::vector<token_position> result;
    std::size_t fed = 0;
    for (;;)
    {
        const cirjson::token_type token = parser->advance();
        if (token == cirjson::END_OF_STREAM)
        {
            break;
        }
        if (token == cirjson::NOT_AVAILABLE)
        {
            if (fed == document.size())
            {
                parser->feeder().end_of_input();
                continue;
            }
            const std::size_t length =
                std::min(chunk_size, document.size() - fed);
            parser->feeder().feed_input(document.data(), fed, length);
            fed += length;
            continue;
        }
        const cirjson::stream_location& location = parser->token_location();
        result.push_back(token_position {
            location.byte_offset, location.line, location.column});
    }

    return result;
}

// Offsets where the tokens of DOCUMENT start, read in chunks of chunk_size
std::vector<std::uint64_t> token_offsets(const std::size_t chunk_size)
{
    cirjson::factory factory(cirjson::read_features(cirjson::ALLOW_C_COMMENTS));
    auto parser = factory.create_non_blocking_byte_array_parser();

    std::vector<std::uint64_t> result;
    std::size_t fed = 0;
    for (;;)
    {
        const cirjson::token_type token = parser->advance();
        if (token == cirjson::END_OF_STREAM)
        {
            break;
        }
        if (token == cirjson::NOT_AVAILABLE)
        {
            if (fed == DOCUMENT.size())
            {
                parser->feeder().end_of_input();
                continue;
            }
            const std::size_t length =
                std::min(chunk_size, DOCUMENT.size() - fed);
            parser->feeder().feed_input(DOCUMENT.data(), fed, length);
            fed += length;
            continue;
        }
        result.push_back(parser->token_location().byte_offset);
    }

    return result;
}

} // namespace

TEST(cirjson_reader_chunked_input, whole_document)
{
    ASSERT_EQ(
        DOCUMENT_TOKENS,
        read_tokens(
            DOCUMENT,
            cirjson::read_features(cirjson::ALLOW_C_COMMENTS)));
}

TEST(cirjson_reader_chunked_input, any_chunk_size)
{
    const std::vector<std::uint64_t> offsets =
        token_offsets(cirjson_test::WHOLE_DOCUMENT);
    ASSERT_EQ(DOCUMENT_TOKENS.size(), offsets.size());
    ASSERT_EQ(3U, offsets.front()); // after the BOM

    for (std::size_t chunk_size = 1; chunk_size <= DOCUMENT.size(); ++chunk_size)
    {
        SCOPED_TRACE(chunk_size);
        ASSERT_EQ(
            DOCUMENT_TOKENS,
            read_tokens(
                DOCUMENT,
                cirjson::read_features(cirjson::ALLOW_C_COMMENTS),
                chunk_size));
        ASSERT_EQ(offsets, token_offsets(chunk_size));
    }
}

TEST(cirjson_reader_chunked_input, lenient_document_any_chunk_size)
{
    ASSERT_EQ(LENIENT_TOKENS, read_tokens(LENIENT_DOCUMENT, LENIENT));

    const std::vector<token_position> positions = token_positions(
        LENIENT_DOCUMENT,
        LENIENT,
        cirjson_test::WHOLE_DOCUMENT);
    ASSERT_EQ(LENIENT_TOKENS.size(), positions.size());
    ASSERT_EQ(2U, positions.front().line); // after the YAML comment
    ASSERT_EQ(5U, positions.back().line);

    for (std::size_t chunk_size = 1;
         chunk_size <= LENIENT_DOCUMENT.size();
         ++chunk_size)
    {
        SCOPED_TRACE(chunk_size);
        ASSERT_EQ(
            LENIENT_TOKENS,
            read_tokens(LENIENT_DOCUMENT, LENIENT, chunk_size));
        ASSERT_EQ(
            positions,
            token_positions(LENIENT_DOCUMENT, LENIENT, chunk_size));
    }
}

TEST(cirjson_reader_chunked_input, not_available)
{
    cirjson::byte_array_parser parser;

    ASSERT_TRUE(parser.feeder().needs_more_input());
    ASSERT_EQ(cirjson::NOT_AVAILABLE, parser.advance());
    ASSERT_EQ(cirjson::NOT_AVAILABLE, parser.advance());

    parser.feeder().feed_input("[\"i\",tr");
    ASSERT_FALSE(parser.feeder().needs_more_input());
    ASSERT_EQ(7U, parser.feeder().available());
    ASSERT_EQ(cirjson::START_ARRAY, parser.advance());
    ASSERT_EQ(cirjson::CIRJSON_ID_ARRAY_ELEMENT, parser.advance());
    ASSERT_EQ("i", parser.text());
    ASSERT_EQ(cirjson::NOT_AVAILABLE, parser.advance());
    ASSERT_TRUE(parser.feeder().needs_more_input());
    ASSERT_EQ(7U, parser.current_location().byte_offset);

    parser.feeder().feed_input("ue");
    ASSERT_EQ(9U, parser.feeder().total_fed());
    // The literal may still go on
    ASSERT_EQ(cirjson::NOT_AVAILABLE, parser.advance());

    parser.feeder().feed_input("]");
    ASSERT_EQ(cirjson::VALUE_TRUE, parser.advance());
    ASSERT_EQ(5U, parser.token_location().byte_offset);
    ASSERT_EQ(cirjson::END_ARRAY, parser.advance());
    ASSERT_EQ(cirjson::NOT_AVAILABLE, parser.advance());

    parser.feeder().end_of_input();
    ASSERT_TRUE(parser.feeder().is_end_of_input());
    ASSERT_FALSE(parser.feeder().needs_more_input());
    ASSERT_EQ(cirjson::END_OF_STREAM, parser.advance());
    ASSERT_TRUE(parser.is_closed());
    ASSERT_EQ(cirjson::END_OF_STREAM, parser.advance());
}

TEST(cirjson_reader_chunked_input, literal_at_end_of_input)
{
    cirjson::byte_array_parser parser;

    parser.feeder().feed_input("null");
    ASSERT_EQ(cirjson::NOT_AVAILABLE, parser.advance());

    parser.feeder().end_of_input();
    ASSERT_EQ(cirjson::VALUE_NULL, parser.advance());
    ASSERT_EQ(cirjson::END_OF_STREAM, parser.advance());
}

TEST(cirjson_reader_chunked_input, feeder_misuse)
{
    {
        cirjson::byte_array_parser parser;
        parser.feeder().feed_input("[\"i\"]");
        try
        {
            parser.feeder().feed_input("]");
            FAIL();
        }
        catch (const cirjson::usage_error& e)
        {
            ASSERT_STREQ(
                "Still have 5 undecoded bytes, should not call 'feed_input'",
                e.what());
        }
    }
    {
        cirjson::byte_array_parser parser;
        parser.feeder().end_of_input();
        try
        {
            parser.feeder().feed_input("1");
            FAIL();
        }
        catch (const cirjson::usage_error& e)
        {
            ASSERT_STREQ("Already closed, can not feed more input", e.what());
        }
    }
    {
        const std::uint8_t data[] = {'[', '"', 'i', '"', ']', ' '};
        cirjson::byte_buffer_parser parser;
        try
        {
            parser.feeder().feed_input(cirjson::byte_buffer {data, 5, 2});
            FAIL();
        }
        catch (const cirjson::usage_error& e)
        {
            ASSERT_STREQ("Input end (2) may not be before start (5)", e.what());
        }
    }
    {
        const char data[] = "[\"i\"]";
        cirjson::byte_array_parser parser;
        ASSERT_THROW(
            parser.feeder().feed_input(
                data,
                3,
                std::numeric_limits<std::size_t>::max()),
            cirjson::usage_error);
    }
}

TEST(cirjson_reader_chunked_input, offset_into_array)
{
    const char data[] = "xx[\"i\",1]yy";

    cirjson::byte_array_parser parser;
    parser.feeder().feed_input(data, 2, 7);
    parser.feeder().end_of_input();

    ASSERT_EQ(cirjson::START_ARRAY, parser.advance());
    ASSERT_EQ(0U, parser.token_location().byte_offset);
    ASSERT_EQ(cirjson::CIRJSON_ID_ARRAY_ELEMENT, parser.advance());
    ASSERT_EQ(cirjson::VALUE_NUMBER_INT, parser.advance());
    ASSERT_EQ("1", parser.text());
    ASSERT_EQ(cirjson::END_ARRAY, parser.advance());
    ASSERT_EQ(cirjson::END_OF_STREAM, parser.advance());
}

TEST(cirjson_reader_chunked_input, byte_buffer)
{
    const std::string_view data = "xx[\"i\",1]yy{\"__cirJsonId__\":\"o\"}";
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(data.data());

    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_buffer_parser();

    std::vector<cirjson::token_type> tokens;
    const cirjson::byte_buffer chunks[] = {
        {bytes, 2, 5},
        {bytes, 5, 9},
        {bytes, 11, data.size()},
    };

    for (const cirjson::byte_buffer& chunk : chunks)
    {
        parser->feeder().feed_input(chunk);
        for (cirjson::token_type token = parser->advance();
             token != cirjson::NOT_AVAILABLE;
             token = parser->advance())
        {
            tokens.push_back(token);
        }
    }
    parser->feeder().end_of_input();
    tokens.push_back(parser->advance());

    const std::vector<cirjson::token_type> expected = {
        cirjson::START_ARRAY,
        cirjson::CIRJSON_ID_ARRAY_ELEMENT,
        cirjson::VALUE_NUMBER_INT,
        cirjson::END_ARRAY,
        cirjson::START_OBJECT,
        cirjson::CIRJSON_ID_PROPERTY_NAME,
        cirjson::VALUE_STRING,
        cirjson::END_OBJECT,
        cirjson::END_OF_STREAM,
    };
    ASSERT_EQ(expected, tokens);
    ASSERT_EQ(
        static_cast<std::uint64_t>(7 + data.size() - 11),
        parser->current_location().byte_offset);
}

TEST(cirjson_reader_chunked_input, buffers_are_recycled)
{
    cirjson::buffer_recycler recycler;
    ASSERT_EQ(0U, recycler.pooled_length(cirjson::buffer_recycler::CHAR_TOKEN_BUFFER));

    {
        cirjson::factory factory;
        auto parser = factory.create_non_blocking_byte_array_parser(&recycler);

        // Checked out while the parser is alive
        ASSERT_EQ(
            0U,
            recycler.pooled_length(cirjson::buffer_recycler::CHAR_TOKEN_BUFFER));

        const std::string long_string = "[\"i\",\"" + std::string(5000, 'a') + "\"]";
        const std::vector<token_record> tokens = read_tokens(*parser, long_string, 100);
        ASSERT_EQ(4U, tokens.size());
        ASSERT_EQ(5000U, tokens[2].text.size());
    }

    ASSERT_GE(
        recycler.pooled_length(cirjson::buffer_recycler::CHAR_TOKEN_BUFFER),
        5000U);
    ASSERT_GE(
        recycler.pooled_length(cirjson::buffer_recycler::CHAR_NAME_COPY_BUFFER),
        200U);

    // The next parser starts with the grown buffer
    cirjson::byte_array_parser parser(
        cirjson::read_features(),
        cirjson::stream_read_constraints(),
        nullptr,
        true,
        &recycler);
    ASSERT_EQ(0U, recycler.pooled_length(cirjson::buffer_recycler::CHAR_TOKEN_BUFFER));
}
