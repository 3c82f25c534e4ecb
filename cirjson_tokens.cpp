// Copyright (c) Giacomo Drago <giacomo@giacomodrago.com>
// All rights reserved.

#include "cirjson_reader.hpp"

#include <magic_enum.hpp>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef VERBOSE
#  define TRACE(str) (std::cerr << str << std::endl)
#  define TRACEFUNC TRACE(__PRETTY_FUNCTION__)
#else
#  define TRACE(str)
#  define TRACEFUNC
#endif

// read_feature values are bits, not a sequence
template <>
struct magic_enum::customize::enum_range<cirjson::read_feature> {
  static constexpr bool is_flags = true;
};

struct options_type {
  std::size_t chunk_size = 4096;
  std::string file_name;  // NOTE: empty means stdin
  cirjson::read_features features;
};

void usage(std::ostream& rOut) {
  rOut << "usage: cirjson_tokens [--chunk N] [--allow-comments] "
          "[--strict-duplicates] [--allow-trailing-comma] [--enable FEATURE]... [FILE]"
       << std::endl;
  rOut << "features:";
  for (const auto feature : magic_enum::enum_values<cirjson::read_feature>()) {
    rOut << " " << magic_enum::enum_name(feature);
  }
  rOut << std::endl;
}

bool parse_options(int argc, char* argv[], options_type& options) {
  TRACEFUNC;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--chunk") {
      if (++i == argc) { return false; }
      const long size = std::strtol(argv[i], nullptr, 10);
      if (size <= 0) { return false; }
      options.chunk_size = static_cast<std::size_t>(size);
    } else if (arg == "--allow-comments") {
      options.features.enable(cirjson::ALLOW_C_COMMENTS).enable(cirjson::ALLOW_YAML_COMMENTS);
    } else if (arg == "--strict-duplicates") {
      options.features.enable(cirjson::STRICT_DUPLICATE_DETECTION);
    } else if (arg == "--allow-trailing-comma") {
      options.features.enable(cirjson::ALLOW_TRAILING_COMMA);
    } else if (arg == "--enable") {
      if (++i == argc) { return false; }
      const auto feature = magic_enum::enum_cast<cirjson::read_feature>(argv[i]);
      if (!feature.has_value()) {
        std::cerr << "unknown feature: " << argv[i] << std::endl;
        return false;
      }
      options.features.enable(*feature);
    } else if (arg.size() > 1 && arg[0] == '-') {
      return false;
    } else if (options.file_name.empty()) {
      options.file_name = arg;
    } else {
      return false;
    }
  }

  return true;
}

void write_token(std::ostream& rOut, const cirjson::byte_array_parser& parser) {
  rOut << magic_enum::enum_name(parser.current_token());
  switch (parser.current_token()) {
    case cirjson::CIRJSON_ID_PROPERTY_NAME:
    case cirjson::PROPERTY_NAME:
    case cirjson::CIRJSON_ID_ARRAY_ELEMENT:
    case cirjson::VALUE_STRING:
      rOut << " \"" << parser.text() << "\"";  // NOTE: not escaped! CK
      break;
    case cirjson::VALUE_NUMBER_INT:
    case cirjson::VALUE_NUMBER_FLOAT:
    case cirjson::VALUE_TRUE:
    case cirjson::VALUE_FALSE:
    case cirjson::VALUE_NULL:
      rOut << " " << parser.text();
      break;
    default:
      break;
  }
  rOut << std::endl;
}

// Feeds the stream chunk by chunk, printing every token as soon as it is
// complete
void dump_tokens(std::istream& in, std::ostream& rOut, const options_type& options) {
  TRACEFUNC;

  cirjson::factory factory(options.features);
  auto parser = factory.create_non_blocking_byte_array_parser();

  std::vector<char> chunk(options.chunk_size);
  for (;;) {
    const cirjson::token_type token = parser->advance();
    if (token == cirjson::END_OF_STREAM) { break; }

    if (token == cirjson::NOT_AVAILABLE) {
      in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const std::size_t count = static_cast<std::size_t>(in.gcount());
      TRACE("read " << count << " bytes");
      if (count > 0) {
        parser->feeder().feed_input(chunk.data(), 0, count);
      } else {
        parser->feeder().end_of_input();
      }
      continue;
    }

    write_token(rOut, *parser);
  }
}

int main(int argc, char* argv[]) {
  options_type options;
  if (!parse_options(argc, argv, options)) {
    usage(std::cerr);
    return 2;
  }

  try {
    if (options.file_name.empty()) {
      dump_tokens(std::cin, std::cout, options);
    } else {
      std::ifstream file(options.file_name, std::ios::binary);
      if (!file) {
        std::cerr << "cannot open " << options.file_name << std::endl;
        return 2;
      }
      dump_tokens(file, std::cout, options);
    }
  } catch (const cirjson::parse_error& e) {
    std::cerr << "PARSE ERROR [" << magic_enum::enum_name(e.reason()) << "]: " << e.what() << std::endl;
    return -1;
  } catch (std::exception& e) {
    std::cerr << "EXCEPTION: " << e.what() << std::endl;
    return -1;
  }

  return 0;
}

/***

$ printf '{"__cirJsonId__":"root","a":[ "a1", 1, 2.5e3, true, null ]}' | ./cirjson_tokens --chunk 3
START_OBJECT
CIRJSON_ID_PROPERTY_NAME "__cirJsonId__"
VALUE_STRING "root"
PROPERTY_NAME "a"
START_ARRAY
CIRJSON_ID_ARRAY_ELEMENT "a1"
VALUE_NUMBER_INT 1
VALUE_NUMBER_FLOAT 2.5e3
VALUE_TRUE true
VALUE_NULL null
END_ARRAY
END_OBJECT

$ printf '["id", 01]' | ./cirjson_tokens --enable ALLOW_LEADING_ZEROS_FOR_NUMBERS
START_ARRAY
CIRJSON_ID_ARRAY_ELEMENT "id"
VALUE_NUMBER_INT 1
END_ARRAY

$ printf '{"__cirJsonId__":"x","a":1,"a":2}' | ./cirjson_tokens --strict-duplicates
START_OBJECT
CIRJSON_ID_PROPERTY_NAME "__cirJsonId__"
VALUE_STRING "x"
PROPERTY_NAME "a"
VALUE_NUMBER_INT 1
PARSE ERROR [DUPLICATE_PROPERTY]: Duplicate Object property "a" (line 1, column 31)

 ***/
