/***
clausklein$ make CXXFLAGS='-std=c++17 -Wextra' cirjson_example
c++ -std=c++17 -Wextra    cirjson_example.cpp   -o cirjson_example

clausklein$ ./cirjson_example
{"__cirJsonId__":"root","field1":42,"array":["array-id",1,2,3], ...
field1=42 field2=asd nested.field1=42 nested.field2=1 array=3 values
clausklein$
 ***/

#include "cirjson_reader.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static char json_obj[] = "{\"__cirJsonId__\":\"root\", \"field1\": 42, \"array\" : [\"array-id\", 1, 2, 3 ], "
                         "\"field2\": \"asd\", "
                         "\"nested\" : { \"__cirJsonId__\":\"nested-id\", \"field1\" : 42.0, \"field2\" : true, "
                         "\"ignored_field\" : 0, "
                         "\"ignored_object\" : {\"__cirJsonId__\":\"o\",\"a\":[\"a\",0]} },"
                         "\"ignored_array\" : [\"i\", 4, 2, {\"__cirJsonId__\":\"x\",\"a\":5}, [\"y\",7]] }";

struct obj_type {
  long long field1 = 0L;
  std::string id;
  std::string field2;
  struct {
    double field1 = 0.0;
    bool field2 = false;
  } nested;
  std::vector<long> array;
};

// The whole document is fed up front, so running out of input is an error
cirjson::token_type next(cirjson::byte_array_parser& parser) {
  const cirjson::token_type token = parser.advance();
  if (token == cirjson::NOT_AVAILABLE || token == cirjson::END_OF_STREAM) {
    throw std::runtime_error("unexpected end of document");
  }
  return token;
}

// Skips the value whose first token is current, nested scopes included
void ignore(cirjson::byte_array_parser& parser) {
  std::size_t depth = cirjson::is_struct_start(parser.current_token()) ? 1 : 0;
  while (depth > 0) {
    const cirjson::token_type token = next(parser);
    if (cirjson::is_struct_start(token)) {
      ++depth;
    } else if (cirjson::is_struct_end(token)) {
      --depth;
    }
  }
}

// Calls handler(name) for every ordinary property of the object just
// started; the id is stored in id
template <typename Handler>
void parse_object(cirjson::byte_array_parser& parser, std::string& id, Handler handler) {
  next(parser);  // __cirJsonId__
  next(parser);
  id = parser.value_as<std::string_view>();

  while (next(parser) == cirjson::PROPERTY_NAME) {
    const std::string name(parser.current_name());
    next(parser);
    handler(name);
  }
}

int main() {
  obj_type obj;
  //=================================
  std::cout << json_obj << std::endl;
  //=================================

  try {
    cirjson::factory factory;
    auto parser = factory.create_non_blocking_byte_array_parser();
    parser->feeder().feed_input(json_obj, 0, sizeof(json_obj) - 1);
    parser->feeder().end_of_input();

    next(*parser);  // START_OBJECT
    //=================================
    parse_object(*parser, obj.id, [&](const std::string& k) {
      if (k == "field1") {
        obj.field1 = parser->value_as<long long>();
      } else if (k == "field2") {
        obj.field2 = parser->value_as<std::string_view>();
      } else if (k == "nested") {
        std::string nested_id;
        //=================================
        parse_object(*parser, nested_id, [&](const std::string& nk) {  // recursion
          if (nk == "field1") {
            obj.nested.field1 = parser->value_as<double>();
          } else if (nk == "field2") {
            obj.nested.field2 = parser->value_as<bool>();
          } else {
            ignore(*parser);  // ANY other OBJECT
          }
        });
        //=================================
      } else if (k == "array") {
        //=================================
        next(*parser);  // array id
        while (next(*parser) != cirjson::END_ARRAY) { obj.array.push_back(parser->value_as<long>()); }
        //=================================
      } else {
        ignore(*parser);  // ANY other OBJECT
      }
    });
    //=================================
    if (parser->advance() != cirjson::END_OF_STREAM) { throw std::runtime_error("trailing content"); }
  } catch (std::exception& e) {
    std::cerr << "EXCEPTION: " << e.what() << std::endl;
    return -1;
  }

  //=================================
  std::vector<long> expected = {1, 2, 3};
  assert(obj.id == "root");
  assert(obj.field1 == 42LL);
  assert(obj.field2 == "asd");
  assert(obj.nested.field1 == 42.0);
  assert(obj.nested.field2 == true);
  assert(obj.array == expected);
  //=================================

  std::cout << "field1=" << obj.field1 << " field2=" << obj.field2 << " nested.field1=" << obj.nested.field1
            << " nested.field2=" << obj.nested.field2 << " array=" << obj.array.size() << " values" << std::endl;

  return 0;
}
