#ifndef CIRJSON_READER_H
#define CIRJSON_READER_H

// Everything needed to tokenize CirJSON documents fed in chunks: create a
// cirjson::factory, ask it for a parser, then alternate feeder().feed_input()
// and advance() until END_OF_STREAM.

#include "cirjson_async_parser.hpp"
#include "cirjson_buffers.hpp"
#include "cirjson_error.hpp"
#include "cirjson_factory.hpp"
#include "cirjson_features.hpp"
#include "cirjson_feeder.hpp"
#include "cirjson_read_context.hpp"
#include "cirjson_symbols.hpp"
#include "cirjson_token.hpp"
#include "cirjson_value.hpp"

#endif // CIRJSON_READER_H
