#pragma once

#include <string>

#include "jsonconfig/api/export.hpp"
#include "jsonconfig/api/status.hpp"
#include "jsonconfig/json/i_json.hpp"

namespace jsonconfig {
namespace json {

// Converts one string to a number when it matches the accepted grammar:
//   integer: -?[0-9]+                       (leading zeros are decimal)
//   float:   -?([0-9]+(\.[0-9]*)?|\.[0-9]+)([eE][+-]?[0-9]+)?
// Integers become int64, or uint64 when only that fits; larger integers are read
// with the float rule. Floats that overflow to infinity are rejected, and so are
// "+", whitespace, separators, hex and the inf/nan spellings.
// Returns false and leaves *out untouched when text stays a string.
JSONCONFIG_API bool CoerceString(const std::string& text, Value* out);

// Rebuilds value with every coercible string leaf replaced by its number.
// Object keys, booleans, null and numbers are left alone.
JSONCONFIG_API Value CoerceNumbers(const Value& value);

// Parse followed by CoerceNumbers. kParseError when text is not valid JSON.
JSONCONFIG_API api::Result<Value> DecodeWithCoercion(const std::string& text);

}  // namespace json
}  // namespace jsonconfig
