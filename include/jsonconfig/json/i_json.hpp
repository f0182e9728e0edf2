#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "jsonconfig/api/export.hpp"
#include "jsonconfig/api/status.hpp"

namespace jsonconfig {
namespace json {

// Object members keep the order the parser produced them in.
using Value = nlohmann::ordered_json;

class JSONCONFIG_API JsonCodec {
 public:
  // Parse strict JSON text into a DOM object.
  // Returns kParseError with the failing byte offset when text is not valid JSON.
  static api::Result<Value> Parse(const std::string& text);

  // Load and parse a strict JSON file from disk (no comment stripping).
  // Returns kNotFound when file does not exist.
  static api::Result<Value> LoadFile(const std::string& path);

  // Serialize JSON to file through a temporary file and rename.
  // Returns kIoError on write failures.
  static api::Status SaveFile(const std::string& path, const Value& value, int indent = 2);

  // Serialize to UTF-8 text. indent < 0 yields the compact form.
  // Returns kInvalidArgument when a string member is not valid UTF-8.
  static api::Result<std::string> Dump(const Value& value, int indent = 2,
                                       bool ensure_ascii = false);

  // Copy of value with the members of every object ordered by key.
  static Value SortKeys(const Value& value);
};

}  // namespace json
}  // namespace jsonconfig
