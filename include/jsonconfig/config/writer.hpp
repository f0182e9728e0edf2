#pragma once

#include <string>

#include "jsonconfig/api/export.hpp"
#include "jsonconfig/api/status.hpp"
#include "jsonconfig/json/i_json.hpp"
#include "jsonconfig/json/sanitizer.hpp"
#include "jsonconfig/log/i_logger.hpp"

namespace jsonconfig {
namespace config {

struct WriteOptions {
  int indent = 2;                  // spaces per level; negative is rejected
  bool sort_keys = true;           // false keeps the order of the source
  bool ensure_ascii = true;        // escape non-ASCII as \uXXXX
  bool atomic_replace = true;      // write a temp file, then rename over path
  json::SanitizeOptions sanitize;  // applied to the serialized source
  log::ILogger* logger = NULL;     // NULL: log::DefaultLogger()
};

// Write source to path as pretty-printed strict JSON.
//
// An object or array Value is serialized first. A string Value, like the string
// overloads, is taken as JSON text and may carry comments. Either way the text is
// sanitized and re-parsed (without numeric coercion) before anything is written.
//
// Returns:
// - kInvalidArgument for a null, boolean or number source, or a negative indent.
//   Nothing is created or truncated.
// - kParseError when the sanitized text is not valid JSON.
// - kIoError when the file cannot be written or replaced.
JSONCONFIG_API api::Status WriteConfig(const std::string& path, const json::Value& source,
                                       const WriteOptions& options);
JSONCONFIG_API api::Status WriteConfig(const std::string& path, const std::string& source,
                                       const WriteOptions& options);
JSONCONFIG_API api::Status WriteConfig(const std::string& path, const char* source,
                                       const WriteOptions& options);

JSONCONFIG_API api::Status WriteConfig(const std::string& path, const json::Value& source,
                                       int indent = 2, bool sort_keys = true);
JSONCONFIG_API api::Status WriteConfig(const std::string& path, const std::string& source,
                                       int indent = 2, bool sort_keys = true);
JSONCONFIG_API api::Status WriteConfig(const std::string& path, const char* source,
                                       int indent = 2, bool sort_keys = true);

}  // namespace config
}  // namespace jsonconfig
