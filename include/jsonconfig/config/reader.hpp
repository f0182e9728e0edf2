#pragma once

#include <string>

#include "jsonconfig/api/export.hpp"
#include "jsonconfig/api/status.hpp"
#include "jsonconfig/json/i_json.hpp"
#include "jsonconfig/json/sanitizer.hpp"
#include "jsonconfig/log/i_logger.hpp"

namespace jsonconfig {
namespace config {

struct ReadOptions {
  bool coerce_numbers = true;         // numeric strings become numbers
  json::SanitizeOptions sanitize;     // comment handling
  log::ILogger* logger = NULL;        // NULL: log::DefaultLogger()
};

// Read a config from a path to an existing regular file, or else from source as
// literal JSON text. The text is sanitized, parsed and numeric strings coerced.
// Returns kParseError for invalid JSON and kIoError when the file cannot be read.
JSONCONFIG_API api::Result<json::Value> ReadConfig(const std::string& source,
                                                   const ReadOptions& options = ReadOptions());

// Like ReadConfig but source must be a file. Returns kNotFound when it is missing.
JSONCONFIG_API api::Result<json::Value> ReadConfigFile(const std::string& path,
                                                       const ReadOptions& options = ReadOptions());

// Like ReadConfig but text is never looked up on disk.
JSONCONFIG_API api::Result<json::Value> ReadConfigString(const std::string& text,
                                                         const ReadOptions& options = ReadOptions());

}  // namespace config
}  // namespace jsonconfig
