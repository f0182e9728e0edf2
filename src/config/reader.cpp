#include "jsonconfig/config/reader.hpp"

#include "file/file_util.hpp"
#include "jsonconfig/json/numeric_coercion.hpp"

namespace jsonconfig {
namespace config {
namespace {

log::ILogger* LoggerOf(const ReadOptions& options) {
  return options.logger != NULL ? options.logger : log::DefaultLogger();
}

api::Result<json::Value> Decode(const std::string& text, const ReadOptions& options) {
  const std::string sanitized = json::Sanitize(text, options.sanitize);
  api::Result<json::Value> decoded = options.coerce_numbers
                                         ? json::DecodeWithCoercion(sanitized)
                                         : json::JsonCodec::Parse(sanitized);
  if (!decoded.ok()) {
    LoggerOf(options)->Log(log::LogSeverity::kWarning, decoded.status().ToString());
  }
  return decoded;
}

}  // namespace

api::Result<json::Value> ReadConfig(const std::string& source, const ReadOptions& options) {
  if (file::IsRegularFile(source)) {
    return ReadConfigFile(source, options);
  }
  return ReadConfigString(source, options);
}

api::Result<json::Value> ReadConfigFile(const std::string& path, const ReadOptions& options) {
  log::ILogger* logger = LoggerOf(options);
  logger->Log(log::LogSeverity::kDebug, "Reading JSON file " + path);

  api::Result<std::string> content = file::ReadTextFile(path);
  if (!content.ok()) {
    logger->Log(log::LogSeverity::kWarning, content.status().ToString());
    return api::Result<json::Value>(content.status());
  }
  return Decode(content.value(), options);
}

api::Result<json::Value> ReadConfigString(const std::string& text, const ReadOptions& options) {
  LoggerOf(options)->Log(log::LogSeverity::kDebug, "Parsing JSON string");
  return Decode(text, options);
}

}  // namespace config
}  // namespace jsonconfig
