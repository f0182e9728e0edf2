#include "jsonconfig/config/writer.hpp"

#include "file/file_util.hpp"

namespace jsonconfig {
namespace config {

#define JC_STATUS(detail, message)                                          \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message),     \
                          api::ErrorModule::kConfig, (detail))
namespace {

log::ILogger* LoggerOf(const WriteOptions& options) {
  return options.logger != NULL ? options.logger : log::DefaultLogger();
}

api::Status Fail(log::ILogger* logger, const api::Status& status) {
  logger->Log(log::LogSeverity::kWarning, status.ToString());
  return status;
}

WriteOptions MakeOptions(int indent, bool sort_keys) {
  WriteOptions options;
  options.indent = indent;
  options.sort_keys = sort_keys;
  return options;
}

// Sanitize, validate and pretty-print json_text into path.
api::Status WriteText(const std::string& path, const std::string& json_text,
                      const WriteOptions& options) {
  log::ILogger* logger = LoggerOf(options);

  const std::string sanitized = json::Sanitize(json_text, options.sanitize);
  api::Result<json::Value> parsed = json::JsonCodec::Parse(sanitized);
  if (!parsed.ok()) {
    return Fail(logger, parsed.status());
  }

  const json::Value& document =
      options.sort_keys ? json::JsonCodec::SortKeys(parsed.value()) : parsed.value();
  api::Result<std::string> pretty =
      json::JsonCodec::Dump(document, options.indent, options.ensure_ascii);
  if (!pretty.ok()) {
    return Fail(logger, pretty.status());
  }

  api::Status st = file::WriteTextFile(path, pretty.value() + "\n", options.atomic_replace);
  if (!st.ok()) {
    return Fail(logger, st);
  }
  return api::Status::Ok();
}

api::Status CheckIndent(const WriteOptions& options) {
  if (options.indent < 0) {
    return JC_STATUS(api::kDetailConfigInvalidIndent, "indent must be >= 0");
  }
  return api::Status::Ok();
}

}  // namespace

api::Status WriteConfig(const std::string& path, const json::Value& source,
                        const WriteOptions& options) {
  log::ILogger* logger = LoggerOf(options);
  logger->Log(log::LogSeverity::kDebug, "Writing JSON file " + path);

  api::Status st = CheckIndent(options);
  if (!st.ok()) {
    return Fail(logger, st);
  }
  if (source.is_string()) {
    return WriteText(path, source.get_ref<const std::string&>(), options);
  }
  if (!source.is_object() && !source.is_array()) {
    return Fail(logger, JC_STATUS(api::kDetailConfigInvalidSource,
                                  std::string("invalid source type '") + source.type_name() +
                                      "', expected string, object or array"));
  }

  // Compact form; the text is re-parsed before anything is written.
  api::Result<std::string> serialized = json::JsonCodec::Dump(source, -1);
  if (!serialized.ok()) {
    return Fail(logger, serialized.status());
  }
  return WriteText(path, serialized.value(), options);
}

api::Status WriteConfig(const std::string& path, const std::string& source,
                        const WriteOptions& options) {
  log::ILogger* logger = LoggerOf(options);
  logger->Log(log::LogSeverity::kDebug, "Writing JSON file " + path);

  api::Status st = CheckIndent(options);
  if (!st.ok()) {
    return Fail(logger, st);
  }
  return WriteText(path, source, options);
}

api::Status WriteConfig(const std::string& path, const char* source,
                        const WriteOptions& options) {
  if (source == NULL) {
    return Fail(LoggerOf(options),
                JC_STATUS(api::kDetailConfigInvalidSource, "source is NULL"));
  }
  return WriteConfig(path, std::string(source), options);
}

api::Status WriteConfig(const std::string& path, const json::Value& source, int indent,
                        bool sort_keys) {
  return WriteConfig(path, source, MakeOptions(indent, sort_keys));
}

api::Status WriteConfig(const std::string& path, const std::string& source, int indent,
                        bool sort_keys) {
  return WriteConfig(path, source, MakeOptions(indent, sort_keys));
}

api::Status WriteConfig(const std::string& path, const char* source, int indent,
                        bool sort_keys) {
  return WriteConfig(path, source, MakeOptions(indent, sort_keys));
}

#undef JC_STATUS

}  // namespace config
}  // namespace jsonconfig
