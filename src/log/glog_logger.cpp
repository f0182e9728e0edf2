#include "log/glog_logger.hpp"

#include <glog/logging.h>

#include "jsonconfig/api/version.hpp"

namespace jsonconfig {
namespace log {
namespace {

google::LogSeverity ToGlogSeverity(LogSeverity severity) {
  switch (severity) {
    case LogSeverity::kWarning:
      return google::GLOG_WARNING;
    case LogSeverity::kError:
      return google::GLOG_ERROR;
    default:
      return google::GLOG_INFO;
  }
}

}  // namespace

const char* GlogLogger::Name() const { return "jsonconfig.log.glog_logger"; }

std::uint32_t GlogLogger::ApiVersion() const { return api::kApiVersion; }

void GlogLogger::Log(LogSeverity severity, const std::string& message) {
  if (severity == LogSeverity::kDebug) {
    VLOG(1) << message;
    return;
  }
  google::LogMessage(__FILE__, __LINE__, ToGlogSeverity(severity)).stream() << message;
}

ILogger* DefaultLogger() {
  static GlogLogger logger;
  return &logger;
}

}  // namespace log
}  // namespace jsonconfig
