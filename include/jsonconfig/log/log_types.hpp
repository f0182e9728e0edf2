#pragma once

#include <string>

namespace jsonconfig {
namespace log {

enum class LogSeverity { kDebug = -1, kInfo = 0, kWarning = 1, kError = 2 };

// Process logging options applied to glog flags by InitLogging.
struct LoggingOptions {
  std::string log_dir;  // empty: no glog log files
  bool logtostderr = true;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;     // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;  // glog treats this as ERROR by default
  int verbosity = 0;         // VLOG level; 1 shows kDebug messages
};

}  // namespace log
}  // namespace jsonconfig
