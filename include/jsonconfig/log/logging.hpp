#pragma once

#include <string>

#include "jsonconfig/api/export.hpp"
#include "jsonconfig/api/status.hpp"
#include "jsonconfig/log/log_types.hpp"

namespace jsonconfig {
namespace log {

// Load logging options from a JSON config (path or literal text). Comments and
// numeric strings are accepted like any config read. Unknown keys are ignored.
// Recognized keys: log_dir, logtostderr, alsologtostderr, colorlogtostderr,
// log_prefix, minloglevel, stderrthreshold, v (or verbosity).
// Levels may be names ("info", "warning", "error", "fatal") or integers.
// Returns kInvalidArgument when a recognized key has the wrong type.
JSONCONFIG_API api::Result<LoggingOptions> LoadLoggingOptions(const std::string& source);

// Initialize glog for the process and apply options. Call once at startup;
// later calls only re-apply options.
JSONCONFIG_API api::Status InitLogging(const std::string& app_name,
                                       const LoggingOptions& options = LoggingOptions());

// Options applied by the last successful InitLogging.
JSONCONFIG_API LoggingOptions CurrentLoggingOptions();

// Shutdown glog. Repeated calls are no-ops.
JSONCONFIG_API void ShutdownLogging();

}  // namespace log
}  // namespace jsonconfig
