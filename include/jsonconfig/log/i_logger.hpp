#pragma once

#include <cstdint>
#include <string>

#include "jsonconfig/api/export.hpp"
#include "jsonconfig/log/log_types.hpp"

namespace jsonconfig {
namespace log {

// Per-call log destination. Read and write operations take one through their
// options; none of them keeps a logger between calls.
class ILogger {
 public:
  virtual ~ILogger() {}

  // Implementation name, for diagnostics.
  virtual const char* Name() const = 0;

  // API version the implementation was built against.
  virtual std::uint32_t ApiVersion() const = 0;

  // Write one message. Must not throw.
  virtual void Log(LogSeverity severity, const std::string& message) = 0;
};

// Stateless glog-backed logger used when options carry no logger.
// kDebug maps to VLOG(1).
JSONCONFIG_API ILogger* DefaultLogger();

}  // namespace log
}  // namespace jsonconfig
