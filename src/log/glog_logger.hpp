#pragma once

#include "jsonconfig/log/i_logger.hpp"

namespace jsonconfig {
namespace log {

class GlogLogger : public ILogger {
 public:
  GlogLogger() {}
  ~GlogLogger() override {}

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Log(LogSeverity severity, const std::string& message) override;
};

}  // namespace log
}  // namespace jsonconfig
