#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "jsonconfig/api/export.hpp"

namespace jsonconfig {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kParseError,
  kNotFound,
  kIoError
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kFile = 0x20,
  kJson = 0x60,
  kConfig = 0x70,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Module-local detail ids. Each pairs with the status code it is raised with.
enum ErrorDetail : std::uint32_t {
  kDetailNone = 0x0000,
  kDetailJsonParseFailed = 0x0001,      // kJson / kParseError
  kDetailJsonInvalidUtf8 = 0x0002,      // kJson / kInvalidArgument
  kDetailConfigInvalidSource = 0x0001,  // kConfig / kInvalidArgument
  kDetailConfigInvalidIndent = 0x0002,  // kConfig / kInvalidArgument
  kDetailConfigInvalidOption = 0x0003,  // kConfig / kInvalidArgument
  kDetailFileNotFound = 0x0001,         // kFile / kNotFound
  kDetailFileReadFailed = 0x0001,       // kFile / kIoError
  kDetailFileWriteFailed = 0x0002,      // kFile / kIoError
  kDetailFileRenameFailed = 0x0003,     // kFile / kIoError
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
JSONCONFIG_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                           std::uint32_t detail_id = 0);
JSONCONFIG_API const char* ErrorModuleName(ErrorModule module);
JSONCONFIG_API const char* StatusCodeName(StatusCode status_code);
JSONCONFIG_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
JSONCONFIG_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}
  Status(StatusCode code, std::string message, std::uint32_t hex_code)
      : code_(code), message_(std::move(message)), hex_code_(hex_code) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // "kParseError(0x60200001): <message>"
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), value_() {}
  Result(const T& value) : status_(Status::Ok()), value_(value) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_;
};

}  // namespace api
}  // namespace jsonconfig
