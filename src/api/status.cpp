#include "jsonconfig/api/status.hpp"

#include <cstdio>

namespace jsonconfig {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define JSONCONFIG_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Core generic status family (detail id = 0)
    {JSONCONFIG_ECODE(ErrorModule::kCore, StatusCode::kOk, kDetailNone), "CORE_OK",
     "Operation succeeded"},
    {JSONCONFIG_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, kDetailNone),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {JSONCONFIG_ECODE(ErrorModule::kCore, StatusCode::kParseError, kDetailNone),
     "CORE_PARSE_ERROR", "Parse error"},
    {JSONCONFIG_ECODE(ErrorModule::kCore, StatusCode::kNotFound, kDetailNone), "CORE_NOT_FOUND",
     "Resource not found"},
    {JSONCONFIG_ECODE(ErrorModule::kCore, StatusCode::kIoError, kDetailNone), "CORE_IO_ERROR",
     "I/O error"},

    // Module detail ids; keep appending here as a unified lookup table.
    {JSONCONFIG_ECODE(ErrorModule::kJson, StatusCode::kParseError, kDetailJsonParseFailed),
     "JSON_PARSE_FAILED", "JSON parse failed"},
    {JSONCONFIG_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument, kDetailJsonInvalidUtf8),
     "JSON_INVALID_UTF8", "JSON value holds a string that is not valid UTF-8"},
    {JSONCONFIG_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument,
                      kDetailConfigInvalidSource),
     "CONFIG_INVALID_SOURCE", "Write source is not an object, array or string"},
    {JSONCONFIG_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument,
                      kDetailConfigInvalidIndent),
     "CONFIG_INVALID_INDENT", "Indent width is negative"},
    {JSONCONFIG_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument,
                      kDetailConfigInvalidOption),
     "CONFIG_INVALID_OPTION", "Configuration option has the wrong type"},
    {JSONCONFIG_ECODE(ErrorModule::kFile, StatusCode::kNotFound, kDetailFileNotFound),
     "FILE_NOT_FOUND", "File does not exist"},
    {JSONCONFIG_ECODE(ErrorModule::kFile, StatusCode::kIoError, kDetailFileReadFailed),
     "FILE_READ_FAILED", "File could not be read"},
    {JSONCONFIG_ECODE(ErrorModule::kFile, StatusCode::kIoError, kDetailFileWriteFailed),
     "FILE_WRITE_FAILED", "File could not be written"},
    {JSONCONFIG_ECODE(ErrorModule::kFile, StatusCode::kIoError, kDetailFileRenameFailed),
     "FILE_RENAME_FAILED", "Temporary file could not replace the target"},
};

#undef JSONCONFIG_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kFile:
      return "file";
    case ErrorModule::kJson:
      return "json";
    case ErrorModule::kConfig:
      return "config";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kParseError:
      return "kParseError";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kIoError:
      return "kIoError";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

std::string Status::ToString() const {
  std::string out = StatusCodeName(code_);
  out += "(";
  out += FormatErrorCodeHex(hex_code_);
  out += ")";
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace api
}  // namespace jsonconfig
