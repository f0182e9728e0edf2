#pragma once

#include <string>

#include "jsonconfig/api/export.hpp"

namespace jsonconfig {
namespace json {

struct SanitizeOptions {
  // When false (default) comment detection is purely line based, so a "//" inside a
  // quoted value also starts a comment. When true, string literals are tracked and
  // only "//" or "#" outside them are treated as comments.
  bool string_aware = false;
};

// Removes "#" and "//" comment lines, trailing "//" comments, surrounding
// whitespace and every byte below 0x20, in that order. Structure is not checked.
JSONCONFIG_API std::string Sanitize(const std::string& text);
JSONCONFIG_API std::string Sanitize(const std::string& text, const SanitizeOptions& options);

}  // namespace json
}  // namespace jsonconfig
