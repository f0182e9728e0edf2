#include "jsonconfig/json/sanitizer.hpp"

#include <vector>

namespace jsonconfig {
namespace json {
namespace {

const char kWhitespace[] = " \t\n\r\f\v";

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(kWhitespace) == std::string::npos;
}

bool StartsComment(const std::string& text, std::size_t pos) {
  if (pos >= text.size()) return false;
  if (text[pos] == '#') return true;
  return text.compare(pos, 2, "//") == 0;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  for (;;) {
    const std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

// A whole-line comment also swallows the whitespace-only lines right above it.
std::string StripCommentsByLine(const std::string& text) {
  std::vector<std::string> lines = SplitLines(text);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    std::string& line = lines[i];
    const std::size_t first = line.find_first_not_of(kWhitespace);
    if (first != std::string::npos && StartsComment(line, first)) {
      line.clear();
      for (std::size_t j = i; j > 0 && IsBlank(lines[j - 1]); --j) {
        lines[j - 1].clear();
      }
      continue;
    }
    const std::size_t inline_comment = line.find("//");
    if (inline_comment != std::string::npos) {
      line.erase(inline_comment);
    }
  }

  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out += '\n';
    out += lines[i];
  }
  return out;
}

std::string StripCommentsOutsideStrings(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool in_string = false;
  bool escaped = false;
  bool line_start = true;
  std::size_t i = 0;

  while (i < text.size()) {
    const char c = text[i];
    if (in_string) {
      out += c;
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      ++i;
      continue;
    }

    if (line_start) {
      std::size_t first = i;
      while (first < text.size() && text[first] != '\n' && IsSpace(text[first])) ++first;
      line_start = false;
      if (StartsComment(text, first)) {
        const std::size_t eol = text.find('\n', first);
        i = eol == std::string::npos ? text.size() : eol;
        continue;
      }
    }

    if (c == '/' && text.compare(i, 2, "//") == 0) {
      const std::size_t eol = text.find('\n', i);
      i = eol == std::string::npos ? text.size() : eol;
      continue;
    }
    if (c == '"') in_string = true;
    if (c == '\n') line_start = true;
    out += c;
    ++i;
  }
  return out;
}

std::string Trim(const std::string& s) {
  const std::size_t start = s.find_first_not_of(kWhitespace);
  if (start == std::string::npos) return std::string();
  const std::size_t end = s.find_last_not_of(kWhitespace);
  return s.substr(start, end - start + 1);
}

std::string RemoveControlCharacters(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (static_cast<unsigned char>(s[i]) >= 0x20) out += s[i];
  }
  return out;
}

}  // namespace

std::string Sanitize(const std::string& text) { return Sanitize(text, SanitizeOptions()); }

std::string Sanitize(const std::string& text, const SanitizeOptions& options) {
  const std::string stripped =
      options.string_aware ? StripCommentsOutsideStrings(text) : StripCommentsByLine(text);
  return RemoveControlCharacters(Trim(stripped));
}

}  // namespace json
}  // namespace jsonconfig
