#include "jsonconfig/json/numeric_coercion.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <locale>
#include <sstream>

namespace jsonconfig {
namespace json {
namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

std::size_t SkipDigits(const std::string& s, std::size_t pos) {
  while (pos < s.size() && IsDigit(s[pos])) ++pos;
  return pos;
}

bool MatchesInteger(const std::string& s) {
  std::size_t pos = 0;
  if (pos < s.size() && s[pos] == '-') ++pos;
  const std::size_t digits_end = SkipDigits(s, pos);
  return digits_end > pos && digits_end == s.size();
}

bool MatchesFloat(const std::string& s) {
  std::size_t pos = 0;
  if (pos < s.size() && s[pos] == '-') ++pos;

  const std::size_t int_end = SkipDigits(s, pos);
  const bool has_int = int_end > pos;
  pos = int_end;
  bool has_frac = false;
  if (pos < s.size() && s[pos] == '.') {
    const std::size_t frac_end = SkipDigits(s, pos + 1);
    has_frac = frac_end > pos + 1;
    pos = frac_end;
  }
  if (!has_int && !has_frac) return false;

  if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
    ++pos;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
    const std::size_t exp_end = SkipDigits(s, pos);
    if (exp_end == pos) return false;
    pos = exp_end;
  }
  return pos == s.size();
}

bool ParseInteger(const std::string& s, Value* out) {
  char* end = NULL;
  errno = 0;
  const long long signed_value = std::strtoll(s.c_str(), &end, 10);
  if (errno == 0 && end != NULL && *end == '\0') {
    *out = Value(static_cast<std::int64_t>(signed_value));
    return true;
  }
  if (s[0] == '-') return false;

  errno = 0;
  const unsigned long long unsigned_value = std::strtoull(s.c_str(), &end, 10);
  if (errno == 0 && end != NULL && *end == '\0') {
    *out = Value(static_cast<std::uint64_t>(unsigned_value));
    return true;
  }
  return false;
}

// True when a float literal (already matched) lies below 1, i.e. the decimal
// exponent of its leading significant digit is negative. All-zero literals count.
bool IsBelowOne(const std::string& s) {
  std::size_t pos = s[0] == '-' ? 1 : 0;
  long magnitude = 0;
  bool significant = false;
  bool fraction = false;
  for (; pos < s.size() && s[pos] != 'e' && s[pos] != 'E'; ++pos) {
    if (s[pos] == '.') {
      fraction = true;
    } else if (!significant) {
      if (fraction) --magnitude;
      significant = s[pos] != '0';
    } else if (!fraction) {
      ++magnitude;
    }
  }
  if (!significant) return true;
  if (pos == s.size()) return magnitude < 0;

  ++pos;
  bool negative = false;
  if (s[pos] == '+' || s[pos] == '-') negative = s[pos++] == '-';
  while (pos + 1 < s.size() && s[pos] == '0') ++pos;
  // Nine digits cannot be outweighed by the mantissa digits of any real input.
  if (s.size() - pos > 9) return negative;
  const long exponent = std::strtol(s.c_str() + pos, NULL, 10);
  return magnitude + (negative ? -exponent : exponent) < 0;
}

bool ParseFloat(const std::string& s, Value* out) {
  std::istringstream in(s);
  in.imbue(std::locale::classic());
  double parsed = 0.0;
  in >> parsed;
  if (in.fail()) {
    // Out of double range. Underflow reads as zero; overflow keeps the string.
    if (!IsBelowOne(s)) return false;
    parsed = s[0] == '-' ? -0.0 : 0.0;
  } else if (!in.eof() || !std::isfinite(parsed)) {
    return false;
  }
  *out = Value(parsed);
  return true;
}

}  // namespace

bool CoerceString(const std::string& text, Value* out) {
  if (out == NULL || text.empty()) return false;
  if (MatchesInteger(text) && ParseInteger(text, out)) return true;
  if (MatchesFloat(text)) return ParseFloat(text, out);
  return false;
}

Value CoerceNumbers(const Value& value) {
  switch (value.type()) {
    case Value::value_t::string: {
      Value number;
      if (CoerceString(value.get_ref<const std::string&>(), &number)) return number;
      return value;
    }
    case Value::value_t::object: {
      Value out = Value::object();
      for (Value::const_iterator it = value.cbegin(); it != value.cend(); ++it) {
        out[it.key()] = CoerceNumbers(it.value());
      }
      return out;
    }
    case Value::value_t::array: {
      Value out = Value::array();
      for (Value::const_iterator it = value.cbegin(); it != value.cend(); ++it) {
        out.push_back(CoerceNumbers(*it));
      }
      return out;
    }
    default:
      return value;
  }
}

api::Result<Value> DecodeWithCoercion(const std::string& text) {
  api::Result<Value> parsed = JsonCodec::Parse(text);
  if (!parsed.ok()) return parsed;
  return api::Result<Value>(CoerceNumbers(parsed.value()));
}

}  // namespace json
}  // namespace jsonconfig
