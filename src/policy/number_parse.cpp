#include "stream_json/number_parse.hpp"
#include <charconv>
#include <cmath>
#include <system_error>
#include <fast_float/fast_float.h>

namespace sj {

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_json_number(std::string_view s) noexcept {
  std::size_t i = 0;
  const std::size_t n = s.size();
  if (i < n && s[i] == '-') ++i;
  if (i >= n) return false;

  // int part: a lone 0 or a non-zero digit run
  if (s[i] == '0') {
    ++i;
  } else if (s[i] >= '1' && s[i] <= '9') {
    while (i < n && is_digit(s[i])) ++i;
  } else {
    return false;
  }

  if (i < n && s[i] == '.') {
    ++i;
    if (i >= n || !is_digit(s[i])) return false;
    while (i < n && is_digit(s[i])) ++i;
  }

  if (i < n && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
    if (i >= n || !is_digit(s[i])) return false;
    while (i < n && is_digit(s[i])) ++i;
  }
  return i == n;
}

static void set_err(NumberError* err, NumberError v) { if (err) *err = v; }

std::optional<Number> parse_number(std::string_view s, NumberError* err) {
  set_err(err, NumberError::None);
  if (!is_json_number(s)) { set_err(err, NumberError::Syntax); return std::nullopt; }

  const char* first = s.data();
  const char* last = s.data() + s.size();

  const bool integral = s.find_first_of(".eE") == std::string_view::npos;
  if (integral) {
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(first, last, v, 10);
    if (ec == std::errc() && ptr == last) {
      Number out;
      out.is_integer = true;
      out.i = v;
      out.d = static_cast<double>(v);
      return out;
    }
    // too wide for int64: fall through to double
  }

  double d = 0.0;
  auto [ptr, ec] = fast_float::from_chars(first, last, d);
  if (ec != std::errc() || ptr != last || !std::isfinite(d)) {
    set_err(err, NumberError::OutOfRange);
    return std::nullopt;
  }
  Number out;
  out.d = d;
  return out;
}

std::optional<double> parse_double(std::string_view s) {
  auto n = parse_number(s);
  if (!n) return std::nullopt;
  return n->d;
}

}
