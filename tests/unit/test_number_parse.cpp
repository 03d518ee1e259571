#include "stream_json/number_parse.hpp"
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool near(double a, double b) { return std::fabs(a - b) <= 1e-9 * std::fmax(1.0, std::fabs(b)); }

int main(){
  // grammar
  for (const char* s : {"0", "-0", "1", "-12", "3.25", "0.5", "1e9", "1E+9", "2.5e-3", "-0.0e0", "12345678901234567890"}) {
    expect(sj::is_json_number(s), std::string("accepts ") + s);
  }
  for (const char* s : {"", "-", "01", "-01", "1.", ".5", "+1", "1e", "1e+", "0x10", "1.2.3", "1e5e5", "Infinity", "NaN", "1 "}) {
    expect(!sj::is_json_number(s), std::string("rejects '") + s + "'");
  }

  // integers stay integers
  {
    auto n = sj::parse_number("-42");
    expect(n && n->is_integer && n->i == -42 && n->d == -42.0, "small integer");
  }
  {
    auto n = sj::parse_number("9223372036854775807");
    expect(n && n->is_integer && n->i == std::numeric_limits<std::int64_t>::max(), "int64 max");
  }
  {
    auto n = sj::parse_number("-9223372036854775808");
    expect(n && n->is_integer && n->i == std::numeric_limits<std::int64_t>::min(), "int64 min");
  }
  {
    auto n = sj::parse_number("18446744073709551616");
    expect(n && !n->is_integer && near(n->d, 18446744073709551616.0), "too wide for int64 falls back to double");
  }

  // doubles
  {
    auto n = sj::parse_number("3.25");
    expect(n && !n->is_integer && n->d == 3.25, "fraction");
  }
  {
    auto n = sj::parse_number("-1.5e3");
    expect(n && !n->is_integer && n->d == -1500.0, "exponent");
  }
  {
    auto d = sj::parse_double("2.5E-3");
    expect(d && near(*d, 0.0025), "parse_double");
  }
  {
    auto d = sj::parse_double("7");
    expect(d && *d == 7.0, "parse_double on an integer");
  }

  // errors
  {
    sj::NumberError err = sj::NumberError::None;
    expect(!sj::parse_number("01", &err) && err == sj::NumberError::Syntax, "syntax error");
    expect(!sj::parse_number("1e999", &err) && err == sj::NumberError::OutOfRange, "overflow is out of range");
    expect(sj::parse_number("1", &err) && err == sj::NumberError::None, "error reset on success");
  }
  expect(!sj::parse_double("abc"), "parse_double rejects junk");

  if (failures) { std::cerr << "[FAIL] number_parse: " << failures << " check(s)\n"; return 1; }
  std::cout << "[PASS] number_parse\n";
  return 0;
}
