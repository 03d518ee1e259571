#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace sj {

// Numeric collaborator for NumberLiteral / NumberValue text. The lexer only
// delimits the literal; grammar and conversion live here.

struct Number {
  bool is_integer = false; // true -> use `i`; `d` holds the same value as double
  std::int64_t i = 0;
  double d = 0.0;
};

enum class NumberError { None, Syntax, OutOfRange };

// Strict RFC 8259 grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
bool is_json_number(std::string_view s) noexcept;

// Integers without fraction/exponent that fit int64 come back as integers
// (std::from_chars); the rest through fast_float.
std::optional<Number> parse_number(std::string_view s, NumberError* err = nullptr);

std::optional<double> parse_double(std::string_view s);

}
