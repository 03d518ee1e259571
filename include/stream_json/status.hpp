#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace sj {

// Result of one Lexer::advance / EventParser::next call.
//   Ok            -> a token / event was produced
//   NeedMoreData  -> buffer exhausted; call again with the next chunk
//   EndOfDocument -> nothing left (input finished, or root value complete)
//   Error         -> fatal for this document; see error()
enum class Status { Ok, NeedMoreData, EndOfDocument, Error };

enum class ErrorCode {
  None,
  // lexical
  InvalidCharacter,
  InvalidEscape,
  InvalidUnicodeEscape,
  InvalidUtf16Surrogate,
  InvalidUtf8,
  ControlCharacter,
  InvalidLiteral,
  InvalidNumber,
  UnexpectedEnd,
  // structural
  UnbalancedClose,
  UnexpectedToken,
  // resource bounds (depth, path length, token size)
  CapacityExceeded
};

enum class ErrorFamily { None, Lexical, Structural, Capacity };

struct Error {
  ErrorCode code = ErrorCode::None;
  std::uint64_t offset = 0; // absolute byte offset in the document
  std::string path;         // parser location when detected (empty for bare lexer errors)
  std::string message;

  explicit operator bool() const noexcept { return code != ErrorCode::None; }
};

std::string_view to_string(ErrorCode code) noexcept;
std::string_view to_string(Status st) noexcept;
ErrorFamily error_family(ErrorCode code) noexcept;

// "<code> at offset N [path P]: message"
std::string describe(const Error& e);

}
