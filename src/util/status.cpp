#include "stream_json/status.hpp"
#include <sstream>

namespace sj {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:                  return "none";
    case ErrorCode::InvalidCharacter:      return "invalid character";
    case ErrorCode::InvalidEscape:         return "invalid escape";
    case ErrorCode::InvalidUnicodeEscape:  return "invalid unicode escape";
    case ErrorCode::InvalidUtf16Surrogate: return "invalid utf-16 surrogate";
    case ErrorCode::InvalidUtf8:           return "invalid utf-8";
    case ErrorCode::ControlCharacter:      return "control character in string";
    case ErrorCode::InvalidLiteral:        return "invalid literal";
    case ErrorCode::InvalidNumber:         return "invalid number";
    case ErrorCode::UnexpectedEnd:         return "unexpected end of input";
    case ErrorCode::UnbalancedClose:       return "unbalanced close";
    case ErrorCode::UnexpectedToken:       return "unexpected token";
    case ErrorCode::CapacityExceeded:      return "capacity exceeded";
  }
  return "unknown";
}

std::string_view to_string(Status st) noexcept {
  switch (st) {
    case Status::Ok:            return "ok";
    case Status::NeedMoreData:  return "need more data";
    case Status::EndOfDocument: return "end of document";
    case Status::Error:         return "error";
  }
  return "unknown";
}

ErrorFamily error_family(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return ErrorFamily::None;
    case ErrorCode::UnbalancedClose:
    case ErrorCode::UnexpectedToken:
      return ErrorFamily::Structural;
    case ErrorCode::CapacityExceeded:
      return ErrorFamily::Capacity;
    default:
      return ErrorFamily::Lexical;
  }
}

std::string describe(const Error& e) {
  std::ostringstream o;
  o << to_string(e.code) << " at offset " << e.offset;
  if (!e.path.empty()) o << " [" << e.path << "]";
  if (!e.message.empty()) o << ": " << e.message;
  return o.str();
}

}
