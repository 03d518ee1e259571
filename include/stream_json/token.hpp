#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sj {

enum class TokenKind {
  OpenObject,
  CloseObject,
  OpenArray,
  CloseArray,
  Colon,
  Comma,
  WhiteSpace,
  StringLiteral,
  NumberLiteral,
  TrueLiteral,
  FalseLiteral,
  NullLiteral
};

// Where Token::text lives.
//   Input   -> the buffer passed to the call that produced the token
//   Scratch -> the lexer's scratch buffer (escaped or chunk-spanning text)
enum class TextSource { Input, Scratch };

struct Token {
  std::string_view text;      // strings: decoded content without quotes
  std::size_t position = 0;   // start inside the current buffer (0 if it began in an earlier one)
  std::uint64_t offset = 0;   // start in the whole document
  TokenKind kind = TokenKind::WhiteSpace;
  TextSource source = TextSource::Input;

  bool is_value_start() const noexcept {
    switch (kind) {
      case TokenKind::OpenObject:
      case TokenKind::OpenArray:
      case TokenKind::StringLiteral:
      case TokenKind::NumberLiteral:
      case TokenKind::TrueLiteral:
      case TokenKind::FalseLiteral:
      case TokenKind::NullLiteral:
        return true;
      default:
        return false;
    }
  }
};

std::string_view to_string(TokenKind k) noexcept;

}
