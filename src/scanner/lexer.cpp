#include "stream_json/lexer.hpp"
#include <string_view>

namespace sj {

static bool is_ws(char c) { return c == ' ' || c == '\n' || c == '\r' || c == '\t'; }

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

// Bytes that may continue a number or literal. Anything wider than the JSON
// grammar is left for the number check / literal match to reject.
static bool is_bare_char(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
      || c == '+' || c == '-' || c == '.';
}

std::string_view to_string(TokenKind k) noexcept {
  switch (k) {
    case TokenKind::OpenObject:    return "{";
    case TokenKind::CloseObject:   return "}";
    case TokenKind::OpenArray:     return "[";
    case TokenKind::CloseArray:    return "]";
    case TokenKind::Colon:         return ":";
    case TokenKind::Comma:         return ",";
    case TokenKind::WhiteSpace:    return "whitespace";
    case TokenKind::StringLiteral: return "string";
    case TokenKind::NumberLiteral: return "number";
    case TokenKind::TrueLiteral:   return "true";
    case TokenKind::FalseLiteral:  return "false";
    case TokenKind::NullLiteral:   return "null";
  }
  return "?";
}

Lexer::Lexer() : Lexer(Config{}) {}

Lexer::Lexer(Config cfg)
  : cfg_(cfg), scratch_(cfg.scratch_reserve, cfg.max_token_bytes) {}

void Lexer::reset() {
  state_ = LexerState::Base;
  scratch_.reset_and_shrink(cfg_.scratch_reserve);
  err_ = Error{};
  cursor_ = buf_size_ = 0;
  base_ = 0;
  next_chunk_ = eof_ = ended_ = failed_ = false;
  token_offset_ = 0;
  token_position_ = 0;
  token_in_buffer_ = true;
  spilled_ = false;
  unicode_acc_ = 0;
  unicode_remaining_ = 0;
  high_surrogate_ = 0;
  escape_offset_ = 0;
  utf8_need_ = 0;
  utf8_lo_ = 0x80;
  utf8_hi_ = 0xBF;
  stats_ = LexerStats{};
}

LexerStats Lexer::stats() const noexcept {
  LexerStats s = stats_;
  s.bytes = base_ + cursor_;
  s.scratch_high_water = scratch_.high_water();
  s.scratch_capacity = scratch_.capacity();
  return s;
}

Status Lexer::advance(std::string_view buf, Token& out) {
  if (failed_) return Status::Error;
  if (ended_) return Status::EndOfDocument;

  if (next_chunk_) {
    base_ += buf_size_;
    cursor_ = 0;
    next_chunk_ = false;
    token_in_buffer_ = false;
  }
  buf_size_ = buf.size();

  Status st = Status::Ok;
  if (cursor_ > buf.size()) {
    fail(ErrorCode::UnexpectedEnd, base_ + buf.size(),
         "buffer shrank between calls without NeedMoreData", st);
    return st;
  }

  for (;;) {
    bool stop = false;
    switch (state_) {
      case LexerState::Base:                 stop = step_base(buf, out, st); break;
      case LexerState::InZeroCopyString:
      case LexerState::CopyingString:        stop = step_string(buf, out, st); break;
      case LexerState::StartEscape:          stop = step_escape(buf, out, st); break;
      case LexerState::ReadingUnicodeEscape: stop = step_unicode(buf, out, st); break;
      case LexerState::AwaitLowSurrogate:
      case LexerState::AwaitLowSurrogateU:   stop = step_low_surrogate(buf, out, st); break;
      case LexerState::InBareValue:          stop = step_bare_value(buf, out, st); break;
    }
    if (stop) return st;
  }
}

bool Lexer::step_base(std::string_view buf, Token& out, Status& st) {
  if (cursor_ >= buf.size()) return exhausted(out, st);

  const char c = buf[cursor_];
  token_offset_ = base_ + cursor_;
  token_position_ = cursor_;
  token_in_buffer_ = true;

  if (is_ws(c)) {
    std::size_t end = cursor_ + 1;
    while (end < buf.size() && is_ws(buf[end])) ++end;
    const std::string_view run = buf.substr(cursor_, end - cursor_);
    cursor_ = end;
    if (!cfg_.emit_whitespace) return false;
    emit(out, TokenKind::WhiteSpace, run, TextSource::Input);
    st = Status::Ok;
    return true;
  }

  auto punct = [&](TokenKind kind) {
    emit(out, kind, buf.substr(cursor_, 1), TextSource::Input);
    ++cursor_;
    st = Status::Ok;
    return true;
  };

  switch (c) {
    case '{': return punct(TokenKind::OpenObject);
    case '}': return punct(TokenKind::CloseObject);
    case '[': return punct(TokenKind::OpenArray);
    case ']': return punct(TokenKind::CloseArray);
    case ':': return punct(TokenKind::Colon);
    case ',': return punct(TokenKind::Comma);
    case '"':
      ++cursor_;
      scratch_.clear();
      utf8_need_ = 0;
      high_surrogate_ = 0;
      state_ = LexerState::InZeroCopyString;
      return false;
    default:
      break;
  }

  if (c == '-' || (c >= '0' && c <= '9') || c == 't' || c == 'f' || c == 'n') {
    scratch_.clear();
    spilled_ = false;
    state_ = LexerState::InBareValue;
    return false;
  }
  return fail(ErrorCode::InvalidCharacter, token_offset_, "unexpected character", st);
}

bool Lexer::step_string(std::string_view buf, Token& out, Status& st) {
  const bool copying = (state_ == LexerState::CopyingString);
  const std::size_t start = cursor_;
  const std::size_t n = buf.size();
  std::size_t i = cursor_;

  while (i < n) {
    const unsigned char c = static_cast<unsigned char>(buf[i]);
    if (utf8_need_ != 0 || c >= 0x80) {
      if (cfg_.validate_utf8 && !check_utf8(c, base_ + i, st)) return true;
      ++i;
      continue;
    }
    if (c == '"') {
      cursor_ = i + 1;
      state_ = LexerState::Base;
      if (!copying) {
        emit(out, TokenKind::StringLiteral, buf.substr(start, i - start), TextSource::Input);
      } else {
        if (!append_scratch(buf.substr(start, i - start), st)) return true;
        emit(out, TokenKind::StringLiteral, scratch_.view(), TextSource::Scratch);
      }
      st = Status::Ok;
      return true;
    }
    if (c == '\\') {
      // everything scanned so far moves to scratch; the backslash itself is dropped
      if (!append_scratch(buf.substr(start, i - start), st)) return true;
      escape_offset_ = base_ + i;
      cursor_ = i + 1;
      state_ = LexerState::StartEscape;
      return false;
    }
    if (c < 0x20) {
      return fail(ErrorCode::ControlCharacter, base_ + i, "unescaped control character in string", st);
    }
    ++i;
  }

  if (!append_scratch(buf.substr(start, n - start), st)) return true;
  cursor_ = n;
  state_ = LexerState::CopyingString;
  return exhausted(out, st);
}

bool Lexer::step_escape(std::string_view buf, Token& out, Status& st) {
  if (cursor_ >= buf.size()) return exhausted(out, st);

  const char c = buf[cursor_];
  const std::uint64_t at = base_ + cursor_;
  ++cursor_;

  char decoded = 0;
  switch (c) {
    case '"':  decoded = '"';  break;
    case '\\': decoded = '\\'; break;
    case '/':  decoded = '/';  break;
    case 'b':  decoded = '\b'; break;
    case 'f':  decoded = '\f'; break;
    case 'n':  decoded = '\n'; break;
    case 'r':  decoded = '\r'; break;
    case 't':  decoded = '\t'; break;
    case 'u':
      unicode_acc_ = 0;
      unicode_remaining_ = 4;
      state_ = LexerState::ReadingUnicodeEscape;
      return false;
    default:
      return fail(ErrorCode::InvalidEscape, at, "invalid escape sequence", st);
  }
  if (!scratch_.push_back(decoded)) {
    return fail(ErrorCode::CapacityExceeded, token_offset_, "string exceeds max_token_bytes", st);
  }
  state_ = LexerState::CopyingString;
  return false;
}

bool Lexer::step_unicode(std::string_view buf, Token& out, Status& st) {
  while (unicode_remaining_ > 0) {
    if (cursor_ >= buf.size()) return exhausted(out, st);
    const int h = hex_val(buf[cursor_]);
    if (h < 0) {
      return fail(ErrorCode::InvalidUnicodeEscape, base_ + cursor_, "expected hex digit in \\u escape", st);
    }
    unicode_acc_ = (unicode_acc_ << 4) | static_cast<std::uint32_t>(h);
    --unicode_remaining_;
    ++cursor_;
  }

  const std::uint32_t unit = unicode_acc_;
  std::uint32_t cp = unit;
  if (high_surrogate_ != 0) {
    if (unit < 0xDC00u || unit > 0xDFFFu) {
      return fail(ErrorCode::InvalidUtf16Surrogate, escape_offset_,
                  "high surrogate not followed by a low surrogate", st);
    }
    cp = 0x10000u + ((high_surrogate_ - 0xD800u) << 10) + (unit - 0xDC00u);
    high_surrogate_ = 0;
  } else if (unit >= 0xD800u && unit <= 0xDBFFu) {
    high_surrogate_ = unit;
    state_ = LexerState::AwaitLowSurrogate;
    return false;
  } else if (unit >= 0xDC00u && unit <= 0xDFFFu) {
    return fail(ErrorCode::InvalidUtf16Surrogate, escape_offset_, "unpaired low surrogate", st);
  }

  if (!scratch_.append_utf8(cp)) {
    return fail(ErrorCode::CapacityExceeded, token_offset_, "string exceeds max_token_bytes", st);
  }
  state_ = LexerState::CopyingString;
  return false;
}

bool Lexer::step_low_surrogate(std::string_view buf, Token& out, Status& st) {
  if (cursor_ >= buf.size()) return exhausted(out, st);

  const char c = buf[cursor_];
  if (state_ == LexerState::AwaitLowSurrogate) {
    if (c != '\\') {
      return fail(ErrorCode::InvalidUtf16Surrogate, base_ + cursor_,
                  "high surrogate not followed by a \\u escape", st);
    }
    escape_offset_ = base_ + cursor_;
    ++cursor_;
    state_ = LexerState::AwaitLowSurrogateU;
    return false;
  }

  if (c != 'u') {
    return fail(ErrorCode::InvalidUtf16Surrogate, base_ + cursor_,
                "high surrogate not followed by a \\u escape", st);
  }
  ++cursor_;
  unicode_acc_ = 0;
  unicode_remaining_ = 4;
  state_ = LexerState::ReadingUnicodeEscape;
  return false;
}

bool Lexer::step_bare_value(std::string_view buf, Token& out, Status& st) {
  const std::size_t start = cursor_;
  std::size_t i = cursor_;
  while (i < buf.size() && is_bare_char(buf[i])) ++i;
  cursor_ = i;

  const std::string_view piece = buf.substr(start, i - start);
  if (i < buf.size()) {
    if (!spilled_) return finish_bare_value(piece, TextSource::Input, out, st);
    if (!append_scratch(piece, st)) return true;
    return finish_bare_value(scratch_.view(), TextSource::Scratch, out, st);
  }

  // may continue in the next chunk
  if (!append_scratch(piece, st)) return true;
  spilled_ = true;
  return exhausted(out, st);
}

bool Lexer::finish_bare_value(std::string_view text, TextSource src, Token& out, Status& st) {
  state_ = LexerState::Base;
  spilled_ = false;

  TokenKind kind = TokenKind::NumberLiteral;
  const char c0 = text.empty() ? '\0' : text.front();
  if (c0 == 't' || c0 == 'f' || c0 == 'n') {
    if (text == "true")       kind = TokenKind::TrueLiteral;
    else if (text == "false") kind = TokenKind::FalseLiteral;
    else if (text == "null")  kind = TokenKind::NullLiteral;
    else return fail(ErrorCode::InvalidLiteral, token_offset_, "expected true, false or null", st);
  }
  emit(out, kind, text, src);
  st = Status::Ok;
  return true;
}

bool Lexer::exhausted(Token& out, Status& st) {
  if (!eof_) {
    next_chunk_ = true;
    st = Status::NeedMoreData;
    return true;
  }
  switch (state_) {
    case LexerState::Base:
      ended_ = true;
      st = Status::EndOfDocument;
      return true;
    case LexerState::InBareValue:
      return finish_bare_value(scratch_.view(), TextSource::Scratch, out, st);
    default:
      return fail(ErrorCode::UnexpectedEnd, base_ + cursor_, "input ended inside a string", st);
  }
}

void Lexer::emit(Token& out, TokenKind kind, std::string_view text, TextSource src) {
  out.text = text;
  out.kind = kind;
  out.source = src;
  out.offset = token_offset_;
  out.position = token_in_buffer_ ? token_position_ : 0;
  ++stats_.tokens;
  if (src == TextSource::Scratch) ++stats_.copied_tokens;
}

bool Lexer::append_scratch(std::string_view s, Status& st) {
  if (scratch_.append(s)) return true;
  fail(ErrorCode::CapacityExceeded, token_offset_, "token exceeds max_token_bytes", st);
  return false;
}

// Lead bytes C2..F4 with the tightened second-byte ranges for E0/ED/F0/F4,
// so overlongs, surrogates and code points past U+10FFFF are rejected.
bool Lexer::check_utf8(unsigned char c, std::uint64_t at, Status& st) {
  if (utf8_need_ == 0) {
    if (c < 0xC2 || c > 0xF4) {
      fail(ErrorCode::InvalidUtf8, at, "invalid utf-8 lead byte", st);
      return false;
    }
    utf8_lo_ = 0x80;
    utf8_hi_ = 0xBF;
    if (c < 0xE0) {
      utf8_need_ = 1;
    } else if (c < 0xF0) {
      utf8_need_ = 2;
      if (c == 0xE0) utf8_lo_ = 0xA0;
      else if (c == 0xED) utf8_hi_ = 0x9F;
    } else {
      utf8_need_ = 3;
      if (c == 0xF0) utf8_lo_ = 0x90;
      else if (c == 0xF4) utf8_hi_ = 0x8F;
    }
    return true;
  }
  if (c < utf8_lo_ || c > utf8_hi_) {
    fail(ErrorCode::InvalidUtf8, at, "invalid utf-8 continuation byte", st);
    return false;
  }
  --utf8_need_;
  utf8_lo_ = 0x80;
  utf8_hi_ = 0xBF;
  return true;
}

bool Lexer::fail(ErrorCode code, std::uint64_t at, const char* msg, Status& st) {
  failed_ = true;
  err_.code = code;
  err_.offset = at;
  err_.path.clear();
  err_.message = msg;
  st = Status::Error;
  return true;
}

}
