#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "stream_json/scratch_buffer.hpp"
#include "stream_json/status.hpp"
#include "stream_json/token.hpp"

namespace sj {

enum class LexerState {
  Base,
  InZeroCopyString,
  StartEscape,
  CopyingString,
  ReadingUnicodeEscape,
  AwaitLowSurrogate,   // after \uD8xx, expecting '\'
  AwaitLowSurrogateU,  // after \uD8xx\, expecting 'u'
  InBareValue          // number / true / false / null
};

struct LexerStats {
  std::uint64_t tokens = 0;
  std::uint64_t bytes = 0;          // bytes consumed so far
  std::uint64_t copied_tokens = 0;  // tokens whose text came from scratch
  std::size_t scratch_high_water = 0;
  std::size_t scratch_capacity = 0;
};

// Resumable JSON tokenizer.
//
// Call advance() repeatedly with the same buffer until it returns
// NeedMoreData; the next call's buffer is then taken as the following chunk.
// Call finish() once no more chunks will come so a trailing bare value can be
// delimited and an unterminated string reported.
class Lexer {
public:
  struct Config {
    bool        emit_whitespace = false;
    bool        validate_utf8   = true;
    std::size_t scratch_reserve = 256;
    std::size_t max_token_bytes = 8 * 1024 * 1024; // 8 MiB guard on scratch; 0 = unbounded
  };

  Lexer();
  explicit Lexer(Config cfg);

  Status advance(std::string_view buffer, Token& out);

  // Marks end of input; may be followed by one last chunk.
  void finish() noexcept { eof_ = true; }

  // Back to the freshly constructed state; scratch grown past
  // Config::scratch_reserve is released.
  void reset();

  LexerState state() const noexcept { return state_; }
  const Error& error() const noexcept { return err_; }
  std::uint64_t offset() const noexcept { return base_ + cursor_; }
  LexerStats stats() const noexcept;
  const Config& config() const noexcept { return cfg_; }

private:
  bool step_base(std::string_view buf, Token& out, Status& st);
  bool step_string(std::string_view buf, Token& out, Status& st);
  bool step_escape(std::string_view buf, Token& out, Status& st);
  bool step_unicode(std::string_view buf, Token& out, Status& st);
  bool step_low_surrogate(std::string_view buf, Token& out, Status& st);
  bool step_bare_value(std::string_view buf, Token& out, Status& st);

  bool exhausted(Token& out, Status& st);
  bool finish_bare_value(std::string_view text, TextSource src, Token& out, Status& st);
  void emit(Token& out, TokenKind kind, std::string_view text, TextSource src);
  bool append_scratch(std::string_view s, Status& st);
  bool check_utf8(unsigned char c, std::uint64_t at, Status& st);
  bool fail(ErrorCode code, std::uint64_t at, const char* msg, Status& st);

  Config cfg_;
  LexerState state_{LexerState::Base};
  ScratchBuffer scratch_;
  Error err_;

  // buffer bookkeeping
  std::size_t cursor_{0};       // next unread byte in the current buffer
  std::size_t buf_size_{0};     // size of the current buffer
  std::uint64_t base_{0};       // document offset of the current buffer's byte 0
  bool next_chunk_{false};      // previous call returned NeedMoreData
  bool eof_{false};
  bool ended_{false};
  bool failed_{false};

  // current token
  std::uint64_t token_offset_{0};
  std::size_t token_position_{0};
  bool token_in_buffer_{true};  // token started inside the current buffer
  bool spilled_{false};         // bare value partially held in scratch

  // \uXXXX decoding
  std::uint32_t unicode_acc_{0};
  std::uint8_t unicode_remaining_{0};
  std::uint32_t high_surrogate_{0};
  std::uint64_t escape_offset_{0};

  // incremental UTF-8 validation of raw string bytes
  std::uint8_t utf8_need_{0};
  unsigned char utf8_lo_{0x80};
  unsigned char utf8_hi_{0xBF};

  LexerStats stats_;
};

}
