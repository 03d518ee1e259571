#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "stream_json/event.hpp"
#include "stream_json/lexer.hpp"
#include "stream_json/status.hpp"

namespace sj {

// Pull parser over a chunked JSON document: grammar, nesting stack and path.
class EventParser {
public:
  struct Config {
    std::size_t   max_depth      = 512;   // open objects/arrays
    std::size_t   max_path_bytes = 2048;
    bool          check_numbers  = true;  // run number literals through is_json_number
    Lexer::Config lexer{};
  };

  using EventCallback = std::function<void(const Event&)>;

  EventParser();
  explicit EventParser(Config cfg);
  ~EventParser();

  EventParser(const EventParser&) = delete;
  EventParser& operator=(const EventParser&) = delete;

  // Same buffer protocol as Lexer::advance. Once the root value is complete
  // and the lexer rests between tokens, EndOfDocument is returned for every
  // further call; feed()/finish(cb) keep checking later chunks for trailing
  // content.
  Status next(std::string_view buffer, Event& out);

  // No more chunks after the current/next one.
  void finish() noexcept;

  // Callback drivers: consume one chunk / flush the end of input.
  // Return false on error (see error()).
  bool feed(std::string_view chunk, const EventCallback& on_event);
  bool finish(const EventCallback& on_event);

  void reset();

  bool done() const noexcept;                // root value complete
  std::size_t depth() const noexcept;        // open containers
  std::string_view path() const noexcept;
  const Error& error() const noexcept;
  std::string error_message() const;
  const Lexer& lexer() const noexcept;
  const Config& config() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
