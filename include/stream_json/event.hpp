#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sj {

enum class EventKind {
  BeginObject,
  EndObject,
  BeginArray,
  EndArray,
  ObjectKey,
  StringValue,
  NumberValue,
  BoolValue,
  NullValue
};

// Lightweight view over one parse event.
// `text` and `path` point into the parser / lexer / caller buffer and are
// valid until the next call on the parser.
struct Event {
  EventKind kind = EventKind::NullValue;
  std::string_view text;   // key, string or raw number; "true"/"false"/"null" for literals
  std::string_view path;   // "$", "$.a", "$.a[0]"
  std::uint64_t offset = 0;
  std::size_t depth = 0;   // open containers, counting the one just begun / not yet ended

  bool is_scalar() const noexcept {
    return kind == EventKind::StringValue || kind == EventKind::NumberValue
        || kind == EventKind::BoolValue || kind == EventKind::NullValue;
  }
  bool as_bool() const noexcept { return kind == EventKind::BoolValue && text == "true"; }
};

std::string_view to_string(EventKind k) noexcept;

}
