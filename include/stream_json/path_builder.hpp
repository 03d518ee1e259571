#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sj {

// Bounded JSONPath-like location: "$", "$.a", "$.a[0]", "$['a b']".
// push_* leave the path untouched and return false when `max_bytes` would be
// exceeded.
class PathBuilder {
public:
  explicit PathBuilder(std::size_t max_bytes = 2048);

  void reset();

  bool push_key(std::string_view key);
  bool push_index(std::uint64_t index);

  // Cut back to a length previously read from size().
  void truncate(std::size_t mark) noexcept;

  std::string_view view() const noexcept { return buf_; }
  std::size_t size() const noexcept { return buf_.size(); }
  std::size_t capacity() const noexcept { return max_bytes_; }

  // True when `key` can be written as ".key" instead of "['key']": an
  // identifier-like run not starting with a digit.
  static bool is_plain_key(std::string_view key) noexcept;

private:
  std::string buf_;
  std::size_t max_bytes_;
};

}
