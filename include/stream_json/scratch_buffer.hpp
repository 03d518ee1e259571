#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace sj {

// Owned storage for token text that cannot be borrowed from the caller's
// buffer (escaped strings, tokens split across chunks).
// Appends fail once the content would exceed `max_bytes` (0 = unbounded).
class ScratchBuffer {
public:
  explicit ScratchBuffer(std::size_t reserve_bytes = 0, std::size_t max_bytes = 0);

  bool append(std::string_view s);
  bool push_back(char c);

  // Encode a code point (<= U+10FFFF, not a surrogate) as UTF-8.
  bool append_utf8(std::uint32_t cp);

  // Drop content; capacity stays (reuse buffer).
  void clear() noexcept;

  // Clear and optionally shrink capacity to `keep_capacity` bytes.
  void reset_and_shrink(std::size_t keep_capacity = 0);

  std::string_view view() const noexcept;
  bool empty() const noexcept { return size_ == 0; }
  std::size_t size() const noexcept { return size_; }
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept;

private:
  bool grow_to(std::size_t need);

  std::vector<char> buf_;
  std::size_t size_{0};
  std::size_t max_bytes_{0};
  std::size_t high_water_{0};
};

}
