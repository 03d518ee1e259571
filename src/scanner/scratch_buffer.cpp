#include "stream_json/scratch_buffer.hpp"
#include <algorithm>
#include <cstring>

namespace sj {

ScratchBuffer::ScratchBuffer(std::size_t reserve_bytes, std::size_t max_bytes)
  : buf_(reserve_bytes), size_(0), max_bytes_(max_bytes), high_water_(0) {}

bool ScratchBuffer::grow_to(std::size_t need) {
  if (max_bytes_ != 0 && need > max_bytes_) return false;
  if (need > buf_.size()) {
    std::size_t grow = std::max(need, buf_.size() + buf_.size() / 2 + 16);
    if (max_bytes_ != 0) grow = std::min(grow, max_bytes_);
    buf_.resize(grow);
  }
  return true;
}

bool ScratchBuffer::append(std::string_view s) {
  if (s.empty()) return true;
  if (!grow_to(size_ + s.size())) return false;
  std::memcpy(buf_.data() + size_, s.data(), s.size());
  size_ += s.size();
  if (size_ > high_water_) high_water_ = size_;
  return true;
}

bool ScratchBuffer::push_back(char c) {
  return append(std::string_view(&c, 1));
}

bool ScratchBuffer::append_utf8(std::uint32_t cp) {
  char out[4];
  std::size_t n = 0;
  if (cp <= 0x7Fu) {
    out[n++] = static_cast<char>(cp);
  } else if (cp <= 0x7FFu) {
    out[n++] = static_cast<char>(0xC0u | (cp >> 6));
    out[n++] = static_cast<char>(0x80u | (cp & 0x3Fu));
  } else if (cp <= 0xFFFFu) {
    out[n++] = static_cast<char>(0xE0u | (cp >> 12));
    out[n++] = static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu));
    out[n++] = static_cast<char>(0x80u | (cp & 0x3Fu));
  } else {
    out[n++] = static_cast<char>(0xF0u | (cp >> 18));
    out[n++] = static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu));
    out[n++] = static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu));
    out[n++] = static_cast<char>(0x80u | (cp & 0x3Fu));
  }
  return append(std::string_view(out, n));
}

void ScratchBuffer::clear() noexcept { size_ = 0; }

void ScratchBuffer::reset_and_shrink(std::size_t keep_capacity) {
  size_ = 0;
  if (keep_capacity < buf_.size()) {
    buf_.resize(keep_capacity);
    buf_.shrink_to_fit();
  }
  if (high_water_ > buf_.size()) high_water_ = buf_.size();
}

std::string_view ScratchBuffer::view() const noexcept {
  return std::string_view(buf_.data(), size_);
}

std::size_t ScratchBuffer::capacity() const noexcept { return buf_.size(); }
std::size_t ScratchBuffer::high_water() const noexcept { return high_water_; }

}
