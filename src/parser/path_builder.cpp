#include "stream_json/path_builder.hpp"
#include <charconv>

namespace sj {

PathBuilder::PathBuilder(std::size_t max_bytes)
  : max_bytes_(max_bytes < 1 ? 1 : max_bytes) {
  buf_.reserve(max_bytes_);
  buf_.push_back('$');
}

void PathBuilder::reset() {
  buf_.clear();
  buf_.push_back('$');
}

bool PathBuilder::is_plain_key(std::string_view key) noexcept {
  if (key.empty()) return false;
  if (key.front() >= '0' && key.front() <= '9') return false; // ".0" is not an identifier
  for (char ch : key) {
    const unsigned char c = static_cast<unsigned char>(ch);
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                 || c == '_' || c == '$' || c >= 0x80;
    if (!ok) return false;
  }
  return true;
}

bool PathBuilder::push_key(std::string_view key) {
  if (is_plain_key(key)) {
    if (buf_.size() + 1 + key.size() > max_bytes_) return false;
    buf_.push_back('.');
    buf_.append(key.data(), key.size());
    return true;
  }

  // ['...'] with ' and \ escaped
  std::size_t need = 4 + key.size();
  for (char c : key) if (c == '\'' || c == '\\') ++need;
  if (buf_.size() + need > max_bytes_) return false;

  buf_.append("['");
  for (char c : key) {
    if (c == '\'' || c == '\\') buf_.push_back('\\');
    buf_.push_back(c);
  }
  buf_.append("']");
  return true;
}

bool PathBuilder::push_index(std::uint64_t index) {
  char tmp[24];
  auto [ptr, ec] = std::to_chars(tmp, tmp + sizeof(tmp), index);
  if (ec != std::errc()) return false;
  const std::size_t digits = static_cast<std::size_t>(ptr - tmp);
  if (buf_.size() + digits + 2 > max_bytes_) return false;
  buf_.push_back('[');
  buf_.append(tmp, digits);
  buf_.push_back(']');
  return true;
}

void PathBuilder::truncate(std::size_t mark) noexcept {
  if (mark < 1) mark = 1; // never drop the root '$'
  if (mark < buf_.size()) buf_.resize(mark);
}

}
