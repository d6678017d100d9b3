#include "typed_csv/arena.hpp"
#include <algorithm>

namespace tc {

Arena::Arena(std::size_t block_bytes) : block_bytes_(std::max<std::size_t>(block_bytes, 64)) {}

char* Arena::alloc(std::size_t n) {
  if (blocks_.empty() || head_ + n > blocks_.back().size) {
    std::size_t sz = std::max(n, block_bytes_);
    blocks_.push_back(Block{std::unique_ptr<char[]>(new char[sz]), sz});
    head_ = 0;
  }
  char* p = blocks_.back().data.get() + head_;
  head_ += n;
  return p;
}

std::string_view Arena::unescape_quotes(std::string_view s, char quote) {
  if (s.empty()) return {};
  char* p = alloc(s.size());
  std::size_t n = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    p[n++] = s[i];
    if (s[i] == quote && i + 1 < s.size() && s[i + 1] == quote) ++i;
  }
  return std::string_view(p, n);
}

void Arena::reset() noexcept {
  if (blocks_.size() > 1) blocks_.resize(1);
  head_ = 0;
}

}
