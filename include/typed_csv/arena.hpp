#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace tc {

// Bump allocator for per-row scratch text (unescaped quoted fields).
// Storage is a list of blocks, so views handed out stay valid until reset().
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 64 * 1024);

  // Copies `s` collapsing every doubled `quote` into one.
  std::string_view unescape_quotes(std::string_view s, char quote);

  // Drops all allocations; keeps the first block for reuse.
  void reset() noexcept;

private:
  char* alloc(std::size_t n);

  struct Block { std::unique_ptr<char[]> data; std::size_t size; };
  std::vector<Block> blocks_;
  std::size_t block_bytes_;
  std::size_t head_{0};   // offset into blocks_.back()
};

}
