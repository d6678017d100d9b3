#include "typed_csv/category_hash.hpp"
#include <cstring>

namespace tc {

static inline std::uint32_t rotl32(std::uint32_t x, int r) { return (x << r) | (x >> (32 - r)); }

static inline std::uint32_t fmix32(std::uint32_t h) {
  h ^= h >> 16;
  h *= 0x85ebca6bu;
  h ^= h >> 13;
  h *= 0xc2b2ae35u;
  h ^= h >> 16;
  return h;
}

std::uint32_t murmur3_32(const void* data, std::size_t len, std::uint32_t seed) noexcept {
  const auto* bytes = static_cast<const unsigned char*>(data);
  const std::size_t nblocks = len / 4;
  constexpr std::uint32_t c1 = 0xcc9e2d51u;
  constexpr std::uint32_t c2 = 0x1b873593u;
  std::uint32_t h1 = seed;

  for (std::size_t i = 0; i < nblocks; ++i) {
    std::uint32_t k1;
    std::memcpy(&k1, bytes + i * 4, 4);   // little-endian hosts
    k1 *= c1;
    k1 = rotl32(k1, 15);
    k1 *= c2;
    h1 ^= k1;
    h1 = rotl32(h1, 13);
    h1 = h1 * 5 + 0xe6546b64u;
  }

  const unsigned char* tail = bytes + nblocks * 4;
  std::uint32_t k1 = 0;
  switch (len & 3) {
    case 3: k1 ^= static_cast<std::uint32_t>(tail[2]) << 16; [[fallthrough]];
    case 2: k1 ^= static_cast<std::uint32_t>(tail[1]) << 8;  [[fallthrough]];
    case 1:
      k1 ^= tail[0];
      k1 *= c1;
      k1 = rotl32(k1, 15);
      k1 *= c2;
      h1 ^= k1;
  }

  h1 ^= static_cast<std::uint32_t>(len);
  return fmix32(h1);
}

std::int32_t category_code(std::string_view s) noexcept {
  return static_cast<std::int32_t>(murmur3_32(s.data(), s.size(), kCategorySeed));
}

}
