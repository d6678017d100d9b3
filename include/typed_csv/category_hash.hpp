#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tc {

// Seed of the category codes. Changing it changes every stored code.
constexpr std::uint32_t kCategorySeed = 33;

// MurmurHash3 x86 32-bit.
std::uint32_t murmur3_32(const void* data, std::size_t len, std::uint32_t seed) noexcept;

// Stable category code of a field's text: murmur3_32 with kCategorySeed,
// read as a signed 32-bit value.
std::int32_t category_code(std::string_view s) noexcept;

}
