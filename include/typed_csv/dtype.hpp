#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace tc {

// Column data types. Category and Str both come from text; Category stores a
// 32-bit hash instead of the text.
enum class DType : std::uint8_t {
  Int32,
  Int64,
  Float32,
  Float64,
  Bool,
  Date,      // int64 milliseconds since epoch, UTC-naive
  Category,  // int32 hash code
  Str
};

// Canonical lowercase name ("int32", "date", ...).
std::string_view dtype_name(DType t) noexcept;

// Accepts the canonical names and common aliases ("int", "long", "double",
// "datetime64[ms]", "object", ...). Case-sensitive.
std::optional<DType> parse_dtype(std::string_view name);

// Physical storage family of a dtype.
enum class Storage : std::uint8_t { I32, I64, F32, F64, U8, Text };

constexpr Storage storage_of(DType t) noexcept {
  switch (t) {
    case DType::Int32:    return Storage::I32;
    case DType::Int64:    return Storage::I64;
    case DType::Float32:  return Storage::F32;
    case DType::Float64:  return Storage::F64;
    case DType::Bool:     return Storage::U8;
    case DType::Date:     return Storage::I64;
    case DType::Category: return Storage::I32;
    case DType::Str:      return Storage::Text;
  }
  return Storage::Text;
}

}
