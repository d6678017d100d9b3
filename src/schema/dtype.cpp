#include "typed_csv/dtype.hpp"
#include <string_view>

namespace tc {

std::string_view dtype_name(DType t) noexcept {
  switch (t) {
    case DType::Int32:    return "int32";
    case DType::Int64:    return "int64";
    case DType::Float32:  return "float32";
    case DType::Float64:  return "float64";
    case DType::Bool:     return "bool";
    case DType::Date:     return "date";
    case DType::Category: return "category";
    case DType::Str:      return "str";
  }
  return "str";
}

namespace {

struct Alias { std::string_view name; DType type; };

constexpr Alias kAliases[] = {
  {"int32", DType::Int32},   {"int", DType::Int32},
  {"short", DType::Int32},   {"int16", DType::Int32},
  {"int64", DType::Int64},   {"long", DType::Int64},
  {"float32", DType::Float32}, {"float", DType::Float32},
  {"float64", DType::Float64}, {"double", DType::Float64},
  {"bool", DType::Bool},     {"boolean", DType::Bool},
  {"date", DType::Date},     {"datetime", DType::Date},
  {"datetime64", DType::Date}, {"datetime64[ms]", DType::Date},
  {"timestamp", DType::Date},
  {"category", DType::Category},
  {"str", DType::Str},       {"string", DType::Str},
  {"object", DType::Str},
};

}

std::optional<DType> parse_dtype(std::string_view name) {
  for (const auto& a : kAliases) if (a.name == name) return a.type;
  return std::nullopt;
}

}
