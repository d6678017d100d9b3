#include "typed_csv/column_builder.hpp"
#include "typed_csv/category_hash.hpp"
#include "typed_csv/value_parser.hpp"

#include <limits>
#include <string>

namespace tc {

// NA for a non-text column: an NA token, or empty text even with na_filter off.
static bool missing(const ValueParser& p, std::string_view s) {
  return s.empty() || p.is_na(s);
}

static bool append_i32(const ValueParser& p, std::string_view s, Column& c) {
  if (missing(p, s)) { c.push_null(); return true; }
  auto v = p.parse_int(s);
  if (!v || *v < std::numeric_limits<std::int32_t>::min() || *v > std::numeric_limits<std::int32_t>::max())
    return false;
  c.push_i32(static_cast<std::int32_t>(*v));
  return true;
}

static bool append_i64(const ValueParser& p, std::string_view s, Column& c) {
  if (missing(p, s)) { c.push_null(); return true; }
  auto v = p.parse_int(s);
  if (!v) return false;
  c.push_i64(*v);
  return true;
}

static bool append_f32(const ValueParser& p, std::string_view s, Column& c) {
  if (missing(p, s)) { c.push_null(); return true; }
  auto v = p.parse_float(s);
  if (!v) return false;
  c.push_f32(static_cast<float>(*v));
  return true;
}

static bool append_f64(const ValueParser& p, std::string_view s, Column& c) {
  if (missing(p, s)) { c.push_null(); return true; }
  auto v = p.parse_float(s);
  if (!v) return false;
  c.push_f64(*v);
  return true;
}

static bool append_bool(const ValueParser& p, std::string_view s, Column& c) {
  if (missing(p, s)) { c.push_null(); return true; }
  auto v = p.parse_bool(s);
  if (!v) return false;
  c.push_bool(*v);
  return true;
}

static bool append_date(const ValueParser& p, std::string_view s, Column& c) {
  if (missing(p, s)) { c.push_null(); return true; }
  auto v = p.parse_date(s);
  if (!v) return false;
  c.push_i64(*v);
  return true;
}

static bool append_category(const ValueParser& p, std::string_view s, Column& c) {
  if (p.is_na(s)) { c.push_null(); return true; }
  c.push_i32(category_code(s));
  return true;
}

static bool append_str(const ValueParser& p, std::string_view s, Column& c) {
  if (p.is_na(s)) { c.push_null(); return true; }
  c.push_text(std::string(s));
  return true;
}

ColumnBuilder::AppendFn append_fn_for(DType t) noexcept {
  switch (t) {
    case DType::Int32:    return &append_i32;
    case DType::Int64:    return &append_i64;
    case DType::Float32:  return &append_f32;
    case DType::Float64:  return &append_f64;
    case DType::Bool:     return &append_bool;
    case DType::Date:     return &append_date;
    case DType::Category: return &append_category;
    case DType::Str:      return &append_str;
  }
  return &append_str;
}

ColumnBuilder::ColumnBuilder(DType t, const ValueParser& parser)
  : parser_(&parser), fn_(append_fn_for(t)), col_(t) {}

}
