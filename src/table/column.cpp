#include "typed_csv/column.hpp"
#include "typed_csv/date_parse.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <type_traits>

namespace tc {

static Column::Data make_storage(DType t) {
  switch (storage_of(t)) {
    case Storage::I32:  return std::vector<std::int32_t>{};
    case Storage::I64:  return std::vector<std::int64_t>{};
    case Storage::F32:  return std::vector<float>{};
    case Storage::F64:  return std::vector<double>{};
    case Storage::U8:   return std::vector<std::uint8_t>{};
    case Storage::Text: return std::vector<std::string>{};
  }
  return std::vector<std::string>{};
}

Column::Column(DType t) : dtype_(t), data_(make_storage(t)) {}

std::size_t Column::null_count() const noexcept {
  return static_cast<std::size_t>(std::count(valid_.begin(), valid_.end(), std::uint8_t{0}));
}

void Column::reserve(std::size_t n) {
  valid_.reserve(n);
  std::visit([n](auto& v) { v.reserve(n); }, data_);
}

void Column::push_null() {
  std::visit([](auto& v) { v.emplace_back(); }, data_);
  valid_.push_back(0);
}

void Column::push_i32(std::int32_t v) { std::get<std::vector<std::int32_t>>(data_).push_back(v); valid_.push_back(1); }
void Column::push_i64(std::int64_t v) { std::get<std::vector<std::int64_t>>(data_).push_back(v); valid_.push_back(1); }
void Column::push_f32(float v)        { std::get<std::vector<float>>(data_).push_back(v); valid_.push_back(1); }
void Column::push_f64(double v)       { std::get<std::vector<double>>(data_).push_back(v); valid_.push_back(1); }
void Column::push_bool(bool v)        { std::get<std::vector<std::uint8_t>>(data_).push_back(v ? 1 : 0); valid_.push_back(1); }
void Column::push_text(std::string v) { std::get<std::vector<std::string>>(data_).push_back(std::move(v)); valid_.push_back(1); }

bool Column::append(const Column& other) {
  if (other.dtype_ != dtype_) return false;
  std::visit([&](auto& dst) {
    using V = std::decay_t<decltype(dst)>;
    const auto& src = std::get<V>(other.data_);
    dst.insert(dst.end(), src.begin(), src.end());
  }, data_);
  valid_.insert(valid_.end(), other.valid_.begin(), other.valid_.end());
  return true;
}

std::string Column::to_text(std::size_t i) const {
  if (!valid(i)) return "<NA>";
  char buf[64];
  switch (dtype_) {
    case DType::Int32:
    case DType::Category:
      return std::to_string(values<std::int32_t>()[i]);
    case DType::Int64:
      return std::to_string(values<std::int64_t>()[i]);
    case DType::Float32:
      std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(values<float>()[i]));
      return buf;
    case DType::Float64:
      std::snprintf(buf, sizeof(buf), "%.17g", values<double>()[i]);
      return buf;
    case DType::Bool:
      return values<std::uint8_t>()[i] ? "True" : "False";
    case DType::Date:
      return format_timestamp_ms(values<std::int64_t>()[i]);
    case DType::Str:
      return values<std::string>()[i];
  }
  return {};
}

}
