#pragma once
#include "typed_csv/dtype.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tc {

// Owned column storage: one physical vector for the dtype's storage family
// plus a validity byte per row (1 = present, 0 = NA). NA slots hold a zero
// value (or an empty string) so every vector has the same length.
class Column {
public:
  using Data = std::variant<std::vector<std::int32_t>,
                            std::vector<std::int64_t>,
                            std::vector<float>,
                            std::vector<double>,
                            std::vector<std::uint8_t>,
                            std::vector<std::string>>;

  explicit Column(DType t = DType::Str);

  DType dtype() const noexcept { return dtype_; }
  std::size_t size() const noexcept { return valid_.size(); }
  bool valid(std::size_t i) const { return valid_[i] != 0; }
  std::size_t null_count() const noexcept;

  // Typed access; T must match storage_of(dtype()).
  template <typename T>
  const std::vector<T>& values() const { return std::get<std::vector<T>>(data_); }
  const std::vector<std::uint8_t>& validity() const noexcept { return valid_; }

  void reserve(std::size_t n);
  void push_null();
  void push_i32(std::int32_t v);
  void push_i64(std::int64_t v);
  void push_f32(float v);
  void push_f64(double v);
  void push_bool(bool v);
  void push_text(std::string v);

  // Appends every row of `other`; dtypes must match.
  bool append(const Column& other);

  // Display form of one value ("<NA>" for missing; dates as ISO text).
  std::string to_text(std::size_t i) const;

  bool operator==(const Column& o) const { return dtype_ == o.dtype_ && valid_ == o.valid_ && data_ == o.data_; }
  bool operator!=(const Column& o) const { return !(*this == o); }

private:
  DType dtype_;
  Data data_;
  std::vector<std::uint8_t> valid_;
};

}
