#pragma once
#include "typed_csv/column.hpp"
#include "typed_csv/dtype.hpp"

#include <string_view>
#include <utility>

namespace tc {

class ValueParser;

// Appends fields of one column. The per-dtype conversion is picked once at
// construction; append() is a single indirect call per field.
class ColumnBuilder {
public:
  using AppendFn = bool (*)(const ValueParser&, std::string_view, Column&);

  ColumnBuilder(DType t, const ValueParser& parser);

  // False when a non-NA field does not convert to the column dtype; the
  // column is left unchanged in that case.
  bool append(std::string_view field) { return fn_(*parser_, field, col_); }
  // Missing trailing field of a short row.
  void append_missing() { col_.push_null(); }

  DType dtype() const noexcept { return col_.dtype(); }
  std::size_t size() const noexcept { return col_.size(); }
  void reserve(std::size_t n) { col_.reserve(n); }

  Column finish() { return std::move(col_); }

private:
  const ValueParser* parser_;
  AppendFn fn_;
  Column col_;
};

ColumnBuilder::AppendFn append_fn_for(DType t) noexcept;

}
