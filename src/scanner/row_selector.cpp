#include "typed_csv/row_selector.hpp"
#include "typed_csv/row_view.hpp"
#include "typed_csv/value_parser.hpp"

#include <algorithm>

namespace tc {

RowSelector::RowSelector(RowStream& rows, const ParseOptions& opt, bool first_window, const ValueParser& values)
  : rows_(rows), opt_(opt), values_(values), first_(first_window), cap_(opt.nrows) {}

static bool all_numeric(const RowView& row, const ValueParser& vp) {
  for (auto f : row.fields())
    if (f.empty() || !vp.parse_number(f)) return false;
  return true;
}

// Next row that survives skiprows / skiprow_indices.
RowStream::Status RowSelector::pull(RowView& row) {
  for (;;) {
    auto st = rows_.next(row);
    if (st != RowStream::Status::Row) return st;
    const std::size_t idx = raw_++;
    if (!first_) return st;
    if (idx < opt_.skiprows) continue;
    const auto& skip = opt_.skiprow_indices;
    if (std::find(skip.begin(), skip.end(), idx) != skip.end()) continue;
    return st;
  }
}

bool RowSelector::begin(std::vector<std::string>& header, bool& has_header) {
  header.clear();
  has_header = false;
  if (first_) {
    std::size_t header_at = 0;
    bool want_header = false;
    switch (opt_.header) {
      case HeaderMode::Infer: want_header = opt_.names.empty(); break;
      case HeaderMode::Row:   want_header = true; header_at = opt_.header_row; break;
      case HeaderMode::None:  break;
    }
    if (want_header) {
      RowView row;
      for (std::size_t k = 0; k <= header_at; ++k) {
        const auto pos = rows_.tell();
        const std::size_t raw = raw_;
        auto st = pull(row);
        if (st == RowStream::Status::Error) return false;
        if (st == RowStream::Status::End) break;
        if (k == header_at && opt_.header == HeaderMode::Infer && all_numeric(row, values_)) {
          rows_.seek(pos);
          raw_ = raw;
          break;
        }
        if (k == header_at) {
          has_header = true;
          header.reserve(row.size());
          for (auto f : row.fields()) header.emplace_back(f);
        }
      }
    }
  }
  data_pos_ = rows_.tell();
  data_raw_ = raw_;
  taken_ = 0;
  return true;
}

RowStream::Status RowSelector::next(RowView& row) {
  if (cap_ && taken_ >= *cap_) return RowStream::Status::End;
  auto st = pull(row);
  if (st == RowStream::Status::Row) ++taken_;
  return st;
}

bool RowSelector::drop_footer(std::size_t n) {
  RowView row;
  std::size_t count = 0;
  RowStream::Status st;
  while ((st = pull(row)) == RowStream::Status::Row) ++count;
  if (st == RowStream::Status::Error) return false;
  cap_ = count > n ? count - n : 0;
  rewind();
  return true;
}

void RowSelector::rewind() {
  rows_.seek(data_pos_);
  raw_ = data_raw_;
  taken_ = 0;
}

}
