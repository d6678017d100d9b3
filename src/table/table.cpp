#include "typed_csv/table.hpp"
#include <utility>

namespace tc {

Table::Table(Schema schema, std::vector<Column> columns, std::optional<IndexColumn> index)
  : schema_(std::move(schema)), columns_(std::move(columns)), index_(std::move(index)) {}

std::size_t Table::num_rows() const noexcept {
  if (!columns_.empty()) return columns_.front().size();
  return index_ ? index_->column.size() : 0;
}

const Column* Table::column(std::string_view name) const {
  auto i = schema_.find(name);
  return i ? &columns_[*i] : nullptr;
}

static bool same_index_field(const Table& a, const Table& b) {
  if (a.index().has_value() != b.index().has_value()) return false;
  return !a.index() || a.index()->field == b.index()->field;
}

bool Table::concat(const std::vector<Table>& parts, Table& out, ReadError& err) {
  if (parts.empty()) { out = Table{}; return true; }
  Table acc = parts.front();
  for (std::size_t p = 1; p < parts.size(); ++p) {
    const Table& t = parts[p];
    if (t.schema_ != acc.schema_ || !same_index_field(acc, t)) {
      err = ReadError::make(ErrorKind::ConfigurationConflict,
                            "concat: schema of part " + std::to_string(p) + " differs from part 0");
      return false;
    }
    bool ok = true;
    for (std::size_t c = 0; c < acc.columns_.size(); ++c) ok = acc.columns_[c].append(t.columns_[c]) && ok;
    if (acc.index_) ok = acc.index_->column.append(t.index_->column) && ok;
    if (!ok) {
      err = ReadError::make(ErrorKind::ConfigurationConflict,
                            "concat: column storage of part " + std::to_string(p) + " differs from part 0");
      return false;
    }
  }
  out = std::move(acc);
  return true;
}

}
