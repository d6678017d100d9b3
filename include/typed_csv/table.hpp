#pragma once
#include "typed_csv/column.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/schema.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tc {

// Row-label column split out of the data columns by index_col.
struct IndexColumn {
  Field field;
  Column column;

  bool operator==(const IndexColumn& o) const { return field == o.field && column == o.column; }
};

// Result of one read: a schema and one equal-length column per entry, plus
// an optional index column of the same length.
class Table {
public:
  Table() = default;
  Table(Schema schema, std::vector<Column> columns, std::optional<IndexColumn> index = std::nullopt);

  const Schema& schema() const noexcept { return schema_; }
  std::size_t num_columns() const noexcept { return columns_.size(); }
  std::size_t num_rows() const noexcept;

  const Column& column(std::size_t i) const { return columns_[i]; }
  // nullptr when no data column has that name.
  const Column* column(std::string_view name) const;
  const std::vector<Column>& columns() const noexcept { return columns_; }

  const std::optional<IndexColumn>& index() const noexcept { return index_; }

  // Appends `parts` in order. Schemas (and index fields) must be identical;
  // a mismatch is a ConfigurationConflict naming the first offending part.
  static bool concat(const std::vector<Table>& parts, Table& out, ReadError& err);

  bool operator==(const Table& o) const {
    return schema_ == o.schema_ && columns_ == o.columns_ && index_ == o.index_;
  }
  bool operator!=(const Table& o) const { return !(*this == o); }

private:
  Schema schema_;
  std::vector<Column> columns_;
  std::optional<IndexColumn> index_;
};

}
