#pragma once
#include "typed_csv/dtype.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/parse_options.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tc {

class ValueParser;

struct Field {
  std::string name;
  DType dtype = DType::Str;

  bool operator==(const Field& o) const { return name == o.name && dtype == o.dtype; }
  bool operator!=(const Field& o) const { return !(*this == o); }
};

struct Schema {
  std::vector<Field> fields;

  std::size_t size() const noexcept { return fields.size(); }
  std::optional<std::size_t> find(std::string_view name) const;

  bool operator==(const Schema& o) const { return fields == o.fields; }
  bool operator!=(const Schema& o) const { return !(*this == o); }
};

// Column names for `ncols` columns in file order:
//   explicit `names` (padded with generated names when short), else the
//   header row, else generated names (prefix + index, or the index).
// Empty header names become "Unnamed: <i>"; duplicates are then mangled.
std::vector<std::string> resolve_names(const std::vector<std::string>& header, bool has_header,
                                       std::size_t ncols, const ParseOptions& opt);

// Renames repeated names to "name.1", "name.2", ... left to right, keeping
// the first occurrence and skipping candidates that already exist.
void mangle_duplicates(std::vector<std::string>& names);

// Positions (file order, ascending) selected by `usecols`; every column when
// empty. Unknown names or out-of-range positions are InvalidOption.
bool select_columns(const std::vector<std::string>& names, const std::vector<ColumnRef>& usecols,
                    std::vector<std::size_t>& selected, ReadError& err);

// Index into `selected` of the index column, when one is configured.
bool resolve_index_col(const std::vector<std::string>& names, const std::vector<std::size_t>& selected,
                       const std::optional<ColumnRef>& index_col,
                       std::optional<std::size_t>& out, ReadError& err);

// Explicit dtypes for the selected columns (nullopt = infer). Positional
// dtypes address the selection when usecols is set and the sizes agree,
// otherwise every column; dtype_by_name overrides.
bool assign_dtypes(const std::vector<std::string>& names, const std::vector<std::size_t>& selected,
                   const ParseOptions& opt, std::vector<std::optional<DType>>& out, ReadError& err);

// Running type classification of one column's non-NA values. Candidates are
// tried in order Int64, Float64, Bool, Date; anything else is Str. A column
// that saw only NA values is Float64.
class TypeInferrer {
public:
  void observe(const ValueParser& p, std::string_view field);
  DType result() const noexcept;
  std::size_t values_seen() const noexcept { return seen_; }

private:
  bool int_{true}, float_{true}, bool_{true}, date_{true};
  std::size_t seen_{0};
};

}
