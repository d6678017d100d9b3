#pragma once
#include "typed_csv/dtype.hpp"
#include "typed_csv/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tc {

// A column addressed by position or by name.
using ColumnRef = std::variant<std::size_t, std::string>;

enum class HeaderMode {
  Infer,  // row 0 (after skips) is the header unless `names` is given or
          // every field of that row parses as a number (then it is data)
  None,   // every row is data
  Row     // `header_row` (after skips) is the header, earlier rows dropped
};

struct ByteRange {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;  // 0 = to end of input
};

struct ParseOptions {
  // Dialect
  std::optional<char> delimiter;     // ',' when unset
  bool delim_whitespace  = false;
  bool detect_delimiter  = false;
  char quote_char        = '"';
  bool quoting           = true;
  char comment_char      = '\0';     // '\0' = no comments
  bool skip_blank_lines  = true;

  // Row selection
  HeaderMode header      = HeaderMode::Infer;
  std::size_t header_row = 0;
  std::size_t skiprows   = 0;
  std::vector<std::size_t> skiprow_indices;
  std::size_t skipfooter = 0;
  std::optional<std::size_t> nrows;

  // Schema
  std::vector<std::string> names;
  std::vector<DType> dtypes;
  std::unordered_map<std::string, DType> dtype_by_name;
  std::string prefix;
  std::optional<ColumnRef> index_col; // unset: no index column
  std::vector<ColumnRef> usecols;

  // Values
  char decimal   = '.';
  char thousands = '\0';              // '\0' = no thousands separator
  std::vector<std::string> true_values;
  std::vector<std::string> false_values;
  std::vector<std::string> na_values;
  bool keep_default_na = true;
  bool na_filter       = true;
  bool dayfirst        = false;

  // Input
  std::optional<ByteRange> byte_range;
  std::size_t chunk_bytes = 512 * 1024;

  char effective_delimiter() const noexcept { return delimiter.value_or(','); }
};

// Checks option combinations before any byte is read.
// Returns false and fills `err` on the first conflict found.
bool validate_options(const ParseOptions& opt, ReadError& err);

// Loads options from a JSON document (keys named as the struct members,
// dtypes given by name). Unknown keys and ill-typed values are InvalidOption.
bool load_parse_options_json(std::string_view json, ParseOptions& out, ReadError& err);
bool load_parse_options_file(const std::string& path, ParseOptions& out, ReadError& err);

}
