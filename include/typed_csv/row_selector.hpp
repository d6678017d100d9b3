#pragma once
#include "typed_csv/parse_options.hpp"
#include "typed_csv/row_stream.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tc {

class RowView;
class ValueParser;

// Classifies the rows of one window into skipped, header and data rows.
// Row indices count rows left after comment and blank-line filtering.
// Only the first window (offset 0) applies skips and header handling.
// With HeaderMode::Infer and no names, a first row whose fields are all
// numbers is data, not a header.
class RowSelector {
public:
  RowSelector(RowStream& rows, const ParseOptions& opt, bool first_window, const ValueParser& values);

  // Consumes skipped rows and the header row, leaving the stream on the
  // first data row. `has_header` is false when no header row was consumed.
  bool begin(std::vector<std::string>& header, bool& has_header);

  // Next data row, or End once the window or the row cap is exhausted.
  RowStream::Status next(RowView& row);

  // Counts the remaining data rows, rewinds, and caps the data pass so the
  // last `n` rows are dropped.
  bool drop_footer(std::size_t n);

  // Back to the first data row for another pass.
  void rewind();

  std::optional<std::size_t> cap() const noexcept { return cap_; }
  const ReadError& error() const { return rows_.error(); }

private:
  RowStream::Status pull(RowView& row);

  RowStream& rows_;
  const ParseOptions& opt_;
  const ValueParser& values_;
  bool first_;
  std::size_t raw_{0};        // rows pulled from the stream (after filtering)
  std::size_t taken_{0};      // data rows handed out in this pass
  std::optional<std::size_t> cap_;

  CsvTokenizer::Position data_pos_;
  std::size_t data_raw_{0};
};

}
