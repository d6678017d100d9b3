#pragma once
#include "typed_csv/byte_source.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/metrics.hpp"
#include "typed_csv/parse_options.hpp"
#include "typed_csv/table.hpp"
#include "typed_csv/tokenizer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tc {

// Reads one window (the whole input unless options.byte_range is set) into
// a Table. A reader may be reused; each read starts from a clean state.
class CsvReader {
public:
  explicit CsvReader(ParseOptions opt = {});
  ~CsvReader();
  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;

  bool read(ByteSource& src, Table& out);
  bool read_file(const std::string& path, Table& out);
  bool read_buffer(std::string_view data, Table& out);

  const ParseOptions& options() const;

  // State of the last read.
  const ReadError& error() const;
  const ReadMetrics& metrics() const;
  // Every column name in file order, before usecols/index_col.
  const std::vector<std::string>& column_names() const;
  // Dialect actually used (after delimiter detection).
  const Dialect& dialect() const;

private:
  struct Impl; Impl* p_;
};

// Opens a fresh source over the same input; called once per window.
using SourceOpener = std::function<std::unique_ptr<ByteSource>(ReadError&)>;

// Splits an input of known size into windows of `segment_bytes`, reads them
// on up to `threads` workers and concatenates the results in offset order.
// Window 0 fixes the dialect, names and dtypes used by the others. Options
// that need the whole input in one pass (byte_range, nrows, skipfooter) are
// a ConfigurationConflict.
bool read_partitioned(const SourceOpener& open, const ParseOptions& opt,
                      std::uint64_t segment_bytes, unsigned threads,
                      Table& out, ReadError& err, ReadMetrics* metrics = nullptr);

}
