#pragma once
#include "typed_csv/byte_range.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/tokenizer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tc {

class ByteSource;
class RowView;

// Rows of one window, loading bytes from the source only as the tokenizer
// asks for them, so a reader that stops early never pulls the rest of the
// input. Loaded bytes are kept, which makes seek() back to any earlier
// position free of re-reads, until forward_only() is called.
class RowStream {
public:
  enum class Status { Row, End, Error };

  RowStream(ByteSource& src, const Dialect& d, Window window, std::size_t chunk_bytes);
  ~RowStream();
  RowStream(const RowStream&) = delete;
  RowStream& operator=(const RowStream&) = delete;

  Status next(RowView& row);

  CsvTokenizer::Position tell() const;
  void seek(CsvTokenizer::Position p);

  // Makes at least `n` bytes (or everything up to EOF) available and
  // returns them; used for dialect sampling before the first row.
  std::string_view prefetch(std::size_t n, bool& complete);

  // Rebuilds the tokenizer with a new dialect; position resets to the start.
  void set_dialect(const Dialect& d);

  // Final pass: bytes before the current row are dropped whenever a new
  // chunk loads. Positions saved earlier are no longer valid for seek().
  void forward_only();

  const ReadError& error() const;
  // Bytes pulled from the source so far, dropped ones included.
  std::uint64_t bytes_loaded() const;
  // Bytes currently held in memory.
  std::size_t resident_bytes() const;

private:
  struct Impl; Impl* p_;
};

}
