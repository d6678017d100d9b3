#pragma once
#include "typed_csv/byte_source.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/parse_options.hpp"
#include "typed_csv/tokenizer.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace tc {

// Resolved window: rows whose first byte is in [start, limit) belong to it.
// `head` holds bytes already pulled from the source starting at `start`.
struct Window {
  static constexpr std::uint64_t kUnbounded = std::numeric_limits<std::uint64_t>::max();

  std::uint64_t start = 0;
  std::uint64_t limit = kUnbounded;
  bool first = true;        // window begins at offset 0 (owns the header)
  std::string head;
};

// Two-phase row-boundary recovery for a requested byte range:
//  1) start = 0 for offset 0, else the first row start at or after offset.
//     Row starts are found by scanning from the beginning of the input with
//     the dialect's quote and comment rules, so line ends inside quoted
//     fields or comments never split a row; CR, LF and CRLF all end rows.
//  2) limit = offset + length, clamped to the input size; length 0 = to end.
// A range past the end of input yields an empty window (start == limit).
bool resolve_window(ByteSource& src, const ByteRange& range, const Dialect& d,
                    std::size_t chunk_bytes, Window& out, ReadError& err);

// Ascending, non-overlapping ranges of `segment` bytes covering `size` bytes.
std::vector<ByteRange> split_ranges(std::uint64_t size, std::uint64_t segment);

}
