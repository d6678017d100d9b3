#include "typed_csv/byte_range.hpp"
#include <algorithm>

namespace tc {

namespace {

// Replays the tokenizer's row-splitting rules (quote parity, comments to end
// of line, CR / LF / CRLF terminators) over raw bytes, one byte at a time.
class RowStartScanner {
public:
  explicit RowStartScanner(const Dialect& d) : d_(d) {}

  // Feeds the byte at absolute position `p`. Returns the position of a row
  // start discovered by this byte, or kNone.
  std::uint64_t feed(char c, std::uint64_t p) {
    std::uint64_t found = kNone;
    if (pending_cr_) {
      pending_cr_ = false;
      if (c == '\n') return p + 1;
      found = p;
    }
    switch (state_) {
      case State::Quoted:
        if (c == d_.quote) state_ = State::Field;
        break;
      case State::Comment:
        if (c == '\n') { state_ = State::Field; found = p + 1; }
        else if (c == '\r') { state_ = State::Field; pending_cr_ = true; }
        break;
      case State::Field:
        if (d_.quoting && c == d_.quote) state_ = State::Quoted;
        else if (d_.comment && c == d_.comment) state_ = State::Comment;
        else if (c == '\n') found = p + 1;
        else if (c == '\r') pending_cr_ = true;
        break;
    }
    return found;
  }

  static constexpr std::uint64_t kNone = static_cast<std::uint64_t>(-1);

private:
  enum class State { Field, Quoted, Comment };
  const Dialect& d_;
  State state_{State::Field};
  bool pending_cr_{false};
};

}

bool resolve_window(ByteSource& src, const ByteRange& range, const Dialect& d,
                    std::size_t chunk_bytes, Window& out, ReadError& err) {
  out = Window{};
  const auto size = src.size();

  if (range.length == 0) {
    out.limit = size ? *size : Window::kUnbounded;
  } else {
    const std::uint64_t room = Window::kUnbounded - range.offset;
    out.limit = range.offset + std::min(range.length, room);
    if (size) out.limit = std::min(out.limit, *size);
  }

  if (range.offset == 0) {
    out.start = 0;
    out.first = true;
    return true;
  }
  out.first = false;

  if (size && range.offset >= *size) {
    out.start = out.limit = *size;
    return true;
  }

  // Phase 1: first row start at or after `offset`, scanning from byte 0.
  RowStartScanner scan(d);
  std::uint64_t pos = 0;
  std::string chunk;
  for (;;) {
    chunk.clear();
    if (!src.read(pos, std::max<std::size_t>(chunk_bytes, 1), chunk)) {
      err = ReadError::make(ErrorKind::IoError, src.last_error());
      return false;
    }
    if (chunk.empty()) {                 // no row starts inside the range
      out.start = pos;
      out.limit = std::min(out.limit, pos);
      return true;
    }
    for (std::size_t i = 0; i < chunk.size(); ++i) {
      const std::uint64_t s = scan.feed(chunk[i], pos + i);
      if (s == RowStartScanner::kNone || s < range.offset) continue;
      out.start = s;
      out.head = chunk.substr(static_cast<std::size_t>(s - pos));
      // Phase 2 is the tokenizer's row limit: rows starting before `limit`
      // are read to completion, later ones belong to the next window.
      if (out.start > out.limit) out.limit = out.start;
      return true;
    }
    pos += chunk.size();
  }
}

std::vector<ByteRange> split_ranges(std::uint64_t size, std::uint64_t segment) {
  std::vector<ByteRange> out;
  if (segment == 0) segment = size ? size : 1;
  for (std::uint64_t off = 0; off < size; off += segment)
    out.push_back(ByteRange{off, std::min(segment, size - off)});
  if (out.empty()) out.push_back(ByteRange{0, 0});
  return out;
}

}
