#include "typed_csv/row_stream.hpp"
#include "typed_csv/arena.hpp"
#include "typed_csv/byte_source.hpp"
#include "typed_csv/row_view.hpp"

#include <algorithm>
#include <memory>

namespace tc {

struct RowStream::Impl {
  ByteSource& src;
  Window win;
  std::size_t chunk_bytes;
  std::string buf;
  std::uint64_t base;          // source offset of buf[0]
  std::uint64_t dropped{0};
  bool eof{false};
  bool forward{false};
  Arena arena;
  std::unique_ptr<CsvTokenizer> tok;
  ReadError err;

  Impl(ByteSource& s, const Dialect& d, Window w, std::size_t chunk)
    : src(s), win(std::move(w)), chunk_bytes(chunk), base(win.start), arena(16 * 1024) {
    buf.swap(win.head);
    const auto size = src.size();
    if (size && base + buf.size() >= *size) eof = true;
    make_tokenizer(d);
  }

  // Row limit relative to buf[0].
  std::size_t row_limit() const {
    if (win.limit <= base) return 0;
    return static_cast<std::size_t>(std::min<std::uint64_t>(win.limit - base,
                                                            static_cast<std::uint64_t>(-1) >> 1));
  }

  void make_tokenizer(const Dialect& d) {
    tok = std::make_unique<CsvTokenizer>(d, arena);
    tok->set_row_limit(row_limit());
    tok->set_input(buf, eof);
  }

  // Drops everything before the row the tokenizer is positioned on.
  void compact() {
    const CsvTokenizer::Position at = tok->tell();
    if (at.offset == 0) return;
    const std::size_t n = std::min(at.offset, buf.size());
    buf.erase(0, n);
    base += n;
    dropped += n;
    tok->seek(CsvTokenizer::Position{at.offset - n, at.line});
    tok->set_row_limit(row_limit());
    tok->set_input(buf, eof);
  }

  // Appends the next chunk; returns false on I/O error.
  bool load_more() {
    if (eof) return true;
    if (forward) compact();
    const std::size_t before = buf.size();
    if (!src.read(base + before, chunk_bytes, buf)) {
      err = ReadError::make(ErrorKind::IoError, src.last_error());
      return false;
    }
    const auto size = src.size();
    if (buf.size() == before || (size && base + buf.size() >= *size)) eof = true;
    tok->set_input(buf, eof);
    return true;
  }
};

RowStream::RowStream(ByteSource& src, const Dialect& d, Window window, std::size_t chunk_bytes)
  : p_(new Impl(src, d, std::move(window), std::max<std::size_t>(chunk_bytes, 1))) {}

RowStream::~RowStream() { delete p_; }

RowStream::Status RowStream::next(RowView& row) {
  for (;;) {
    switch (p_->tok->next(row)) {
      case CsvTokenizer::Status::Row:
        return Status::Row;
      case CsvTokenizer::Status::End:
        return Status::End;
      case CsvTokenizer::Status::Error:
        p_->err = ReadError::make(ErrorKind::MalformedQuoting, p_->tok->error());
        p_->err.line = p_->tok->error_line();
        return Status::Error;
      case CsvTokenizer::Status::NeedMore:
        if (!p_->load_more()) return Status::Error;
        break;
    }
  }
}

CsvTokenizer::Position RowStream::tell() const { return p_->tok->tell(); }
void RowStream::seek(CsvTokenizer::Position p) { p_->tok->seek(p); }

std::string_view RowStream::prefetch(std::size_t n, bool& complete) {
  while (p_->buf.size() < n && !p_->eof) {
    if (!p_->load_more()) break;
  }
  complete = p_->eof;
  return std::string_view(p_->buf).substr(0, std::min(n, p_->buf.size()));
}

void RowStream::set_dialect(const Dialect& d) { p_->make_tokenizer(d); }

void RowStream::forward_only() { p_->forward = true; }

const ReadError& RowStream::error() const { return p_->err; }
std::uint64_t RowStream::bytes_loaded() const { return p_->dropped + p_->buf.size(); }
std::size_t RowStream::resident_bytes() const { return p_->buf.size(); }

}
