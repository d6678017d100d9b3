#include "typed_csv/tokenizer.hpp"
#include "typed_csv/arena.hpp"
#include "typed_csv/parse_options.hpp"
#include "typed_csv/row_view.hpp"

#include <string_view>
#include <vector>

namespace tc {

Dialect dialect_from(const ParseOptions& opt) {
  Dialect d;
  d.delimiter = opt.effective_delimiter();
  d.delim_whitespace = opt.delim_whitespace;
  d.quote = opt.quote_char;
  d.quoting = opt.quoting;
  d.comment = opt.comment_char;
  d.skip_blank_lines = opt.skip_blank_lines;
  return d;
}

static inline bool is_ws(char c) { return c == ' ' || c == '\t'; }
static inline bool is_eol(char c) { return c == '\n' || c == '\r'; }

static std::string_view trim(std::string_view s) {
  while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
  return s;
}

struct CsvTokenizer::Impl {
  Dialect d;
  Arena& arena;
  std::string_view buf;
  bool eof{false};
  std::size_t limit{std::numeric_limits<std::size_t>::max()};
  Position pos;

  enum class Step { Done, NeedMore, Error };

  // Position just past the terminator at `p` (which is '\n' or '\r').
  // Returns false when a lone '\r' sits at the buffer end and more may come.
  bool skip_terminator(std::size_t p, std::size_t& next) const {
    if (buf[p] == '\r') {
      if (p + 1 >= buf.size() && !eof) return false;
      next = (p + 1 < buf.size() && buf[p + 1] == '\n') ? p + 2 : p + 1;
    } else {
      next = p + 1;
    }
    return true;
  }

  // From `p`, find the end of the physical line and the position after it.
  bool skip_line(std::size_t p, std::size_t& next) const {
    while (p < buf.size() && !is_eol(buf[p])) ++p;
    if (p >= buf.size()) {
      if (!eof) return false;
      next = buf.size();
      return true;
    }
    return skip_terminator(p, next);
  }

  void emit_field(RowView& row, std::size_t b, std::size_t e, bool any_quote, bool escaped) {
    std::string_view f = trim(buf.substr(b, e - b));
    if (d.quoting && any_quote && f.size() >= 2 && f.front() == d.quote && f.back() == d.quote) {
      std::string_view inner = f.substr(1, f.size() - 2);
      row.push(escaped ? arena.unescape_quotes(inner, d.quote) : inner, true);
      return;
    }
    row.push(f, false);
  }

  Step parse_fields(std::size_t p, RowView& row, std::size_t& next, std::size_t& extra_lines,
                    std::string& err) {
    extra_lines = 0;
    for (;;) {
      const std::size_t fstart = p;
      bool in_q = false, any_quote = false, escaped = false;
      for (;;) {
        if (p >= buf.size()) {
          if (!eof) return Step::NeedMore;
          if (in_q) {
            err = "unterminated quoted field";
            return Step::Error;
          }
          emit_field(row, fstart, p, any_quote, escaped);
          next = buf.size();
          return Step::Done;
        }
        const char c = buf[p];
        if (d.quoting && c == d.quote) {
          if (in_q) {
            if (p + 1 >= buf.size() && !eof) return Step::NeedMore;
            if (p + 1 < buf.size() && buf[p + 1] == d.quote) { escaped = true; p += 2; continue; }
            in_q = false;
          } else {
            in_q = true;
            any_quote = true;
          }
          ++p;
          continue;
        }
        if (in_q) {
          if (c == '\n') ++extra_lines;
          ++p;
          continue;
        }
        if (is_eol(c)) {
          emit_field(row, fstart, p, any_quote, escaped);
          return skip_terminator(p, next) ? Step::Done : Step::NeedMore;
        }
        if (d.comment && c == d.comment) {
          emit_field(row, fstart, p, any_quote, escaped);
          return skip_line(p, next) ? Step::Done : Step::NeedMore;
        }
        if (d.delim_whitespace && is_ws(c)) {
          std::size_t r = p;
          while (r < buf.size() && is_ws(buf[r])) ++r;
          if (r >= buf.size() && !eof) return Step::NeedMore;
          emit_field(row, fstart, p, any_quote, escaped);
          if (r >= buf.size()) { next = buf.size(); return Step::Done; }
          if (is_eol(buf[r])) return skip_terminator(r, next) ? Step::Done : Step::NeedMore;
          if (d.comment && buf[r] == d.comment) return skip_line(r, next) ? Step::Done : Step::NeedMore;
          p = r;
          break;  // next field
        }
        if (!d.delim_whitespace && c == d.delimiter) {
          emit_field(row, fstart, p, any_quote, escaped);
          ++p;
          break;  // next field
        }
        ++p;
      }
    }
  }
};

CsvTokenizer::CsvTokenizer(const Dialect& d, Arena& row_arena)
  : p_(new Impl{d, row_arena}) {}

CsvTokenizer::~CsvTokenizer() { delete p_; }

void CsvTokenizer::set_input(std::string_view buf, bool at_eof) {
  p_->buf = buf;
  p_->eof = at_eof;
}

void CsvTokenizer::set_row_limit(std::size_t limit) { p_->limit = limit; }

CsvTokenizer::Position CsvTokenizer::tell() const { return p_->pos; }
void CsvTokenizer::seek(Position p) { p_->pos = p; }
const Dialect& CsvTokenizer::dialect() const { return p_->d; }

CsvTokenizer::Status CsvTokenizer::next(RowView& row) {
  Impl& m = *p_;
  m.arena.reset();
  for (;;) {
    const std::size_t start = m.pos.offset;
    if (start >= m.limit) return Status::End;
    if (start >= m.buf.size()) return m.eof ? Status::End : Status::NeedMore;

    std::size_t q = start;
    while (q < m.buf.size() && is_ws(m.buf[q])) ++q;
    if (q >= m.buf.size() && !m.eof) return Status::NeedMore;

    std::size_t next = 0;
    const bool at_end = q >= m.buf.size();
    if (!at_end && m.d.comment && m.buf[q] == m.d.comment) {
      if (!m.skip_line(q, next)) return Status::NeedMore;
      m.pos.offset = next;
      ++m.pos.line;
      continue;
    }
    if (at_end || is_eol(m.buf[q])) {
      if (at_end) next = m.buf.size();
      else if (!m.skip_terminator(q, next)) return Status::NeedMore;
      const std::size_t line = m.pos.line;
      m.pos.offset = next;
      ++m.pos.line;
      if (m.d.skip_blank_lines) continue;
      row.reset(start, line);
      row.push(std::string_view{}, false);
      return Status::Row;
    }

    row.reset(start, m.pos.line);
    std::size_t extra_lines = 0;
    switch (m.parse_fields(m.d.delim_whitespace ? q : start, row, next, extra_lines, err_)) {
      case Impl::Step::NeedMore:
        return Status::NeedMore;
      case Impl::Step::Error:
        err_line_ = m.pos.line;
        err_ += " starting on line " + std::to_string(m.pos.line);
        return Status::Error;
      case Impl::Step::Done:
        break;
    }
    m.pos.offset = next;
    m.pos.line += 1 + extra_lines;
    return Status::Row;
  }
}

bool detect_dialect(std::string_view sample, bool sample_is_complete,
                    const Dialect& base, Dialect& out) {
  constexpr std::size_t kMaxRows = 100;
  if (!sample_is_complete) {
    auto nl = sample.find_last_of("\r\n");
    sample = (nl == std::string_view::npos) ? std::string_view{} : sample.substr(0, nl + 1);
  }

  struct Candidate { char delim; bool whitespace; };
  const Candidate candidates[] = {{',', false}, {';', false}, {'\t', false}, {'|', false}, {' ', true}};

  out = base;
  out.delimiter = ',';
  out.delim_whitespace = false;
  std::size_t best_fields = 1;
  bool found = false;

  for (const auto& c : candidates) {
    Dialect d = base;
    d.delimiter = c.delim;
    d.delim_whitespace = c.whitespace;
    d.skip_blank_lines = true;

    Arena arena(4 * 1024);
    CsvTokenizer tok(d, arena);
    tok.set_input(sample, true);
    RowView row;
    std::size_t rows = 0, fields = 0;
    bool consistent = true;
    while (rows < kMaxRows && tok.next(row) == CsvTokenizer::Status::Row) {
      if (rows == 0) fields = row.size();
      else if (row.size() != fields) { consistent = false; break; }
      ++rows;
    }
    if (!consistent || rows == 0 || fields <= best_fields) continue;
    best_fields = fields;
    out = d;
    out.skip_blank_lines = base.skip_blank_lines;
    found = true;
  }
  return found;
}

}
