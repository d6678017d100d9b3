#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace tc {

class Arena;
class RowView;
struct ParseOptions;

struct Dialect {
  char delimiter        = ',';
  bool delim_whitespace = false;  // runs of space/tab separate fields
  char quote            = '"';
  bool quoting          = true;
  char comment          = '\0';   // '\0' = none
  bool skip_blank_lines = true;
};

Dialect dialect_from(const ParseOptions& opt);

// Pull-based row splitter over a growing buffer. The caller owns the buffer,
// may append to it between calls (re-pointing with set_input) and may rewind
// with seek(); the tokenizer keeps only a position, never buffer contents.
class CsvTokenizer {
public:
  enum class Status {
    Row,       // `row` holds the next row
    NeedMore,  // buffer ends inside a row and more input exists; nothing consumed
    End,       // input exhausted, or next row starts at/after the row limit
    Error      // unterminated quote at end of input, see error()
  };

  struct Position {
    std::size_t offset = 0;  // into the buffer
    std::size_t line = 1;    // 1-based physical line
  };

  CsvTokenizer(const Dialect& d, Arena& row_arena);
  ~CsvTokenizer();
  CsvTokenizer(const CsvTokenizer&) = delete;
  CsvTokenizer& operator=(const CsvTokenizer&) = delete;

  void set_input(std::string_view buf, bool at_eof);

  // Rows whose first byte is at or past `limit` are not emitted.
  void set_row_limit(std::size_t limit);

  Status next(RowView& row);

  Position tell() const;
  void seek(Position p);

  const Dialect& dialect() const;
  const std::string& error() const { return err_; }
  std::size_t error_line() const noexcept { return err_line_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
  std::size_t err_line_{0};
};

// Delimiter sniffing over the first complete lines of `sample`: tries comma,
// semicolon, tab, pipe and whitespace, keeping `base` for everything else.
// Returns false (and leaves `out` = base with a comma) when no candidate gives
// a consistent field count above one.
bool detect_dialect(std::string_view sample, bool sample_is_complete,
                    const Dialect& base, Dialect& out);

}
