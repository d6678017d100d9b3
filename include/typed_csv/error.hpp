#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace tc {

enum class ErrorKind {
  None,
  InputNotFound,          // missing path, or path is not a regular file
  ConfigurationConflict,  // mutually exclusive options set together
  InvalidOption,          // bad option value (dtype name, usecols, JSON config)
  EmptyInputNoDtype,      // no data rows and no dtypes to fall back on
  ConversionFailure,      // field text does not match its column dtype
  MalformedQuoting,       // quoted field still open at end of input
  IoError                 // read failure on an already opened source
};

std::string_view to_string(ErrorKind k);

// Fatal error for one read. Row/column context is filled for
// ConversionFailure and MalformedQuoting; npos means "not applicable".
struct ReadError {
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  ErrorKind   kind = ErrorKind::None;
  std::string message;
  std::size_t row = npos;       // 0-based data row within the read
  std::size_t line = npos;      // 1-based source line within the window
  std::size_t column = npos;    // 0-based position in the resolved schema
  std::string column_name;
  std::string field;            // raw field text

  bool ok() const noexcept { return kind == ErrorKind::None; }
  void clear() { *this = ReadError{}; }
  std::string to_string() const;

  static ReadError make(ErrorKind k, std::string msg) {
    ReadError e;
    e.kind = k;
    e.message = std::move(msg);
    return e;
  }
};

}
