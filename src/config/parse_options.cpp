#include "typed_csv/parse_options.hpp"
#include <string>

namespace tc {

static bool conflict(ReadError& err, std::string msg) {
  err = ReadError::make(ErrorKind::ConfigurationConflict, std::move(msg));
  return false;
}

static std::string show(char c) {
  if (c == '\t') return "'\\t'";
  if (c == ' ') return "' '";
  return std::string("'") + c + "'";
}

bool validate_options(const ParseOptions& opt, ReadError& err) {
  if (opt.skipfooter > 0 && opt.nrows)
    return conflict(err, "skipfooter and nrows cannot be combined");
  if (opt.delim_whitespace && opt.delimiter)
    return conflict(err, "delim_whitespace cannot be combined with an explicit delimiter");
  if (opt.detect_delimiter && (opt.delimiter || opt.delim_whitespace))
    return conflict(err, "detect_delimiter cannot be combined with an explicit delimiter");
  if (opt.skipfooter > 0 && opt.byte_range)
    return conflict(err, "skipfooter requires the whole input and cannot be combined with byte_range");

  // Special characters must not shadow each other.
  struct Role { const char* name; char c; bool set; };
  const Role roles[] = {
    {"delimiter", opt.effective_delimiter(), !opt.delim_whitespace && !opt.detect_delimiter},
    {"quote_char", opt.quote_char, opt.quoting},
    {"comment_char", opt.comment_char, opt.comment_char != '\0'},
    {"decimal", opt.decimal, true},
    {"thousands", opt.thousands, opt.thousands != '\0'},
  };
  for (std::size_t i = 0; i < sizeof(roles) / sizeof(roles[0]); ++i) {
    for (std::size_t j = i + 1; j < sizeof(roles) / sizeof(roles[0]); ++j) {
      if (!roles[i].set || !roles[j].set) continue;
      // decimal/thousands may equal the delimiter (only matters in quoted fields)
      if (i == 0 && (j == 3 || j == 4)) continue;
      if (roles[i].c == roles[j].c)
        return conflict(err, std::string(roles[i].name) + " and " + roles[j].name +
                             " are both " + show(roles[i].c));
    }
  }

  if (opt.quoting && (opt.quote_char == '\n' || opt.quote_char == '\r'))
    return conflict(err, "quote_char cannot be a line terminator");
  if (opt.delimiter && (*opt.delimiter == '\n' || *opt.delimiter == '\r'))
    return conflict(err, "delimiter cannot be a line terminator");
  if (opt.chunk_bytes == 0) {
    err = ReadError::make(ErrorKind::InvalidOption, "chunk_bytes must be positive");
    return false;
  }
  err.clear();
  return true;
}

}
