#include "typed_csv/error.hpp"
#include <sstream>

namespace tc {

std::string_view to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:                  return "none";
    case ErrorKind::InputNotFound:         return "input not found";
    case ErrorKind::ConfigurationConflict: return "configuration conflict";
    case ErrorKind::InvalidOption:         return "invalid option";
    case ErrorKind::EmptyInputNoDtype:     return "empty input without dtypes";
    case ErrorKind::ConversionFailure:     return "conversion failure";
    case ErrorKind::MalformedQuoting:      return "malformed quoting";
    case ErrorKind::IoError:               return "i/o error";
  }
  return "unknown";
}

std::string ReadError::to_string() const {
  std::ostringstream o;
  o << tc::to_string(kind);
  if (!message.empty()) o << ": " << message;
  if (row != npos) o << " (row " << row;
  else if (line != npos) o << " (line " << line;
  else return o.str();
  if (row != npos && line != npos) o << ", line " << line;
  if (column != npos) {
    o << ", column " << column;
    if (!column_name.empty()) o << " '" << column_name << "'";
  }
  if (!field.empty() || column != npos) o << ", field \"" << field << "\"";
  o << ")";
  return o.str();
}

}
