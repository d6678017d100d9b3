#include "typed_csv/parse_options.hpp"

#include <simdjson.h>
#include <filesystem>
#include <string>
#include <string_view>

namespace tc {

namespace {

using simdjson::ondemand::json_type;
using simdjson::ondemand::value;

struct BadOption { std::string msg; };

std::string key_msg(std::string_view key, const char* what) {
  return "\"" + std::string(key) + "\": " + what;
}

char get_char(value& v, std::string_view key, bool allow_empty) {
  std::string_view s = v.get_string().value();
  if (s.empty() && allow_empty) return '\0';
  if (s.size() != 1) throw BadOption{key_msg(key, "expected a single character")};
  return s[0];
}

std::vector<std::string> get_strings(value& v, std::string_view key) {
  std::vector<std::string> out;
  if (v.type().value() != json_type::array) throw BadOption{key_msg(key, "expected an array of strings")};
  simdjson::ondemand::array arr = v.get_array();
  for (auto el : arr) {
    value ev = el.value();
    if (ev.type().value() != json_type::string) throw BadOption{key_msg(key, "expected an array of strings")};
    out.emplace_back(std::string_view(ev.get_string().value()));
  }
  return out;
}

DType get_dtype(value& v, std::string_view key) {
  std::string_view s = v.get_string().value();
  auto t = parse_dtype(s);
  if (!t) throw BadOption{key_msg(key, "unknown dtype \"") + std::string(s) + "\""};
  return *t;
}

ColumnRef get_column_ref(value& v, std::string_view key) {
  switch (v.type().value()) {
    case json_type::number: return static_cast<std::size_t>(v.get_uint64().value());
    case json_type::string: return std::string(std::string_view(v.get_string().value()));
    default: throw BadOption{key_msg(key, "expected a column position or name")};
  }
}

void apply_key(std::string_view key, value& v, ParseOptions& o) {
  if (key == "delimiter") {
    char c = get_char(v, key, true);
    if (c) o.delimiter = c; else o.delimiter.reset();
  } else if (key == "delim_whitespace") {
    o.delim_whitespace = v.get_bool().value();
  } else if (key == "detect_delimiter") {
    o.detect_delimiter = v.get_bool().value();
  } else if (key == "quote_char") {
    o.quote_char = get_char(v, key, false);
  } else if (key == "quoting") {
    o.quoting = v.get_bool().value();
  } else if (key == "comment_char") {
    o.comment_char = get_char(v, key, true);
  } else if (key == "skip_blank_lines") {
    o.skip_blank_lines = v.get_bool().value();
  } else if (key == "header") {
    switch (v.type().value()) {
      case json_type::number:
        o.header = HeaderMode::Row;
        o.header_row = static_cast<std::size_t>(v.get_uint64().value());
        break;
      case json_type::null:
        o.header = HeaderMode::None;
        break;
      case json_type::string: {
        std::string_view s = v.get_string().value();
        if (s == "infer") o.header = HeaderMode::Infer;
        else if (s == "none") o.header = HeaderMode::None;
        else throw BadOption{key_msg(key, "expected \"infer\", \"none\" or a row index")};
        break;
      }
      default: throw BadOption{key_msg(key, "expected \"infer\", \"none\" or a row index")};
    }
  } else if (key == "skiprows") {
    if (v.type().value() == json_type::array) {
      o.skiprow_indices.clear();
      simdjson::ondemand::array arr = v.get_array();
      for (auto el : arr)
        o.skiprow_indices.push_back(static_cast<std::size_t>(el.value().get_uint64().value()));
    } else {
      o.skiprows = static_cast<std::size_t>(v.get_uint64().value());
    }
  } else if (key == "skipfooter") {
    o.skipfooter = static_cast<std::size_t>(v.get_uint64().value());
  } else if (key == "nrows") {
    if (v.type().value() == json_type::null) o.nrows.reset();
    else o.nrows = static_cast<std::size_t>(v.get_uint64().value());
  } else if (key == "names") {
    o.names = get_strings(v, key);
  } else if (key == "dtypes") {
    if (v.type().value() == json_type::object) {
      o.dtype_by_name.clear();
      simdjson::ondemand::object obj = v.get_object();
      for (auto field : obj) {
        std::string name(std::string_view(field.unescaped_key().value()));
        value fv = field.value();
        o.dtype_by_name[name] = get_dtype(fv, key);
      }
    } else if (v.type().value() == json_type::array) {
      o.dtypes.clear();
      simdjson::ondemand::array arr = v.get_array();
      for (auto el : arr) {
        value ev = el.value();
        o.dtypes.push_back(get_dtype(ev, key));
      }
    } else {
      throw BadOption{key_msg(key, "expected an array or an object of dtype names")};
    }
  } else if (key == "prefix") {
    o.prefix = std::string(std::string_view(v.get_string().value()));
  } else if (key == "index_col") {
    switch (v.type().value()) {
      case json_type::boolean:
        if (v.get_bool().value()) throw BadOption{key_msg(key, "true is not a column")};
        o.index_col.reset();
        break;
      case json_type::null:
        o.index_col.reset();
        break;
      default:
        o.index_col = get_column_ref(v, key);
    }
  } else if (key == "usecols") {
    o.usecols.clear();
    simdjson::ondemand::array arr = v.get_array();
    for (auto el : arr) {
      value ev = el.value();
      o.usecols.push_back(get_column_ref(ev, key));
    }
  } else if (key == "decimal") {
    o.decimal = get_char(v, key, false);
  } else if (key == "thousands") {
    o.thousands = get_char(v, key, true);
  } else if (key == "true_values") {
    o.true_values = get_strings(v, key);
  } else if (key == "false_values") {
    o.false_values = get_strings(v, key);
  } else if (key == "na_values") {
    o.na_values = get_strings(v, key);
  } else if (key == "keep_default_na") {
    o.keep_default_na = v.get_bool().value();
  } else if (key == "na_filter") {
    o.na_filter = v.get_bool().value();
  } else if (key == "dayfirst") {
    o.dayfirst = v.get_bool().value();
  } else if (key == "byte_range") {
    ByteRange r;
    std::size_t n = 0;
    simdjson::ondemand::array arr = v.get_array();
    for (auto el : arr) {
      std::uint64_t x = el.value().get_uint64().value();
      if (n == 0) r.offset = x;
      else if (n == 1) r.length = x;
      ++n;
    }
    if (n != 2) throw BadOption{key_msg(key, "expected [offset, length]")};
    o.byte_range = r;
  } else if (key == "chunk_bytes") {
    o.chunk_bytes = static_cast<std::size_t>(v.get_uint64().value());
  } else {
    throw BadOption{"unknown option \"" + std::string(key) + "\""};
  }
}

}

bool load_parse_options_json(std::string_view json, ParseOptions& out, ReadError& err) {
  ParseOptions o = out;
  std::string current_key;
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    auto doc = parser.iterate(padded);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      current_key = std::string(std::string_view(field.unescaped_key().value()));
      value v = field.value();
      apply_key(current_key, v, o);
    }
  } catch (const BadOption& e) {
    err = ReadError::make(ErrorKind::InvalidOption, e.msg);
    return false;
  } catch (const simdjson::simdjson_error& e) {
    std::string msg = current_key.empty() ? std::string("invalid JSON")
                                          : key_msg(current_key, "invalid value");
    err = ReadError::make(ErrorKind::InvalidOption, msg + " (" + e.what() + ")");
    return false;
  }
  out = std::move(o);
  err.clear();
  return true;
}

bool load_parse_options_file(const std::string& path, ParseOptions& out, ReadError& err) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    err = ReadError::make(ErrorKind::InputNotFound, "options file not found: " + path);
    return false;
  }
  auto loaded = simdjson::padded_string::load(path);
  if (loaded.error()) {
    err = ReadError::make(ErrorKind::IoError,
                          "cannot read " + path + ": " + simdjson::error_message(loaded.error()));
    return false;
  }
  return load_parse_options_json(std::string_view(loaded.value_unsafe()), out, err);
}

}
