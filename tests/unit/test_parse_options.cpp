#include "typed_csv/dtype.hpp"
#include "typed_csv/parse_options.hpp"
#include "../check.hpp"

#include <iostream>
#include <string>

using tc_test::check;

static tc::ErrorKind validate(const tc::ParseOptions& o) {
  tc::ReadError err;
  tc::validate_options(o, err);
  return err.kind;
}

static void test_conflicts() {
  using K = tc::ErrorKind;
  tc::ParseOptions base;
  check(validate(base) == K::None, "defaults are valid");

  auto o = base;
  o.skipfooter = 1; o.nrows = 3;
  check(validate(o) == K::ConfigurationConflict, "skipfooter + nrows");

  o = base;
  o.delimiter = ','; o.delim_whitespace = true;
  check(validate(o) == K::ConfigurationConflict, "delimiter + delim_whitespace");

  o = base;
  o.detect_delimiter = true; o.delimiter = ';';
  check(validate(o) == K::ConfigurationConflict, "detect_delimiter + delimiter");

  o = base;
  o.skipfooter = 1; o.byte_range = tc::ByteRange{0, 10};
  check(validate(o) == K::ConfigurationConflict, "skipfooter + byte_range");

  o = base;
  o.comment_char = '"';
  check(validate(o) == K::ConfigurationConflict, "comment equals quote");

  o = base;
  o.decimal = ','; o.thousands = ',';
  check(validate(o) == K::ConfigurationConflict, "decimal equals thousands");

  o = base;
  o.delimiter = ';'; o.decimal = ',';
  check(validate(o) == K::None, "decimal ',' with delimiter ';'");

  o = base;
  o.chunk_bytes = 0;
  check(validate(o) == K::InvalidOption, "zero chunk_bytes");
}

static void test_dtype_names() {
  check(tc::parse_dtype("int") == tc::DType::Int32 && tc::parse_dtype("long") == tc::DType::Int64,
        "dtype aliases: integers");
  check(tc::parse_dtype("double") == tc::DType::Float64 && tc::parse_dtype("float") == tc::DType::Float32,
        "dtype aliases: floats");
  check(tc::parse_dtype("datetime64[ms]") == tc::DType::Date && tc::parse_dtype("object") == tc::DType::Str,
        "dtype aliases: date and object");
  check(!tc::parse_dtype("decimal128"), "dtype aliases: unknown name");
  check(tc::dtype_name(tc::DType::Category) == "category", "dtype name");
}

static void test_json() {
  tc::ParseOptions o;
  tc::ReadError err;
  bool ok = tc::load_parse_options_file("tests/data/options.json", o, err);
  if (!check(ok, "json: loads options file")) { std::cerr << "       " << err.to_string() << "\n"; return; }
  check(o.delimiter == ';' && o.decimal == ',' && o.thousands == '\'', "json: characters");
  check(o.header == tc::HeaderMode::Row && o.header_row == 0, "json: header row");
  check(o.dtype_by_name.size() == 2 && o.dtype_by_name.at("area") == tc::DType::Float64, "json: dtype map");
  check(o.usecols.size() == 3 && std::get<std::size_t>(o.usecols[1]) == 2, "json: mixed usecols");
  check(o.index_col && std::get<std::string>(*o.index_col) == "city", "json: index_col by name");
  check(o.na_values == std::vector<std::string>{"-"} && o.chunk_bytes == 4096, "json: lists and sizes");

  tc::ParseOptions p;
  ok = tc::load_parse_options_json(
      R"({"header": null, "skiprows": [0, 2], "dtypes": ["int", "str"], "index_col": false,
          "byte_range": [10, 20], "nrows": 5, "delim_whitespace": true, "delimiter": ""})", p, err);
  check(ok, "json: inline document");
  check(p.header == tc::HeaderMode::None && p.skiprow_indices == std::vector<std::size_t>{0, 2},
        "json: header null and skiprows list");
  check(p.dtypes.size() == 2 && p.dtypes[0] == tc::DType::Int32 && !p.index_col, "json: dtype list, index_col false");
  check(p.byte_range && p.byte_range->offset == 10 && p.byte_range->length == 20 && p.nrows == std::size_t{5},
        "json: byte_range and nrows");
  check(p.delim_whitespace && !p.delimiter, "json: empty delimiter clears it");

  tc::ParseOptions q;
  q.quote_char = '\'';
  check(!tc::load_parse_options_file("tests/data/bad_options.json", q, err) &&
        err.kind == tc::ErrorKind::InvalidOption && err.message.find("sep_typo") != std::string::npos,
        "json: unknown key is InvalidOption");
  check(q.quote_char == '\'' && !q.delimiter, "json: failed load leaves options untouched");

  check(!tc::load_parse_options_json(R"({"dtypes": ["int128"]})", q, err) && err.kind == tc::ErrorKind::InvalidOption,
        "json: unknown dtype");
  check(!tc::load_parse_options_json(R"({"nrows": "ten"})", q, err) && err.kind == tc::ErrorKind::InvalidOption,
        "json: ill-typed value");
  check(!tc::load_parse_options_json("{not json", q, err) && err.kind == tc::ErrorKind::InvalidOption,
        "json: malformed document");
  check(!tc::load_parse_options_file("tests/data/none.json", q, err) && err.kind == tc::ErrorKind::InputNotFound,
        "json: missing file");
}

int main() {
  test_conflicts();
  test_dtype_names();
  test_json();
  return tc_test::finish("parse_options");
}
