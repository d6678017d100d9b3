#include "typed_csv/byte_source.hpp"
#include "typed_csv/category_hash.hpp"
#include "typed_csv/csv_reader.hpp"
#include "typed_csv/log.hpp"
#include "typed_csv/parse_options.hpp"
#include "typed_csv/table.hpp"
#include "../check.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using tc_test::check;
using Names = std::vector<std::string>;

static Names names_of(const tc::Table& t) {
  Names n;
  for (const auto& f : t.schema().fields) n.push_back(f.name);
  return n;
}

static std::vector<tc::DType> dtypes_of(const tc::Table& t) {
  std::vector<tc::DType> d;
  for (const auto& f : t.schema().fields) d.push_back(f.dtype);
  return d;
}

static bool read_or_report(tc::CsvReader& r, const std::string& path, tc::Table& t) {
  if (r.read_file(path, t)) return true;
  std::cerr << "[ERR] " << path << ": " << r.error().to_string() << "\n";
  return false;
}

static void test_mixed_types() {
  tc::CsvReader r;
  tc::Table t;
  if (!check(read_or_report(r, "tests/data/mixed_types.csv", t), "mixed_types: reads")) return;
  check(t.num_rows() == 4 && t.num_columns() == 6, "mixed_types: shape 4x6");
  check(names_of(t) == Names{"id", "name", "score", "active", "joined", "code"}, "mixed_types: header names");
  using D = tc::DType;
  check(dtypes_of(t) == std::vector<D>{D::Int64, D::Str, D::Float64, D::Bool, D::Date, D::Str},
        "mixed_types: inferred dtypes");

  const auto& name = *t.column("name");
  check(name.to_text(0) == "Smith, John", "quoted delimiter stays in the field");
  check(name.to_text(1) == "Line\nBreak", "quoted newline stays in the field");
  check(name.to_text(2) == "He said \"hi\"", "doubled quotes unescape");
  check(!name.valid(3), "empty string field is NA");

  const auto& score = *t.column("score");
  check(!score.valid(2) && score.null_count() == 1, "NA token in float column");
  check(score.values<double>()[3] == 2.25, "padded float is trimmed");

  const auto& active = *t.column("active");
  check(active.to_text(0) == "True" && active.to_text(1) == "False" && active.to_text(3) == "False",
        "bool tokens are case-insensitive");

  const auto& joined = *t.column("joined");
  check(joined.to_text(0) == "2016-04-30T00:00:00.000", "date: ISO date");
  check(joined.to_text(1) == "2016-05-01T01:02:03.400", "date: ISO timestamp with millis");
  check(joined.to_text(2) == "1995-11-22T00:00:00.000", "date: month/day/year");
  check(joined.to_text(3) == "2007-04-30T13:06:40.000", "date: PM suffix");

  check(r.metrics().rows == 4 && r.metrics().windows == 1, "metrics: rows and windows");
  check(r.metrics().stage_ms("convert") >= 0.0 && r.metrics().stages.size() == 3, "metrics: tokenize/infer/convert stages");
}

static void test_category_and_selection() {
  tc::ParseOptions o;
  o.dtype_by_name = {{"code", tc::DType::Category}};
  o.usecols = {std::string("code"), std::string("id"), std::string("score")};
  o.index_col = tc::ColumnRef{std::string("id")};
  tc::CsvReader r(o);
  tc::Table t;
  if (!check(read_or_report(r, "tests/data/mixed_types.csv", t), "category: reads")) return;

  check(names_of(t) == Names{"score", "code"}, "usecols keeps file order, index split out");
  check(t.index() && t.index()->field.name == "id" && t.index()->column.values<std::int64_t>()[2] == 3,
        "index_col by name");
  const auto& codes = t.column("code")->values<std::int32_t>();
  check(codes == std::vector<std::int32_t>{2022314536, -189888986, 1512937027, 397836265}, "category hash codes");
  check(codes[0] == tc::category_code("HBM0676"), "category codes match category_code()");
  check(r.column_names().size() == 6, "column_names lists every file column");
}

static void test_conversion_failure() {
  tc::ParseOptions o;
  o.dtype_by_name = {{"name", tc::DType::Int64}};
  tc::CsvReader r(o);
  tc::Table t;
  check(!r.read_file("tests/data/mixed_types.csv", t), "forced int64 on text fails");
  const auto& e = r.error();
  check(e.kind == tc::ErrorKind::ConversionFailure, "conversion: kind");
  check(e.row == 0 && e.line == 2 && e.column == 1, "conversion: row, line and column");
  check(e.column_name == "name" && e.field == "Smith, John", "conversion: column name and field text");

  tc::ParseOptions narrow;
  narrow.header = tc::HeaderMode::None;
  narrow.dtypes = {tc::DType::Int32};
  tc::CsvReader r2(narrow);
  check(!r2.read_buffer("1\n3000000000\n", t) && r2.error().kind == tc::ErrorKind::ConversionFailure &&
            r2.error().row == 1,
        "conversion: int32 overflow");
}

static void test_crlf_tabs() {
  tc::ParseOptions o;
  o.dayfirst = true;
  tc::CsvReader r(o);
  tc::Table t;
  if (!check(read_or_report(r, "tests/data/crlf_tabs.csv", t), "crlf_tabs: reads")) return;
  using D = tc::DType;
  check(dtypes_of(t) == std::vector<D>{D::Date, D::Int64, D::Str}, "crlf_tabs: dtypes");
  check(names_of(t) == Names{"date", "value", "label"}, "crlf_tabs: CR dropped from last header name");
  check(t.column("date")->to_text(0) == "1994-07-14T00:00:00.000", "crlf_tabs: dayfirst date");
  check(t.column("value")->values<std::int64_t>() == std::vector<std::int64_t>{1234, 5}, "crlf_tabs: trimmed ints");
  check(t.column("label")->to_text(0) == "alpha" && t.column("label")->to_text(1) == "beta",
        "crlf_tabs: trimmed text");
}

static void test_blanks_and_comments() {
  tc::ParseOptions base;
  base.comment_char = '#';
  tc::Table t;

  auto o = base;
  o.header = tc::HeaderMode::Row;
  o.header_row = 1;
  tc::CsvReader r1(o);
  check(read_or_report(r1, "tests/data/blanks_comments.csv", t) && t.num_rows() == 2 &&
            names_of(t) == Names{"4", "5", "6"},
        "comments: header on second row");

  o = base;
  o.header = tc::HeaderMode::Row;
  o.skiprows = 2;
  tc::CsvReader r2(o);
  check(read_or_report(r2, "tests/data/blanks_comments.csv", t) && t.num_rows() == 1 &&
            names_of(t) == Names{"7", "8", "9"},
        "comments: skiprows then header");

  o = base;
  o.skiprows = 2;
  tc::CsvReader r3(o);
  check(read_or_report(r3, "tests/data/blanks_comments.csv", t) && t.num_rows() == 2 &&
            names_of(t) == Names{"0", "1", "2"},
        "comments: numeric first row is data under header inference");

  tc::ParseOptions keep;
  keep.skip_blank_lines = false;
  tc::CsvReader r4(keep);
  check(r4.read_buffer("a,b\n1,2\n\n3,4\n", t) && t.num_rows() == 3 && !t.column("a")->valid(1) &&
            !t.column("b")->valid(1) && t.column("a")->dtype() == tc::DType::Int64,
        "blank line kept as an all-NA row");
}

static void test_errors() {
  tc::CsvReader r;
  tc::Table t;
  check(!r.read_file("tests/data/malformed_quote.csv", t) && r.error().kind == tc::ErrorKind::MalformedQuoting,
        "unterminated quote");
  check(r.error().line == 2, "unterminated quote: line of the opening row");

  check(!r.read_file("tests/data/header_only.csv", t) && r.error().kind == tc::ErrorKind::EmptyInputNoDtype,
        "header only without dtypes");
  check(!r.read_buffer("", t) && r.error().kind == tc::ErrorKind::EmptyInputNoDtype, "empty input");

  tc::ParseOptions o;
  o.dtypes = {tc::DType::Int32, tc::DType::Int32};
  tc::CsvReader typed(o);
  check(typed.read_file("tests/data/header_only.csv", t) && t.num_rows() == 0 && t.num_columns() == 2 &&
            t.schema().fields[1].dtype == tc::DType::Int32 && names_of(t) == Names{"a", "b"},
        "header only with dtypes is an empty table");

  check(!r.read_file("tests/data/does_not_exist.csv", t) && r.error().kind == tc::ErrorKind::InputNotFound,
        "missing file");
  check(!r.read_file("tests/data", t) && r.error().kind == tc::ErrorKind::InputNotFound, "directory path");

  tc::ParseOptions bad;
  bad.skipfooter = 1;
  bad.nrows = 2;
  tc::CsvReader conflict(bad);
  check(!conflict.read_buffer("a\n1\n2\n3\n", t) && conflict.error().kind == tc::ErrorKind::ConfigurationConflict,
        "skipfooter with nrows");

  tc::ParseOptions unknown;
  unknown.usecols = {std::string("zz")};
  tc::CsvReader sel(unknown);
  check(!sel.read_buffer("a,b\n1,2\n", t) && sel.error().kind == tc::ErrorKind::InvalidOption, "unknown usecols name");
}

static void test_mangled_header() {
  tc::CsvReader r;
  tc::Table t;
  check(read_or_report(r, "tests/data/mangled_header.csv", t) &&
            names_of(t) == Names{"Unnamed: 0", "a", "a.1", "b", "a.2", "Unnamed: 5"} && t.num_rows() == 2,
        "duplicate and empty header names");
  check(t.column("a.2")->values<std::int64_t>() == std::vector<std::int64_t>{5, 11}, "mangled column keeps its data");
}

static void test_options_file() {
  tc::ParseOptions o;
  tc::ReadError err;
  if (!check(tc::load_parse_options_file("tests/data/options.json", o, err), "options.json loads")) return;
  tc::CsvReader r(o);
  tc::Table t;
  if (!check(read_or_report(r, "tests/data/semicolon_eu.csv", t), "semicolon_eu: reads")) return;
  check(names_of(t) == Names{"population", "area"}, "semicolon_eu: schema after index split");
  check(dtypes_of(t) == std::vector<tc::DType>{tc::DType::Int64, tc::DType::Float64}, "semicolon_eu: dtypes");
  check(t.index() && t.index()->column.to_text(1) == "Bern", "semicolon_eu: city index");
  check(t.column("population")->values<std::int64_t>() == std::vector<std::int64_t>{1234, 133115, 177654},
        "semicolon_eu: thousands separator");
  check(t.column("area")->values<double>() == std::vector<double>{87.88, 51.62, 23.91}, "semicolon_eu: decimal comma");
}

static void test_detect_delimiter() {
  tc::ParseOptions o;
  o.detect_delimiter = true;
  tc::CsvReader r(o);
  tc::Table t;
  check(r.read_buffer("a;b;c\n1;2;3\n4;5;6\n", t) && r.dialect().delimiter == ';' && t.num_columns() == 3 &&
            t.num_rows() == 2,
        "detects ';'");
  check(r.read_buffer("a\tb\n1\t2\n", t) && r.dialect().delimiter == '\t' && t.num_columns() == 2, "detects tab");
}

static void test_headerless_numbers() {
  tc::ParseOptions none;
  none.header = tc::HeaderMode::None;
  tc::CsvReader r(none);
  tc::Table t;
  check(r.read_buffer("1.2,1\n2.3,2\n", t) && names_of(t) == Names{"0", "1"} && t.num_rows() == 2,
        "header none: generated names");
  check(dtypes_of(t) == std::vector<tc::DType>{tc::DType::Float64, tc::DType::Int64}, "header none: float64, int64");
  check(t.column("0")->values<double>()[0] == 1.2, "header none: first line is data row 0");

  tc::CsvReader inferred;
  check(inferred.read_buffer("1.2,1\n2.3,2\n", t) && names_of(t) == Names{"0", "1"} && t.num_rows() == 2,
        "header inference: all-numeric first line is data");

  check(inferred.read_buffer("float_point,integer\n1.2,1\n2.3,2\n", t) &&
            names_of(t) == Names{"float_point", "integer"} && t.num_rows() == 2,
        "header inference: text first line is the header");
  check(inferred.read_buffer("a,1\n2,3\n", t) && names_of(t) == Names{"a", "1"} && t.num_rows() == 1,
        "header inference: one text field makes the first line a header");

  tc::ParseOptions pre = none;
  pre.prefix = "col_";
  tc::CsvReader p(pre);
  check(p.read_buffer("1, 1, 1, 1\n", t) && names_of(t) == Names{"col_0", "col_1", "col_2", "col_3"}, "prefix");

  tc::ParseOptions named;
  named.names = {"x", "y"};
  tc::CsvReader n(named);
  check(n.read_buffer("1,2,3\n4,5\n", t) && names_of(t) == Names{"x", "y"} && t.num_rows() == 2,
        "explicit names: extra fields ignored");
  check(n.read_buffer("1\n2,3\n", t) && !t.column("y")->valid(0), "explicit names: short row padded with NA");
}

static void test_row_limits() {
  std::string ten;
  for (int i = 0; i < 10; ++i) ten += std::to_string(i) + "\n";

  tc::ParseOptions o;
  o.header = tc::HeaderMode::None;
  o.skiprows = 2;
  o.nrows = 3;
  tc::CsvReader r(o);
  tc::Table t;
  check(r.read_buffer(ten, t) && t.column(0).values<std::int64_t>() == std::vector<std::int64_t>{2, 3, 4},
        "skiprows then nrows");

  tc::ParseOptions f;
  f.header = tc::HeaderMode::None;
  f.skipfooter = 3;
  tc::CsvReader footer(f);
  check(footer.read_buffer(ten, t) && t.num_rows() == 7 && t.column(0).values<std::int64_t>().back() == 6,
        "skipfooter drops trailing rows");

  tc::ParseOptions idx;
  idx.header = tc::HeaderMode::None;
  idx.skiprow_indices = {0, 5};
  tc::CsvReader ri(idx);
  check(ri.read_buffer(ten, t) && t.num_rows() == 8 && t.column(0).values<std::int64_t>()[4] == 6,
        "skiprow_indices");

  tc::ParseOptions zero;
  zero.nrows = 0;
  zero.dtypes = {tc::DType::Int64, tc::DType::Str};
  tc::CsvReader rz(zero);
  check(rz.read_buffer("a,b\n1,x\n", t) && t.num_rows() == 0 && t.num_columns() == 2, "nrows 0 with dtypes");

  std::string big;
  for (int i = 0; i < 20000; ++i) big += std::to_string(i) + "," + std::to_string(i * 2) + "\n";
  tc::ParseOptions early;
  early.nrows = 5;
  early.chunk_bytes = 256;
  tc::CsvReader re(early);
  check(re.read_buffer(big, t) && t.num_rows() == 5, "nrows: row count");
  check(re.metrics().bytes < big.size() / 4, "nrows: stops reading early");
}

static void test_values() {
  tc::ParseOptions eu;
  eu.delimiter = ';';
  eu.decimal = ',';
  eu.thousands = '\'';
  eu.header = tc::HeaderMode::None;
  tc::CsvReader r(eu);
  tc::Table t;
  check(r.read_buffer("1'234,56\n", t) && t.column(0).values<double>()[0] == 1234.56, "decimal and thousands");

  tc::CsvReader def;
  check(def.read_buffer("a,b\nNA,x\n,y\nnull,NA\n", t), "NA tokens: reads");
  check(t.column("a")->dtype() == tc::DType::Float64 && t.column("a")->null_count() == 3, "all-NA column is float64");
  check(t.column("b")->dtype() == tc::DType::Str && !t.column("b")->valid(2), "NA in text column");

  tc::ParseOptions raw;
  raw.keep_default_na = false;
  raw.na_values = {"x"};
  tc::CsvReader rr(raw);
  check(rr.read_buffer("a,b\nNA,x\n,y\nnull,NA\n", t) && t.column("a")->dtype() == tc::DType::Str &&
            t.column("a")->to_text(0) == "NA" && !t.column("a")->valid(1) && !t.column("b")->valid(0) &&
            t.column("b")->to_text(2) == "NA",
        "keep_default_na off: only na_values and empty text");

  tc::ParseOptions off;
  off.na_filter = false;
  off.dtypes = {tc::DType::Str, tc::DType::Int64};
  tc::CsvReader ro(off);
  check(ro.read_buffer("a,b\nNA,\n,2\n", t) && t.column("a")->to_text(0) == "NA" && t.column("a")->valid(1) &&
            !t.column("b")->valid(0),
        "na_filter off: text kept, empty numeric is NA");

  tc::CsvReader guard;
  check(guard.read_buffer("v\n3977\n4329\n", t) && t.column("v")->dtype() == tc::DType::Int64, "numbers never infer bool");

  tc::ParseOptions yes;
  yes.true_values = {"yes"};
  yes.false_values = {"no"};
  tc::CsvReader ry(yes);
  check(ry.read_buffer("flag,n\nyes,true\nNo,false\n", t) && t.column("flag")->dtype() == tc::DType::Bool &&
            t.column("flag")->to_text(1) == "False",
        "custom bool tokens");

  tc::ParseOptions asint;
  asint.dtypes = {tc::DType::Int32};
  tc::CsvReader ri(asint);
  check(ri.read_buffer("n\nTrue\n7\nfalse\n", t) &&
            t.column("n")->values<std::int32_t>() == std::vector<std::int32_t>{1, 7, 0},
        "bool tokens in an int column");
}

static void test_stream_source() {
  std::istringstream in("a,b\n1,x\n2,y\n");
  auto src = tc::make_stream_source(in);
  tc::CsvReader r;
  tc::Table t;
  check(r.read(*src, t) && t.num_rows() == 2 && t.column("a")->values<std::int64_t>()[1] == 2, "stream source");
}

// Typed read of a large stream in small chunks; the stream cannot rewind, so
// this also covers the single forward conversion pass.
static void test_large_stream() {
  std::string data = "id,x\n";
  const int n = 200000;
  for (int i = 0; i < n; ++i) data += std::to_string(i) + "," + std::to_string(i) + ".5\n";
  std::istringstream in(data);
  auto src = tc::make_stream_source(in);
  tc::ParseOptions o;
  o.dtypes = {tc::DType::Int64, tc::DType::Float64};
  o.chunk_bytes = 4096;
  tc::CsvReader r(o);
  tc::Table t;
  if (!check(r.read(*src, t), "large stream: reads")) {
    std::cerr << "       " << r.error().to_string() << "\n";
    return;
  }
  check(t.num_rows() == static_cast<std::size_t>(n), "large stream: row count");
  const auto& ids = t.column(0).values<std::int64_t>();
  const auto& xs = t.column(1).values<double>();
  check(ids[0] == 0 && ids[n - 1] == n - 1 && xs[12345] == 12345.5, "large stream: values");
  check(r.metrics().bytes == data.size() && src->bytes_read() == data.size(), "large stream: every byte pulled once");
}

static void test_debug_logging() {
  tc::set_log_level(tc::LogLevel::Debug);
  check(tc::log_enabled(tc::LogLevel::Debug), "log: debug enabled after set_log_level");
  tc::CsvReader r;
  tc::Table t;
  check(r.read_buffer("a,b\n1,2\n", t) && t.num_rows() == 1, "log: read with debug output");
  tc::set_log_level(tc::LogLevel::Warn);
  check(!tc::log_enabled(tc::LogLevel::Info) && tc::log_enabled(tc::LogLevel::Warn), "log: level restored");
}

int main() {
  test_mixed_types();
  test_category_and_selection();
  test_conversion_failure();
  test_crlf_tabs();
  test_blanks_and_comments();
  test_errors();
  test_mangled_header();
  test_options_file();
  test_detect_delimiter();
  test_headerless_numbers();
  test_row_limits();
  test_values();
  test_stream_source();
  test_large_stream();
  test_debug_logging();
  return tc_test::finish("end_to_end_csv");
}
