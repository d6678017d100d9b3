#include "typed_csv/value_parser.hpp"
#include "typed_csv/date_parse.hpp"
#include "typed_csv/parse_options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <fast_float/fast_float.h>

namespace tc {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

const std::vector<std::string_view>& ValueParser::default_na_tokens() {
  static const std::vector<std::string_view> tokens = {
    "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan",
    "1.#IND", "1.#QNAN", "N/A", "NA", "NULL", "NaN", "n/a", "nan", "null", "<NA>"};
  return tokens;
}

ValueParser::ValueParser(const ParseOptions& opt)
  : decimal_(opt.decimal),
    thousands_(opt.thousands),
    dayfirst_(opt.dayfirst),
    na_filter_(opt.na_filter),
    keep_default_na_(opt.keep_default_na),
    na_values_(opt.na_values),
    true_values_(opt.true_values),
    false_values_(opt.false_values) {
  true_values_.insert(true_values_.begin(), "true");
  false_values_.insert(false_values_.begin(), "false");
}

bool ValueParser::is_na(std::string_view s) const {
  if (!na_filter_) return false;
  if (s.empty()) return true;
  if (keep_default_na_) {
    const auto& d = default_na_tokens();
    if (std::find(d.begin(), d.end(), s) != d.end()) return true;
  }
  for (const auto& n : na_values_) if (s == n) return true;
  return false;
}

// Strips thousands separators and maps the decimal separator to '.'.
// A '.' that is not the configured decimal separator is rejected.
bool ValueParser::normalize_number(std::string_view s, std::string& out) const {
  out.clear();
  out.reserve(s.size());
  for (char c : s) {
    if (thousands_ && c == thousands_) continue;
    if (c == decimal_) { out.push_back('.'); continue; }
    if (c == '.') return false;
    out.push_back(c);
  }
  return true;
}

static std::string_view strip_plus(std::string_view s) {
  if (s.size() > 1 && s[0] == '+' && s[1] != '-' && s[1] != '+') s.remove_prefix(1);
  return s;
}

std::optional<std::int64_t> ValueParser::parse_integer(std::string_view s) const {
  std::string norm;
  if (thousands_) {
    if (!normalize_number(s, norm)) return std::nullopt;
    s = norm;
  }
  s = strip_plus(s);
  if (s.empty()) return std::nullopt;
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ValueParser::parse_int(std::string_view s) const {
  if (auto v = parse_integer(s)) return v;
  if (auto b = parse_bool(s)) return *b ? 1 : 0;
  return std::nullopt;
}

std::optional<double> ValueParser::parse_number(std::string_view s) const {
  std::string norm;
  if (thousands_ || decimal_ != '.') {
    if (!normalize_number(s, norm)) return std::nullopt;
    s = norm;
  }
  s = strip_plus(s);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> ValueParser::parse_float(std::string_view s) const {
  if (auto v = parse_number(s)) return v;
  if (auto b = parse_bool(s)) return *b ? 1.0 : 0.0;
  return std::nullopt;
}

std::optional<bool> ValueParser::parse_bool(std::string_view s) const {
  for (const auto& t : true_values_) if (ieq(s, t)) return true;
  for (const auto& f : false_values_) if (ieq(s, f)) return false;
  return std::nullopt;
}

std::optional<std::int64_t> ValueParser::parse_date(std::string_view s) const {
  return parse_date_ms(s, dayfirst_);
}

}
