#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tc {

struct ParseOptions;

// Field-level conversions for one read. Built once from the options; the
// default NA and boolean token tables are process-wide constants.
class ValueParser {
public:
  explicit ValueParser(const ParseOptions& opt);

  // NA test: empty text, a default NA token (keep_default_na) or a user
  // na_values token. Always false when na_filter is off.
  bool is_na(std::string_view s) const;
  bool na_filter() const noexcept { return na_filter_; }

  // Plain integer text (sign, digits, thousands separators). No bool tokens.
  std::optional<std::int64_t> parse_integer(std::string_view s) const;
  // Integer column value: integer text or a true/false token (1/0).
  std::optional<std::int64_t> parse_int(std::string_view s) const;

  // Plain float text honouring decimal/thousands; scientific notation ok.
  std::optional<double> parse_number(std::string_view s) const;
  // Float column value: float text or a true/false token (1.0/0.0).
  std::optional<double> parse_float(std::string_view s) const;

  // Case-insensitive match against {"true"} + true_values and
  // {"false"} + false_values. Numeric text never matches.
  std::optional<bool> parse_bool(std::string_view s) const;

  // Milliseconds since 1970-01-01, see parse_date_ms().
  std::optional<std::int64_t> parse_date(std::string_view s) const;

  // Default NA tokens, in table order.
  static const std::vector<std::string_view>& default_na_tokens();

private:
  bool normalize_number(std::string_view s, std::string& out) const;

  char decimal_;
  char thousands_;
  bool dayfirst_;
  bool na_filter_;
  bool keep_default_na_;
  std::vector<std::string> na_values_;
  std::vector<std::string> true_values_;
  std::vector<std::string> false_values_;
};

}
