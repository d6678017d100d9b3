#include "typed_csv/date_parse.hpp"
#include <cctype>
#include <cstdio>
#include <string_view>

namespace tc {

static bool is_digit(char c){ return c>='0' && c<='9'; }
static bool is_space(char c){ return c==' ' || c=='\t'; }

namespace {

struct Cursor {
  std::string_view s;
  size_t i = 0;

  bool done() const { return i >= s.size(); }
  char peek() const { return done() ? '\0' : s[i]; }
  void skip_spaces() { while (!done() && is_space(s[i])) ++i; }

  // Reads 1..max_digits digits; returns the digit count (0 on failure).
  size_t number(int& out, size_t max_digits) {
    size_t j = i;
    int v = 0;
    while (j < s.size() && is_digit(s[j]) && (j - i) < max_digits) { v = v*10 + (s[j] - '0'); ++j; }
    if (j < s.size() && is_digit(s[j])) return 0;   // too many digits
    const size_t n = j - i;
    i = j;
    out = v;
    return n;
  }
};

}

std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) noexcept {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
  const unsigned mp = (5*doy + 2)/153;
  d = doy - (153*mp + 2)/5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

static bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static int days_in_month(int y, int m) {
  static constexpr int kDays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

std::optional<std::int64_t> parse_date_ms(std::string_view s, bool dayfirst) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  Cursor c{s};
  int a = 0, b = 0, y3 = 0;
  const size_t na = c.number(a, 4);
  if (na == 0) return std::nullopt;
  c.skip_spaces();
  const char sep = c.peek();
  if (sep != '-' && sep != '/') return std::nullopt;
  ++c.i;
  c.skip_spaces();
  if (c.number(b, 2) == 0) return std::nullopt;
  c.skip_spaces();
  if (c.peek() != sep) return std::nullopt;
  ++c.i;
  c.skip_spaces();
  const size_t n3 = c.number(y3, na > 2 ? 2 : 4);
  if (n3 == 0) return std::nullopt;

  int Y, M, D;
  if (na > 2) {                 // year first
    if (na != 4) return std::nullopt;
    Y = a; M = b; D = y3;
  } else {
    if (n3 == 3) return std::nullopt;
    Y = y3;
    if (n3 <= 2) Y += (Y < 69) ? 2000 : 1900;
    if (dayfirst) { D = a; M = b; } else { M = a; D = b; }
  }
  if (M < 1 || M > 12 || D < 1 || D > days_in_month(Y, M)) return std::nullopt;

  int h = 0, m = 0, sec = 0, ms = 0;
  if (!c.done()) {
    if (c.peek() == 'T') ++c.i;
    else if (is_space(c.peek())) c.skip_spaces();
    else return std::nullopt;

    if (c.number(h, 2) == 0 || c.peek() != ':') return std::nullopt;
    ++c.i;
    if (c.number(m, 2) == 0) return std::nullopt;
    if (c.peek() == ':') {
      ++c.i;
      if (c.number(sec, 2) == 0) return std::nullopt;
      if (c.peek() == '.') {
        ++c.i;
        size_t digits = 0;
        while (!c.done() && is_digit(c.peek())) {
          if (digits < 3) ms = ms*10 + (c.peek() - '0');
          ++digits; ++c.i;
        }
        if (digits == 0) return std::nullopt;
        for (size_t k = digits; k < 3; ++k) ms *= 10;
      }
    }
    c.skip_spaces();
    if (c.i + 2 <= s.size()) {
      const char p0 = static_cast<char>(std::toupper((unsigned char)s[c.i]));
      const char p1 = static_cast<char>(std::toupper((unsigned char)s[c.i + 1]));
      if ((p0 == 'A' || p0 == 'P') && p1 == 'M') {
        if (h < 1 || h > 12) return std::nullopt;
        if (p0 == 'A' && h == 12) h = 0;
        if (p0 == 'P' && h != 12) h += 12;
        c.i += 2;
      }
    }
    if (c.peek() == 'Z') ++c.i;
    if (!c.done()) return std::nullopt;
    if (h > 23 || m > 59 || sec > 59) return std::nullopt;
  }

  const std::int64_t days = days_from_civil(Y, static_cast<unsigned>(M), static_cast<unsigned>(D));
  return ((days * 24 + h) * 60 + m) * 60000LL + sec * 1000LL + ms;
}

std::string format_timestamp_ms(std::int64_t ms) {
  std::int64_t days = ms / 86400000;
  std::int64_t rem = ms % 86400000;
  if (rem < 0) { rem += 86400000; --days; }
  std::int64_t y; unsigned mo, d;
  civil_from_days(days, y, mo, d);
  const int h = static_cast<int>(rem / 3600000);
  const int mi = static_cast<int>(rem / 60000 % 60);
  const int s = static_cast<int>(rem / 1000 % 60);
  const int f = static_cast<int>(rem % 1000);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03d",
                static_cast<long long>(y), mo, d, h, mi, s, f);
  return buf;
}

}
