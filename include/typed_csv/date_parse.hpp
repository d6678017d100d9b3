#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tc {

// Parses a date or timestamp into milliseconds since 1970-01-01 (UTC-naive).
// Accepted forms:
//   Y-M-D, Y/M/D                       (4-digit year first)
//   M/D/Y, M-D-Y or D/M/Y (dayfirst)   (2-digit years: <69 -> 20xx)
//   spaces around the separators are allowed
// optionally followed by 'T' or whitespace and H:M[:S[.fff]], an AM/PM
// marker and a trailing 'Z'.
std::optional<std::int64_t> parse_date_ms(std::string_view s, bool dayfirst = false);

// YYYY-MM-DDTHH:MM:SS.mmm
std::string format_timestamp_ms(std::int64_t ms);

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept;

}
