#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "fastcsv/field.hpp"

namespace fcsv {

// Broken-down result of the ISO-8601 subset parser.
struct Iso8601Parts {
  int year = 0, month = 0, day = 0;
  int hour = 0, minute = 0, second = 0, millis = 0;
  int offset_minutes = 0; // east of UTC
  bool has_time = false;
};

// Parse YYYY-MM-DD[(T| )HH:MM:SS[.fff]][Z|(+|-)HH[:]MM]. Whole input must match.
std::optional<Iso8601Parts> parse_iso8601(std::string_view s);

// Fast parse of the same subset: returns epoch millis (UTC) on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

// Calendar date of the same subset (time of day, if any, is dropped).
std::optional<Date> parse_iso8601_date(std::string_view s);

}
