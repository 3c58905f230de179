#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace fcsv {

// Calendar date produced by the `date` converter.
struct Date {
  int year  = 1970;
  int month = 1;
  int day   = 1;
};

// Point in time produced by the `date_time` converter (UTC, epoch millis).
struct DateTime {
  std::int64_t epoch_ms = 0;
};

// Interned-style name produced by the `symbol` header converter.
struct Symbol {
  std::string name;
};

inline bool operator==(const Date& a, const Date& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator<(const Date& a, const Date& b) {
  return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}
inline bool operator==(const DateTime& a, const DateTime& b) { return a.epoch_ms == b.epoch_ms; }
inline bool operator<(const DateTime& a, const DateTime& b) { return a.epoch_ms < b.epoch_ms; }
inline bool operator==(const Symbol& a, const Symbol& b) { return a.name == b.name; }
inline bool operator<(const Symbol& a, const Symbol& b) { return a.name < b.name; }

// A single value of a record.
//   monostate -> absent (empty unquoted field, or a missing Row position)
//   string    -> raw text as parsed
//   the rest  -> whatever a converter produced
using Field = std::variant<std::monostate, std::string, std::int64_t, double,
                           Date, DateTime, Symbol>;

using Record = std::vector<Field>;

// Position of a field, handed to converters that ask for it.
struct FieldInfo {
  std::size_t   index = 0; // zero-based column
  std::uint64_t line  = 0; // logical records read so far (1-based)
};

inline bool is_nil(const Field& f) noexcept { return std::holds_alternative<std::monostate>(f); }
inline bool is_string(const Field& f) noexcept { return std::holds_alternative<std::string>(f); }

// Text form used when writing. Absent fields render as "".
std::string to_text(const Field& f);

// Debug form: strings quoted, absent as `nil`, symbols with a leading ':'.
std::string inspect(const Field& f);

}
