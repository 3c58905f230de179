#include "fastcsv/date_parse.hpp"
#include <chrono>
#include <cctype>
#include <ctime>
#include <string_view>

// Portable, small subset ISO-8601 parser (YYYY-MM-DD[THH:MM:SS[.ms]][Z|offset]).

namespace fcsv {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static int days_in_month(int y, int m) {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) return 29;
  return days[m - 1];
}

std::optional<Iso8601Parts> parse_iso8601(std::string_view s) {
  // Expected forms:
  // YYYY-MM-DD
  // YYYY-MM-DDTHH:MM:SS
  // YYYY-MM-DDTHH:MM:SS.mmm
  // All optionally suffixed with 'Z' or a +HH:MM / -HHMM offset

  if (s.size() < 10) return std::nullopt;
  Iso8601Parts r;

  if (!(parse_int(s.substr(0,4), r.year) && s[4]=='-' && parse_int(s.substr(5,2), r.month) && s[7]=='-' && parse_int(s.substr(8,2), r.day)))
    return std::nullopt;
  if (r.month < 1 || r.month > 12) return std::nullopt;
  if (r.day < 1 || r.day > days_in_month(r.year, r.month)) return std::nullopt;

  size_t i = 10;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    if (i+8 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i,2), r.hour) && s[i+2]==':' && parse_int(s.substr(i+3,2), r.minute) && s[i+5]==':' && parse_int(s.substr(i+6,2), r.second)))
      return std::nullopt;
    if (r.hour > 23 || r.minute > 59 || r.second > 60) return std::nullopt;
    r.has_time = true;
    i += 8;
    if (i < s.size() && s[i]=='.') {
      size_t j=i+1, k=j;
      while (k < s.size() && is_digit(s[k])) ++k;
      int frac=0; if (!parse_int(s.substr(j, (k-j) > 3 ? 3 : (k-j)), frac)) return std::nullopt;
      if ((k-j)==1) r.millis = frac*100;
      else if ((k-j)==2) r.millis = frac*10;
      else r.millis = frac; // digits past milliseconds are truncated
      i = k;
    }
    if (i < s.size() && s[i]=='Z') {
      ++i;
    } else if (i < s.size() && (s[i]=='+' || s[i]=='-')) {
      const int sign = (s[i]=='-') ? -1 : 1;
      ++i;
      int oh=0, om=0;
      if (i+2 > s.size() || !parse_int(s.substr(i,2), oh)) return std::nullopt;
      i += 2;
      if (i < s.size() && s[i]==':') ++i;
      if (i+2 > s.size() || !parse_int(s.substr(i,2), om)) return std::nullopt;
      i += 2;
      if (oh > 23 || om > 59) return std::nullopt;
      r.offset_minutes = sign * (oh * 60 + om);
    }
  }

  if (i != s.size()) return std::nullopt;
  return r;
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  auto p = parse_iso8601(s);
  if (!p) return std::nullopt;

  // Build a time_point in UTC, then back out the offset
  std::tm tm{}; tm.tm_year = p->year - 1900; tm.tm_mon = p->month - 1; tm.tm_mday = p->day;
  tm.tm_hour = p->hour; tm.tm_min = p->minute; tm.tm_sec = p->second;

#if defined(_WIN32)
  // Windows: _mkgmtime
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == (std::time_t)-1 && !(p->year == 1969 && p->month == 12 && p->day == 31)) return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + p->millis - std::int64_t(p->offset_minutes) * 60'000);
}

std::optional<Date> parse_iso8601_date(std::string_view s) {
  auto p = parse_iso8601(s);
  if (!p) return std::nullopt;
  return Date{p->year, p->month, p->day};
}

}
