#include "fastcsv/field.hpp"
#include <charconv>
#include <cstdio>
#include <ctime>
#include <string>

namespace fcsv {

static std::string format_double(double v) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc()) return std::to_string(v);
  std::string s(buf, ptr);
  // keep a float looking like a float ("1" -> "1.0")
  if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
  return s;
}

static std::string format_date(const Date& d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return buf;
}

static std::string format_date_time(const DateTime& dt) {
  std::int64_t secs = dt.epoch_ms / 1000;
  std::int64_t ms   = dt.epoch_ms % 1000;
  if (ms < 0) { ms += 1000; --secs; }

  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[48];
  if (ms == 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  }
  return buf;
}

namespace {

struct TextVisitor {
  std::string operator()(std::monostate) const { return {}; }
  std::string operator()(const std::string& s) const { return s; }
  std::string operator()(std::int64_t v) const { return std::to_string(v); }
  std::string operator()(double v) const { return format_double(v); }
  std::string operator()(const Date& d) const { return format_date(d); }
  std::string operator()(const DateTime& dt) const { return format_date_time(dt); }
  std::string operator()(const Symbol& s) const { return s.name; }
};

}

std::string to_text(const Field& f) { return std::visit(TextVisitor{}, f); }

std::string inspect(const Field& f) {
  if (is_nil(f)) return "nil";
  if (auto s = std::get_if<std::string>(&f)) {
    std::string out = "\"";
    for (char c : *s) {
      switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:   out += c;      break;
      }
    }
    out += '"';
    return out;
  }
  if (auto sym = std::get_if<Symbol>(&f)) return ":" + sym->name;
  return to_text(f);
}

}
