#include "fastcsv/converters.hpp"
#include "fastcsv/date_parse.hpp"
#include "fastcsv/errors.hpp"
#include <algorithm>
#include <charconv>
#include <cctype>
#include <string_view>
#include <fast_float/fast_float.h>

namespace fcsv {

static bool ieq_prefix(std::string_view s, std::string_view pfx) {
  if (s.size() < pfx.size()) return false;
  for (size_t i = 0; i < pfx.size(); ++i) if (std::tolower((unsigned char)s[i]) != pfx[i]) return false;
  return true;
}

Converter::operator bool() const noexcept {
  return std::visit([](const auto& fn) { return static_cast<bool>(fn); }, fn_);
}

Field Converter::operator()(const Field& f, const FieldInfo& info) const {
  if (auto fn = std::get_if<FieldFn>(&fn_)) return (*fn)(f);
  return std::get<FieldInfoFn>(fn_)(f, info);
}

// ---- built-ins ------------------------------------------------------------

Field convert_integer(const Field& f) {
  auto s = std::get_if<std::string>(&f);
  if (!s || s->empty()) return f;

  std::string_view v(*s);
  bool neg = false;
  if (v[0] == '+' || v[0] == '-') { neg = (v[0] == '-'); v.remove_prefix(1); }
  int base = 10;
  if (ieq_prefix(v, "0x"))      { base = 16; v.remove_prefix(2); }
  else if (ieq_prefix(v, "0b")) { base = 2;  v.remove_prefix(2); }
  else if (ieq_prefix(v, "0o")) { base = 8;  v.remove_prefix(2); }
  if (v.empty() || v[0] == '+' || v[0] == '-') return f;

  std::uint64_t mag = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), mag, base);
  if (ec != std::errc() || ptr != v.data() + v.size()) return f;

  constexpr std::uint64_t max_pos = static_cast<std::uint64_t>(INT64_MAX);
  if (!neg && mag > max_pos) return f;
  if (neg && mag > max_pos + 1) return f;
  std::int64_t out = neg ? static_cast<std::int64_t>(0 - mag) : static_cast<std::int64_t>(mag);
  return out;
}

Field convert_float(const Field& f) {
  auto s = std::get_if<std::string>(&f);
  if (!s || s->empty()) return f;

  std::string_view v(*s);
  if (v[0] == '+') {
    v.remove_prefix(1);
    if (v.empty() || v[0] == '-' || v[0] == '+') return f;
  }
  // fast_float also takes "inf"/"nan"; a CSV float must start numerically
  const char c0 = (v[0] == '-' && v.size() > 1) ? v[1] : v[0];
  if (!(std::isdigit((unsigned char)c0) || c0 == '.')) return f;

  double out;
  auto [ptr, ec] = fast_float::from_chars(v.data(), v.data() + v.size(), out);
  if (ec != std::errc() || ptr != v.data() + v.size()) return f;
  return out;
}

Field convert_date(const Field& f) {
  auto s = std::get_if<std::string>(&f);
  if (!s) return f;
  if (auto d = parse_iso8601_date(*s)) return *d;
  return f;
}

Field convert_date_time(const Field& f) {
  auto s = std::get_if<std::string>(&f);
  if (!s) return f;
  if (auto ms = parse_iso8601_ms(*s)) return DateTime{*ms};
  return f;
}

Field convert_downcase(const Field& f) {
  auto s = std::get_if<std::string>(&f);
  if (!s) return f;
  std::string out(*s);
  for (auto& c : out) c = static_cast<char>(std::tolower((unsigned char)c));
  return out;
}

Field convert_symbol(const Field& f) {
  auto s = std::get_if<std::string>(&f);
  if (!s) return f;
  Symbol sym;
  sym.name.reserve(s->size());
  for (unsigned char c : *s) {
    char lc = static_cast<char>(std::tolower(c));
    if (lc == ' ') lc = '_';
    if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '_') sym.name.push_back(lc);
  }
  return sym;
}

// ---- registry -------------------------------------------------------------

void ConverterRegistry::add(std::string name, Converter c) {
  entries_[std::move(name)] = std::move(c);
}

void ConverterRegistry::add_combo(std::string name, std::vector<std::string> names) {
  entries_[std::move(name)] = std::move(names);
}

bool ConverterRegistry::contains(std::string_view name) const {
  return entries_.find(name) != entries_.end();
}

std::vector<Converter> ConverterRegistry::resolve(std::string_view name) const {
  std::vector<Converter> out;
  resolve_into(name, out, 0);
  return out;
}

void ConverterRegistry::resolve_into(std::string_view name, std::vector<Converter>& out, int depth) const {
  if (depth > 32) throw ConfigError("converter combo nests too deeply: " + std::string(name));
  auto it = entries_.find(name);
  if (it == entries_.end()) throw ConfigError("Unknown converter: " + std::string(name));
  if (auto c = std::get_if<Converter>(&it->second)) {
    out.push_back(*c);
    return;
  }
  for (const auto& n : std::get<std::vector<std::string>>(it->second)) resolve_into(n, out, depth + 1);
}

ConverterRegistry& data_converters() {
  static ConverterRegistry reg = [] {
    ConverterRegistry r;
    r.add("integer",   Converter::field(convert_integer));
    r.add("float",     Converter::field(convert_float));
    r.add_combo("numeric", {"integer", "float"});
    r.add("date",      Converter::field(convert_date));
    r.add("date_time", Converter::field(convert_date_time));
    r.add_combo("all", {"date_time", "numeric"});
    return r;
  }();
  return reg;
}

ConverterRegistry& header_converters() {
  static ConverterRegistry reg = [] {
    ConverterRegistry r;
    r.add("downcase", Converter::field(convert_downcase));
    r.add("symbol",   Converter::field(convert_symbol));
    return r;
  }();
  return reg;
}

// ---- pipeline -------------------------------------------------------------

void ConverterPipeline::add(Converter c) {
  if (!c) throw ConfigError("empty converter");
  converters_.push_back(std::move(c));
}

void ConverterPipeline::add(const ConverterRegistry& reg, std::string_view name) {
  auto resolved = reg.resolve(name);
  converters_.insert(converters_.end(), resolved.begin(), resolved.end());
}

Field ConverterPipeline::apply_one(Field f, const FieldInfo& info) const {
  for (const auto& c : converters_) {
    f = c(f, info);
    if (!is_string(f)) break; // converted (or absent): later converters never see it
  }
  return f;
}

void ConverterPipeline::apply(Record& rec, std::uint64_t line) const {
  if (converters_.empty()) return;
  for (std::size_t i = 0; i < rec.size(); ++i) {
    rec[i] = apply_one(std::move(rec[i]), FieldInfo{i, line});
  }
}

}
