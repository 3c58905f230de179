#include "fastcsv/converters.hpp"
#include "fastcsv/csv_stream.hpp"
#include "fastcsv/errors.hpp"
#include "fastcsv/source.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using fcsv::Field;
using fcsv::Record;

static int g_fail = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++g_fail; }
}

static Field S(std::string s) { return Field(std::move(s)); }
static Field I(std::int64_t v) { return Field(v); }
static Field D(double v) { return Field(v); }

static void expect(const Field& got, const Field& want, const std::string& what) {
  check(got == want, what + ": got " + fcsv::inspect(got) + ", want " + fcsv::inspect(want));
}

static void test_integer() {
  expect(fcsv::convert_integer(S("42")), I(42), "decimal");
  expect(fcsv::convert_integer(S("-7")), I(-7), "negative");
  expect(fcsv::convert_integer(S("+3")), I(3), "explicit plus");
  expect(fcsv::convert_integer(S("0x1F")), I(31), "hex prefix");
  expect(fcsv::convert_integer(S("0b101")), I(5), "binary prefix");
  expect(fcsv::convert_integer(S("0o17")), I(15), "octal prefix");
  expect(fcsv::convert_integer(S("007")), I(7), "leading zeros stay decimal");
  expect(fcsv::convert_integer(S("-9223372036854775808")), I(std::numeric_limits<std::int64_t>::min()), "int64 min");
  expect(fcsv::convert_integer(S("9223372036854775808")), S("9223372036854775808"), "overflow left as text");
  expect(fcsv::convert_integer(S("1.5")), S("1.5"), "float text untouched");
  expect(fcsv::convert_integer(S("12abc")), S("12abc"), "trailing junk");
  expect(fcsv::convert_integer(S(" 12")), S(" 12"), "leading space");
  expect(fcsv::convert_integer(S("")), S(""), "empty string");
  expect(fcsv::convert_integer(Field{}), Field{}, "absent");
}

static void test_float() {
  expect(fcsv::convert_float(S("1.5")), D(1.5), "plain");
  expect(fcsv::convert_float(S("-2.25")), D(-2.25), "negative");
  expect(fcsv::convert_float(S("+0.5")), D(0.5), "explicit plus");
  expect(fcsv::convert_float(S(".25")), D(0.25), "leading dot");
  expect(fcsv::convert_float(S("1e3")), D(1000.0), "exponent");
  expect(fcsv::convert_float(S("3")), D(3.0), "integer text becomes a float");
  expect(fcsv::convert_float(S("inf")), S("inf"), "inf is text");
  expect(fcsv::convert_float(S("nan")), S("nan"), "nan is text");
  expect(fcsv::convert_float(S("1.5x")), S("1.5x"), "trailing junk");
  expect(fcsv::convert_float(S("-")), S("-"), "bare sign");
}

static void test_dates() {
  expect(fcsv::convert_date(S("2024-02-29")), Field(fcsv::Date{2024, 2, 29}), "leap day");
  expect(fcsv::convert_date(S("2023-02-29")), S("2023-02-29"), "not a leap year");
  expect(fcsv::convert_date(S("2024-13-01")), S("2024-13-01"), "bad month");
  expect(fcsv::convert_date(S("yesterday")), S("yesterday"), "free text");

  expect(fcsv::convert_date_time(S("1970-01-01T00:00:01Z")), Field(fcsv::DateTime{1000}), "utc");
  expect(fcsv::convert_date_time(S("1970-01-01T01:00:00+01:00")), Field(fcsv::DateTime{0}), "offset with colon");
  expect(fcsv::convert_date_time(S("1970-01-01 00:00:00.250-0000")), Field(fcsv::DateTime{250}), "space separator, millis");
  expect(fcsv::convert_date_time(S("1970-01-02")), Field(fcsv::DateTime{86400000}), "date only is midnight");
  expect(fcsv::convert_date_time(S("1970-01-01T25:00:00Z")), S("1970-01-01T25:00:00Z"), "bad hour");

  check(fcsv::to_text(fcsv::DateTime{1000}) == "1970-01-01T00:00:01+00:00", "date_time text form");
  check(fcsv::to_text(fcsv::DateTime{1500}) == "1970-01-01T00:00:01.500+00:00", "date_time text with millis");
  check(fcsv::to_text(fcsv::Date{2024, 3, 9}) == "2024-03-09", "date text form");
  check(fcsv::to_text(D(1.0)) == "1.0", "float text keeps a decimal point");
}

static void test_header_converters() {
  expect(fcsv::convert_downcase(S("ABC Def")), S("abc def"), "downcase");
  expect(fcsv::convert_symbol(S("TWO Three")), Field(fcsv::Symbol{"two_three"}), "symbol");
  expect(fcsv::convert_symbol(S("Unit Price ($)")), Field(fcsv::Symbol{"unit_price_"}), "symbol drops punctuation");
  expect(fcsv::convert_symbol(Field{}), Field{}, "absent header stays absent");
  check(fcsv::inspect(fcsv::Symbol{"id"}) == ":id", "symbol inspect form");
}

static void test_registry() {
  auto& data = fcsv::data_converters();
  for (const char* n : {"integer", "float", "numeric", "date", "date_time", "all"})
    check(data.contains(n), std::string("built-in data converter: ") + n);
  check(data.resolve("numeric").size() == 2, "numeric is integer then float");
  check(data.resolve("all").size() == 3, "all is date_time then numeric");
  check(fcsv::header_converters().contains("symbol"), "built-in header converter: symbol");

  bool threw = false;
  try { (void)data.resolve("nope"); } catch (const fcsv::ConfigError&) { threw = true; }
  check(threw, "unknown converter name throws ConfigError");

  fcsv::ConverterRegistry reg;
  reg.add_combo("a", {"b"});
  reg.add_combo("b", {"a"});
  threw = false;
  try { (void)reg.resolve("a"); } catch (const fcsv::ConfigError&) { threw = true; }
  check(threw, "combo cycle throws ConfigError");

  reg.add("twice", fcsv::Converter::field([](const Field& f) -> Field {
    if (auto i = std::get_if<std::int64_t>(&f)) return *i * 2;
    return f;
  }));
  reg.add_combo("int_twice", {"twice"});
  check(reg.resolve("int_twice").size() == 1, "custom combo resolves");
}

static void test_pipeline() {
  fcsv::ConverterPipeline pipe;
  pipe.add(fcsv::data_converters(), "numeric");
  Record rec{S("1"), S("2.5"), S("x"), Field{}, S("")};
  pipe.apply(rec, 1);
  check(rec == Record{I(1), D(2.5), S("x"), Field{}, S("")}, "numeric over a record");

  // converters after a successful one never run
  int calls = 0;
  fcsv::ConverterPipeline counted;
  counted.add(fcsv::data_converters(), "integer");
  counted.add(fcsv::Converter::field([&](const Field& f) { ++calls; return f; }));
  Record r2{S("1"), S("a"), Field{}};
  counted.apply(r2, 1);
  check(calls == 1, "only the unconverted string reaches the second converter, calls=" + std::to_string(calls));

  std::vector<fcsv::FieldInfo> seen;
  fcsv::ConverterPipeline info;
  info.add(fcsv::Converter::with_info([&](const Field& f, const fcsv::FieldInfo& fi) {
    seen.push_back(fi);
    return f;
  }));
  Record r3{S("a"), S("b"), S("c")};
  info.apply(r3, 7);
  check(seen.size() == 3 && seen[2].index == 2 && seen[2].line == 7, "FieldInfo carries index and line");

  bool threw = false;
  try { pipe.add(fcsv::Converter{}); } catch (const fcsv::ConfigError&) { threw = true; }
  check(threw, "empty converter rejected");
}

static void test_through_stream() {
  fcsv::Options opts;
  opts.headers = fcsv::HeaderSpec::first_row();
  opts.converters.emplace_back(std::string("numeric"));
  opts.header_converters.emplace_back(std::string("symbol"));
  auto rows = fcsv::parse_rows("Name,Age\nBob,42\n", opts);
  check(rows.size() == 1, "one data row");
  if (!rows.empty()) {
    expect(rows[0].field(Field(fcsv::Symbol{"age"})), I(42), "data converted, header symbolized");
    expect(rows[0].field(Field(fcsv::Symbol{"name"})), S("Bob"), "text stays text");
  }

  // data converters never touch the header row
  fcsv::Options ret = opts;
  ret.header_converters.clear();
  ret.return_headers = true;
  fcsv::StringSource src("10,20\n1,2\n");
  fcsv::CsvStream csv(src, ret);
  auto header = csv.shift();
  check(header && *header == Record{S("10"), S("20")}, "numeric-looking headers stay text");
  auto data = csv.shift();
  check(data && *data == Record{I(1), I(2)}, "data row converted");

  fcsv::Options failing;
  failing.converters.emplace_back(fcsv::Converter::field([](const Field&) -> Field {
    throw std::runtime_error("converter blew up");
  }));
  bool threw = false;
  try { (void)fcsv::parse("a\n", failing); } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "converter blew up";
  }
  check(threw, "converter exceptions propagate unchanged");

  fcsv::Options unknown;
  unknown.converters.emplace_back(std::string("no_such"));
  threw = false;
  try { (void)fcsv::parse("a\n", unknown); } catch (const fcsv::ConfigError&) { threw = true; }
  check(threw, "unknown converter name in options throws ConfigError");

  // late installation
  fcsv::StringSource late_src("1,x\n2,y\n");
  fcsv::CsvStream late(late_src);
  auto first = late.shift();
  late.convert("integer");
  auto second = late.shift();
  check(first && *first == Record{S("1"), S("x")}, "before convert()");
  check(second && *second == Record{I(2), S("y")}, "after convert()");
}

int main(){
  test_integer();
  test_float();
  test_dates();
  test_header_converters();
  test_registry();
  test_pipeline();
  test_through_stream();

  if (g_fail) { std::cerr << "[FAIL] converters: " << g_fail << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] converters\n";
  return 0;
}
