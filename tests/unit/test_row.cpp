#include "fastcsv/csv_stream.hpp"
#include "fastcsv/row.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using fcsv::Field;
using fcsv::Record;
using fcsv::Row;

static int g_fail = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++g_fail; }
}

static Field S(std::string s) { return Field(std::move(s)); }
static Field I(std::int64_t v) { return Field(v); }
static const Field nil{};

// Duplicate "A" headers and one more header than fields.
static Row sample() {
  return Row({S("A"), S("B"), S("C"), S("A"), S("A")}, {I(1), I(2), I(3), I(4)});
}

static void test_lookup() {
  Row row = sample();
  check(row.size() == 5, "row padded to the longer side");
  check(row.headers() == Record{S("A"), S("B"), S("C"), S("A"), S("A")}, "headers in order");

  check(row.field("A") == I(1), "first A");
  check(row.field("A", 1) == I(4), "A at or after 1");
  check(row.field("A", 4) == nil, "last A has no field");
  check(row.field("B") == I(2), "by header");
  check(row.field(2) == I(3), "by position");
  check(row.field(10) == nil, "position out of range");
  check(row.field(-1) == nil, "negative position");
  check(row.field("Z") == nil, "missing header");
  check(row.field(2, 1) == I(3) && row.field(0, 4) == I(1), "minimum index ignored by position");
  check(row.field(std::size_t(3), 0) == I(4), "unsigned position with minimum index");
  check(row.field(-1, 0) == nil, "negative position with minimum index");
}

static void test_fields() {
  Row row = sample();
  check(row.fields() == Record{I(1), I(2), I(3), I(4), nil}, "all fields");
  check(row.fields({"B", "C", Row::Selector("A", 3)}) == Record{I(2), I(3), I(4)}, "selectors with minimum index");
  check(row.fields({0, 2}) == Record{I(1), I(3)}, "positional selectors");
  check(row.fields({}) == row.fields(), "no selectors means all fields");
  check(row.fields({-1, 1}) == Record{nil, I(2)}, "negative selector is out of range, like field(-1)");
  check(row.fields({Row::Selector(std::size_t(99))}) == Record{nil}, "selector past the end");
}

static void test_index_and_presence() {
  Row row = sample();
  check(row.index("A") == std::optional<std::size_t>(0), "index of first A");
  check(row.index("A", 1) == std::optional<std::size_t>(3), "index of second A");
  check(row.index("A", 4) == std::optional<std::size_t>(4), "index of third A");
  check(!row.index("A", 5), "no A past the end");
  check(!row.index("Z"), "missing header has no index");

  check(row.header_present("A") && !row.header_present("Z"), "header_present");
  check(row.field_present(I(3)), "field_present value");
  check(row.field_present(nil), "padded position counts as an absent field");
  check(!row.field_present(I(9)), "field_present missing value");
}

static void test_hash_and_iteration() {
  Row row = sample();
  auto h = row.to_hash();
  check(h.size() == 3, "duplicate headers collapse");
  check(h[S("A")] == nil && h[S("B")] == I(2) && h[S("C")] == I(3), "later duplicates overwrite earlier ones");

  int a_count = 0;
  std::int64_t sum = 0;
  for (const auto& [header, field] : row) {
    if (header == S("A")) ++a_count;
    if (auto v = std::get_if<std::int64_t>(&field)) sum += *v;
  }
  check(a_count == 3, "three A pairs");
  check(sum == 10, "sum over fields");
  check(row.to_a().size() == 5, "to_a pairs");
}

static void test_kinds_and_padding() {
  Row short_headers({S("A")}, {I(1), I(2)});
  check(short_headers.headers() == Record{S("A"), nil}, "missing headers are absent");
  check(short_headers.field(1) == I(2), "field past the headers");

  Row header({S("x")}, {S("x")}, Row::Kind::Header);
  check(header.header_row() && !header.field_row(), "header kind");
  check(sample().field_row(), "field kind by default");

  fcsv::Options opts;
  opts.headers = fcsv::HeaderSpec::first_row();
  opts.return_headers = true;
  auto rows = fcsv::parse_rows("a,b\n1,2\n", opts);
  check(rows.size() == 2 && rows[0].header_row() && rows[1].field_row(), "kinds from a stream");
  if (rows.size() == 2) check(rows[1].field("b") == S("2"), "stream row by header");

  auto plain = fcsv::parse_rows("1,2\n");
  check(plain.size() == 1 && plain[0].headers() == Record{nil, nil}, "without headers every header is absent");
}

int main(){
  test_lookup();
  test_fields();
  test_index_and_presence();
  test_hash_and_iteration();
  test_kinds_and_padding();

  if (g_fail) { std::cerr << "[FAIL] row: " << g_fail << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] row\n";
  return 0;
}
