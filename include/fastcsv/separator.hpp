#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fcsv {

class Source;

// Line terminator used when auto-discovery finds none.
inline constexpr std::string_view kDefaultRowSep = "\n";

// Read-ahead size for row separator discovery.
inline constexpr std::size_t kDiscoverySampleBytes = 1024;

// Requested row separator: a literal, or auto-discovery.
struct RowSep {
  std::optional<std::string> literal; // nullopt -> auto

  static RowSep automatic() { return RowSep{}; }
  static RowSep of(std::string s) { return RowSep{std::move(s)}; }
  bool is_auto() const noexcept { return !literal.has_value(); }
};

// Literal row separator for `req`. For auto, samples `src` for the first
// "\r\n", "\n" or "\r" (anywhere, quoted or not) and restores its position.
std::string resolve_row_sep(const RowSep& req, Source& src);

// The same discovery over a string already in memory.
std::string discover_row_sep(std::string_view sample);

}
