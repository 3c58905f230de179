#include "fastcsv/separator.hpp"
#include "fastcsv/source.hpp"

namespace fcsv {

std::string discover_row_sep(std::string_view sample) {
  std::size_t pos = sample.find_first_of("\r\n");
  if (pos == std::string_view::npos) return std::string(kDefaultRowSep);
  if (sample[pos] == '\n') return "\n";
  if (pos + 1 < sample.size() && sample[pos + 1] == '\n') return "\r\n";
  return "\r";
}

std::string resolve_row_sep(const RowSep& req, Source& src) {
  if (!req.is_auto()) return *req.literal;

  const std::uint64_t saved = src.tell();
  std::string found;
  while (found.empty()) {
    // out of data: probably a single line, use the default
    if (src.eof()) { found = std::string(kDefaultRowSep); break; }

    std::string sample = src.read(kDiscoverySampleBytes);
    // never split a "\r\n" across two samples
    if (!sample.empty() && sample.back() == '\r' && !src.eof()) sample += src.read(1);

    std::size_t pos = sample.find_first_of("\r\n");
    if (pos != std::string::npos) found = discover_row_sep(sample.substr(pos));
  }
  src.seek(saved);
  return found;
}

}
