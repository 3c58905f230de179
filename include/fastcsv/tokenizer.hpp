#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "fastcsv/field.hpp"

namespace fcsv {

class Source;

struct TokenizerConfig {
  std::string col_sep = ",";
  std::string row_sep = "\n";   // already resolved, never "auto"
  char        quote   = '"';
};

// Pulls physical lines from a Source and assembles one logical record per
// call, joining lines while a quoted field is still open.
class RecordTokenizer {
public:
  enum class Status { Ok, End, Error };
  enum class Split  { Complete, Incomplete, Malformed };

  RecordTokenizer(const TokenizerConfig& cfg, Source& src);
  ~RecordTokenizer();

  RecordTokenizer(const RecordTokenizer&) = delete;
  RecordTokenizer& operator=(const RecordTokenizer&) = delete;

  // Ok: `out` holds the record (empty for a blank line). End: no data left.
  // Error: malformed input, see error().
  Status next(Record& out);

  // Tokenize one working buffer (row separator already stripped).
  // Incomplete means a quoted field is still open at the end of `text`.
  Split split(std::string_view text, Record& out, std::string* err) const;

  const std::string& error() const { return err_; }
  std::uint64_t records() const { return records_; }
  void reset_count() noexcept { records_ = 0; }
  const TokenizerConfig& config() const;

private:
  struct Impl; Impl* p_;
  std::uint64_t records_{0};
  std::string err_;
};

}
