#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fastcsv/converters.hpp"
#include "fastcsv/field.hpp"
#include "fastcsv/options.hpp"
#include "fastcsv/row.hpp"

namespace fcsv {

class Source;
class Sink;

// Record-at-a-time reader/writer over a Source and/or Sink.
//
// Separators are fixed at construction (row_sep "auto" is resolved by peeking
// at the source). Reads yield one logical record per call; with headers
// active they yield Rows, the header row itself only when return_headers is
// set. Malformed input throws MalformedCsvError, bad options ConfigError.
class CsvStream {
public:
  using RowCallback = std::function<void(const Row&)>;

  explicit CsvStream(Source& in, const Options& opts = {});
  explicit CsvStream(Sink& out, const Options& opts = {});
  CsvStream(Source& in, Sink& out, const Options& opts = {});
  ~CsvStream();

  CsvStream(const CsvStream&) = delete;
  CsvStream& operator=(const CsvStream&) = delete;

  // Next record's fields (the header row's values count as a record when
  // returned), nullopt at end of data.
  std::optional<Record> shift();
  // Next record as a Row; without headers every header is absent.
  std::optional<Row> shift_row();

  // Remaining records.
  std::vector<Record> read();
  std::vector<Row> read_rows();
  void each(const RowCallback& fn);

  // Render `fields` onto the sink. Throws SourceError when not writable.
  CsvStream& append(const Record& fields);
  CsvStream& append(const Row& row);
  CsvStream& operator<<(const Record& fields) { return append(fields); }

  // Late converter installation, appended after the configured ones.
  void convert(std::string_view name);
  void convert(Converter c);
  void header_convert(std::string_view name);
  void header_convert(Converter c);

  // Back to the start of the source; header detection starts over.
  void rewind();

  // Headers in effect, nullopt until known (first_row before the first read).
  std::optional<std::vector<Field>> headers() const;

  const std::string& col_sep() const noexcept;
  const std::string& row_sep() const noexcept;
  std::uint64_t lineno() const noexcept;   // logical records read so far
  bool readable() const noexcept;
  bool writable() const noexcept;

private:
  struct Impl; Impl* p_;
};

// ---- one-shot helpers -------------------------------------------------------

// All records of `text`.
std::vector<Record> parse(std::string text, const Options& opts = {});
std::vector<Row> parse_rows(std::string text, const Options& opts = {});

// First record of `text`; anything after it is ignored.
std::optional<Record> parse_line(std::string text, const Options& opts = {});

// One rendered record, row separator included.
std::string generate_line(const Record& fields, const Options& opts = {});

// Text produced by appending to a write-only stream inside `fn`.
std::string generate(const std::function<void(CsvStream&)>& fn, const Options& opts = {});

// File helpers.
void foreach(const std::string& path, const Options& opts, const CsvStream::RowCallback& fn);
std::vector<Record> read_file(const std::string& path, const Options& opts = {});

}
