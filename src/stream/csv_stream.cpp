#include "fastcsv/csv_stream.hpp"
#include "fastcsv/errors.hpp"
#include "fastcsv/file_source.hpp"
#include "fastcsv/separator.hpp"
#include "fastcsv/serializer.hpp"
#include "fastcsv/source.hpp"
#include "fastcsv/tokenizer.hpp"
#include <optional>
#include <utility>

namespace fcsv {

static void load_pipeline(ConverterPipeline& pipe, const ConverterRegistry& reg,
                          const std::vector<ConverterRef>& refs) {
  for (const auto& ref : refs) {
    if (auto name = std::get_if<std::string>(&ref)) pipe.add(reg, *name);
    else pipe.add(std::get<Converter>(ref));
  }
}

struct CsvStream::Impl {
  Source* in{nullptr};
  Sink* out{nullptr};
  Options opts;
  std::string col_sep;
  std::string row_sep;
  std::optional<RecordTokenizer> tok;
  ConverterPipeline converters;
  ConverterPipeline header_converters;

  std::vector<Field> headers;
  bool headers_ready{false};
  bool header_returned{false};
  std::string wbuf;

  Impl(Source* i, Sink* o, const Options& op) : in(i), out(o), opts(op) {
    validate(opts);
    col_sep = opts.col_sep;
    row_sep = in ? resolve_row_sep(opts.row_sep, *in)
                 : opts.row_sep.literal.value_or(std::string(kDefaultRowSep));
    if (in) tok.emplace(TokenizerConfig{col_sep, row_sep, '"'}, *in);

    load_pipeline(converters, data_converters(), opts.converters);
    load_pipeline(header_converters, fcsv::header_converters(), opts.header_converters);
    init_headers();
  }

  void init_headers() {
    headers.clear();
    headers_ready = false;
    header_returned = false;
    switch (opts.headers.mode) {
      case HeaderSpec::Mode::None:
      case HeaderSpec::Mode::FirstRow:
        return;
      case HeaderSpec::Mode::Names:
        for (const auto& n : opts.headers.names) headers.emplace_back(n);
        break;
      case HeaderSpec::Mode::Line: {
        StringSource src(opts.headers.line);
        RecordTokenizer t(TokenizerConfig{col_sep, row_sep, '"'}, src);
        if (t.next(headers) == RecordTokenizer::Status::Error)
          throw ConfigError("headers: " + t.error());
        break;
      }
    }
    header_converters.apply(headers, 0);
    headers_ready = true;
  }

  std::uint64_t lineno() const { return tok ? tok->records() : 0; }

  // One raw record from the tokenizer, false at end of data.
  bool tokenize(Record& rec) {
    if (!tok) throw SourceError("stream is not readable");
    switch (tok->next(rec)) {
      case RecordTokenizer::Status::Ok:    return true;
      case RecordTokenizer::Status::End:   return false;
      case RecordTokenizer::Status::Error: break;
    }
    throw MalformedCsvError(tok->error(), tok->records());
  }

  bool next(Record& rec, Row::Kind& kind) {
    if (opts.return_headers && headers_ready && !header_returned) {
      // headers given up front are handed out before the first data row
      header_returned = true;
      rec = headers;
      kind = Row::Kind::Header;
      return true;
    }

    if (opts.headers.mode == HeaderSpec::Mode::FirstRow && !headers_ready) {
      do {
        if (!tokenize(headers)) return false;
      } while (opts.skip_blanks && headers.empty());
      header_converters.apply(headers, lineno());
      headers_ready = true;
      if (opts.return_headers) {
        header_returned = true;
        rec = headers;
        kind = Row::Kind::Header;
        return true;
      }
    }

    do {
      if (!tokenize(rec)) return false;
    } while (opts.skip_blanks && rec.empty());

    converters.apply(rec, lineno());
    kind = Row::Kind::Field;
    return true;
  }
};

CsvStream::CsvStream(Source& in, const Options& opts)
  : p_(new Impl(&in, nullptr, opts)) {}

CsvStream::CsvStream(Sink& out, const Options& opts)
  : p_(new Impl(nullptr, &out, opts)) {}

CsvStream::CsvStream(Source& in, Sink& out, const Options& opts)
  : p_(new Impl(&in, &out, opts)) {}

CsvStream::~CsvStream() { delete p_; }

std::optional<Record> CsvStream::shift() {
  Record rec;
  Row::Kind kind;
  if (!p_->next(rec, kind)) return std::nullopt;
  return rec;
}

std::optional<Row> CsvStream::shift_row() {
  Record rec;
  Row::Kind kind;
  if (!p_->next(rec, kind)) return std::nullopt;
  static const std::vector<Field> no_headers;
  return Row(p_->opts.headers.active() ? p_->headers : no_headers, rec, kind);
}

std::vector<Record> CsvStream::read() {
  std::vector<Record> out;
  while (auto rec = shift()) out.push_back(std::move(*rec));
  return out;
}

std::vector<Row> CsvStream::read_rows() {
  std::vector<Row> out;
  while (auto row = shift_row()) out.push_back(std::move(*row));
  return out;
}

void CsvStream::each(const RowCallback& fn) {
  while (auto row = shift_row()) fn(*row);
}

CsvStream& CsvStream::append(const Record& fields) {
  if (!p_->out) throw SourceError("stream is not writable");
  p_->wbuf.clear();
  render_record_into(p_->wbuf, fields, p_->col_sep, p_->row_sep);
  p_->out->write(p_->wbuf);
  return *this;
}

CsvStream& CsvStream::append(const Row& row) { return append(row.fields()); }

void CsvStream::convert(std::string_view name) { p_->converters.add(data_converters(), name); }
void CsvStream::convert(Converter c) { p_->converters.add(std::move(c)); }
void CsvStream::header_convert(std::string_view name) { p_->header_converters.add(fcsv::header_converters(), name); }
void CsvStream::header_convert(Converter c) { p_->header_converters.add(std::move(c)); }

void CsvStream::rewind() {
  if (!p_->in) throw SourceError("stream is not readable");
  p_->in->seek(0);
  p_->tok->reset_count();
  if (p_->opts.headers.mode == HeaderSpec::Mode::FirstRow) {
    p_->headers.clear();
    p_->headers_ready = false;
  }
  p_->header_returned = false;
}

std::optional<std::vector<Field>> CsvStream::headers() const {
  if (!p_->opts.headers.active() || !p_->headers_ready) return std::nullopt;
  return p_->headers;
}

const std::string& CsvStream::col_sep() const noexcept { return p_->col_sep; }
const std::string& CsvStream::row_sep() const noexcept { return p_->row_sep; }
std::uint64_t CsvStream::lineno() const noexcept { return p_->lineno(); }
bool CsvStream::readable() const noexcept { return p_->in != nullptr; }
bool CsvStream::writable() const noexcept { return p_->out != nullptr; }

// ---- one-shot helpers -------------------------------------------------------

std::vector<Record> parse(std::string text, const Options& opts) {
  StringSource src(std::move(text));
  CsvStream csv(src, opts);
  return csv.read();
}

std::vector<Row> parse_rows(std::string text, const Options& opts) {
  StringSource src(std::move(text));
  CsvStream csv(src, opts);
  return csv.read_rows();
}

std::optional<Record> parse_line(std::string text, const Options& opts) {
  StringSource src(std::move(text));
  CsvStream csv(src, opts);
  return csv.shift();
}

std::string generate_line(const Record& fields, const Options& opts) {
  StringSink sink;
  CsvStream csv(sink, opts);
  csv << fields;
  return sink.take();
}

std::string generate(const std::function<void(CsvStream&)>& fn, const Options& opts) {
  StringSink sink;
  {
    CsvStream csv(sink, opts);
    fn(csv);
  }
  return sink.take();
}

void foreach(const std::string& path, const Options& opts, const CsvStream::RowCallback& fn) {
  FileSource src(path);
  CsvStream csv(src, opts);
  csv.each(fn);
}

std::vector<Record> read_file(const std::string& path, const Options& opts) {
  FileSource src(path);
  CsvStream csv(src, opts);
  return csv.read();
}

}
