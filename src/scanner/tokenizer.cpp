#include "fastcsv/tokenizer.hpp"
#include "fastcsv/source.hpp"
#include <string_view>
#include <utility>

namespace fcsv {

static bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Quoted field left open at the end of the text seen so far. The fields
// before it stay in the caller's record; `val` holds the field's text up to
// `p`, the offset the next scan resumes from.
struct OpenQuote {
  bool open{false};
  std::string val;
  std::size_t p{0};
};

struct RecordTokenizer::Impl {
  TokenizerConfig cfg;
  Source& src;
  std::string buf; // accumulated physical lines of the current record
  OpenQuote pending;

  // `resume`, when given, carries an open quoted field between calls on a
  // growing text that keeps its earlier bytes as a prefix.
  RecordTokenizer::Split split(std::string_view text, Record& out, std::string* err,
                               OpenQuote* resume = nullptr) const {
    const std::string& sep = cfg.col_sep;
    const char quote = cfg.quote;
    const std::size_t n = text.size();

    enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;
    std::string val;
    std::size_t start = 0;
    std::size_t p = 0;

    if (resume && resume->open) {
      val = std::move(resume->val);
      p = resume->p;
      resume->open = false;
      mode = Mode::Quoted;
    } else {
      out.clear();
      if (text.empty()) return Split::Complete;
    }

    while (true) {
      switch (mode) {
        case Mode::FieldStart:
          if (p == n) { out.emplace_back(); return Split::Complete; } // separator ended the text
          if (text[p] == quote) { val.clear(); ++p; mode = Mode::Quoted; }
          else { start = p; mode = Mode::Unquoted; }
          break;

        case Mode::Unquoted: {
          std::size_t e = (sep.size() == 1) ? text.find(sep[0], start) : text.find(sep, start);
          if (e == std::string_view::npos) e = n;
          std::string_view raw = text.substr(start, e - start);
          if (raw.find(quote) != std::string_view::npos) {
            if (err) *err = "Illegal quoting in unquoted field";
            return Split::Malformed;
          }
          if (raw.find_first_of("\r\n") != std::string_view::npos) {
            if (err) *err = "Unquoted fields do not allow \\r or \\n";
            return Split::Malformed;
          }
          if (raw.empty()) out.emplace_back();               // absent, not ""
          else out.emplace_back(std::string(raw));
          if (e == n) return Split::Complete;
          p = e + sep.size();
          mode = Mode::FieldStart;
          break;
        }

        case Mode::Quoted: {
          std::size_t q = text.find(quote, p);
          if (q == std::string_view::npos) {
            // may close on a later line
            if (resume) {
              val.append(text.data() + p, n - p);
              resume->open = true;
              resume->val = std::move(val);
              resume->p = n;
            }
            return Split::Incomplete;
          }
          val.append(text.data() + p, q - p);
          p = q + 1;
          mode = Mode::QuoteEscape;
          break;
        }

        case Mode::QuoteEscape:
          if (p == n) { out.emplace_back(std::move(val)); return Split::Complete; }
          if (text[p] == quote) {
            val.push_back(quote);                            // escaped quote
            ++p;
            mode = Mode::Quoted;
          } else if (text.compare(p, sep.size(), sep) == 0) {
            out.emplace_back(std::move(val));
            val = std::string();
            p += sep.size();
            mode = Mode::FieldStart;
          } else {
            if (err) *err = "Illegal quoting: unescaped quote inside quoted field";
            return Split::Malformed;
          }
          break;
      }
    }
  }
};

RecordTokenizer::RecordTokenizer(const TokenizerConfig& cfg, Source& src)
  : p_(new Impl{cfg, src, {}}) {}

RecordTokenizer::~RecordTokenizer() { delete p_; }

const TokenizerConfig& RecordTokenizer::config() const { return p_->cfg; }

RecordTokenizer::Split RecordTokenizer::split(std::string_view text, Record& out, std::string* err) const {
  return p_->split(text, out, err);
}

RecordTokenizer::Status RecordTokenizer::next(Record& out) {
  std::string& buf = p_->buf;
  const std::string& row_sep = p_->cfg.row_sep;

  OpenQuote& pending = p_->pending;

  buf.clear();
  out.clear();
  pending = OpenQuote{};
  if (!p_->src.gets(row_sep, buf)) return Status::End;

  while (true) {
    // strip exactly one trailing row separator from a view, buf stays intact;
    // a stripped separator inside an open quote is rescanned as field text
    std::string_view work(buf);
    if (ends_with(work, row_sep)) work.remove_suffix(row_sep.size());

    switch (p_->split(work, out, &err_, &pending)) {
      case Split::Complete:
        ++records_;
        return Status::Ok;
      case Split::Malformed:
        ++records_;
        out.clear();
        return Status::Error;
      case Split::Incomplete:
        if (!p_->src.gets(row_sep, buf)) {
          ++records_;
          out.clear();
          pending = OpenQuote{};
          err_ = "Unclosed quoted field";
          return Status::Error;
        }
        break;
    }
  }
}

}
