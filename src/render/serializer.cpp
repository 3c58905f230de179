#include "fastcsv/serializer.hpp"

namespace fcsv {

static bool needs_quotes(std::string_view text, std::string_view col_sep) {
  if (text.empty()) return true; // "" must not read back as absent
  if (text.find_first_of("\"\r\n") != std::string_view::npos) return true;
  if (col_sep.size() == 1) return text.find(col_sep[0]) != std::string_view::npos;
  // multi-char separators: a partial match at the field edge would merge
  // with the real separator on reading, so any separator char forces quotes
  return text.find_first_of(col_sep) != std::string_view::npos;
}

static void append_field(std::string& out, const Field& f, std::string_view col_sep) {
  if (is_nil(f)) return;
  const std::string text = to_text(f);
  if (!needs_quotes(text, col_sep)) { out += text; return; }
  out.push_back('"');
  for (char c : text) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
}

std::string render_field(const Field& f, std::string_view col_sep) {
  std::string out;
  append_field(out, f, col_sep);
  return out;
}

void render_record_into(std::string& out, const Record& rec,
                        std::string_view col_sep, std::string_view row_sep) {
  for (std::size_t i = 0; i < rec.size(); ++i) {
    if (i) out.append(col_sep);
    append_field(out, rec[i], col_sep);
  }
  out.append(row_sep);
}

std::string render_record(const Record& rec, std::string_view col_sep, std::string_view row_sep) {
  std::string out;
  render_record_into(out, rec, col_sep, row_sep);
  return out;
}

}
