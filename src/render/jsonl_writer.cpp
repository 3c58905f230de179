#include "fastcsv/jsonl_writer.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <map>
#include <sstream>

namespace fcsv {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static void put(std::ostringstream& o, const Field& f) {
  if (is_nil(f)) { o << "null"; return; }
  if (auto i = std::get_if<std::int64_t>(&f)) { o << *i; return; }
  if (auto d = std::get_if<double>(&f)) {
    if (std::isfinite(*d)) o << to_text(f);
    else o << "null";
    return;
  }
  esc(o, to_text(f));
}

std::string JsonlWriter::field_to_json(const Field& f) {
  std::ostringstream o;
  put(o, f);
  return o.str();
}

std::string JsonlWriter::record_to_json(const Record& rec) {
  std::ostringstream o;
  o << "[";
  for (size_t i=0;i<rec.size();++i){
    if (i) o << ",";
    put(o, rec[i]);
  }
  o << "]";
  return o.str();
}

std::string JsonlWriter::row_to_json(const Row& row) {
  std::ostringstream o;
  std::map<std::string, int> seen;
  o << "{";
  size_t i = 0;
  for (const auto& [header, field] : row) {
    if (i) o << ",";
    std::string key = is_nil(header) ? std::to_string(i) : to_text(header);
    const int n = ++seen[key];
    if (n > 1) key += "#" + std::to_string(n);
    esc(o, key);
    o << ":";
    put(o, field);
    ++i;
  }
  o << "}";
  return o.str();
}

}
