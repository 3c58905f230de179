#pragma once
#include <string>

#include "fastcsv/field.hpp"
#include "fastcsv/row.hpp"

namespace fcsv {

// JSON Lines rendering of parsed data, one value per line (no trailing '\n').
class JsonlWriter {
public:
  // {"header": value, ...} in column order. A column without a header is
  // keyed by its zero-based position. Repeats of a key get "#2", "#3", ...
  // appended so every column survives in the object.
  static std::string row_to_json(const Row& row);

  // [value, ...]
  static std::string record_to_json(const Record& rec);

  // absent -> null, integers/floats -> numbers, everything else -> string.
  static std::string field_to_json(const Field& f);
};

}
