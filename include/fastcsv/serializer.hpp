#pragma once
#include <string>
#include <string_view>

#include "fastcsv/field.hpp"

namespace fcsv {

// One field as written: absent -> empty and unquoted; text that is empty or
// holds the column separator, a quote, CR or LF -> quoted with "" escapes.
std::string render_field(const Field& f, std::string_view col_sep);

// Fields joined by `col_sep`, terminated by `row_sep`.
std::string render_record(const Record& rec, std::string_view col_sep, std::string_view row_sep);

// Appending form of render_record, for callers reusing a buffer.
void render_record_into(std::string& out, const Record& rec,
                        std::string_view col_sep, std::string_view row_sep);

}
