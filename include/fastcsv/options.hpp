#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "fastcsv/converters.hpp"
#include "fastcsv/separator.hpp"

namespace fcsv {

// How a stream finds its column names.
struct HeaderSpec {
  enum class Mode {
    None,     // no header handling
    FirstRow, // first record is the header row
    Names,    // `names` used as given, nothing consumed
    Line      // `line` split by col_sep at construction, nothing consumed
  };

  Mode mode = Mode::None;
  std::vector<std::string> names;
  std::string line;

  static HeaderSpec none() { return {}; }
  static HeaderSpec first_row() { HeaderSpec h; h.mode = Mode::FirstRow; return h; }
  static HeaderSpec of(std::vector<std::string> names) {
    HeaderSpec h; h.mode = Mode::Names; h.names = std::move(names); return h;
  }
  static HeaderSpec from_line(std::string line) {
    HeaderSpec h; h.mode = Mode::Line; h.line = std::move(line); return h;
  }

  bool active() const noexcept { return mode != Mode::None; }
};

// A converter given by registry name or directly.
using ConverterRef = std::variant<std::string, Converter>;

struct Options {
  std::string col_sep = ",";
  RowSep row_sep = RowSep::automatic();
  std::vector<ConverterRef> converters;
  HeaderSpec headers;
  bool return_headers = false;
  std::vector<ConverterRef> header_converters;
  bool skip_blanks = false;
};

// Value of one loosely-typed option (command line, JSON file).
using OptionValue = std::variant<bool, std::string, std::vector<std::string>>;
using OptionList  = std::vector<std::pair<std::string, OptionValue>>;

// Checks separators; throws ConfigError. Converter names are checked when a
// stream resolves them.
void validate(const Options& opts);

// Apply one keyed option. Unknown keys and ill-typed values throw ConfigError.
void set_option(Options& opts, std::string_view key, const OptionValue& value);

// Defaults overlaid with `kv`, in order.
Options options_from_pairs(const OptionList& kv);

// `{"col_sep": ";", "headers": true, "converters": ["numeric"], ...}`
OptionList option_list_from_json(std::string_view json);
Options options_from_json(std::string_view json);
Options options_from_json_file(const std::string& path);

// Filter option routing: "in_x"/"input_x" only reach the input side,
// "out_x"/"output_x" only the output side, everything else both.
struct SplitOptions {
  OptionList input;
  OptionList output;
};
SplitOptions split_filter_options(const OptionList& kv);

// Lenient boolean text: true/false, 1/0, yes/no, on/off (any case).
std::optional<bool> parse_bool_token(std::string_view s);

}
