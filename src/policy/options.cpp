#include "fastcsv/options.hpp"
#include "fastcsv/errors.hpp"
#include <cctype>
#include <string_view>
#include <simdjson.h>

namespace fcsv {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<bool> parse_bool_token(std::string_view s) {
  static constexpr std::string_view true_tokens[]  = {"true", "1", "yes", "on"};
  static constexpr std::string_view false_tokens[] = {"false", "0", "no", "off"};
  for (auto t : true_tokens)  if (ieq(s, t)) return true;
  for (auto f : false_tokens) if (ieq(s, f)) return false;
  return std::nullopt;
}

static bool as_bool(std::string_view key, const OptionValue& v) {
  if (auto b = std::get_if<bool>(&v)) return *b;
  if (auto s = std::get_if<std::string>(&v)) {
    if (auto b = parse_bool_token(*s)) return *b;
  }
  throw ConfigError("option '" + std::string(key) + "' expects a boolean");
}

static std::string as_string(std::string_view key, const OptionValue& v) {
  if (auto s = std::get_if<std::string>(&v)) return *s;
  throw ConfigError("option '" + std::string(key) + "' expects a string");
}

static std::vector<ConverterRef> as_converters(std::string_view key, const OptionValue& v) {
  std::vector<ConverterRef> out;
  if (auto s = std::get_if<std::string>(&v)) {
    if (!s->empty()) out.emplace_back(*s);
    return out;
  }
  if (auto names = std::get_if<std::vector<std::string>>(&v)) {
    for (const auto& n : *names) out.emplace_back(n);
    return out;
  }
  if (std::get<bool>(v) == false) return out;
  throw ConfigError("option '" + std::string(key) + "' expects converter names");
}

static HeaderSpec as_headers(const OptionValue& v) {
  if (auto b = std::get_if<bool>(&v)) return *b ? HeaderSpec::first_row() : HeaderSpec::none();
  if (auto names = std::get_if<std::vector<std::string>>(&v)) return HeaderSpec::of(*names);
  const std::string& s = std::get<std::string>(v);
  if (s == "first_row" || ieq(s, "true")) return HeaderSpec::first_row();
  if (ieq(s, "false")) return HeaderSpec::none();
  return HeaderSpec::from_line(s);
}

void set_option(Options& opts, std::string_view key, const OptionValue& value) {
  if (key == "col_sep") {
    opts.col_sep = as_string(key, value);
  } else if (key == "row_sep") {
    std::string s = as_string(key, value);
    opts.row_sep = (s == "auto") ? RowSep::automatic() : RowSep::of(std::move(s));
  } else if (key == "converters") {
    opts.converters = as_converters(key, value);
  } else if (key == "headers") {
    opts.headers = as_headers(value);
  } else if (key == "return_headers") {
    opts.return_headers = as_bool(key, value);
  } else if (key == "header_converters") {
    opts.header_converters = as_converters(key, value);
  } else if (key == "skip_blanks") {
    opts.skip_blanks = as_bool(key, value);
  } else {
    throw ConfigError("Unknown options: " + std::string(key));
  }
}

void validate(const Options& opts) {
  if (opts.col_sep.empty()) throw ConfigError("col_sep must not be empty");
  if (opts.col_sep.find('"') != std::string::npos) throw ConfigError("col_sep must not contain a quote");
  if (opts.row_sep.literal) {
    if (opts.row_sep.literal->empty()) throw ConfigError("row_sep must not be empty");
    if (opts.row_sep.literal->find('"') != std::string::npos) throw ConfigError("row_sep must not contain a quote");
    if (*opts.row_sep.literal == opts.col_sep) throw ConfigError("row_sep and col_sep must differ");
  }
}

Options options_from_pairs(const OptionList& kv) {
  static constexpr std::string_view known[] = {
    "col_sep", "row_sep", "converters", "headers",
    "return_headers", "header_converters", "skip_blanks"};

  // report every unknown key at once, before touching anything
  std::string unknown;
  for (const auto& kv_pair : kv) {
    bool ok = false;
    for (auto k : known) if (kv_pair.first == k) { ok = true; break; }
    if (!ok) unknown += unknown.empty() ? kv_pair.first : ", " + kv_pair.first;
  }
  if (!unknown.empty()) throw ConfigError("Unknown options: " + unknown);

  Options opts;
  for (const auto& [key, value] : kv) set_option(opts, key, value);
  validate(opts);
  return opts;
}

OptionList option_list_from_json(std::string_view json) {
  OptionList out;
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    auto doc = parser.iterate(padded);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key()));
      simdjson::ondemand::value v = field.value();
      switch (v.type().value()) {
        case simdjson::ondemand::json_type::boolean:
          out.emplace_back(key, bool(v.get_bool()));
          break;
        case simdjson::ondemand::json_type::null:
          out.emplace_back(key, false);
          break;
        case simdjson::ondemand::json_type::string:
          out.emplace_back(key, std::string(std::string_view(v.get_string())));
          break;
        case simdjson::ondemand::json_type::array: {
          std::vector<std::string> items;
          for (auto el : v.get_array()) items.emplace_back(std::string_view(el.get_string()));
          out.emplace_back(key, std::move(items));
          break;
        }
        default:
          throw ConfigError("option '" + key + "': expected boolean, string or array of strings");
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    throw ConfigError(std::string("invalid options JSON: ") + e.what());
  }
  return out;
}

Options options_from_json(std::string_view json) {
  return options_from_pairs(option_list_from_json(json));
}

Options options_from_json_file(const std::string& path) {
  simdjson::padded_string json;
  auto err = simdjson::padded_string::load(path).get(json);
  if (err) throw SourceError("cannot read options file '" + path + "': " + simdjson::error_message(err));
  return options_from_json(std::string_view(json.data(), json.size()));
}

SplitOptions split_filter_options(const OptionList& kv) {
  SplitOptions out;
  auto strip = [](const std::string& key, std::string_view pfx, std::string* rest) {
    if (key.size() > pfx.size() && key.compare(0, pfx.size(), pfx) == 0) {
      *rest = key.substr(pfx.size());
      return true;
    }
    return false;
  };
  for (const auto& [key, value] : kv) {
    std::string rest;
    if (strip(key, "input_", &rest) || strip(key, "in_", &rest)) {
      out.input.emplace_back(rest, value);
    } else if (strip(key, "output_", &rest) || strip(key, "out_", &rest)) {
      out.output.emplace_back(rest, value);
    } else {
      out.input.emplace_back(key, value);
      out.output.emplace_back(key, value);
    }
  }
  return out;
}

}
