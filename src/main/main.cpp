#include "fastcsv/csv_stream.hpp"
#include "fastcsv/errors.hpp"
#include "fastcsv/file_source.hpp"
#include "fastcsv/filter.hpp"
#include "fastcsv/jsonl_writer.hpp"
#include "fastcsv/options.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string input  = "-";
  std::string output = "-";
  std::string format = "csv"; // csv|jsonl
  std::string options_file;
  bool quiet = false;
  fcsv::OptionList options;
};

void usage() {
  std::cout <<
    "Usage: fastcsv [--KEY=VALUE ...] [--in_KEY=VALUE ...] [--out_KEY=VALUE ...]\n"
    "               [--options=<file.json>] [--format=csv|jsonl] [--quiet]\n"
    "               [input|-] [output|-]\n"
    "Keys: col_sep row_sep converters headers return_headers header_converters skip_blanks\n"
    "      (in_/input_ keys apply to reading only, out_/output_ keys to writing only)\n";
}

// "\t" on a command line means a tab
std::string unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      switch (s[i + 1]) {
        case 't':  out += '\t'; ++i; continue;
        case 'n':  out += '\n'; ++i; continue;
        case 'r':  out += '\r'; ++i; continue;
        case '\\': out += '\\'; ++i; continue;
        default: break;
      }
    }
    out += s[i];
  }
  return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream in(s);
  while (std::getline(in, cur, ',')) if (!cur.empty()) out.push_back(cur);
  return out;
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (a == "-h" || a == "--help") { usage(); std::exit(0); }
    if (a == "--quiet") { c.quiet = true; continue; }
    if (eat("--format=", &c.format)) continue;
    if (eat("--options=", &c.options_file)) continue;
    if (a.rfind("--", 0) == 0 && a.size() > 2) {
      auto eq = a.find('=');
      std::string key = a.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
      if (eq == std::string::npos) { c.options.emplace_back(key, true); continue; }
      std::string val = unescape(a.substr(eq + 1));
      if (ends_with(key, "converters")) c.options.emplace_back(key, split_list(val));
      else c.options.emplace_back(key, val);
      continue;
    }
    positional.push_back(a);
  }
  if (positional.size() > 0) c.input  = positional[0];
  if (positional.size() > 1) c.output = positional[1];
  if (positional.size() > 2) throw fcsv::ConfigError("too many positional arguments");
  if (c.format != "csv" && c.format != "jsonl") throw fcsv::ConfigError("unknown --format: " + c.format);
  return c;
}

fcsv::OptionList load_options_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw fcsv::SourceError("cannot open options file '" + path + "'");
  std::ostringstream ss;
  ss << in.rdbuf();
  return fcsv::option_list_from_json(ss.str());
}

std::uint64_t export_jsonl(fcsv::Source& in, fcsv::Sink& out, const fcsv::Options& opts) {
  fcsv::CsvStream csv(in, opts);
  std::uint64_t rows = 0;
  std::string line;
  while (auto row = csv.shift_row()) {
    if (row->header_row()) continue;
    line = opts.headers.active() ? fcsv::JsonlWriter::row_to_json(*row)
                                 : fcsv::JsonlWriter::record_to_json(row->fields());
    line += '\n';
    out.write(line);
    ++rows;
  }
  out.flush();
  return rows;
}

int run(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  fcsv::OptionList kv;
  if (!cli.options_file.empty()) kv = load_options_file(cli.options_file);
  kv.insert(kv.end(), cli.options.begin(), cli.options.end());

  fcsv::SplitOptions split = fcsv::split_filter_options(kv);
  fcsv::Options in_opts  = fcsv::options_from_pairs(split.input);
  fcsv::Options out_opts = fcsv::options_from_pairs(split.output);

  std::unique_ptr<fcsv::FileSource> src = (cli.input == "-")
      ? std::make_unique<fcsv::FileSource>(stdin, fcsv::FileSource::Config{})
      : std::make_unique<fcsv::FileSource>(cli.input);
  std::unique_ptr<fcsv::FileSink> sink = (cli.output == "-")
      ? std::make_unique<fcsv::FileSink>(stdout)
      : std::make_unique<fcsv::FileSink>(cli.output);

  std::uint64_t rows = (cli.format == "jsonl")
      ? export_jsonl(*src, *sink, in_opts)
      : fcsv::filter(*src, *sink, in_opts, out_opts, nullptr);

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const std::uint64_t bytes = src->bytes_read();
  const double sec = wall_ms / 1000.0;
  const double mib_s = sec > 0.0 ? (bytes / (1024.0 * 1024.0)) / sec : 0.0;

  if (!cli.quiet) {
    std::cerr << "[fastcsv] ok: " << (cli.input == "-" ? "<stdin>" : cli.input)
              << " rows=" << rows
              << " bytes=" << bytes
              << " time=" << wall_ms << "ms"
              << " throughput=" << mib_s << " MiB/s\n";
  }
  return 0;
}

}

int main(int argc, char** argv) {
  try {
    return run(parse_cli(argc, argv));
  } catch (const fcsv::ConfigError& e) {
    std::cerr << "[fastcsv] config error: " << e.what() << "\n";
    return 2;
  } catch (const fcsv::MalformedCsvError& e) {
    std::cerr << "[fastcsv] malformed CSV: " << e.what() << "\n";
    return 3;
  } catch (const fcsv::SourceError& e) {
    std::cerr << "[fastcsv] I/O error: " << e.what() << "\n";
    return 4;
  }
}
