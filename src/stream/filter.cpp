#include "fastcsv/filter.hpp"
#include "fastcsv/csv_stream.hpp"
#include "fastcsv/source.hpp"

namespace fcsv {

std::uint64_t filter(Source& in, Sink& out,
                     const Options& in_opts, const Options& out_opts,
                     const FilterFn& fn) {
  CsvStream input(in, in_opts);
  CsvStream output(out, out_opts);

  std::uint64_t n = 0;
  Record fields;
  while (auto row = input.shift_row()) {
    fields = row->fields();
    if (fn) fn(*row, fields);
    output << fields;
    ++n;
  }
  out.flush();
  return n;
}

std::uint64_t filter(Source& in, Sink& out, const OptionList& kv, const FilterFn& fn) {
  SplitOptions split = split_filter_options(kv);
  return filter(in, out, options_from_pairs(split.input), options_from_pairs(split.output), fn);
}

}
