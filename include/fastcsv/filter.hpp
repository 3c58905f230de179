#pragma once
#include <cstdint>
#include <functional>

#include "fastcsv/field.hpp"
#include "fastcsv/options.hpp"
#include "fastcsv/row.hpp"

namespace fcsv {

class Source;
class Sink;

// Called once per row read; `out` starts as the row's fields and is written
// as-is after the call. Header rows arrive too when return_headers is set.
using FilterFn = std::function<void(const Row& row, Record& out)>;

// Copy every row of `in` to `out`, passing each through `fn` (may be empty).
// Returns the number of rows written.
std::uint64_t filter(Source& in, Sink& out,
                     const Options& in_opts, const Options& out_opts,
                     const FilterFn& fn);

// Same, with one option list routed by split_filter_options().
std::uint64_t filter(Source& in, Sink& out, const OptionList& kv, const FilterFn& fn);

}
