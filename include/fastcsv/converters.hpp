#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "fastcsv/field.hpp"

namespace fcsv {

// A field transformer. Exactly one of the two call shapes is chosen when the
// converter is built; the pipeline never inspects the callable itself.
class Converter {
public:
  using FieldFn     = std::function<Field(const Field&)>;
  using FieldInfoFn = std::function<Field(const Field&, const FieldInfo&)>;

  Converter() = default;
  Converter(FieldFn fn) : fn_(std::move(fn)) {}
  Converter(FieldInfoFn fn) : fn_(std::move(fn)) {}

  static Converter field(FieldFn fn) { return Converter(std::move(fn)); }
  static Converter with_info(FieldInfoFn fn) { return Converter(std::move(fn)); }

  bool wants_info() const noexcept { return std::holds_alternative<FieldInfoFn>(fn_); }
  explicit operator bool() const noexcept;

  Field operator()(const Field& f, const FieldInfo& info) const;

private:
  std::variant<FieldFn, FieldInfoFn> fn_;
};

// Name -> converter, or name -> ordered list of other names (combos may nest).
class ConverterRegistry {
public:
  void add(std::string name, Converter c);
  void add_combo(std::string name, std::vector<std::string> names);
  bool contains(std::string_view name) const;

  // Flattened converters for `name`, combos expanded in order.
  // Throws ConfigError for unknown names or combo cycles.
  std::vector<Converter> resolve(std::string_view name) const;

private:
  void resolve_into(std::string_view name, std::vector<Converter>& out, int depth) const;

  std::map<std::string, std::variant<Converter, std::vector<std::string>>, std::less<>> entries_;
};

// Process-wide registries, seeded on first use. Not synchronized.
//   data:   integer, float, numeric, date, date_time, all
//   header: downcase, symbol
ConverterRegistry& data_converters();
ConverterRegistry& header_converters();

// Built-in conversions; each returns the input unchanged when it does not apply.
Field convert_integer(const Field& f);
Field convert_float(const Field& f);
Field convert_date(const Field& f);
Field convert_date_time(const Field& f);
Field convert_downcase(const Field& f);
Field convert_symbol(const Field& f);

// Ordered, short-circuiting chain applied to every field of a record.
class ConverterPipeline {
public:
  void add(Converter c);
  void add(const ConverterRegistry& reg, std::string_view name);

  bool empty() const noexcept { return converters_.empty(); }
  std::size_t size() const noexcept { return converters_.size(); }

  // Run each field through the converters until one yields a non-string.
  void apply(Record& rec, std::uint64_t line) const;
  Field apply_one(Field f, const FieldInfo& info) const;

private:
  std::vector<Converter> converters_;
};

}
