#pragma once
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "fastcsv/field.hpp"

namespace fcsv {

// Header/field pairs of one record, addressable by position or by header.
// Headers may repeat; lookups take a minimum index to reach later copies.
class Row {
public:
  using Pair = std::pair<Field, Field>; // (header, field)
  using const_iterator = std::vector<Pair>::const_iterator;

  enum class Kind { Field, Header };

  // Zipped by position; the shorter side is padded with absent values.
  Row(const std::vector<Field>& headers, const std::vector<Field>& fields,
      Kind kind = Kind::Field);
  Row() = default;

  // One lookup for fields(): a position, or a header searched from `minimum_index`.
  struct Selector {
    Selector(std::size_t index) : key(index) {}
    // negative positions are out of range, like field(int)
    Selector(int index)
      : key(index < 0 ? std::numeric_limits<std::size_t>::max() : static_cast<std::size_t>(index)) {}
    Selector(const char* header) : key(Field(std::string(header))) {}
    Selector(const std::string& header) : key(Field(header)) {}
    Selector(Field header, std::size_t minimum_index) : key(std::move(header)), minimum_index(minimum_index) {}
    Selector(const char* header, std::size_t minimum_index)
      : key(Field(std::string(header))), minimum_index(minimum_index) {}

    static Selector header(Field h, std::size_t minimum_index = 0) { return Selector(std::move(h), minimum_index); }

    std::variant<std::size_t, Field> key;
    std::size_t minimum_index = 0;
  };

  std::vector<Field> headers() const;

  // Field at `index`, absent when out of range.
  Field field(std::size_t index) const;
  Field field(int index) const { return index < 0 ? Field{} : field(static_cast<std::size_t>(index)); }
  // Positional lookups take a minimum index too, and ignore it.
  Field field(std::size_t index, std::size_t /*minimum_index*/) const { return field(index); }
  Field field(int index, std::size_t /*minimum_index*/) const { return field(index); }
  // First field at or after `minimum_index` whose header equals `header`.
  Field field(const Field& header, std::size_t minimum_index = 0) const;
  Field field(const char* header, std::size_t minimum_index = 0) const {
    return field(Field(std::string(header)), minimum_index);
  }

  std::vector<Field> fields() const;
  std::vector<Field> fields(std::initializer_list<Selector> selectors) const;
  std::vector<Field> fields(const std::vector<Selector>& selectors) const;

  std::optional<std::size_t> index(const Field& header, std::size_t minimum_index = 0) const;
  std::optional<std::size_t> index(const char* header, std::size_t minimum_index = 0) const {
    return index(Field(std::string(header)), minimum_index);
  }

  bool header_present(const Field& name) const;
  bool header_present(const char* name) const { return header_present(Field(std::string(name))); }
  bool field_present(const Field& value) const;

  // Later duplicate headers overwrite earlier ones.
  std::map<Field, Field> to_hash() const;
  const std::vector<Pair>& to_a() const noexcept { return row_; }

  std::size_t size() const noexcept { return row_.size(); }
  bool empty() const noexcept { return row_.empty(); }
  const_iterator begin() const noexcept { return row_.begin(); }
  const_iterator end() const noexcept { return row_.end(); }

  bool header_row() const noexcept { return kind_ == Kind::Header; }
  bool field_row() const noexcept { return kind_ == Kind::Field; }

private:
  std::vector<Pair> row_;
  Kind kind_{Kind::Field};
};

}
