#include "fastcsv/row.hpp"
#include <algorithm>

namespace fcsv {

Row::Row(const std::vector<Field>& headers, const std::vector<Field>& fields, Kind kind)
  : kind_(kind) {
  const std::size_t n = std::max(headers.size(), fields.size());
  row_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    row_.emplace_back(i < headers.size() ? headers[i] : Field{},
                      i < fields.size()  ? fields[i]  : Field{});
  }
}

std::vector<Field> Row::headers() const {
  std::vector<Field> out;
  out.reserve(row_.size());
  for (const auto& p : row_) out.push_back(p.first);
  return out;
}

Field Row::field(std::size_t index) const {
  return index < row_.size() ? row_[index].second : Field{};
}

Field Row::field(const Field& header, std::size_t minimum_index) const {
  auto i = index(header, minimum_index);
  return i ? row_[*i].second : Field{};
}

std::vector<Field> Row::fields() const {
  std::vector<Field> out;
  out.reserve(row_.size());
  for (const auto& p : row_) out.push_back(p.second);
  return out;
}

std::vector<Field> Row::fields(std::initializer_list<Selector> selectors) const {
  return fields(std::vector<Selector>(selectors));
}

std::vector<Field> Row::fields(const std::vector<Selector>& selectors) const {
  if (selectors.empty()) return fields();
  std::vector<Field> out;
  out.reserve(selectors.size());
  for (const auto& s : selectors) {
    if (auto i = std::get_if<std::size_t>(&s.key)) out.push_back(field(*i));
    else out.push_back(field(std::get<Field>(s.key), s.minimum_index));
  }
  return out;
}

std::optional<std::size_t> Row::index(const Field& header, std::size_t minimum_index) const {
  for (std::size_t i = minimum_index; i < row_.size(); ++i) {
    if (row_[i].first == header) return i;
  }
  return std::nullopt;
}

bool Row::header_present(const Field& name) const {
  return std::any_of(row_.begin(), row_.end(), [&](const Pair& p) { return p.first == name; });
}

bool Row::field_present(const Field& value) const {
  return std::any_of(row_.begin(), row_.end(), [&](const Pair& p) { return p.second == value; });
}

std::map<Field, Field> Row::to_hash() const {
  std::map<Field, Field> out;
  for (const auto& p : row_) out[p.first] = p.second;
  return out;
}

}
