#include "fastcsv/source.hpp"
#include <algorithm>

namespace fcsv {

bool StringSource::gets(std::string_view sep, std::string& out) {
  if (pos_ >= data_.size()) return false;
  std::string_view rest(data_.data() + pos_, data_.size() - pos_);
  std::size_t hit = sep.empty() ? std::string_view::npos : rest.find(sep);
  std::size_t take = (hit == std::string_view::npos) ? rest.size() : hit + sep.size();
  out.append(rest.substr(0, take));
  pos_ += take;
  return true;
}

std::string StringSource::read(std::size_t n) {
  std::size_t take = std::min(n, data_.size() - std::min(pos_, data_.size()));
  std::string out = data_.substr(pos_, take);
  pos_ += take;
  return out;
}

void StringSource::seek(std::uint64_t pos) {
  pos_ = static_cast<std::size_t>(std::min<std::uint64_t>(pos, data_.size()));
}

}
