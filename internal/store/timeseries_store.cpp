#include "timeseries_store.hpp"

#include <map>

namespace fieldgate::store {

std::string SeriesKey(const fieldgate::v1::Point& point) {
  std::map<std::string, std::string> sorted(point.tags().begin(), point.tags().end());

  std::string key;
  for (const auto& [k, v] : sorted) {
    if (!key.empty()) key.push_back(',');
    key += k;
    key.push_back('=');
    key += v;
  }
  return key;
}

} // namespace fieldgate::store
