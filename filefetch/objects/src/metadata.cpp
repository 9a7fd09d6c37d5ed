#include "filefetch/metadata.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace filefetch {

Metadata::Metadata(std::initializer_list<std::pair<std::string_view, std::string_view>> keyValues) {
  for (const auto& [key, value] : keyValues) {
    addValue(key, value);
  }
}

Metadata::const_iterator Metadata::find(std::string_view key) const noexcept {
  return std::ranges::find_if(_entries, [key](const Entry& entry) { return entry.first == key; });
}

void Metadata::setValue(std::string_view key, std::string_view value) {
  const auto it = find(key);
  if (it == _entries.end()) {
    _entries.emplace_back(std::string(key), Values{std::string(value)});
    return;
  }
  Values& values = _entries[static_cast<std::size_t>(it - _entries.begin())].second;
  values.clear();
  values.emplace_back(value);
}

void Metadata::addValue(std::string_view key, std::string_view value) {
  const auto it = find(key);
  if (it == _entries.end()) {
    _entries.emplace_back(std::string(key), Values{std::string(value)});
    return;
  }
  _entries[static_cast<std::size_t>(it - _entries.begin())].second.emplace_back(value);
}

bool Metadata::remove(std::string_view key) {
  const auto it = find(key);
  if (it == _entries.end()) {
    return false;
  }
  _entries.erase(it);
  return true;
}

std::optional<std::string_view> Metadata::firstValue(std::string_view key) const noexcept {
  const auto it = find(key);
  if (it == _entries.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second.front());
}

std::span<const std::string> Metadata::values(std::string_view key) const noexcept {
  const auto it = find(key);
  if (it == _entries.end()) {
    return {};
  }
  return it->second;
}

}  // namespace filefetch
