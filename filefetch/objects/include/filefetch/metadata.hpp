#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace filefetch {

// Ordered multi-valued mapping from header-like keys to string values.
// Keys are case-sensitive and kept in insertion order. A key is present only if it has at least one value.
class Metadata {
 public:
  using Values = std::vector<std::string>;
  using Entry = std::pair<std::string, Values>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Metadata() noexcept = default;

  // Build a Metadata from single-valued key/value pairs. Repeated keys accumulate values.
  Metadata(std::initializer_list<std::pair<std::string_view, std::string_view>> keyValues);

  // Replace all values of 'key' by the single 'value' (key keeps its position if already present).
  void setValue(std::string_view key, std::string_view value);

  // Append 'value' to the values of 'key'.
  void addValue(std::string_view key, std::string_view value);

  // Remove 'key' and all its values. Returns true if it was present.
  bool remove(std::string_view key);

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != _entries.end(); }

  // First value of 'key', if any.
  [[nodiscard]] std::optional<std::string_view> firstValue(std::string_view key) const noexcept;

  // First value of 'key', or an empty string_view if absent.
  [[nodiscard]] std::string_view firstValueOrEmpty(std::string_view key) const noexcept {
    return firstValue(key).value_or(std::string_view{});
  }

  // All values of 'key' (empty span if absent).
  [[nodiscard]] std::span<const std::string> values(std::string_view key) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

  void clear() noexcept { _entries.clear(); }

  bool operator==(const Metadata&) const noexcept = default;

 private:
  [[nodiscard]] const_iterator find(std::string_view key) const noexcept;

  std::vector<Entry> _entries;
};

}  // namespace filefetch
