#pragma once

#include "scidata/value.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scidata {

// "part/sub/name.ext" -> {"part/sub", "name.ext"}; root items have an empty part.
auto split_item_name(std::string_view name) -> std::pair<std::string_view, std::string_view>;

// Throws InvalidName unless `name` has the form [part/]name.ext with no
// empty, "." or ".." segments, no backslash and no leading '/'.
void validate_item_name(std::string_view name);

// content.json and meta.json at the root
auto is_reserved_name(std::string_view name) -> bool;

// Orders by part, then by name within the part.
struct ItemNameLess {
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const;
};

using ItemMap = std::map<std::string, Value, ItemNameLess>;

/**
 * Flat mapping from qualified item names to decoded values.
 *
 * Holds every item except the two reserved attribute records. Values are
 * stored decoded; encoding happens when the owning container is hashed or
 * written.
 */
class Items {
public:
  Items() = default;

  [[nodiscard]] const Value &get(std::string_view name) const; // NotFound
  [[nodiscard]] bool contains(std::string_view name) const;

  void set(std::string_view name, Value value); // InvalidName
  void remove(std::string_view name);           // NotFound

  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] const ItemMap &entries() const { return entries_; }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }

  bool operator==(const Items &) const = default;

private:
  ItemMap entries_;
};

} // namespace scidata
