#include "scidata/items.hpp"

#include "scidata/consts.hpp"
#include "scidata/errors.hpp"

namespace scidata {

auto split_item_name(std::string_view name) -> std::pair<std::string_view, std::string_view> {
  const std::size_t pos = name.rfind('/');
  if (pos == std::string_view::npos) {
    return {std::string_view{}, name};
  }
  return {name.substr(0, pos), name.substr(pos + 1)};
}

void validate_item_name(std::string_view name) {
  auto bad = [&](std::string_view why) {
    throw InvalidName("item name '" + std::string(name) + "': " + std::string(why));
  };
  if (name.empty()) {
    bad("empty");
  }
  if (name.front() == '/') {
    bad("leading '/'");
  }
  if (name.find('\\') != std::string_view::npos) {
    bad("backslash");
  }
  if (name.find(consts::kNul) != std::string_view::npos) {
    bad("NUL character");
  }

  std::string_view rest = name;
  while (true) {
    const auto pos = rest.find('/');
    const auto segment = rest.substr(0, pos);
    if (segment.empty()) {
      bad("empty segment");
    }
    if (segment == "." || segment == "..") {
      bad("path traversal");
    }
    if (pos == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(pos + 1);
  }

  const auto [part, base] = split_item_name(name);
  const auto dot = base.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == base.size()) {
    bad("expected name.ext");
  }
}

bool is_reserved_name(std::string_view name) {
  return name == consts::kContentItem || name == consts::kMetaItem;
}

bool ItemNameLess::operator()(std::string_view a, std::string_view b) const {
  const auto [pa, na] = split_item_name(a);
  const auto [pb, nb] = split_item_name(b);
  if (pa != pb) {
    return pa < pb;
  }
  return na < nb;
}

const Value &Items::get(std::string_view name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    throw NotFound("no item '" + std::string(name) + "'");
  }
  return it->second;
}

bool Items::contains(std::string_view name) const { return entries_.find(name) != entries_.end(); }

void Items::set(std::string_view name, Value value) {
  validate_item_name(name);
  if (is_reserved_name(name)) {
    throw InvalidName("item name '" + std::string(name) + "' is reserved");
  }
  entries_.insert_or_assign(std::string(name), std::move(value));
}

void Items::remove(std::string_view name) {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    throw NotFound("no item '" + std::string(name) + "'");
  }
  entries_.erase(it);
}

std::vector<std::string> Items::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[name, value] : entries_) {
    out.push_back(name);
  }
  return out;
}

} // namespace scidata
