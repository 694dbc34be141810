#pragma once

#include "scidata/attributes.hpp"
#include "scidata/codec.hpp"
#include "scidata/config.hpp"
#include "scidata/items.hpp"
#include "scidata/lifecycle.hpp"
#include "scidata/value.hpp"

#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scidata {

class SyncEngine;

// Items payload for building a container; must include content.json and
// meta.json as JSON values.
using Payload = std::map<std::string, Value>;

/**
 * Scientific data container: identifier, attribute records and items.
 *
 * Built from a payload it starts mutable; loaded from an archive or the
 * remote store it starts immutable. write(), hash(), freeze() and upload
 * seal it; release() forks a new mutable lineage from the current content.
 *
 * The codec registry is held by reference and must outlive the container.
 * Containers have value semantics: copies share nothing.
 */
class Container {
public:
  Container(const Payload &items, const CodecRegistry &registry, const Defaults &defaults = {});

  static Container from_archive(std::span<const std::uint8_t> bytes,
                                const CodecRegistry &registry);
  static Container load(const std::filesystem::path &path, const CodecRegistry &registry);

  // Lifecycle
  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] bool is_mutable() const { return CanMutate(state_); }

  // Attributes
  [[nodiscard]] const ContentDescriptor &content() const { return content_; }
  [[nodiscard]] const Metadata &meta() const { return meta_; }
  [[nodiscard]] const std::string &uuid() const { return content_.uuid; }

  // Replace editable attributes. uuid, created, modelVersion and hash are
  // kept from the current record; static can only be set by freeze().
  void set_content(ContentDescriptor content);
  void set_meta(Metadata meta);

  // Items. The reserved records are readable as JSON items but can only be
  // changed through set_content()/set_meta().
  [[nodiscard]] Value get(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const;
  void set(std::string_view name, Value value);
  void remove(std::string_view name);
  [[nodiscard]] std::vector<std::string> list_names() const;
  [[nodiscard]] std::vector<std::string> keys() const { return list_names(); }
  [[nodiscard]] const Items &items() const { return items_; }

  // Content digest; stores it in content().hash and seals the container.
  std::string hash();

  // Mark static with its digest. Throws AlreadyStatic.
  void freeze();

  // Fresh uuid, cleared replaces/created/modified/hash/modelVersion/static,
  // mutable again. Items and other attributes are kept.
  void release();

  // Serialize (sealing the container first).
  [[nodiscard]] std::vector<std::uint8_t> to_archive();
  void write(const std::filesystem::path &path);

  [[nodiscard]] std::string summary() const;

  [[nodiscard]] const CodecRegistry &registry() const { return *registry_; }

private:
  friend class SyncEngine;

  explicit Container(const CodecRegistry &registry) : registry_(&registry) {}

  void require_mutable(std::string_view op) const;
  void touch(); // bump modified, never backwards
  void seal(Trigger trigger);

  // Adopt timestamps the store recorded for this container.
  void accept_remote(const ContentDescriptor &accepted);

  const CodecRegistry *registry_;
  ContentDescriptor content_;
  Metadata meta_;
  Items items_;
  State state_{State::kMutable};
};

} // namespace scidata
