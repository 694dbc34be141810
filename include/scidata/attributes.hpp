#pragma once

#include "scidata/config.hpp"
#include "scidata/value.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace scidata {

struct ContainerType {
  std::string name;                   // required, no whitespace
  std::optional<std::string> id;      // e.g. a DOI
  std::optional<std::string> version; // required iff id is set

  bool operator==(const ContainerType &) const = default;
};

struct Software {
  std::string name;
  std::string version;
  std::optional<std::string> id;
  std::optional<std::string> id_type; // required iff id is set

  bool operator==(const Software &) const = default;
};

// content.json
struct ContentDescriptor {
  std::string uuid;
  std::optional<std::string> replaces;
  ContainerType container_type;
  std::time_t created{0};
  std::time_t modified{0};
  bool is_static{false};
  bool complete{true};
  std::optional<std::string> hash;
  std::vector<Software> used_software;
  std::string model_version;

  bool operator==(const ContentDescriptor &) const = default;
};

// meta.json
struct Metadata {
  std::string author;
  std::string email;
  std::optional<std::string> organization;
  std::optional<std::string> comment;
  std::string title;
  std::vector<std::string> keywords;
  std::optional<std::string> description;
  std::optional<std::string> created; // free-form dataset timestamp
  std::optional<std::string> doi;
  std::optional<std::string> license;

  bool operator==(const Metadata &) const = default;
};

struct Attributes {
  ContentDescriptor content;
  Metadata meta;
};

// nlohmann ADL hooks; optional fields are omitted when unset.
void to_json(Json &j, const ContainerType &t);
void to_json(Json &j, const Software &s);
void to_json(Json &j, const ContentDescriptor &c);
void to_json(Json &j, const Metadata &m);

/**
 * Parse, default and validate the two attribute records.
 *
 * Fills uuid, created, modified and modelVersion when absent (modelVersion
 * is always restamped), and meta author/email from `defaults`. Throws
 * SchemaViolation for a missing required field without a default, a
 * whitespace in containerType.name, an id without its companion field, a
 * static container without hash, or a malformed value.
 */
Attributes validate_and_default(const Json &content, const Json &meta,
                                const Defaults &defaults = {});

// content.json alone, with the same defaulting and checks.
ContentDescriptor parse_content(const Json &content);

// Checks on already-typed records (the same rules, no defaulting).
void validate(const ContentDescriptor &content);
void validate(const Metadata &meta);

} // namespace scidata
