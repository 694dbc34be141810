#include "scidata/hashing.hpp"

#include "scidata/consts.hpp"
#include "scidata/container.hpp"
#include "scidata/hash.hpp"

#include <string>

namespace scidata {

Json hashable_content(const ContentDescriptor &content) {
  Json j = content;
  for (const char *key : {"uuid", "replaces", "created", "modified", "hash", "modelVersion", "static"}) {
    j.erase(key);
  }
  return j;
}

namespace {

std::string item_digest(const CodecRegistry &registry, std::string_view name, const Value &value) {
  const auto ext = extension_of(name);
  auto [codec, bytes] = registry.encode_with(ext, value);
  if (!registry.contains(ext)) {
    // Loaded back as raw bytes, so only the stored bytes may count.
    return codec->Codec::hash(bytes);
  }
  return codec->hash(bytes);
}

} // namespace

std::string content_digest(const Container &container) {
  const CodecRegistry &registry = container.registry();

  Sha256 h;
  for (const auto &name : container.list_names()) {
    std::string d;
    if (name == consts::kContentItem) {
      d = item_digest(registry, name, Value(hashable_content(container.content())));
    } else if (name == consts::kMetaItem) {
      d = item_digest(registry, name, Value(Json(container.meta())));
    } else {
      d = item_digest(registry, name, container.items().get(name));
    }

    // name \0 <len> \0 <digest>
    h.update(name);
    h.update(std::string_view(&consts::kNul, 1));
    h.update(std::to_string(d.size()));
    h.update(std::string_view(&consts::kNul, 1));
    h.update(d);
  }
  return to_hex(h.finish());
}

} // namespace scidata
