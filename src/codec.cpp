#include "scidata/codec.hpp"

#include "scidata/errors.hpp"
#include "scidata/hash.hpp"
#include "scidata/logging.hpp"

#include <algorithm>
#include <mutex>

namespace scidata {

std::string Codec::hash(std::span<const std::uint8_t> bytes) const { return to_hex(sha256(bytes)); }

std::string_view extension_of(std::string_view item_name) {
  const auto slash = item_name.rfind('/');
  const auto base = slash == std::string_view::npos ? item_name : item_name.substr(slash + 1);
  const auto dot = base.rfind('.');
  if (dot == std::string_view::npos) {
    return {};
  }
  return base.substr(dot + 1);
}

void CodecRegistry::register_codec(const std::string &ext, CodecPtr codec,
                                   std::optional<ValueKind> default_for) {
  if (ext.empty() || ext.find('.') != std::string::npos || ext.find('/') != std::string::npos) {
    throw InvalidName("bad codec extension: '" + ext + "'");
  }
  if (!codec) {
    throw UnsupportedFormat("null codec for extension '" + ext + "'");
  }

  std::unique_lock lock(mu_);
  by_ext_[ext] = codec;

  // Last registration becomes the default, except for structured data.
  if (default_for) {
    const bool fixed = *default_for == ValueKind::Json && defaults_.contains(ValueKind::Json);
    if (!fixed) {
      defaults_[*default_for] = codec;
    }
  }

  if (std::ranges::find(formats_, codec) == formats_.end()) {
    formats_.push_back(codec);
  }
  lock.unlock();

  SCIDATA_LOG_DEBUG("codec registered", {logging::StringField("ext", ext),
                                         logging::StringField("codec", codec->name())});
}

void CodecRegistry::register_alias(const std::string &ext, const std::string &existing_ext) {
  CodecPtr codec = find(existing_ext);
  if (!codec) {
    throw UnsupportedFormat("cannot alias '" + ext + "' to unknown extension '" + existing_ext +
                            "'");
  }
  register_codec(ext, std::move(codec));
}

bool CodecRegistry::contains(std::string_view ext) const {
  std::shared_lock lock(mu_);
  return by_ext_.find(ext) != by_ext_.end();
}

std::vector<std::string> CodecRegistry::extensions() const {
  std::shared_lock lock(mu_);
  std::vector<std::string> out;
  out.reserve(by_ext_.size());
  for (const auto &[ext, codec] : by_ext_) {
    out.push_back(ext);
  }
  return out;
}

CodecPtr CodecRegistry::find(std::string_view ext) const {
  std::shared_lock lock(mu_);
  auto it = by_ext_.find(ext);
  return it == by_ext_.end() ? nullptr : it->second;
}

CodecPtr CodecRegistry::default_for(ValueKind kind) const {
  std::shared_lock lock(mu_);
  auto it = defaults_.find(kind);
  return it == defaults_.end() ? nullptr : it->second;
}

CodecRegistry::Encoded CodecRegistry::encode_with(std::string_view ext, const Value &value) const {
  if (auto codec = find(ext)) {
    return Encoded{.codec = codec, .bytes = codec->encode(value)};
  }

  // Unknown extension: the kind default first, then every converter that
  // takes this kind of value. The first one that encodes wins.
  std::vector<CodecPtr> candidates;
  if (auto codec = default_for(value.kind())) {
    candidates.push_back(std::move(codec));
  }
  {
    std::shared_lock lock(mu_);
    for (const auto &codec : formats_) {
      if (std::ranges::find(candidates, codec) == candidates.end()) {
        candidates.push_back(codec);
      }
    }
  }
  for (const auto &codec : candidates) {
    if (!codec->accepts(value)) {
      continue;
    }
    try {
      return Encoded{.codec = codec, .bytes = codec->encode(value)};
    } catch (const UnsupportedFormat &) {
      continue; // try the next converter
    }
  }
  throw UnsupportedFormat("no codec for extension '" + std::string(ext) + "' and " +
                          std::string(kind_name(value.kind())) + " value");
}

Bytes CodecRegistry::encode(std::string_view ext, const Value &value) const {
  return encode_with(ext, value).bytes;
}

Value CodecRegistry::decode(std::string_view ext, std::span<const std::uint8_t> bytes) const {
  auto codec = find(ext);
  if (!codec) {
    throw UnsupportedFormat("no codec for extension '" + std::string(ext) + "'");
  }
  return codec->decode(bytes);
}

} // namespace scidata
