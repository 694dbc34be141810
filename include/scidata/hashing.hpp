#pragma once

#include "scidata/attributes.hpp"

#include <string>

namespace scidata {

class Container;

/**
 * Deterministic SHA-256 over the container content (64-char hex).
 *
 * Items are visited in list order; each contributes
 *   name \0 <length of item digest> \0 <item digest>
 * where the item digest comes from the item's codec. Every item enters
 * through its digest, never its raw bytes, so codecs without a hash
 * override contribute the SHA-256 of their encoded bytes. Items whose
 * extension has no registered codec always use that plain SHA-256, since
 * they load back as raw bytes. content.json takes
 * part without its bookkeeping fields (see hashable_content), so equal
 * content built at different times gives the same digest.
 *
 * Pure: does not change the container.
 */
std::string content_digest(const Container &container);

// content.json as it enters the digest: uuid, replaces, created, modified,
// hash, modelVersion and static removed.
Json hashable_content(const ContentDescriptor &content);

} // namespace scidata
