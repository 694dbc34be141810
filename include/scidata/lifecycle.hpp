#pragma once

#include <cstdint>
#include <string_view>

namespace scidata {

enum class State : std::uint8_t {
  kMutable = 0,
  kImmutable = 1,
};

enum class Trigger : std::uint8_t {
  kSerialize,
  kHash,
  kFreeze,
  kUpload,
  kRelease,
};

constexpr bool CanMutate(State state) { return state == State::kMutable; }

// Serialize/hash/freeze/upload seal the container (idempotently); only
// release opens it again.
constexpr State NextState(State from, Trigger trigger) {
  if (trigger == Trigger::kRelease) {
    return State::kMutable;
  }
  (void)from;
  return State::kImmutable;
}

constexpr std::string_view StateName(State state) {
  return state == State::kMutable ? "mutable" : "immutable";
}

} // namespace scidata
