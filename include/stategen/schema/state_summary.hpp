#pragma once

#include <stategen/schema/primitives.hpp>
#include <cstdint>

// Schema type: state summary.
// Checkpoint pointer recorded for every saved root; locates the nearest full
// state for replay without decoding one.
namespace stategen::schema {

template <uint16_t Version>
struct state_summary;

template <>
struct state_summary<1> final {
  uint16_t version{1};
  slot_t slot{};
  hash32_t root{};

  bool operator==(const state_summary<1>&) const = default;
};

using state_summary_t = state_summary<1>;

}  // namespace stategen::schema
