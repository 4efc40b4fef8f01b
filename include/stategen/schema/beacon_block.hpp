#pragma once

#include <stategen/schema/primitives.hpp>
#include <cstdint>

// Schema type: beacon block.
// Transition input: immutable once observed; the root is the BLAKE3 hash of
// its SCALE encoding.
namespace stategen::schema {

template <uint16_t Version>
struct beacon_block;

template <>
struct beacon_block<1> final {
  uint16_t version{1};
  slot_t slot{};
  validator_index_t proposer_index{};
  hash32_t parent_root{};
  bytes_t body;

  bool operator==(const beacon_block<1>&) const = default;
};

using beacon_block_t = beacon_block<1>;

}  // namespace stategen::schema
