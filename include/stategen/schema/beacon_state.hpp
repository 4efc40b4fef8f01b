#pragma once

#include <stategen/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: beacon state.
// Snapshot of chain state at one slot. A plain value: copies are deep, and
// equal inputs replayed in the same order encode to identical bytes.
namespace stategen::schema {

template <uint16_t Version>
struct beacon_state;

template <>
struct beacon_state<1> final {
  uint16_t version{1};
  slot_t slot{};
  uint64_t genesis_time{};
  hash32_t latest_block_root{};
  slot_t latest_block_slot{};
  uint64_t block_count{};
  hash32_t accumulator{};
  std::vector<gwei_t> balances;

  bool operator==(const beacon_state<1>&) const = default;
};

using beacon_state_t = beacon_state<1>;

}  // namespace stategen::schema
