#pragma once

#include <stategen/schema/primitives.hpp>
#include <cstdint>

// Schema type: split info.
// Hot/cold boundary: states below `slot` are archival, the rest are hot.
namespace stategen::schema {

template <uint16_t Version>
struct split_info;

template <>
struct split_info<1> final {
  uint16_t version{1};
  slot_t slot{};
  hash32_t root{};

  bool operator==(const split_info<1>&) const = default;
};

using split_info_t = split_info<1>;

}  // namespace stategen::schema
