#pragma once
#include <stategen/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace stategen::schema::key {

/// Byte-wise key assembly. Slots and indexes are written big endian so that
/// RocksDB's lexicographic order matches numeric order.
struct builder final {
  stategen::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);
  builder& write_big_endian(uint64_t value);
};

}  // namespace stategen::schema::key
