#pragma once
#include <blake3.h>
#include <stategen/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace stategen::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::span<const uint8_t>& bytes);
  hasher& update(const std::string_view& str);
  hasher& update(uint64_t value);

  stategen::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

stategen::schema::hash32_t hash(const std::string_view& str);
stategen::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace stategen::blake3
