#include <stategen/blake3/hash.hpp>

#include <array>

namespace stategen::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const uint64_t value) {
  // Little endian, independent of host order.
  auto encoded = std::array<uint8_t, sizeof(value)>{};
  for (size_t i = 0; i < encoded.size(); ++i) {
    encoded[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
  }
  return update(std::span<const uint8_t>{encoded.data(), encoded.size()});
}

stategen::schema::hash32_t hasher::finalize() const {
  auto output = stategen::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

stategen::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

stategen::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace stategen::blake3
