#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stategen::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using slot_t = uint64_t;
using epoch_t = uint64_t;
using validator_index_t = uint64_t;
using gwei_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
bytes_view_t make_bytes_view(const hash32_t& hash);

std::string_view make_string_view(const bytes_t& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// First four bytes of the hash as hex, for log lines.
std::string short_hex(const hash32_t& hash);

/// Roots are uniformly distributed; the leading word is a good bucket hash.
struct hash32_hasher final {
  std::size_t operator()(const hash32_t& hash) const noexcept;
};

}  // namespace stategen::schema
