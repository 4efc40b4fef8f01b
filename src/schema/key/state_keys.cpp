#include <boost/endian/conversion.hpp>
#include <stategen/schema/key/builder.hpp>
#include <stategen/schema/key/state_keys.hpp>
#include <algorithm>
#include <cstring>

namespace stategen::schema::key {

namespace {

bool has_prefix(const bytes_view_t& key, const std::string_view& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                    [](const char lhs, const uint8_t rhs) {
                      return static_cast<uint8_t>(lhs) == rhs;
                    });
}

uint64_t read_big_endian(const uint8_t* bytes) {
  auto value = uint64_t{};
  std::memcpy(&value, bytes, sizeof(value));
  return boost::endian::big_to_native(value);
}

}  // namespace

bytes_t make_prefix(const std::string_view& prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_hot_summary_key(const hash32_t& root) {
  return builder{}.write(kHotSummaryPrefix).write(root).data;
}

bytes_t make_hot_state_key(const hash32_t& root) {
  return builder{}.write(kHotStatePrefix).write(root).data;
}

bytes_t make_hot_state_slot_key(const slot_t slot, const hash32_t& root) {
  return builder{}
      .write(kHotStateSlotPrefix)
      .write_big_endian(slot)
      .write(root)
      .data;
}

bytes_t make_cold_summary_key(const hash32_t& root) {
  return builder{}.write(kColdSummaryPrefix).write(root).data;
}

bytes_t make_cold_archive_key(const uint64_t index) {
  return builder{}.write(kColdArchivePrefix).write_big_endian(index).data;
}

bytes_t make_cold_block_slot_key(const slot_t slot, const hash32_t& root) {
  return builder{}
      .write(kColdBlockSlotPrefix)
      .write_big_endian(slot)
      .write(root)
      .data;
}

bytes_t make_block_key(const hash32_t& root) {
  return builder{}.write(kBlockRootPrefix).write(root).data;
}

bytes_t make_block_slot_key(const slot_t slot, const hash32_t& root) {
  return builder{}
      .write(kBlockSlotPrefix)
      .write_big_endian(slot)
      .write(root)
      .data;
}

bytes_t make_split_key() {
  return builder{}.write(kSplitKey).data;
}

bytes_t make_slot_upper_bound(const std::string_view& prefix,
                              const slot_t slot) {
  auto all_ones = hash32_t{};
  all_ones.fill(0xFF);
  return builder{}.write(prefix).write_big_endian(slot).write(all_ones).data;
}

std::optional<std::pair<slot_t, hash32_t>> parse_slot_root_key(
    const std::string_view& prefix,
    const bytes_view_t& key) {
  if (!has_prefix(key, prefix) ||
      key.size() != prefix.size() + sizeof(slot_t) + sizeof(hash32_t)) {
    return std::nullopt;
  }
  auto slot = read_big_endian(key.data() + prefix.size());
  auto root = hash32_t{};
  std::copy_n(key.data() + prefix.size() + sizeof(slot_t), root.size(),
              std::begin(root));
  return std::pair{slot, root};
}

std::optional<uint64_t> parse_index_key(const std::string_view& prefix,
                                        const bytes_view_t& key) {
  if (!has_prefix(key, prefix) || key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  return read_big_endian(key.data() + prefix.size());
}

}  // namespace stategen::schema::key
