#pragma once
#include <stategen/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Key layout of the state generation keyspaces.
//
//   HOT|SUMMARY|<root>                  -> state_summary
//   HOT|STATE|<root>                    -> beacon_state (boundary states)
//   HOT|STATE_SLOT|<slot be><root>      -> root
//   COLD|SUMMARY|<root>                 -> state_summary
//   COLD|ARCHIVE|<index be>             -> beacon_state (archived points)
//   COLD|BLOCK_SLOT|<slot be><root>     -> root (canonical blocks)
//   BLOCK|ROOT|<root>                   -> beacon_block
//   BLOCK|SLOT|<slot be><root>          -> root
//   SYS|SPLIT                           -> split_info
namespace stategen::schema::key {

inline constexpr auto kHotSummaryPrefix = std::string_view{"HOT|SUMMARY|"};
inline constexpr auto kHotStatePrefix = std::string_view{"HOT|STATE|"};
inline constexpr auto kHotStateSlotPrefix = std::string_view{"HOT|STATE_SLOT|"};
inline constexpr auto kColdSummaryPrefix = std::string_view{"COLD|SUMMARY|"};
inline constexpr auto kColdArchivePrefix = std::string_view{"COLD|ARCHIVE|"};
inline constexpr auto kColdBlockSlotPrefix =
    std::string_view{"COLD|BLOCK_SLOT|"};
inline constexpr auto kBlockRootPrefix = std::string_view{"BLOCK|ROOT|"};
inline constexpr auto kBlockSlotPrefix = std::string_view{"BLOCK|SLOT|"};
inline constexpr auto kSplitKey = std::string_view{"SYS|SPLIT"};

bytes_t make_prefix(const std::string_view& prefix);

bytes_t make_hot_summary_key(const hash32_t& root);
bytes_t make_hot_state_key(const hash32_t& root);
bytes_t make_hot_state_slot_key(slot_t slot, const hash32_t& root);
bytes_t make_cold_summary_key(const hash32_t& root);
bytes_t make_cold_archive_key(uint64_t index);
bytes_t make_cold_block_slot_key(slot_t slot, const hash32_t& root);
bytes_t make_block_key(const hash32_t& root);
bytes_t make_block_slot_key(slot_t slot, const hash32_t& root);
bytes_t make_split_key();

/// Upper bound for reverse seeks: sorts after every `<prefix><slot be>...`
/// key whose slot is <= `slot`.
bytes_t make_slot_upper_bound(const std::string_view& prefix, slot_t slot);

/// Split a `<prefix><slot be><root>` key back into slot and root.
std::optional<std::pair<slot_t, hash32_t>> parse_slot_root_key(
    const std::string_view& prefix,
    const bytes_view_t& key);

/// Parse the big endian index of a `<prefix><index be>` key.
std::optional<uint64_t> parse_index_key(const std::string_view& prefix,
                                        const bytes_view_t& key);

}  // namespace stategen::schema::key
