#include <stategen/state/options.hpp>

namespace stategen::state {

bool validate(const options& opts, std::string& error) {
  if (opts.slots_per_epoch == 0) {
    error = "slots_per_epoch must be greater than zero";
    return false;
  }
  if (opts.slots_per_archived_point == 0) {
    error = "slots_per_archived_point must be greater than zero";
    return false;
  }
  if ((opts.slots_per_archived_point % opts.slots_per_epoch) != 0) {
    error = "slots_per_archived_point must be a multiple of slots_per_epoch";
    return false;
  }
  if (opts.hot_state_cache_size == 0) {
    error = "hot_state_cache_size must be greater than zero";
    return false;
  }
  return true;
}

stategen::schema::epoch_t epoch_of(const options& opts,
                                   const stategen::schema::slot_t slot) {
  return slot / opts.slots_per_epoch;
}

bool is_epoch_start(const options& opts, const stategen::schema::slot_t slot) {
  return (slot % opts.slots_per_epoch) == 0;
}

uint64_t archive_index_of(const options& opts,
                          const stategen::schema::slot_t slot) {
  return slot / opts.slots_per_archived_point;
}

std::vector<stategen::schema::slot_t> archived_slots_in(
    const options& opts,
    const stategen::schema::slot_t from,
    const stategen::schema::slot_t to) {
  auto slots = std::vector<stategen::schema::slot_t>{};
  if (to <= from) {
    return slots;
  }
  // Walk indexes so the last slot near the top of the range cannot wrap.
  auto index = archive_index_of(opts, from);
  if (from % opts.slots_per_archived_point != 0) {
    ++index;
  }
  const auto last = archive_index_of(opts, to - 1);
  for (; index <= last; ++index) {
    slots.push_back(index * opts.slots_per_archived_point);
  }
  return slots;
}

}  // namespace stategen::state
