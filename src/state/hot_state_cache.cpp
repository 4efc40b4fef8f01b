#include <spdlog/spdlog.h>
#include <stategen/state/hot_state_cache.hpp>

using namespace stategen::schema;

namespace stategen::state {

hot_state_cache::hot_state_cache(const std::size_t capacity)
    : capacity_{capacity == 0 ? 1 : capacity} {}

bool hot_state_cache::has(const hash32_t& root) const {
  auto lock = std::scoped_lock{mutex_};
  return index_.contains(root);
}

std::optional<beacon_state_t> hot_state_cache::get(const hash32_t& root) {
  auto lock = std::scoped_lock{mutex_};
  auto found = index_.find(root);
  if (found == std::end(index_)) {
    return std::nullopt;
  }
  entries_.splice(std::begin(entries_), entries_, found->second);
  return found->second->second;
}

void hot_state_cache::put(const hash32_t& root, beacon_state_t state) {
  auto lock = std::scoped_lock{mutex_};
  auto found = index_.find(root);
  if (found != std::end(index_)) {
    found->second->second = std::move(state);
    entries_.splice(std::begin(entries_), entries_, found->second);
    return;
  }

  entries_.emplace_front(root, std::move(state));
  index_.emplace(root, std::begin(entries_));
  if (index_.size() > capacity_) {
    auto& evicted = entries_.back();
    spdlog::debug("Evicting hot state slot={} root={}", evicted.second.slot,
                  short_hex(evicted.first));
    index_.erase(evicted.first);
    entries_.pop_back();
  }
}

void hot_state_cache::clear(const std::vector<hash32_t>& roots) {
  auto lock = std::scoped_lock{mutex_};
  for (const auto& root : roots) {
    auto found = index_.find(root);
    if (found == std::end(index_)) {
      continue;
    }
    entries_.erase(found->second);
    index_.erase(found);
  }
}

std::size_t hot_state_cache::remove_below(const slot_t slot) {
  auto lock = std::scoped_lock{mutex_};
  auto removed = std::size_t{};
  for (auto it = std::begin(entries_); it != std::end(entries_);) {
    if (it->second.slot < slot) {
      index_.erase(it->first);
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t hot_state_cache::size() const {
  auto lock = std::scoped_lock{mutex_};
  return index_.size();
}

}  // namespace stategen::state
