#include "slotkeeper/scheduling/availability_cache.hpp"

#include <tuple>

namespace slotkeeper::scheduling {

bool AvailabilityKey::operator<(const AvailabilityKey &other) const {
  return std::tie(business_id, date, duration_minutes, staff_id) <
         std::tie(other.business_id, other.date, other.duration_minutes, other.staff_id);
}

AvailabilityCache::Entry AvailabilityCache::find(const AvailabilityKey &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto business = businesses_.find(key.business_id);
  if (business == businesses_.end()) {
    return nullptr;
  }
  const auto it = business->second.entries.find(key);
  return it == business->second.entries.end() ? nullptr : it->second;
}

std::uint64_t AvailabilityCache::generation(const std::string &business_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto business = businesses_.find(business_id);
  return business == businesses_.end() ? 0 : business->second.generation;
}

AvailabilityCache::Entry AvailabilityCache::insert(const AvailabilityKey &key, Entry value,
                                                   const std::uint64_t read_generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &business = businesses_[key.business_id];
  if (business.generation != read_generation) {
    return value;
  }
  const auto [it, inserted] = business.entries.emplace(key, std::move(value));
  return it->second;
}

std::size_t AvailabilityCache::invalidate(const std::string &business_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &business = businesses_[business_id];
  const std::size_t dropped = business.entries.size();
  business.entries.clear();
  ++business.generation;
  return dropped;
}

std::size_t AvailabilityCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &[id, business] : businesses_) {
    total += business.entries.size();
  }
  return total;
}

} // namespace slotkeeper::scheduling
