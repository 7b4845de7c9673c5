#pragma once

#include "slotkeeper/scheduling/model.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace slotkeeper::scheduling {

struct AvailabilityKey {
  std::string business_id;
  Date date{};
  int duration_minutes = 0;
  std::optional<std::string> staff_id;

  bool operator<(const AvailabilityKey &other) const;
};

/// Memo of resolved days. Entries are immutable and shared, so a hit hands back the same
/// object until the business is invalidated. Invalidation is per business and bumps a
/// generation counter; a result computed under an older generation is never stored.
class AvailabilityCache {
public:
  using Entry = std::shared_ptr<const DayAvailability>;

  [[nodiscard]] Entry find(const AvailabilityKey &key) const;

  /// Generation to capture before reading the store for `business_id`.
  [[nodiscard]] std::uint64_t generation(const std::string &business_id) const;

  /// Stores `value` when `read_generation` is still current. Returns the cached entry for
  /// the key, which is an earlier insert when another thread won the race.
  Entry insert(const AvailabilityKey &key, Entry value, std::uint64_t read_generation);

  /// Drops every entry of the business. Returns how many were dropped.
  std::size_t invalidate(const std::string &business_id);
  [[nodiscard]] std::size_t size() const;

private:
  struct BusinessEntries {
    std::uint64_t generation = 0;
    std::map<AvailabilityKey, Entry> entries;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, BusinessEntries> businesses_;
};

} // namespace slotkeeper::scheduling
