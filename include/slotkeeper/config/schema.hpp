#pragma once

#include <string>

namespace slotkeeper::config {

struct StoreConfig {
  std::string backend = "sqlite";
  std::string path = "~/.slotkeeper/schedule.db";
};

struct AvailabilityConfig {
  int slot_step_minutes = 30;
  int search_horizon_days = 30;
  int max_range_days = 93;
  bool cache_enabled = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StoreConfig store;
  AvailabilityConfig availability;
  ObservabilityConfig observability;
};

} // namespace slotkeeper::config
