#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>

#include "r3load/reload_coordinator.hpp"
#include "r3load/reload_events.hpp"

namespace r3::load {

// everything a hot module shares between its update thread and the threads calling into the library
struct module_state {
  // shared for symbol lookups and calls, exclusive for the swap
  mutable std::shared_mutex mutex{};
  std::unique_ptr<reload_coordinator> coordinator{};
  reload_notifier notifier{};

  // successful reload count
  std::atomic<uint64_t> version{0};
  // set after each successful reload, cleared by take_was_updated()
  std::atomic<bool> updated{false};
};

} // namespace r3::load
