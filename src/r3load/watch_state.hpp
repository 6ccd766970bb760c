#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

#include "r3load/channel.hpp"

namespace r3::load {

// unit signal sent once per accepted change of the watched artifact
struct change_signal {};

// state shared between a coordinator and its watcher thread
struct watch_state {
  // crc-32 of the bytes currently loaded, 0 when nothing is loaded
  std::atomic<uint32_t> fingerprint{0};
  // set by the watcher when a change is accepted, cleared by the coordinator before it reloads
  std::atomic<bool> changed{false};

  std::mutex subscribers_mutex{};
  std::vector<sender<change_signal>> subscribers{};
};

} // namespace r3::load
