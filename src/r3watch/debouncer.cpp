#include "r3watch/debouncer.hpp"

namespace r3::watch {

batch_kind classify_batch(const std::vector<fs_event>& events) {
  if (events.empty()) {
    return batch_kind::none;
  }

  bool removed = false;
  for (const auto& event : events) {
    switch (event.type) {
      case fs_event::kind::created:
      case fs_event::kind::modified:
        removed = false;
        break;
      case fs_event::kind::removed:
        removed = true;
        break;
      case fs_event::kind::other:
        break;
    }
  }
  return removed ? batch_kind::removed : batch_kind::changed;
}

std::vector<fs_event> collect_batch(
    path_watcher& watcher, std::chrono::milliseconds debounce, std::chrono::milliseconds first_wait
) {
  std::vector<fs_event> batch;
  if (!watcher.wait(batch, first_wait)) {
    return batch;
  }

  using clock = std::chrono::steady_clock;
  auto quiet_deadline = clock::now() + debounce;
  for (;;) {
    const auto now = clock::now();
    if (now >= quiet_deadline) {
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(quiet_deadline - now);
    if (remaining.count() == 0) {
      remaining = std::chrono::milliseconds(1);
    }
    if (watcher.wait(batch, remaining)) {
      quiet_deadline = clock::now() + debounce;
    }
  }
  return batch;
}

const char* batch_kind_name(batch_kind kind) {
  switch (kind) {
    case batch_kind::none:
      return "none";
    case batch_kind::changed:
      return "changed";
    case batch_kind::removed:
      return "removed";
  }
  return "unknown";
}

} // namespace r3::watch
