#pragma once

#include <chrono>
#include <vector>

#include "r3watch/path_watcher.hpp"

namespace r3::watch {

enum class batch_kind { none, changed, removed };

// folds a coalesced batch: create/modify clear the removal state, remove sets it, anything else keeps it
batch_kind classify_batch(const std::vector<fs_event>& events);

/**
 * @brief Coalesce raw events into one batch
 *
 * Waits up to @p first_wait for an event. Once one arrives, keeps collecting until no new event has been seen for
 * @p debounce. Returns an empty batch when nothing arrived within @p first_wait.
 */
std::vector<fs_event> collect_batch(
    path_watcher& watcher, std::chrono::milliseconds debounce, std::chrono::milliseconds first_wait
);

const char* batch_kind_name(batch_kind kind);

} // namespace r3::watch
