#pragma once

#include <chrono>
#include <memory>

#include "r3watch/path_watcher.hpp"

namespace r3::watch {

enum class watch_backend { native, inotify, poll };

const char* watch_backend_name(watch_backend kind);

// returns nullptr when the requested backend does not exist on this platform
std::unique_ptr<path_watcher> make_path_watcher(
    watch_backend kind, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100)
);

} // namespace r3::watch
