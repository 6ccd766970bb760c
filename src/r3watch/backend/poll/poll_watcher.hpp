#pragma once

#include <chrono>
#include <memory>

#include "r3watch/path_watcher.hpp"

namespace r3::watch::backend::poll_backend {

std::unique_ptr<path_watcher> make_path_watcher(std::chrono::milliseconds interval);

} // namespace r3::watch::backend::poll_backend
