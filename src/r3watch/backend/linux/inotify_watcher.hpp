#pragma once

#include <memory>

#include "r3watch/path_watcher.hpp"

namespace r3::watch::backend::linux_backend {

std::unique_ptr<path_watcher> make_path_watcher();

} // namespace r3::watch::backend::linux_backend
