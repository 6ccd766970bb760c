#include "r3watch/watcher_factory.hpp"

#include "r3watch/backend/poll/poll_watcher.hpp"

#if defined(__linux__)
#include "r3watch/backend/linux/inotify_watcher.hpp"
#endif

namespace r3::watch {

const char* watch_backend_name(watch_backend kind) {
  switch (kind) {
    case watch_backend::native:
      return "native";
    case watch_backend::inotify:
      return "inotify";
    case watch_backend::poll:
      return "poll";
  }
  return "unknown";
}

std::unique_ptr<path_watcher> make_path_watcher(watch_backend kind, std::chrono::milliseconds poll_interval) {
  switch (kind) {
    case watch_backend::poll:
      return backend::poll_backend::make_path_watcher(poll_interval);
    case watch_backend::inotify:
#if defined(__linux__)
      return backend::linux_backend::make_path_watcher();
#else
      return nullptr;
#endif
    case watch_backend::native:
#if defined(__linux__)
      return backend::linux_backend::make_path_watcher();
#else
      return backend::poll_backend::make_path_watcher(poll_interval);
#endif
  }
  return nullptr;
}

} // namespace r3::watch
