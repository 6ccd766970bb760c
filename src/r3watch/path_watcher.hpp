#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace r3::watch {

struct fs_event {
  enum class kind { created, modified, removed, other };
  kind type = kind::other;
  std::string path{};
};

// watches a single file; events are drained by the owning thread through wait()
class path_watcher {
public:
  virtual ~path_watcher() = default;

  // registers a watch on the file; false if the file is missing or the watch cannot be created
  virtual bool arm(const std::filesystem::path& path) = 0;
  virtual void disarm() = 0;
  virtual bool armed() const = 0;

  // appends pending events to out, waiting up to timeout for the first one; true if anything was appended
  virtual bool wait(std::vector<fs_event>& out, std::chrono::milliseconds timeout) = 0;
};

} // namespace r3::watch
