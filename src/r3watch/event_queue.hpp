#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "r3watch/path_watcher.hpp"

namespace r3::watch {

class event_queue {
public:
  void push(const fs_event& event) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(event);
    }
    cv_.notify_one();
  }

  bool poll(fs_event& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
      return false;
    }
    out = events_.front();
    events_.pop_front();
    return true;
  }

  // moves every queued event into out, waiting up to timeout for the first one
  bool drain(std::vector<fs_event>& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
      return false;
    }
    while (!events_.empty()) {
      out.push_back(std::move(events_.front()));
      events_.pop_front();
    }
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
  }

private:
  mutable std::mutex mutex_{};
  std::condition_variable cv_{};
  std::deque<fs_event> events_{};
};

} // namespace r3::watch
