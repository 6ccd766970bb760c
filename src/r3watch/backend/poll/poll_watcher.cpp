#include "r3watch/backend/poll/poll_watcher.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

#include <redlog.hpp>

#include "r3watch/event_queue.hpp"

namespace r3::watch::backend::poll_backend {
namespace {

struct file_snapshot {
  bool exists = false;
  std::filesystem::file_time_type write_time{};
  uintmax_t size = 0;

  bool operator==(const file_snapshot& other) const {
    return exists == other.exists && write_time == other.write_time && size == other.size;
  }
};

file_snapshot take_snapshot(const std::filesystem::path& path) {
  file_snapshot snapshot{};
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    return snapshot;
  }

  auto write_time = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return snapshot;
  }
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return snapshot;
  }

  snapshot.exists = true;
  snapshot.write_time = write_time;
  snapshot.size = size;
  return snapshot;
}

class poll_watcher final : public path_watcher {
public:
  explicit poll_watcher(std::chrono::milliseconds interval)
      : log_(redlog::get_logger("r3.watch.poll")), interval_(interval) {}

  ~poll_watcher() override { disarm(); }

  bool arm(const std::filesystem::path& path) override {
    disarm();

    auto snapshot = take_snapshot(path);
    if (!snapshot.exists) {
      return false;
    }

    path_ = path;
    last_ = snapshot;
    queue_.clear();
    running_.store(true, std::memory_order_release);
    armed_.store(true, std::memory_order_release);
    thread_ = std::thread(&poll_watcher::run, this);
    log_.trc("watch armed", redlog::field("path", path_.string()), redlog::field("interval_ms", interval_.count()));
    return true;
  }

  void disarm() override {
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      running_.store(false, std::memory_order_release);
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
    armed_.store(false, std::memory_order_release);
  }

  bool armed() const override { return armed_.load(std::memory_order_acquire); }

  bool wait(std::vector<fs_event>& out, std::chrono::milliseconds timeout) override {
    return queue_.drain(out, timeout);
  }

private:
  void run() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (running_.load(std::memory_order_acquire)) {
      stop_cv_.wait_for(lock, interval_, [this] { return !running_.load(std::memory_order_acquire); });
      if (!running_.load(std::memory_order_acquire)) {
        break;
      }

      auto current = take_snapshot(path_);
      if (current == last_) {
        continue;
      }

      fs_event event{};
      event.path = path_.string();
      if (!current.exists) {
        // a vanished file ends the watch, same as a native watch on a deleted inode
        event.type = fs_event::kind::removed;
        queue_.push(event);
        armed_.store(false, std::memory_order_release);
        log_.trc("watched file vanished", redlog::field("path", event.path));
        break;
      }

      event.type = fs_event::kind::modified;
      queue_.push(event);
      last_ = current;
    }
  }

  redlog::logger log_;
  std::chrono::milliseconds interval_;
  std::filesystem::path path_{};
  file_snapshot last_{};
  event_queue queue_{};
  std::atomic<bool> running_{false};
  std::atomic<bool> armed_{false};
  std::mutex stop_mutex_{};
  std::condition_variable stop_cv_{};
  std::thread thread_{};
};

} // namespace

std::unique_ptr<path_watcher> make_path_watcher(std::chrono::milliseconds interval) {
  return std::make_unique<poll_watcher>(interval);
}

} // namespace r3::watch::backend::poll_backend
