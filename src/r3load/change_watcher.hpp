#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include <redlog.hpp>

#include "r3load/result.hpp"
#include "r3load/watch_state.hpp"
#include "r3watch/path_watcher.hpp"
#include "r3watch/watcher_factory.hpp"

namespace r3::load {

struct change_watcher_config {
  std::filesystem::path path{};
  std::chrono::milliseconds debounce{500};
  std::chrono::milliseconds rearm_delay{500};
  watch::watch_backend backend = watch::watch_backend::native;
  std::chrono::milliseconds poll_interval{100};
};

/**
 * @brief Watches one artifact and turns raw file events into de-duplicated change signals
 *
 * While armed, raw events are coalesced with a quiet-period debounce. A batch that ends in a removal (or after which
 * the file is gone) moves the watcher to pending_rearm, where it retries arming every rearm_delay and treats a
 * successful rearm as a change. Every candidate change goes through the fingerprint gate: it is dropped when the
 * current bytes hash to the stored fingerprint or when a change is already pending.
 */
class change_watcher {
public:
  enum class state { armed, pending_rearm, stopped };

  static result<std::unique_ptr<change_watcher>> start(
      const change_watcher_config& config, std::shared_ptr<watch_state> shared
  );

  ~change_watcher();

  change_watcher(const change_watcher&) = delete;
  change_watcher& operator=(const change_watcher&) = delete;

  // stops and joins the watcher thread; safe to call more than once
  void stop();

  state current_state() const { return state_.load(std::memory_order_acquire); }

private:
  change_watcher(
      change_watcher_config config, std::shared_ptr<watch_state> shared, std::unique_ptr<watch::path_watcher> watcher
  );

  void run();
  bool try_rearm();
  bool signal_change();
  // false when stop was requested during the sleep
  bool sleep_unless_stopped(std::chrono::milliseconds duration);

  change_watcher_config config_;
  std::shared_ptr<watch_state> shared_;
  std::unique_ptr<watch::path_watcher> watcher_;
  redlog::logger log_;

  std::atomic<bool> running_{false};
  std::atomic<state> state_{state::pending_rearm};
  std::mutex stop_mutex_{};
  std::condition_variable stop_cv_{};
  std::thread thread_{};
};

const char* change_watcher_state_name(change_watcher::state value);

} // namespace r3::load
