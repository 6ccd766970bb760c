#include "r3load/change_watcher.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "r3base/crc32.hpp"
#include "r3watch/debouncer.hpp"

namespace r3::load {
namespace {

// upper bound on how long the thread waits for a first event before checking for stop
constexpr auto kWaitSlice = std::chrono::milliseconds(100);

bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

} // namespace

const char* change_watcher_state_name(change_watcher::state value) {
  switch (value) {
    case change_watcher::state::armed:
      return "armed";
    case change_watcher::state::pending_rearm:
      return "pending_rearm";
    case change_watcher::state::stopped:
      return "stopped";
  }
  return "unknown";
}

change_watcher::change_watcher(
    change_watcher_config config, std::shared_ptr<watch_state> shared, std::unique_ptr<watch::path_watcher> watcher
)
    : config_(std::move(config)), shared_(std::move(shared)), watcher_(std::move(watcher)),
      log_(redlog::get_logger("r3.load.watcher")) {}

change_watcher::~change_watcher() { stop(); }

result<std::unique_ptr<change_watcher>> change_watcher::start(
    const change_watcher_config& config, std::shared_ptr<watch_state> shared
) {
  auto log = redlog::get_logger("r3.load.watcher");

  if (!shared) {
    return error_result<std::unique_ptr<change_watcher>>(error_code::invalid_argument, "missing watch state");
  }

  auto backend = watch::make_path_watcher(config.backend, config.poll_interval);
  if (!backend) {
    log.err("watch backend unavailable", redlog::field("backend", watch::watch_backend_name(config.backend)));
    return error_result<std::unique_ptr<change_watcher>>(
        error_code::watch_error,
        std::string("watch backend unavailable on this platform: ") + watch::watch_backend_name(config.backend)
    );
  }

  std::unique_ptr<change_watcher> watcher(new change_watcher(config, std::move(shared), std::move(backend)));

  if (watcher->watcher_->arm(watcher->config_.path)) {
    watcher->state_.store(state::armed, std::memory_order_release);
  } else {
    log.dbg("artifact not watchable yet, waiting for it", redlog::field("path", config.path.string()));
    watcher->state_.store(state::pending_rearm, std::memory_order_release);
  }

  log.inf(
      "start watching changes", redlog::field("path", config.path.string()),
      redlog::field("backend", watch::watch_backend_name(config.backend)),
      redlog::field("debounce_ms", config.debounce.count())
  );

  watcher->running_.store(true, std::memory_order_release);
  watcher->thread_ = std::thread(&change_watcher::run, watcher.get());
  return ok_result(std::move(watcher));
}

void change_watcher::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
  }
  stop_cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  if (watcher_) {
    watcher_->disarm();
  }
  state_.store(state::stopped, std::memory_order_release);
  log_.dbg("watcher stopped", redlog::field("path", config_.path.string()));
}

void change_watcher::run() {
  while (running_.load(std::memory_order_acquire)) {
    if (state_.load(std::memory_order_acquire) == state::pending_rearm) {
      if (!sleep_unless_stopped(config_.rearm_delay)) {
        break;
      }
      if (!try_rearm()) {
        continue;
      }
      log_.inf("watching again after removal", redlog::field("path", config_.path.string()));
      signal_change();
      continue;
    }

    std::vector<watch::fs_event> batch = watch::collect_batch(*watcher_, config_.debounce, kWaitSlice);
    if (batch.empty()) {
      // a backend that lost its watch without reporting it
      if (!watcher_->armed()) {
        state_.store(state::pending_rearm, std::memory_order_release);
      }
      continue;
    }

    auto kind = watch::classify_batch(batch);
    log_.trc(
        "file change batch", redlog::field("events", batch.size()), redlog::field("kind", watch::batch_kind_name(kind))
    );

    if (kind == watch::batch_kind::removed || !file_exists(config_.path)) {
      log_.dbg("artifact removed, trying to watch it again", redlog::field("path", config_.path.string()));
      watcher_->disarm();
      state_.store(state::pending_rearm, std::memory_order_release);
      continue;
    }

    signal_change();
  }
}

bool change_watcher::try_rearm() {
  if (!file_exists(config_.path)) {
    return false;
  }
  if (!watcher_->arm(config_.path)) {
    return false;
  }
  state_.store(state::armed, std::memory_order_release);
  return true;
}

bool change_watcher::signal_change() {
  uint32_t current = util::hash_file(config_.path);
  if (current == shared_->fingerprint.load(std::memory_order_acquire) ||
      shared_->changed.load(std::memory_order_acquire)) {
    log_.trc("change suppressed", redlog::field("path", config_.path.string()), redlog::field("crc32", current));
    return false;
  }

  log_.dbg("artifact changed", redlog::field("path", config_.path.string()), redlog::field("crc32", current));
  shared_->changed.store(true, std::memory_order_release);

  std::lock_guard<std::mutex> lock(shared_->subscribers_mutex);
  auto& subscribers = shared_->subscribers;
  size_t before = subscribers.size();
  subscribers.erase(
      std::remove_if(
          subscribers.begin(), subscribers.end(),
          [](const sender<change_signal>& tx) { return !tx.send(change_signal{}); }
      ),
      subscribers.end()
  );
  log_.trc(
      "change signal sent", redlog::field("subscribers", subscribers.size()),
      redlog::field("pruned", before - subscribers.size())
  );
  return true;
}

bool change_watcher::sleep_unless_stopped(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_for(lock, duration, [this] { return !running_.load(std::memory_order_acquire); });
  return running_.load(std::memory_order_acquire);
}

} // namespace r3::load
