#include "r3load/update_loop.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace r3::load {
namespace {

// bounds how long a stop request can go unnoticed while no change arrives
constexpr auto kSignalWaitSlice = std::chrono::milliseconds(100);

} // namespace

const char* update_phase_name(update_phase phase) {
  switch (phase) {
    case update_phase::idle:
      return "idle";
    case update_phase::waiting_for_signal:
      return "waiting_for_signal";
    case update_phase::announcing:
      return "announcing";
    case update_phase::acquiring_exclusive_access:
      return "acquiring_exclusive_access";
    case update_phase::reloading:
      return "reloading";
    case update_phase::done:
      return "done";
  }
  return "unknown";
}

update_loop::update_loop(
    std::shared_ptr<module_state> state, receiver<change_signal> changes, std::chrono::milliseconds lock_retry_delay
)
    : state_(std::move(state)), changes_(std::move(changes)), lock_retry_delay_(lock_retry_delay),
      log_(redlog::get_logger("r3.load.update")) {}

update_loop::~update_loop() { stop(); }

void update_loop::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  thread_ = std::thread(&update_loop::run, this);
}

void update_loop::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  phase_.store(update_phase::idle, std::memory_order_release);
}

void update_loop::run() {
  log_.dbg("update thread started");

  while (running_.load(std::memory_order_acquire)) {
    phase_.store(update_phase::waiting_for_signal, std::memory_order_release);

    auto signal = changes_.recv_for(kSignalWaitSlice);
    if (!signal) {
      if (changes_.disconnected()) {
        log_.dbg("change source closed, update thread exiting");
        break;
      }
      continue;
    }

    run_cycle();
  }

  phase_.store(update_phase::idle, std::memory_order_release);
  log_.dbg("update thread stopped");
}

void update_loop::run_cycle() {
  phase_.store(update_phase::announcing, std::memory_order_release);
  log_.trc("announcing reload");
  state_->notifier.send_about_to_reload_and_wait();

  phase_.store(update_phase::acquiring_exclusive_access, std::memory_order_release);
  std::unique_lock<std::shared_mutex> lock(state_->mutex, std::try_to_lock);
  if (!lock.owns_lock()) {
    log_.vrb("library in use, waiting for exclusive access");
    auto started = std::chrono::steady_clock::now();
    while (!lock.try_lock()) {
      std::this_thread::sleep_for(lock_retry_delay_);
    }
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    log_.vrb("acquired exclusive access", redlog::field("waited_ms", waited.count()));
  }

  phase_.store(update_phase::reloading, std::memory_order_release);
  bool swapped = false;
  if (state_->coordinator) {
    auto updated = state_->coordinator->update();
    if (!updated.ok()) {
      log_.err(
          "reload failed", redlog::field("code", error_code_name(updated.status.code)),
          redlog::field("error", updated.status.message)
      );
    } else {
      swapped = updated.value;
    }
  }

  phase_.store(update_phase::done, std::memory_order_release);
  if (swapped) {
    uint64_t version = state_->version.fetch_add(1, std::memory_order_release) + 1;
    state_->updated.store(true, std::memory_order_release);
    log_.inf("library reloaded", redlog::field("version", version));
  }
  lock.unlock();

  cycles_.fetch_add(1, std::memory_order_acq_rel);
  state_->notifier.send_reloaded();
}

} // namespace r3::load
