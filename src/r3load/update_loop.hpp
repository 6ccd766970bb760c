#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <redlog.hpp>

#include "r3load/channel.hpp"
#include "r3load/module_state.hpp"
#include "r3load/watch_state.hpp"

namespace r3::load {

enum class update_phase { idle, waiting_for_signal, announcing, acquiring_exclusive_access, reloading, done };

const char* update_phase_name(update_phase phase);

/**
 * @brief Background thread driving reload cycles for one module
 *
 * Per change signal: announce the reload and wait for every hold to be released, take exclusive access to the
 * coordinator, update, bump the version and set the update flag on success, then announce the reload as done.
 * Errors end the current cycle only.
 */
class update_loop {
public:
  update_loop(
      std::shared_ptr<module_state> state, receiver<change_signal> changes,
      std::chrono::milliseconds lock_retry_delay = std::chrono::milliseconds(1)
  );
  ~update_loop();

  update_loop(const update_loop&) = delete;
  update_loop& operator=(const update_loop&) = delete;

  void start();

  // joins the thread; a loop blocked on outstanding reload holds returns once they are released
  void stop();

  update_phase phase() const { return phase_.load(std::memory_order_acquire); }
  bool running() const { return running_.load(std::memory_order_acquire); }
  uint64_t cycles() const { return cycles_.load(std::memory_order_acquire); }

private:
  void run();
  void run_cycle();

  std::shared_ptr<module_state> state_;
  receiver<change_signal> changes_;
  std::chrono::milliseconds lock_retry_delay_;
  redlog::logger log_;

  std::atomic<bool> running_{false};
  std::atomic<update_phase> phase_{update_phase::idle};
  std::atomic<uint64_t> cycles_{0};
  std::thread thread_{};
};

} // namespace r3::load
