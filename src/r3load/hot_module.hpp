#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "r3load/config.hpp"
#include "r3load/module_state.hpp"
#include "r3load/reload_events.hpp"
#include "r3load/result.hpp"
#include "r3load/update_loop.hpp"

namespace r3::load {

/**
 * @brief A hot-reloadable library together with the machinery that keeps it current
 *
 * Owns the coordinator, the lifecycle notifier, the update thread and the version/update flag. Calls into the
 * library go through an access object (or hot_function), which holds shared access for as long as it lives; the
 * update thread needs exclusive access to swap.
 */
class hot_module {
public:
  // shared access to the currently loaded library; the library cannot be swapped while this exists
  class access {
  public:
    template <typename T> result<T> get_symbol(std::string_view name) const {
      return state_->coordinator->get_symbol<T>(name);
    }

    bool is_loaded() const { return state_->coordinator->is_loaded(); }
    uint64_t load_counter() const { return state_->coordinator->load_counter(); }
    const std::filesystem::path& loaded_path() const { return state_->coordinator->loaded_path(); }

  private:
    friend class hot_module;

    explicit access(const module_state* state) : lock_(state->mutex), state_(state) {}

    std::shared_lock<std::shared_mutex> lock_;
    const module_state* state_;
  };

  static result<std::unique_ptr<hot_module>> open(const hot_module_config& config);

  ~hot_module();

  hot_module(const hot_module&) = delete;
  hot_module& operator=(const hot_module&) = delete;

  access read() const { return access(state_.get()); }

  reload_observer subscribe() { return state_->notifier.subscribe(); }
  receiver<change_signal> subscribe_to_file_changes() { return state_->coordinator->subscribe_to_file_changes(); }

  // number of successful reloads so far
  uint64_t version() const { return state_->version.load(std::memory_order_acquire); }

  // true once after each successful reload
  bool take_was_updated() { return state_->updated.exchange(false, std::memory_order_acq_rel); }

  update_phase phase() const { return loop_->phase(); }

  const std::string& name() const noexcept { return name_; }
  const std::filesystem::path& watched_path() const noexcept { return state_->coordinator->watched_path(); }

  // stops the update thread and the watcher; the loaded library stays usable
  void stop();

private:
  hot_module(std::string name, std::shared_ptr<module_state> state, std::unique_ptr<update_loop> loop);

  std::string name_;
  std::shared_ptr<module_state> state_;
  std::unique_ptr<update_loop> loop_;
  redlog::logger log_;
};

} // namespace r3::load
