#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "r3load/change_watcher.hpp"
#include "r3load/channel.hpp"
#include "r3load/config.hpp"
#include "r3load/library_handle.hpp"
#include "r3load/result.hpp"
#include "r3load/watch_state.hpp"

namespace r3::load {

/**
 * @brief Owns the loaded copy of one library and swaps it when the build output changes
 *
 * The watched artifact is never opened directly. Each load copies it to a private, uniquely named file next to it
 * and opens that copy, so the build can overwrite the artifact while the process holds the previous version.
 *
 * Not internally synchronized: callers serialize update() against symbol lookups (hot_module does this with a
 * shared mutex). Subscribing and the read-only accessors are safe from any thread.
 */
class reload_coordinator {
public:
  static result<std::unique_ptr<reload_coordinator>> create(const hot_module_config& config);

  ~reload_coordinator();

  reload_coordinator(const reload_coordinator&) = delete;
  reload_coordinator& operator=(const reload_coordinator&) = delete;

  // reloads if the watcher reported a change; true when a reload cycle ran
  result<bool> update();

  template <typename T> result<T> get_symbol(std::string_view name) const {
    if (!handle_) {
      return error_result<T>(error_code::library_not_loaded, "library not loaded: " + watched_path_.string());
    }
    return handle_->symbol_as<T>(name);
  }

  result<void*> get_symbol_address(std::string_view name) const;

  // one change_signal per accepted change of the watched artifact
  receiver<change_signal> subscribe_to_file_changes();

  // stops the watcher thread; the loaded library stays usable
  void stop_watching();

  const std::filesystem::path& watched_path() const noexcept { return watched_path_; }
  const std::filesystem::path& loaded_path() const noexcept { return loaded_path_; }
  uint64_t load_counter() const noexcept { return load_counter_; }
  uint32_t fingerprint() const noexcept { return shared_->fingerprint.load(std::memory_order_acquire); }
  bool is_loaded() const noexcept { return static_cast<bool>(handle_); }
  bool change_pending() const noexcept { return shared_->changed.load(std::memory_order_acquire); }
  change_watcher::state watcher_state() const;

private:
  explicit reload_coordinator(const hot_module_config& config);

  status reload();
  // copies the watched artifact to the current loaded path, fingerprints it and opens it
  status load_copy();
  void remove_loaded_copy();

  std::filesystem::path lib_dir_{};
  std::string lib_name_{};
  std::optional<std::string> name_template_{};
  uint64_t pid_ = 0;

  std::filesystem::path watched_path_{};
  std::filesystem::path loaded_path_{};
  uint64_t load_counter_ = 0;

  std::unique_ptr<library_handle> handle_{};
  std::shared_ptr<watch_state> shared_;
  std::unique_ptr<change_watcher> watcher_{};
  redlog::logger log_;
};

} // namespace r3::load
