#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "r3base/env_config.hpp"
#include "r3load/result.hpp"
#include "r3watch/watcher_factory.hpp"

namespace r3::load {

struct hot_module_config {
  // directory holding the build output; may be relative to any ancestor of the working directory
  std::filesystem::path lib_dir{};
  // bare library name without platform prefix or extension
  std::string lib_name{};

  std::chrono::milliseconds debounce{500};
  std::chrono::milliseconds rearm_delay{500};
  // placeholders: {lib_name} {load_counter} {pid}
  std::optional<std::string> loaded_name_template{};
  std::chrono::milliseconds lock_retry_delay{1};

  watch::watch_backend watch_backend = watch::watch_backend::native;
  std::chrono::milliseconds poll_interval{100};

  status validate() const;
};

/**
 * @brief Overlay R3LOAD_* environment settings onto a config
 *
 * Recognized: DEBOUNCE_MS, REARM_MS, NAME_TEMPLATE, WATCH_BACKEND (native|inotify|poll), POLL_MS. Unset variables
 * leave the field unchanged.
 */
void apply_env_overrides(hot_module_config& config, const util::env_config& env);

// same, reading the R3LOAD_ prefix
void apply_env_overrides(hot_module_config& config);

} // namespace r3::load
