#include "r3load/config.hpp"

namespace r3::load {

status hot_module_config::validate() const {
  if (lib_dir.empty()) {
    return make_status(error_code::invalid_argument, "lib_dir is empty");
  }
  if (lib_name.empty()) {
    return make_status(error_code::invalid_argument, "lib_name is empty");
  }
  if (debounce.count() <= 0) {
    return make_status(error_code::invalid_argument, "debounce must be positive");
  }
  if (rearm_delay.count() <= 0) {
    return make_status(error_code::invalid_argument, "rearm_delay must be positive");
  }
  if (lock_retry_delay.count() <= 0) {
    return make_status(error_code::invalid_argument, "lock_retry_delay must be positive");
  }
  if (poll_interval.count() <= 0) {
    return make_status(error_code::invalid_argument, "poll_interval must be positive");
  }
  if (loaded_name_template && loaded_name_template->empty()) {
    return make_status(error_code::invalid_argument, "loaded_name_template is empty");
  }
  return ok_status();
}

void apply_env_overrides(hot_module_config& config, const util::env_config& env) {
  config.debounce = env.get_millis("DEBOUNCE_MS", config.debounce);
  config.rearm_delay = env.get_millis("REARM_MS", config.rearm_delay);
  config.poll_interval = env.get_millis("POLL_MS", config.poll_interval);

  if (env.has("NAME_TEMPLATE")) {
    config.loaded_name_template = env.get<std::string>("NAME_TEMPLATE", "");
  }

  config.watch_backend = env.get_enum<watch::watch_backend>(
      {
          {"native", watch::watch_backend::native},
          {"inotify", watch::watch_backend::inotify},
          {"poll", watch::watch_backend::poll},
      },
      "WATCH_BACKEND", config.watch_backend
  );
}

void apply_env_overrides(hot_module_config& config) { apply_env_overrides(config, util::env_config("R3LOAD")); }

} // namespace r3::load
